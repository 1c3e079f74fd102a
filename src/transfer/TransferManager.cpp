// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "transfer/TransferManager.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/make_shared.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/TimeUtils.h"
#include "client/Http.h"
#include "client/RetryStrategy.h"
#include "client/RetryingTransport.h"
#include "client/Utils.h"
#include "transfer/ChunkTransferWorker.h"
#include "transfer/RangePartitioner.h"
#include "transfer/TransferCoordinator.h"

namespace CX {

namespace Transfer {

using boost::bind;
using boost::optional;
using boost::shared_ptr;
using boost::to_string;
using CX::Client::ClientError;
using CX::Client::PreconditionSet;
using CX::Client::RetryStrategy;
using CX::Client::RetryingTransport;
using CX::Client::TransferError;
using CX::Client::Transport;
using CX::Client::Http::HttpRequest;
using CX::Client::Http::HttpResponse;
using CX::Configure::TransferConfigure;
using CX::Data::Buffer;
using CX::Data::ForwardOnlyStreamSource;
using CX::Data::TransferSink;
using CX::Data::TransferSource;
using CX::TimeUtils::GetElapsedMilliseconds;
using CX::TimeUtils::GetMonotonicMilliseconds;
using std::string;
using std::vector;

namespace {

ClientError<TransferError::Value> ConfigurationError(const string &name,
                                                     const string &msg) {
  return ClientError<TransferError::Value>(TransferError::CONFIGURATION_ERROR,
                                           name, msg, false);
}

// Remaining part of a timeout budget, 0 stays 0 (no limit)
//
// @param  : budget, start of the budget
// @return : {false if exhausted, remaining milliseconds}
std::pair<bool, uint64_t> RemainingTimeout(uint64_t timeoutInMs,
                                           uint64_t startInMs) {
  if (timeoutInMs == 0) {
    return std::make_pair(true, static_cast<uint64_t>(0));
  }
  uint64_t elapsed = GetElapsedMilliseconds(startInMs);
  if (elapsed >= timeoutInMs) {
    return std::make_pair(false, static_cast<uint64_t>(0));
  }
  return std::make_pair(true, timeoutInMs - elapsed);
}

// The caller's concurrency when given, otherwise the configured one. Streams
// without random access fall back to sequential transfer.
uint32_t SelectConcurrency(const optional<uint32_t> &requested,
                           uint32_t configured, bool randomAccess) {
  if (requested) {
    return *requested;
  }
  return randomAccess ? configured : 1;
}

TransferResult MakeResult(const optional<ChunkResult> &metadata,
                          const TransferHandle &handle) {
  TransferResult result;
  if (metadata) {
    result.SetETag(metadata->GetETag());
    result.SetLastModified(metadata->GetLastModified());
  }
  result.SetBytesTransferred(handle.GetBytesTransferred());
  result.SetChunkCount(handle.GetCompletedChunkCount());
  return result;
}

}  // namespace

// --------------------------------------------------------------------------
TransferManager::TransferManager(const TransferConfigure &configure,
                                 const shared_ptr<Transport> &transport)
    : m_configure(configure),
      m_transport(boost::make_shared<RetryingTransport>(
          transport, RetryStrategy(configure.m_transactionRetries,
                                   configure.m_retryScaleFactor))) {}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::Fail(
    const ClientError<TransferError::Value> &err,
    TransferHandle *handle) const {
  handle->SetError(err);
  handle->UpdateStatus(TransferStatus::Failed);
  return TransferOutcome(handle->GetError());
}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::Upload(
    const shared_ptr<ResourceEndpoint> &endpoint, TransferSource *source,
    const UploadOptions &options, shared_ptr<TransferHandle> *handle) const {
  shared_ptr<TransferHandle> transferHandle =
      boost::make_shared<TransferHandle>(
          TransferDirection::Upload, endpoint ? endpoint->GetURL() : string());
  if (handle != NULL) {
    *handle = transferHandle;
  }
  transferHandle->SetProgressCallback(options.m_progressCallback);

  ClientError<TransferError::Value> err = m_configure.Validate();
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, transferHandle.get());
  }
  if (!endpoint || source == NULL) {
    return Fail(ConfigurationError("Upload", "Null endpoint or source"),
                transferHandle.get());
  }

  uint32_t maxConcurrency =
      SelectConcurrency(options.m_maxConcurrency, m_configure.m_maxConcurrency,
                        source->IsSeekable());
  bool validateContent =
      options.m_validateContent.get_value_or(m_configure.m_validateContent);
  uint64_t timeoutInMs =
      options.m_timeoutInMs.get_value_or(m_configure.m_timeout);

  err = TransferCoordinator::CheckConcurrency(maxConcurrency,
                                              source->IsSeekable());
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, transferHandle.get());
  }

  optional<uint64_t> size = source->GetSize();
  if (size) {
    transferHandle->SetTotalBytes(*size);
    return UploadKnownSize(endpoint, source, *size, options, maxConcurrency,
                           validateContent, timeoutInMs, transferHandle.get());
  }

  ForwardOnlyStreamSource *stream =
      dynamic_cast<ForwardOnlyStreamSource *>(source);
  if (stream == NULL) {
    return Fail(ConfigurationError("Upload", "Source of " +
                                                 CX::Data::SourceKindToString(
                                                     source->GetKind()) +
                                                 " kind has no size"),
                transferHandle.get());
  }
  if (!endpoint->SupportsUnknownLengthUpload()) {
    return Fail(ConfigurationError("Upload", endpoint->GetName() +
                                                 " needs the size up front"),
                transferHandle.get());
  }
  return UploadUnknownSize(endpoint, stream, options, validateContent,
                           timeoutInMs, transferHandle.get());
}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::UploadKnownSize(
    const shared_ptr<ResourceEndpoint> &endpoint, TransferSource *source,
    uint64_t size, const UploadOptions &options, uint32_t maxConcurrency,
    bool validateContent, uint64_t timeoutInMs, TransferHandle *handle) const {
  uint64_t threshold = endpoint->SupportsSingleShotUpload()
                           ? endpoint->GetSingleUploadThreshold(m_configure)
                           : 0;
  PlanOutcome plan = PlanChunks(TransferPlan(
      size, endpoint->GetUploadChunkSize(m_configure), threshold));
  if (!plan.IsSuccess()) {
    return Fail(plan.GetError(), handle);
  }
  const vector<ChunkDescriptor> &descriptors = plan.GetResult();

  // requests that make content visible carry the preconditions, staged
  // chunks do not
  ChunkTransferWorker guardedWorker(m_transport, endpoint,
                                    options.m_preconditions, validateContent,
                                    handle);
  TransferCoordinator coordinator(maxConcurrency, timeoutInMs);

  if (endpoint->SupportsSingleShotUpload() && size <= threshold) {
    ChunkResultsOutcome outcome = coordinator.Execute(
        descriptors, bind(&ChunkTransferWorker::UploadSingle, &guardedWorker,
                          _1, source, _2),
        handle);
    if (!outcome.IsSuccess()) {
      return Fail(outcome.GetError(), handle);
    }
    handle->UpdateStatus(TransferStatus::Completed);
    return TransferOutcome(MakeResult(outcome.GetResult().front(), *handle));
  }

  HttpRequest prepareRequest;
  if (endpoint->BuildPrepareUploadRequest(size, &prepareRequest)) {
    HttpResponse response;
    ClientError<TransferError::Value> err =
        guardedWorker.Send(&prepareRequest, "PrepareUpload", &response);
    if (!CX::Client::IsGoodTransferError(err)) {
      return Fail(err, handle);
    }
    if (size == 0) {
      ChunkResult created(0);
      SetResultMetadata(response, &created);
      handle->UpdateStatus(TransferStatus::Completed);
      return TransferOutcome(MakeResult(created, *handle));
    }
  }

  ChunkTransferWorker chunkWorker(m_transport, endpoint, PreconditionSet(),
                                  validateContent, handle);
  ChunkResultsOutcome outcome = coordinator.Execute(
      descriptors,
      bind(&ChunkTransferWorker::UploadChunk, &chunkWorker, _1, source, _2),
      handle);
  if (!outcome.IsSuccess()) {
    return Fail(outcome.GetError(), handle);
  }
  return CommitUpload(endpoint, outcome.GetResult(), options.m_preconditions,
                      handle);
}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::UploadUnknownSize(
    const shared_ptr<ResourceEndpoint> &endpoint,
    ForwardOnlyStreamSource *source, const UploadOptions &options,
    bool validateContent, uint64_t timeoutInMs, TransferHandle *handle) const {
  ChunkTransferWorker chunkWorker(m_transport, endpoint, PreconditionSet(),
                                  validateContent, handle);
  StreamingPartitioner partitioner(endpoint->GetUploadChunkSize(m_configure));
  TransferCoordinator coordinator(1, timeoutInMs);
  ChunkResultsOutcome outcome = coordinator.ExecuteStreaming(
      source, &partitioner,
      bind(&ChunkTransferWorker::UploadFilledChunk, &chunkWorker, _1, _2),
      handle);
  if (!outcome.IsSuccess()) {
    return Fail(outcome.GetError(), handle);
  }
  return CommitUpload(endpoint, outcome.GetResult(), options.m_preconditions,
                      handle);
}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::CommitUpload(
    const shared_ptr<ResourceEndpoint> &endpoint,
    const vector<ChunkResult> &results, const PreconditionSet &preconditions,
    TransferHandle *handle) const {
  HttpRequest request;
  if (!endpoint->BuildCommitUploadRequest(results, &request)) {
    handle->UpdateStatus(TransferStatus::Completed);
    return TransferOutcome(MakeResult(SelectLatestModified(results), *handle));
  }

  ChunkTransferWorker commitWorker(m_transport, endpoint, preconditions,
                                   false);
  HttpResponse response;
  ClientError<TransferError::Value> err =
      commitWorker.Send(&request, "CommitUpload", &response);
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, handle);
  }
  ChunkResult committed(static_cast<uint32_t>(results.size()));
  SetResultMetadata(response, &committed);
  handle->UpdateStatus(TransferStatus::Completed);
  return TransferOutcome(MakeResult(committed, *handle));
}

// --------------------------------------------------------------------------
TransferOutcome TransferManager::Download(
    const shared_ptr<ResourceEndpoint> &endpoint, TransferSink *sink,
    const DownloadOptions &options, shared_ptr<TransferHandle> *handle) const {
  shared_ptr<TransferHandle> transferHandle =
      boost::make_shared<TransferHandle>(
          TransferDirection::Download, endpoint ? endpoint->GetURL() : string());
  if (handle != NULL) {
    *handle = transferHandle;
  }
  TransferHandle *h = transferHandle.get();
  h->SetProgressCallback(options.m_progressCallback);

  ClientError<TransferError::Value> err = m_configure.Validate();
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, h);
  }
  if (!endpoint || sink == NULL) {
    return Fail(ConfigurationError("Download", "Null endpoint or sink"), h);
  }
  if (options.m_length && !options.m_offset) {
    return Fail(ConfigurationError("Download", "Length requires an offset"),
                h);
  }
  if (options.m_length && *options.m_length == 0) {
    return Fail(
        ConfigurationError("Download", "Length must be greater than zero"), h);
  }

  uint32_t maxConcurrency =
      SelectConcurrency(options.m_maxConcurrency, m_configure.m_maxConcurrency,
                        sink->IsSeekable());
  bool validateContent =
      options.m_validateContent.get_value_or(m_configure.m_validateContent);
  uint64_t timeoutInMs =
      options.m_timeoutInMs.get_value_or(m_configure.m_timeout);
  err = TransferCoordinator::CheckConcurrency(maxConcurrency,
                                              sink->IsSeekable());
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, h);
  }

  uint64_t startInMs = GetMonotonicMilliseconds();
  h->UpdateStatus(TransferStatus::InProgress);

  // the first request learns the size of the resource
  uint64_t rangeBegin = options.m_offset.get_value_or(0);
  optional<uint64_t> requestedEnd;
  if (options.m_length) {
    requestedEnd = rangeBegin + *options.m_length - 1;
  }
  uint64_t firstSize = validateContent ? m_configure.m_maxChunkGetSize
                                       : m_configure.m_maxSingleGetSize;
  uint64_t firstEnd = rangeBegin + firstSize - 1;
  if (requestedEnd) {
    firstEnd = std::min(firstEnd, *requestedEnd);
  }

  ChunkTransferWorker firstWorker(m_transport, endpoint,
                                  options.m_preconditions, validateContent, h);
  HttpRequest request;
  endpoint->BuildDownloadRequest(rangeBegin, firstEnd, validateContent,
                                 &request);
  HttpResponse response;
  err = firstWorker.Send(&request, "DownloadFirstChunk", &response);
  if (err.GetError() == TransferError::INVALID_RANGE && rangeBegin == 0) {
    // an empty resource has no satisfiable range
    DebugInfo("Range not satisfiable at offset 0, fetch "
              << endpoint->GetURL() << " without range");
    endpoint->BuildFullDownloadRequest(&request);
    response = HttpResponse();
    err = firstWorker.Send(&request, "DownloadFirstChunk", &response);
  }
  if (!CX::Client::IsGoodTransferError(err)) {
    return Fail(err, h);
  }

  uint64_t resourceSize = 0;
  uint64_t firstLength = 0;
  string contentRange = response.GetHeader(CX::Client::Http::CONTENT_RANGE);
  if (!contentRange.empty()) {
    boost::tuple<bool, uint64_t, uint64_t, uint64_t> range =
        CX::Client::Utils::ParseResponseContentRange(contentRange);
    if (!boost::get<0>(range) || boost::get<1>(range) != rangeBegin) {
      return Fail(ClientError<TransferError::Value>(
                      TransferError::UNEXPECTED_RESPONSE, "DownloadFirstChunk",
                      "Unexpected Content-Range " + contentRange, false),
                  h);
    }
    firstLength = boost::get<2>(range) - boost::get<1>(range) + 1;
    resourceSize = boost::get<3>(range);
  } else {
    string contentLength = response.GetHeader(CX::Client::Http::CONTENT_LENGTH);
    try {
      firstLength = contentLength.empty()
                        ? 0
                        : boost::lexical_cast<uint64_t>(contentLength);
    } catch (const boost::bad_lexical_cast &) {
      return Fail(ClientError<TransferError::Value>(
                      TransferError::UNEXPECTED_RESPONSE, "DownloadFirstChunk",
                      "Malformed Content-Length " + contentLength, false),
                  h);
    }
    resourceSize = rangeBegin + firstLength;
  }

  // a requested range beyond the end is trimmed to the resource
  uint64_t end = resourceSize > 0 ? resourceSize - 1 : 0;
  if (requestedEnd) {
    end = std::min(end, *requestedEnd);
  }
  uint64_t transferSize = resourceSize > rangeBegin ? end - rangeBegin + 1 : 0;
  h->SetTotalBytes(transferSize);

  ChunkDescriptor firstChunk(0, rangeBegin, firstLength,
                             transferSize <= firstLength);
  h->AddPendingChunk(0);
  Buffer firstBuffer =
      boost::make_shared<vector<char> >(static_cast<size_t>(firstLength));
  ChunkResult first =
      firstWorker.ReceiveChunk(firstChunk, response, sink, rangeBegin,
                               firstBuffer);
  RecordChunkResult(first, startInMs, timeoutInMs, h);
  if (!first.IsSuccess() || h->HasError()) {
    return Fail(h->GetError(), h);
  }

  uint64_t nextStart = rangeBegin + firstLength;
  if (transferSize > 0 && nextStart <= end) {
    std::pair<bool, uint64_t> remaining =
        RemainingTimeout(timeoutInMs, startInMs);
    if (!remaining.first) {
      return Fail(ClientError<TransferError::Value>(
                      TransferError::TIMEOUT, "Download",
                      "Exceeded timeout of " + to_string(timeoutInMs) +
                          " ms after the first chunk",
                      false),
                  h);
    }

    PlanOutcome plan = PlanChunks(TransferPlan(
        end - nextStart + 1, m_configure.m_maxChunkGetSize, 0, nextStart, 1));
    if (!plan.IsSuccess()) {
      return Fail(plan.GetError(), h);
    }

    // a resource changed since the first response fails the later chunks
    PreconditionSet pinned = options.m_preconditions;
    if (first.GetETag()) {
      pinned.m_ifMatch = *first.GetETag();
    }
    ChunkTransferWorker chunkWorker(m_transport, endpoint, pinned,
                                    validateContent, h);
    TransferCoordinator coordinator(maxConcurrency, remaining.second);
    ChunkResultsOutcome outcome = coordinator.Execute(
        plan.GetResult(),
        bind(&ChunkTransferWorker::DownloadChunk, &chunkWorker, _1, sink,
             rangeBegin, _2),
        h);
    if (!outcome.IsSuccess()) {
      return Fail(outcome.GetError(), h);
    }
  }

  h->UpdateStatus(TransferStatus::Completed);
  TransferResult result = MakeResult(first, *h);
  result.SetResourceSize(resourceSize);
  return TransferOutcome(result);
}

// --------------------------------------------------------------------------
PagedResultCursor<ListedItem> TransferManager::List(
    const shared_ptr<ResourceEndpoint> &endpoint,
    const optional<string> &startToken) const {
  return PagedResultCursor<ListedItem>(
      bind(&TransferManager::FetchListPage, this, endpoint, _1, _2),
      m_configure.m_resultsPerPage, startToken);
}

// --------------------------------------------------------------------------
ListPageOutcome TransferManager::FetchListPage(
    const shared_ptr<ResourceEndpoint> &endpoint,
    const optional<string> &marker, uint32_t maxResults) const {
  if (!endpoint) {
    return ListPageOutcome(ConfigurationError("List", "Null endpoint"));
  }
  HttpRequest request;
  endpoint->BuildListRequest(marker, maxResults, &request);

  ChunkTransferWorker worker(m_transport, endpoint, PreconditionSet(), false);
  HttpResponse response;
  ClientError<TransferError::Value> err =
      worker.Send(&request, "List", &response);
  if (!CX::Client::IsGoodTransferError(err)) {
    return ListPageOutcome(err);
  }

  string body;
  response.ReadBody(&body);
  return endpoint->ParseListResponse(body);
}

}  // namespace Transfer
}  // namespace CX
