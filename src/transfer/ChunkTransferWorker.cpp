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

#include "transfer/ChunkTransferWorker.h"

#include <stddef.h>
#include <stdint.h>

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/TimeUtils.h"
#include "client/ConditionalGuard.h"
#include "client/NullTransport.h"
#include "data/IOStream.h"

namespace CX {

namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using CX::Client::ClientError;
using CX::Client::PreconditionSet;
using CX::Client::TransferError;
using CX::Client::Transport;
using CX::Client::TransportOutcome;
using CX::Client::Http::HttpRequest;
using CX::Client::Http::HttpResponse;
using CX::Data::Buffer;
using CX::Data::IOStream;
using CX::Data::TransferSink;
using CX::Data::TransferSource;
using CX::HashUtils::ComputeContentMD5;
using CX::StringUtils::FormatChunk;
using std::string;
using std::vector;

namespace {

// Chunk buffer holding at least length bytes
Buffer EnsureBuffer(const Buffer &buffer, uint64_t length) {
  if (buffer && buffer->size() >= length) {
    return buffer;
  }
  DebugWarning("Chunk buffer too small for " << length
                                             << " bytes, allocate a new one");
  return boost::make_shared<vector<char> >(static_cast<size_t>(length));
}

char *BufferData(const Buffer &buffer) {
  return (buffer && !buffer->empty()) ? &(*buffer)[0] : NULL;
}

ClientError<TransferError::Value> IntegrityError(const string &operation,
                                                 const string &expected,
                                                 const string &actual) {
  return ClientError<TransferError::Value>(
      TransferError::INTEGRITY_ERROR, operation,
      "Content-MD5 mismatch, expected " + expected + " but computed " + actual,
      false);
}

}  // namespace

// --------------------------------------------------------------------------
void SetResultMetadata(const HttpResponse &response, ChunkResult *result) {
  if (result == NULL) {
    return;
  }
  if (response.HasHeader(CX::Client::Http::ETAG)) {
    result->SetETag(response.GetHeader(CX::Client::Http::ETAG));
  }
  if (response.HasHeader(CX::Client::Http::LAST_MODIFIED)) {
    std::pair<bool, time_t> res = CX::TimeUtils::HttpDateToSeconds(
        response.GetHeader(CX::Client::Http::LAST_MODIFIED));
    if (res.first) {
      result->SetLastModified(res.second);
    }
  }
}

// --------------------------------------------------------------------------
ChunkTransferWorker::ChunkTransferWorker(
    const shared_ptr<Transport> &transport,
    const shared_ptr<ResourceEndpoint> &endpoint,
    const PreconditionSet &preconditions, bool validateContent,
    TransferHandle *handle)
    : m_transport(transport),
      m_endpoint(endpoint),
      m_preconditions(preconditions),
      m_validateContent(validateContent),
      m_handle(handle) {
  if (!m_transport) {
    m_transport = boost::make_shared<CX::Client::NullTransport>();
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> ChunkTransferWorker::Send(
    HttpRequest *request, const string &operationName,
    HttpResponse *response) const {
  CX::Client::ApplyPreconditions(m_preconditions, request);

  TransportOutcome outcome;
  try {
    outcome = m_transport->Send(*request);
  } catch (const std::exception &err) {
    return ClientError<TransferError::Value>(
        TransferError::TRANSPORT_ERROR, operationName,
        string("Transport threw: ") + err.what(), false);
  }

  if (response != NULL && outcome.IsSuccess()) {
    *response = outcome.GetResult();
  }
  return CX::Client::TranslateOutcome(outcome, *request, operationName);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::UploadChunk(const ChunkDescriptor &descriptor,
                                             TransferSource *source,
                                             const Buffer &buffer) const {
  return ReadAndSendUpload(descriptor, source, buffer, false);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::UploadSingle(const ChunkDescriptor &descriptor,
                                              TransferSource *source,
                                              const Buffer &buffer) const {
  return ReadAndSendUpload(descriptor, source, buffer, true);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::UploadFilledChunk(
    const ChunkDescriptor &descriptor, const Buffer &buffer) const {
  if (descriptor.GetLength() > 0 &&
      (!buffer || buffer->size() < descriptor.GetLength())) {
    return MakeFailedResult(
        descriptor.GetIndex(),
        ClientError<TransferError::Value>(
            TransferError::CONFIGURATION_ERROR, "UploadChunk",
            "Chunk buffer is smaller than the chunk", false));
  }
  return SendUpload(descriptor, buffer, false);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::ReadAndSendUpload(
    const ChunkDescriptor &descriptor, TransferSource *source,
    const Buffer &buffer, bool singleShot) const {
  if (source == NULL) {
    return MakeFailedResult(
        descriptor.GetIndex(),
        ClientError<TransferError::Value>(TransferError::CONFIGURATION_ERROR,
                                          "UploadChunk", "Null source", false));
  }

  Buffer chunkBuffer = EnsureBuffer(buffer, descriptor.GetLength());
  if (descriptor.GetLength() > 0) {
    size_t length = static_cast<size_t>(descriptor.GetLength());
    size_t readSize = source->ReadAt(descriptor.GetStartOffset(), length,
                                     BufferData(chunkBuffer));
    if (readSize != length) {
      return MakeFailedResult(
          descriptor.GetIndex(),
          ClientError<TransferError::Value>(
              TransferError::UNKNOWN, "UploadChunk",
              "Source returned " + to_string(readSize) + " of " +
                  to_string(length) + " bytes at offset " +
                  to_string(descriptor.GetStartOffset()),
              false));
    }
  }
  return SendUpload(descriptor, chunkBuffer, singleShot);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::SendUpload(const ChunkDescriptor &descriptor,
                                            const Buffer &buffer,
                                            bool singleShot) const {
  size_t length = static_cast<size_t>(descriptor.GetLength());
  HttpRequest request;
  if (singleShot) {
    m_endpoint->BuildSingleUploadRequest(length, &request);
  } else {
    m_endpoint->BuildChunkUploadRequest(descriptor, &request);
  }
  request.SetBody(boost::make_shared<IOStream>(buffer, length), length);

  string localMD5;
  if (m_validateContent) {
    localMD5 = ComputeContentMD5(BufferData(buffer), length);
    request.SetHeader(CX::Client::Http::CONTENT_MD5, localMD5);
  }

  string operation = singleShot ? "UploadSingle" : "UploadChunk";
  HttpResponse response;
  ClientError<TransferError::Value> err = Send(&request, operation, &response);
  if (!CX::Client::IsGoodTransferError(err)) {
    return MakeFailedResult(descriptor.GetIndex(), err);
  }

  // the service echoes the digest it computed over the received bytes
  if (m_validateContent && response.HasHeader(CX::Client::Http::CONTENT_MD5)) {
    string remoteMD5 = response.GetHeader(CX::Client::Http::CONTENT_MD5);
    if (remoteMD5 != localMD5) {
      return MakeFailedResult(descriptor.GetIndex(),
                              IntegrityError(operation, localMD5, remoteMD5));
    }
  }

  ChunkResult result(descriptor.GetIndex());
  result.SetBytesTransferred(length);
  SetResultMetadata(response, &result);
  OnChunkTransferred(result);
  return result;
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::DownloadChunk(
    const ChunkDescriptor &descriptor, TransferSink *sink, uint64_t rangeBegin,
    const Buffer &buffer) const {
  HttpRequest request;
  if (descriptor.IsEmpty()) {
    m_endpoint->BuildFullDownloadRequest(&request);
  } else {
    m_endpoint->BuildDownloadRequest(descriptor.GetStartOffset(),
                                     descriptor.GetEndOffsetInclusive(),
                                     m_validateContent, &request);
  }

  HttpResponse response;
  ClientError<TransferError::Value> err =
      Send(&request, "DownloadChunk", &response);
  if (!CX::Client::IsGoodTransferError(err)) {
    return MakeFailedResult(descriptor.GetIndex(), err);
  }
  return ReceiveChunk(descriptor, response, sink, rangeBegin, buffer);
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::ReceiveChunk(
    const ChunkDescriptor &descriptor, const HttpResponse &response,
    TransferSink *sink, uint64_t rangeBegin, const Buffer &buffer) const {
  if (sink == NULL) {
    return MakeFailedResult(
        descriptor.GetIndex(),
        ClientError<TransferError::Value>(TransferError::CONFIGURATION_ERROR,
                                          "DownloadChunk", "Null sink", false));
  }

  size_t length = static_cast<size_t>(descriptor.GetLength());
  Buffer chunkBuffer = EnsureBuffer(buffer, length);
  size_t received = 0;
  bool overflow = false;
  const shared_ptr<std::iostream> &body = response.GetBody();
  if (body) {
    if (length > 0) {
      body->read(BufferData(chunkBuffer), length);
      received = static_cast<size_t>(body->gcount());
    }
    overflow = body->good() &&
               body->peek() != std::char_traits<char>::eof();
  }
  if (received != length || overflow) {
    return MakeFailedResult(
        descriptor.GetIndex(),
        ClientError<TransferError::Value>(
            TransferError::UNEXPECTED_RESPONSE, "DownloadChunk",
            "Expect " + to_string(length) + " bytes in response body, got " +
                (overflow ? string("more") : to_string(received)),
            false));
  }

  if (m_validateContent) {
    if (response.HasHeader(CX::Client::Http::CONTENT_MD5)) {
      string remoteMD5 = response.GetHeader(CX::Client::Http::CONTENT_MD5);
      string localMD5 = ComputeContentMD5(BufferData(chunkBuffer), length);
      if (remoteMD5 != localMD5) {
        return MakeFailedResult(
            descriptor.GetIndex(),
            IntegrityError("DownloadChunk", remoteMD5, localMD5));
      }
    } else {
      DebugInfo("No Content-MD5 in response, skip validating "
                << FormatChunk(descriptor.GetIndex()));
    }
  }

  if (length > 0 &&
      !sink->WriteAt(descriptor.GetStartOffset() - rangeBegin,
                     BufferData(chunkBuffer), length)) {
    return MakeFailedResult(
        descriptor.GetIndex(),
        ClientError<TransferError::Value>(
            TransferError::UNKNOWN, "DownloadChunk",
            "Sink rejected " + to_string(length) + " bytes at offset " +
                to_string(descriptor.GetStartOffset() - rangeBegin),
            false));
  }

  ChunkResult result(descriptor.GetIndex());
  result.SetBytesTransferred(length);
  SetResultMetadata(response, &result);
  OnChunkTransferred(result);
  return result;
}

// --------------------------------------------------------------------------
ChunkResult ChunkTransferWorker::MakeFailedResult(
    uint32_t index, const ClientError<TransferError::Value> &err) const {
  ClientError<TransferError::Value> error = err;
  error.AppendContext(FormatChunk(index));
  ChunkResult result(index);
  result.SetError(error);
  return result;
}

// --------------------------------------------------------------------------
void ChunkTransferWorker::OnChunkTransferred(const ChunkResult &result) const {
  if (m_handle != NULL) {
    m_handle->UpdateBytesTransferred(result.GetBytesTransferred());
  }
}

}  // namespace Transfer
}  // namespace CX
