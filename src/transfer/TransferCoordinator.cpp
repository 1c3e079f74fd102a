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

#include "transfer/TransferCoordinator.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/TimeUtils.h"
#include "data/ResourceManager.h"

namespace CX {

namespace Transfer {

using boost::to_string;
using CX::Client::ClientError;
using CX::Client::TransferError;
using CX::Data::Buffer;
using CX::Data::ForwardOnlyStreamSource;
using CX::Data::ResourceManager;
using CX::StringUtils::FormatChunk;
using CX::Threading::ThreadPool;
using CX::TimeUtils::GetElapsedMilliseconds;
using CX::TimeUtils::GetMonotonicMilliseconds;
using std::vector;

namespace {

bool IsTimedOut(uint64_t startInMs, uint64_t timeoutInMs) {
  return timeoutInMs > 0 && GetElapsedMilliseconds(startInMs) > timeoutInMs;
}

ClientError<TransferError::Value> MakeTimeoutError(uint64_t timeoutInMs,
                                                   uint32_t index) {
  return ClientError<TransferError::Value>(
      TransferError::TIMEOUT, "TransferChunk",
      "Exceeded timeout of " + to_string(timeoutInMs) + " ms " +
          FormatChunk(index),
      false);
}

// Completion of a chunk dispatched to the thread pool
struct ChunkReceivedHandler {
  TransferHandle *m_handle;
  ResourceManager *m_resourceManager;
  Buffer m_buffer;
  uint64_t m_startInMs;
  uint64_t m_timeoutInMs;

  ChunkReceivedHandler(TransferHandle *handle,
                       ResourceManager *resourceManager, const Buffer &buffer,
                       uint64_t startInMs, uint64_t timeoutInMs)
      : m_handle(handle),
        m_resourceManager(resourceManager),
        m_buffer(buffer),
        m_startInMs(startInMs),
        m_timeoutInMs(timeoutInMs) {}

  void operator()(const ChunkResult &result) {
    RecordChunkResult(result, m_startInMs, m_timeoutInMs, m_handle);
    m_resourceManager->Release(m_buffer);
  }
};

}  // namespace

// --------------------------------------------------------------------------
void RecordChunkResult(const ChunkResult &result, uint64_t startInMs,
                       uint64_t timeoutInMs, TransferHandle *handle) {
  ChunkResult res = result;
  if (res.IsSuccess() && IsTimedOut(startInMs, timeoutInMs)) {
    res.SetError(MakeTimeoutError(timeoutInMs, res.GetIndex()));
  }

  if (res.IsSuccess()) {
    handle->ChangeChunkToCompleted(res);
    return;
  }

  bool first = handle->SetError(res.GetError());
  if (first) {
    Error("Stop dispatching " << handle->GetResourceUrl() << " on "
                              << CX::Client::GetMessageForTransferError(
                                     res.GetError()));
  } else {
    DebugWarning("Drop error after the first one "
                 << CX::Client::GetMessageForTransferError(res.GetError()));
  }
  handle->ChangeChunkToFailed(res);
}

// --------------------------------------------------------------------------
TransferCoordinator::TransferCoordinator(uint32_t maxConcurrency,
                                         uint64_t timeoutInMs)
    : m_maxConcurrency(maxConcurrency), m_timeoutInMs(timeoutInMs) {}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TransferCoordinator::CheckConcurrency(
    uint32_t maxConcurrency, bool randomAccess) {
  if (maxConcurrency == 0) {
    return ClientError<TransferError::Value>(
        TransferError::CONFIGURATION_ERROR, "CheckConcurrency",
        "Max concurrency must be greater than zero", false);
  }
  if (maxConcurrency > 1 && !randomAccess) {
    return ClientError<TransferError::Value>(
        TransferError::CONFIGURATION_ERROR, "CheckConcurrency",
        "Max concurrency " + to_string(maxConcurrency) +
            " requires a seekable stream, use 1 for forward-only streams",
        false);
  }
  return ClientError<TransferError::Value>(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
ChunkResultsOutcome TransferCoordinator::Execute(
    const vector<ChunkDescriptor> &descriptors, const ChunkTask &task,
    TransferHandle *handle) const {
  ClientError<TransferError::Value> err =
      CheckConcurrency(m_maxConcurrency, true);
  if (!CX::Client::IsGoodTransferError(err)) {
    return ChunkResultsOutcome(err);
  }

  uint64_t bufferSize = 0;
  BOOST_FOREACH(const ChunkDescriptor &descriptor, descriptors) {
    bufferSize = std::max(bufferSize, descriptor.GetLength());
  }

  uint64_t startInMs = GetMonotonicMilliseconds();
  handle->UpdateStatus(TransferStatus::InProgress);
  if (m_maxConcurrency == 1 || descriptors.size() <= 1) {
    return ExecuteSequentially(descriptors, bufferSize, task, startInMs,
                               handle);
  }
  return ExecuteConcurrently(descriptors, bufferSize, task, startInMs, handle);
}

// --------------------------------------------------------------------------
bool TransferCoordinator::CheckBeforeDispatch(const ChunkDescriptor &descriptor,
                                              uint64_t startInMs,
                                              TransferHandle *handle) const {
  if (!handle->ShouldContinue()) {
    DebugInfo("Skip " << descriptor.ToString() << " after a failed chunk");
    return false;
  }
  if (IsTimedOut(startInMs, m_timeoutInMs)) {
    handle->SetError(MakeTimeoutError(m_timeoutInMs, descriptor.GetIndex()));
    Warning("Timeout before dispatching " << descriptor.ToString() << " of "
                                          << handle->GetResourceUrl());
    return false;
  }
  return true;
}

// --------------------------------------------------------------------------
ChunkResultsOutcome TransferCoordinator::ExecuteSequentially(
    const vector<ChunkDescriptor> &descriptors, uint64_t bufferSize,
    const ChunkTask &task, uint64_t startInMs, TransferHandle *handle) const {
  Buffer buffer =
      boost::make_shared<vector<char> >(static_cast<size_t>(bufferSize));
  BOOST_FOREACH(const ChunkDescriptor &descriptor, descriptors) {
    if (!CheckBeforeDispatch(descriptor, startInMs, handle)) {
      break;
    }
    handle->AddPendingChunk(descriptor.GetIndex());
    RecordChunkResult(task(descriptor, buffer), startInMs, m_timeoutInMs,
                      handle);
  }
  return Finish(handle);
}

// --------------------------------------------------------------------------
ChunkResultsOutcome TransferCoordinator::ExecuteConcurrently(
    const vector<ChunkDescriptor> &descriptors, uint64_t bufferSize,
    const ChunkTask &task, uint64_t startInMs, TransferHandle *handle) const {
  size_t poolSize = std::min(static_cast<size_t>(m_maxConcurrency),
                             descriptors.size());
  // the thread pool is declared last so its workers are joined before the
  // buffers they release go away
  ResourceManager resourceManager(poolSize, static_cast<size_t>(bufferSize));
  ThreadPool threadPool(poolSize);

  BOOST_FOREACH(const ChunkDescriptor &descriptor, descriptors) {
    if (!CheckBeforeDispatch(descriptor, startInMs, handle)) {
      break;
    }
    // blocks while maxConcurrency chunks are in flight
    Buffer buffer = resourceManager.Acquire();
    if (!buffer) {
      break;
    }
    if (!CheckBeforeDispatch(descriptor, startInMs, handle)) {
      resourceManager.Release(buffer);
      break;
    }
    handle->AddPendingChunk(descriptor.GetIndex());
    threadPool.SubmitAsync(
        ChunkReceivedHandler(handle, &resourceManager, buffer, startInMs,
                             m_timeoutInMs),
        task, descriptor, buffer);
  }

  handle->WaitForPendingChunks();
  resourceManager.ShutdownAndWait();
  return Finish(handle);
}

// --------------------------------------------------------------------------
ChunkResultsOutcome TransferCoordinator::ExecuteStreaming(
    ForwardOnlyStreamSource *source, StreamingPartitioner *partitioner,
    const ChunkTask &task, TransferHandle *handle) const {
  ClientError<TransferError::Value> err =
      CheckConcurrency(m_maxConcurrency, false);
  if (!CX::Client::IsGoodTransferError(err)) {
    return ChunkResultsOutcome(err);
  }
  if (partitioner->GetChunkSize() == 0) {
    return ChunkResultsOutcome(ClientError<TransferError::Value>(
        TransferError::CONFIGURATION_ERROR, "ExecuteStreaming",
        "Chunk size must be greater than zero", false));
  }

  uint64_t startInMs = GetMonotonicMilliseconds();
  handle->UpdateStatus(TransferStatus::InProgress);

  size_t chunkSize = static_cast<size_t>(partitioner->GetChunkSize());
  Buffer buffer = boost::make_shared<vector<char> >(chunkSize);
  uint32_t firstIndex = partitioner->GetNextIndex();
  while (!partitioner->IsFinished()) {
    ChunkDescriptor next(partitioner->GetNextIndex(),
                         partitioner->GetNextOffset(), 0, false);
    if (!CheckBeforeDispatch(next, startInMs, handle)) {
      break;
    }

    size_t filled = source->ReadNext(chunkSize, &(*buffer)[0]);
    bool endOfSource = filled < chunkSize || source->IsExhausted();
    ChunkDescriptor descriptor = partitioner->Describe(filled, endOfSource);
    // an empty chunk is only sent for an empty source
    if (descriptor.IsEmpty() && descriptor.GetIndex() != firstIndex) {
      break;
    }

    handle->AddPendingChunk(descriptor.GetIndex());
    RecordChunkResult(task(descriptor, buffer), startInMs, m_timeoutInMs,
                      handle);
  }

  if (!handle->HasError()) {
    handle->SetTotalBytes(partitioner->GetNextOffset());
  }
  return Finish(handle);
}

// --------------------------------------------------------------------------
ChunkResultsOutcome TransferCoordinator::Finish(TransferHandle *handle) const {
  if (handle->HasError()) {
    handle->UpdateStatus(TransferStatus::Failed);
    return ChunkResultsOutcome(handle->GetError());
  }
  handle->UpdateStatus(TransferStatus::Completed);
  return ChunkResultsOutcome(handle->GetOrderedResults());
}

}  // namespace Transfer
}  // namespace CX
