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

#include "transfer/TransferHandle.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace CX {

namespace Transfer {

using boost::lock_guard;
using boost::mutex;
using boost::optional;
using boost::to_string;
using boost::unique_lock;
using CX::Client::ClientError;
using CX::Client::TransferError;
using std::string;
using std::vector;

namespace {

bool IsFinishedStatus(TransferStatus::Value status) {
  return status == TransferStatus::Failed ||
         status == TransferStatus::Completed;
}

}  // namespace

// --------------------------------------------------------------------------
ChunkResult::ChunkResult(uint32_t index)
    : m_index(index),
      m_bytesTransferred(0),
      m_error(TransferError::GOOD, false) {}

// --------------------------------------------------------------------------
bool ChunkResult::IsSuccess() const {
  return CX::Client::IsGoodTransferError(m_error);
}

// --------------------------------------------------------------------------
string ChunkResult::ToString() const {
  string str = "[chunk=" + to_string(m_index) +
               ", bytes: " + to_string(m_bytesTransferred);
  if (m_eTag) {
    str += ", etag: " + *m_eTag;
  }
  if (m_lastModified) {
    str += ", last modified: " + to_string(*m_lastModified);
  }
  if (!IsSuccess()) {
    str += ", error: " + CX::Client::GetMessageForTransferError(m_error);
  }
  return str + "]";
}

// --------------------------------------------------------------------------
optional<ChunkResult> SelectLatestModified(const vector<ChunkResult> &results) {
  optional<ChunkResult> winner;
  BOOST_FOREACH(const ChunkResult &result, results) {
    if (!result.IsSuccess() || !result.GetLastModified()) {
      continue;
    }
    if (!winner) {
      winner = result;
      continue;
    }
    time_t current = *winner->GetLastModified();
    time_t candidate = *result.GetLastModified();
    if (candidate > current ||
        (candidate == current && result.GetIndex() > winner->GetIndex())) {
      winner = result;
    }
  }
  return winner;
}

// --------------------------------------------------------------------------
string GetTransferStatusName(TransferStatus::Value status) {
  switch (status) {
    case TransferStatus::NotStarted:
      return "NotStarted";
    case TransferStatus::InProgress:
      return "InProgress";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Completed:
      return "Completed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string GetTransferDirectionName(TransferDirection::Value direction) {
  return direction == TransferDirection::Upload ? "Upload" : "Download";
}

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(TransferDirection::Value direction,
                               const string &resourceUrl,
                               const optional<uint64_t> &totalBytes)
    : m_direction(direction),
      m_resourceUrl(resourceUrl),
      m_bytesTransferred(0),
      m_totalBytes(totalBytes),
      m_cancel(false),
      m_status(TransferStatus::NotStarted),
      m_error(TransferError::GOOD, false),
      m_hasError(false) {}

// --------------------------------------------------------------------------
TransferStatus::Value TransferHandle::GetStatus() const {
  lock_guard<mutex> locker(m_statusLock);
  return m_status;
}

// --------------------------------------------------------------------------
void TransferHandle::UpdateStatus(TransferStatus::Value status) {
  lock_guard<mutex> locker(m_statusLock);
  if (m_status == TransferStatus::Failed) {
    DebugWarning("Ignore status change from " +
                 GetTransferStatusName(m_status) + " to " +
                 GetTransferStatusName(status) + " on " + m_resourceUrl);
    return;
  }
  m_status = status;
}

// --------------------------------------------------------------------------
bool TransferHandle::IsFinished() const {
  return IsFinishedStatus(GetStatus());
}

// --------------------------------------------------------------------------
bool TransferHandle::ShouldContinue() const {
  lock_guard<mutex> locker(m_cancelLock);
  return !m_cancel;
}

// --------------------------------------------------------------------------
void TransferHandle::Cancel() {
  lock_guard<mutex> locker(m_cancelLock);
  m_cancel = true;
}

// --------------------------------------------------------------------------
bool TransferHandle::SetError(const ClientError<TransferError::Value> &error) {
  {
    lock_guard<mutex> locker(m_errorLock);
    if (m_hasError) {
      DebugInfo("Discard error after the first one: " +
                CX::Client::GetMessageForTransferError(error));
      return false;
    }
    m_error = error;
    m_hasError = true;
  }
  Cancel();
  return true;
}

// --------------------------------------------------------------------------
bool TransferHandle::HasError() const {
  lock_guard<mutex> locker(m_errorLock);
  return m_hasError;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TransferHandle::GetError() const {
  lock_guard<mutex> locker(m_errorLock);
  return m_error;
}

// --------------------------------------------------------------------------
void TransferHandle::AddPendingChunk(uint32_t index) {
  lock_guard<mutex> locker(m_chunksLock);
  m_pendingChunks.insert(index);
}

// --------------------------------------------------------------------------
void TransferHandle::ChangeChunkToCompleted(const ChunkResult &result) {
  {
    lock_guard<mutex> locker(m_chunksLock);
    m_pendingChunks.erase(result.GetIndex());
    m_failedChunks.erase(result.GetIndex());
    m_completedChunks[result.GetIndex()] = result;
  }
  m_chunksCond.notify_all();
}

// --------------------------------------------------------------------------
void TransferHandle::ChangeChunkToFailed(const ChunkResult &result) {
  {
    lock_guard<mutex> locker(m_chunksLock);
    m_pendingChunks.erase(result.GetIndex());
    m_failedChunks[result.GetIndex()] = result;
  }
  m_chunksCond.notify_all();
}

// --------------------------------------------------------------------------
bool TransferHandle::HasPendingChunks() const {
  lock_guard<mutex> locker(m_chunksLock);
  return !m_pendingChunks.empty();
}

// --------------------------------------------------------------------------
size_t TransferHandle::GetPendingChunkCount() const {
  lock_guard<mutex> locker(m_chunksLock);
  return m_pendingChunks.size();
}

// --------------------------------------------------------------------------
size_t TransferHandle::GetCompletedChunkCount() const {
  lock_guard<mutex> locker(m_chunksLock);
  return m_completedChunks.size();
}

// --------------------------------------------------------------------------
vector<ChunkResult> TransferHandle::GetOrderedResults() const {
  lock_guard<mutex> locker(m_chunksLock);
  vector<ChunkResult> results;
  results.reserve(m_completedChunks.size());
  // std::map iterates in ascending key order
  BOOST_FOREACH(const IndexToChunkResultMap::value_type &p, m_completedChunks) {
    results.push_back(p.second);
  }
  return results;
}

// --------------------------------------------------------------------------
void TransferHandle::WaitForPendingChunks() const {
  unique_lock<mutex> lock(m_chunksLock);
  while (!NoPendingChunks()) {
    m_chunksCond.wait(lock);
  }
}

// --------------------------------------------------------------------------
uint64_t TransferHandle::GetBytesTransferred() const {
  lock_guard<mutex> locker(m_progressLock);
  return m_bytesTransferred;
}

// --------------------------------------------------------------------------
optional<uint64_t> TransferHandle::GetTotalBytes() const {
  lock_guard<mutex> locker(m_progressLock);
  return m_totalBytes;
}

// --------------------------------------------------------------------------
void TransferHandle::SetTotalBytes(uint64_t totalBytes) {
  lock_guard<mutex> locker(m_progressLock);
  m_totalBytes = totalBytes;
}

// --------------------------------------------------------------------------
void TransferHandle::SetProgressCallback(const ProgressCallback &callback) {
  lock_guard<mutex> locker(m_progressLock);
  m_progressCallback = callback;
}

// --------------------------------------------------------------------------
void TransferHandle::UpdateBytesTransferred(uint64_t amount) {
  // held across the update and the report, so callbacks see increasing
  // values in order
  lock_guard<mutex> reportLocker(m_reportLock);
  uint64_t bytesTransferred = 0;
  optional<uint64_t> totalBytes;
  ProgressCallback callback;
  {
    lock_guard<mutex> locker(m_progressLock);
    m_bytesTransferred += amount;
    bytesTransferred = m_bytesTransferred;
    totalBytes = m_totalBytes;
    callback = m_progressCallback;
  }
  if (callback) {
    callback(bytesTransferred, totalBytes);
  }
}

}  // namespace Transfer
}  // namespace CX
