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

#ifndef CHUNKXFER_TRANSFER_TRANSFERHANDLE_H_
#define CHUNKXFER_TRANSFER_TRANSFERHANDLE_H_

#include <stdint.h>  // for uint32_t uint64_t
#include <time.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ClientError.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Transfer {

class ChunkResult {
 public:
  explicit ChunkResult(uint32_t index = 0);

  ~ChunkResult() {}

 public:
  std::string ToString() const;
  // accessor
  uint32_t GetIndex() const { return m_index; }
  uint64_t GetBytesTransferred() const { return m_bytesTransferred; }
  const boost::optional<std::string> &GetETag() const { return m_eTag; }
  const boost::optional<time_t> &GetLastModified() const {
    return m_lastModified;
  }
  const CX::Client::ClientError<CX::Client::TransferError::Value> &GetError()
      const {
    return m_error;
  }
  bool IsSuccess() const;

  // mutator
  void SetBytesTransferred(uint64_t bytes) { m_bytesTransferred = bytes; }
  void SetETag(const std::string &etag) { m_eTag = etag; }
  void SetLastModified(time_t lastModified) { m_lastModified = lastModified; }
  void SetError(
      const CX::Client::ClientError<CX::Client::TransferError::Value> &err) {
    m_error = err;
  }

 private:
  uint32_t m_index;
  uint64_t m_bytesTransferred;
  boost::optional<std::string> m_eTag;
  boost::optional<time_t> m_lastModified;
  CX::Client::ClientError<CX::Client::TransferError::Value> m_error;
};

typedef std::map<uint32_t, ChunkResult> IndexToChunkResultMap;

// Pick the chunk reporting the newest modification time, the greater index
// wins a tie. Failed chunks and chunks without a time are ignored.
//
// @param  : results
// @return : winning result, none if no result carries a time
boost::optional<ChunkResult> SelectLatestModified(
    const std::vector<ChunkResult> &results);

struct TransferStatus {
  enum Value {
    NotStarted,  // no chunk has been dispatched yet
    InProgress,  // chunks are being dispatched
    Failed,      // stopped on the first chunk error
    Completed    // every chunk was transferred
  };
};

std::string GetTransferStatusName(TransferStatus::Value status);

struct TransferDirection {
  enum Value { Upload, Download };
};

std::string GetTransferDirectionName(TransferDirection::Value direction);

// Called with (bytes transferred so far, total bytes if known). Reports are
// serialized and run outside the progress lock, so the callback may query
// the handle.
typedef boost::function<void(uint64_t, const boost::optional<uint64_t> &)>
    ProgressCallback;

//
// TransferHandle
//
// Shared state of one transfer call: chunks in flight, results by index,
// progress and the first error. Workers and the coordinator update it
// from several threads.
//
class TransferHandle : private boost::noncopyable {
 public:
  TransferHandle(TransferDirection::Value direction,
                 const std::string &resourceUrl,
                 const boost::optional<uint64_t> &totalBytes = boost::none);

  ~TransferHandle() {}

 public:
  TransferDirection::Value GetDirection() const { return m_direction; }
  const std::string &GetResourceUrl() const { return m_resourceUrl; }

  TransferStatus::Value GetStatus() const;
  // A failed handle keeps its status, a completed one may still fail in a
  // later step such as committing the chunks
  void UpdateStatus(TransferStatus::Value status);
  bool IsFinished() const;

  bool ShouldContinue() const;
  // Stop issuing new chunks, in flight chunks still finish
  void Cancel();

  // Record the first error and cancel, later errors are dropped
  //
  // @param  : error
  // @return : true if this error became the error of the transfer
  bool SetError(
      const CX::Client::ClientError<CX::Client::TransferError::Value> &error);
  bool HasError() const;
  CX::Client::ClientError<CX::Client::TransferError::Value> GetError() const;

  // chunk bookkeeping
  void AddPendingChunk(uint32_t index);
  void ChangeChunkToCompleted(const ChunkResult &result);
  void ChangeChunkToFailed(const ChunkResult &result);
  bool HasPendingChunks() const;
  size_t GetPendingChunkCount() const;
  size_t GetCompletedChunkCount() const;
  // Completed results in ascending index order
  std::vector<ChunkResult> GetOrderedResults() const;
  // Block until no chunk is in flight
  void WaitForPendingChunks() const;

  // progress
  uint64_t GetBytesTransferred() const;
  boost::optional<uint64_t> GetTotalBytes() const;
  void SetTotalBytes(uint64_t totalBytes);
  void SetProgressCallback(const ProgressCallback &callback);
  // Add transferred bytes and report progress, reports are serialized
  void UpdateBytesTransferred(uint64_t amount);

 private:
  TransferHandle() {}

  bool NoPendingChunks() const { return m_pendingChunks.empty(); }

 private:
  TransferDirection::Value m_direction;
  std::string m_resourceUrl;

  std::set<uint32_t> m_pendingChunks;
  IndexToChunkResultMap m_completedChunks;
  IndexToChunkResultMap m_failedChunks;
  mutable boost::mutex m_chunksLock;
  mutable boost::condition_variable m_chunksCond;

  uint64_t m_bytesTransferred;
  boost::optional<uint64_t> m_totalBytes;
  ProgressCallback m_progressCallback;
  mutable boost::mutex m_progressLock;
  boost::mutex m_reportLock;  // serializes progress callbacks

  bool m_cancel;
  mutable boost::mutex m_cancelLock;

  TransferStatus::Value m_status;
  mutable boost::mutex m_statusLock;

  CX::Client::ClientError<CX::Client::TransferError::Value> m_error;
  bool m_hasError;
  mutable boost::mutex m_errorLock;
};

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_TRANSFERHANDLE_H_
