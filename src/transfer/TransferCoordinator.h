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

#ifndef CHUNKXFER_TRANSFER_TRANSFERCOORDINATOR_H_
#define CHUNKXFER_TRANSFER_TRANSFERCOORDINATOR_H_

#include <stdint.h>

#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "data/StreamBuf.h"
#include "data/TransferSource.h"
#include "transfer/RangePartitioner.h"
#include "transfer/TransferHandle.h"

namespace CX {

namespace Transfer {

// Moves one chunk using the given chunk buffer
typedef boost::function<ChunkResult(const ChunkDescriptor &,
                                    const CX::Data::Buffer &)>
    ChunkTask;

typedef CX::Client::Outcome<
    std::vector<ChunkResult>,
    CX::Client::ClientError<CX::Client::TransferError::Value> >
    ChunkResultsOutcome;

//
// TransferCoordinator
//
// Dispatches chunk tasks in ascending index order with at most
// maxConcurrency of them in flight, one pooled buffer per chunk in flight.
// A concurrency of one runs every chunk on the calling thread.
//
// The first failed chunk stops the dispatch, chunks already in flight are
// waited for and their errors dropped. A timeout is a wall clock budget
// checked before each dispatch and again when a chunk completes.
//
class TransferCoordinator : private boost::noncopyable {
 public:
  // @param  : max chunks in flight, timeout in milliseconds (0 for none)
  explicit TransferCoordinator(uint32_t maxConcurrency,
                               uint64_t timeoutInMs = 0);

  ~TransferCoordinator() {}

 public:
  uint32_t GetMaxConcurrency() const { return m_maxConcurrency; }
  uint64_t GetTimeout() const { return m_timeoutInMs; }

  // Check a concurrency setting against the data it is applied to
  //
  // @param  : max concurrency, whether the source or sink is random access
  // @return : GOOD, or CONFIGURATION_ERROR for zero, or for more than one
  //           on a source or sink without random access
  static CX::Client::ClientError<CX::Client::TransferError::Value>
  CheckConcurrency(uint32_t maxConcurrency, bool randomAccess);

  // Run the task for every chunk
  //
  // @param  : chunks in ascending index order, task, handle of the transfer
  // @return : results in ascending index order, or the first error
  ChunkResultsOutcome Execute(const std::vector<ChunkDescriptor> &descriptors,
                              const ChunkTask &task,
                              TransferHandle *handle) const;

  // Run the task over a forward-only source of unknown length, chunks are
  // filled from the source one after another on the calling thread
  //
  // @param  : source, partitioner, task, handle of the transfer
  // @return : results in ascending index order, or the first error
  ChunkResultsOutcome ExecuteStreaming(CX::Data::ForwardOnlyStreamSource *source,
                                       StreamingPartitioner *partitioner,
                                       const ChunkTask &task,
                                       TransferHandle *handle) const;

 private:
  bool CheckBeforeDispatch(const ChunkDescriptor &descriptor,
                           uint64_t startInMs, TransferHandle *handle) const;
  ChunkResultsOutcome ExecuteSequentially(
      const std::vector<ChunkDescriptor> &descriptors, uint64_t bufferSize,
      const ChunkTask &task, uint64_t startInMs, TransferHandle *handle) const;
  ChunkResultsOutcome ExecuteConcurrently(
      const std::vector<ChunkDescriptor> &descriptors, uint64_t bufferSize,
      const ChunkTask &task, uint64_t startInMs, TransferHandle *handle) const;
  ChunkResultsOutcome Finish(TransferHandle *handle) const;

 private:
  uint32_t m_maxConcurrency;
  uint64_t m_timeoutInMs;
};

// Record a finished chunk on the handle, a chunk completing after the
// timeout budget is turned into a TIMEOUT error
void RecordChunkResult(const ChunkResult &result, uint64_t startInMs,
                       uint64_t timeoutInMs, TransferHandle *handle);

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_TRANSFERCOORDINATOR_H_
