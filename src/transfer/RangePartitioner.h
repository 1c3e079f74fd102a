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

#ifndef CHUNKXFER_TRANSFER_RANGEPARTITIONER_H_
#define CHUNKXFER_TRANSFER_RANGEPARTITIONER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/optional.hpp"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Transfer {

//
// TransferPlan
//
// How one transfer call splits its range. Offsets of the produced chunks
// start at rangeBegin and indexes at firstIndex, a download planning the
// bytes after its first request uses both.
//
struct TransferPlan {
  TransferPlan(const boost::optional<uint64_t> &totalSize, uint64_t chunkSize,
               uint64_t singleShotThreshold, uint64_t rangeBegin = 0,
               uint32_t firstIndex = 0)
      : m_totalSize(totalSize),
        m_chunkSize(chunkSize),
        m_singleShotThreshold(singleShotThreshold),
        m_rangeBegin(rangeBegin),
        m_firstIndex(firstIndex) {}

  boost::optional<uint64_t> m_totalSize;  // unknown for streamed sources
  uint64_t m_chunkSize;
  uint64_t m_singleShotThreshold;
  uint64_t m_rangeBegin;
  uint32_t m_firstIndex;
};

class ChunkDescriptor {
 public:
  ChunkDescriptor()
      : m_index(0), m_startOffset(0), m_length(0), m_isFinal(false) {}
  ChunkDescriptor(uint32_t index, uint64_t startOffset, uint64_t length,
                  bool isFinal)
      : m_index(index),
        m_startOffset(startOffset),
        m_length(length),
        m_isFinal(isFinal) {}

 public:
  uint32_t GetIndex() const { return m_index; }
  uint64_t GetStartOffset() const { return m_startOffset; }
  uint64_t GetLength() const { return m_length; }
  bool IsFinal() const { return m_isFinal; }
  bool IsEmpty() const { return m_length == 0; }

  // Inclusive end offset, only meaningful for a non-empty chunk
  uint64_t GetEndOffsetInclusive() const { return m_startOffset + m_length - 1; }

  std::string ToString() const;

  bool operator==(const ChunkDescriptor &rhs) const {
    return m_index == rhs.m_index && m_startOffset == rhs.m_startOffset &&
           m_length == rhs.m_length && m_isFinal == rhs.m_isFinal;
  }
  bool operator!=(const ChunkDescriptor &rhs) const { return !(*this == rhs); }

 private:
  uint32_t m_index;
  uint64_t m_startOffset;
  uint64_t m_length;
  bool m_isFinal;
};

typedef CX::Client::Outcome<std::vector<ChunkDescriptor>,
                            CX::Client::ClientError<
                                CX::Client::TransferError::Value> >
    PlanOutcome;

// Check plan settings
//
// @param  : plan
// @return : GOOD, or CONFIGURATION_ERROR when chunk size is zero
CX::Client::ClientError<CX::Client::TransferError::Value> ValidatePlan(
    const TransferPlan &plan);

// Split a range of known size into chunks
//
// @param  : plan
// @return : chunk descriptors in ascending index order
//
// A size up to the single shot threshold gives one chunk of the whole
// range, a zero size gives one empty chunk. Otherwise the range is cut in
// ceil(size / chunk size) chunks, the last one holding the remainder.
// Unknown size is a CONFIGURATION_ERROR, see StreamingPartitioner.
PlanOutcome PlanChunks(const TransferPlan &plan);

//
// StreamingPartitioner
//
// Describes chunks of a source of unknown length one at a time. The caller
// fills a buffer of chunk size, then reports how many bytes it got and
// whether the source is exhausted. A short fill marks the chunk final.
//
class StreamingPartitioner {
 public:
  explicit StreamingPartitioner(uint64_t chunkSize, uint64_t rangeBegin = 0,
                                uint32_t firstIndex = 0)
      : m_chunkSize(chunkSize),
        m_nextOffset(rangeBegin),
        m_nextIndex(firstIndex),
        m_finished(false) {}

 public:
  uint64_t GetChunkSize() const { return m_chunkSize; }
  uint64_t GetNextOffset() const { return m_nextOffset; }
  uint32_t GetNextIndex() const { return m_nextIndex; }
  bool IsFinished() const { return m_finished; }

  // Describe the chunk just filled from the source
  //
  // @param  : bytes filled, whether the source has no more data
  // @return : descriptor of the filled chunk
  ChunkDescriptor Describe(uint64_t bytesFilled, bool endOfSource);

 private:
  uint64_t m_chunkSize;
  uint64_t m_nextOffset;
  uint32_t m_nextIndex;
  bool m_finished;
};

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_RANGEPARTITIONER_H_
