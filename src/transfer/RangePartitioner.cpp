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

#include "transfer/RangePartitioner.h"

#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "base/LogMacros.h"

namespace CX {

namespace Transfer {

using CX::Client::ClientError;
using CX::Client::TransferError;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ChunkDescriptor::ToString() const {
  std::stringstream ss;
  ss << "[chunk=" << m_index << " start=" << m_startOffset
     << " length=" << m_length;
  if (m_isFinal) {
    ss << " final";
  }
  ss << "]";
  return ss.str();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> ValidatePlan(const TransferPlan &plan) {
  if (plan.m_chunkSize == 0) {
    return ClientError<TransferError::Value>(
        TransferError::CONFIGURATION_ERROR, "PlanChunks",
        "Chunk size must be greater than zero", false);
  }
  return ClientError<TransferError::Value>(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
PlanOutcome PlanChunks(const TransferPlan &plan) {
  ClientError<TransferError::Value> err = ValidatePlan(plan);
  if (!CX::Client::IsGoodTransferError(err)) {
    return PlanOutcome(err);
  }
  if (!plan.m_totalSize) {
    return PlanOutcome(ClientError<TransferError::Value>(
        TransferError::CONFIGURATION_ERROR, "PlanChunks",
        "Unable to plan a range of unknown size up front", false));
  }

  uint64_t totalSize = *plan.m_totalSize;
  vector<ChunkDescriptor> descriptors;
  if (totalSize <= plan.m_singleShotThreshold || totalSize == 0) {
    descriptors.push_back(
        ChunkDescriptor(plan.m_firstIndex, plan.m_rangeBegin, totalSize, true));
    return PlanOutcome(descriptors);
  }

  uint64_t count = totalSize / plan.m_chunkSize;
  uint64_t remainder = totalSize % plan.m_chunkSize;
  if (remainder > 0) {
    ++count;
  }
  descriptors.reserve(count);

  uint64_t offset = 0;
  for (uint64_t i = 0; i < count; ++i) {
    bool isFinal = (i + 1 == count);
    uint64_t length = (isFinal && remainder > 0) ? remainder : plan.m_chunkSize;
    descriptors.push_back(
        ChunkDescriptor(plan.m_firstIndex + static_cast<uint32_t>(i),
                        plan.m_rangeBegin + offset, length, isFinal));
    offset += length;
  }
  return PlanOutcome(descriptors);
}

// --------------------------------------------------------------------------
ChunkDescriptor StreamingPartitioner::Describe(uint64_t bytesFilled,
                                               bool endOfSource) {
  DebugErrorIf(m_finished, "Describe chunk after the final one");
  DebugErrorIf(bytesFilled > m_chunkSize,
               "Filled " << bytesFilled << " bytes into a chunk of "
                         << m_chunkSize);
  bool isFinal = endOfSource || bytesFilled < m_chunkSize;
  ChunkDescriptor descriptor(m_nextIndex, m_nextOffset, bytesFilled, isFinal);
  ++m_nextIndex;
  m_nextOffset += bytesFilled;
  m_finished = isFinal;
  return descriptor;
}

}  // namespace Transfer
}  // namespace CX
