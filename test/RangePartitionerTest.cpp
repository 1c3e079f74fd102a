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

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/optional.hpp"
#include "gtest/gtest.h"

#include "client/TransferError.h"
#include "transfer/RangePartitioner.h"

namespace CX {

namespace Transfer {

using CX::Client::TransferError;
using std::string;
using std::vector;

vector<ChunkDescriptor> Plan(const TransferPlan &plan) {
  PlanOutcome outcome = PlanChunks(plan);
  EXPECT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  return outcome.GetResult();
}

// Ranges are contiguous, ascending and cover [begin, begin + size)
void ExpectCovers(const vector<ChunkDescriptor> &descriptors, uint64_t begin,
                  uint64_t size) {
  ASSERT_FALSE(descriptors.empty());
  uint64_t next = begin;
  for (size_t i = 0; i < descriptors.size(); ++i) {
    EXPECT_EQ(descriptors[i].GetStartOffset(), next) << i;
    EXPECT_GT(descriptors[i].GetLength(), 0u) << i;
    EXPECT_EQ(descriptors[i].IsFinal(), i + 1 == descriptors.size()) << i;
    next += descriptors[i].GetLength();
  }
  EXPECT_EQ(next, begin + size);
}

TEST(RangePartitionerTest, TwoChunksAboveThreshold) {
  vector<ChunkDescriptor> descriptors = Plan(TransferPlan(2048, 1024, 512));
  ASSERT_EQ(descriptors.size(), 2u);
  EXPECT_EQ(descriptors[0], ChunkDescriptor(0, 0, 1024, false));
  EXPECT_EQ(descriptors[0].GetEndOffsetInclusive(), 1023u);
  EXPECT_EQ(descriptors[1], ChunkDescriptor(1, 1024, 1024, true));
  EXPECT_EQ(descriptors[1].GetEndOffsetInclusive(), 2047u);
}

TEST(RangePartitionerTest, SingleShotAtOrBelowThreshold) {
  uint64_t sizes[] = {1, 100, 511, 512};
  for (size_t i = 0; i < sizeof(sizes) / sizeof(sizes[0]); ++i) {
    vector<ChunkDescriptor> descriptors =
        Plan(TransferPlan(sizes[i], 64, 512));
    ASSERT_EQ(descriptors.size(), 1u) << sizes[i];
    EXPECT_EQ(descriptors[0], ChunkDescriptor(0, 0, sizes[i], true));
  }
}

TEST(RangePartitionerTest, ZeroSizeGivesOneEmptyChunk) {
  // with and without a single shot threshold
  vector<ChunkDescriptor> descriptors = Plan(TransferPlan(0, 1024, 0));
  ASSERT_EQ(descriptors.size(), 1u);
  EXPECT_TRUE(descriptors[0].IsEmpty());
  EXPECT_TRUE(descriptors[0].IsFinal());
  EXPECT_EQ(descriptors[0].GetStartOffset(), 0u);

  EXPECT_EQ(Plan(TransferPlan(0, 1024, 512)), descriptors);
}

TEST(RangePartitionerTest, RemainderInLastChunk) {
  vector<ChunkDescriptor> descriptors = Plan(TransferPlan(2500, 1024, 0));
  ASSERT_EQ(descriptors.size(), 3u);
  EXPECT_EQ(descriptors[2], ChunkDescriptor(2, 2048, 452, true));
  ExpectCovers(descriptors, 0, 2500);
}

TEST(RangePartitionerTest, CountIsCeilingAndRangesAreContiguous) {
  uint64_t chunkSizes[] = {1, 3, 7, 64, 1000};
  uint64_t totals[] = {1, 2, 63, 64, 65, 999, 1000, 1001, 4097};
  for (size_t c = 0; c < sizeof(chunkSizes) / sizeof(chunkSizes[0]); ++c) {
    for (size_t t = 0; t < sizeof(totals) / sizeof(totals[0]); ++t) {
      uint64_t chunk = chunkSizes[c];
      uint64_t total = totals[t];
      vector<ChunkDescriptor> descriptors = Plan(TransferPlan(total, chunk, 0));
      EXPECT_EQ(descriptors.size(), (total + chunk - 1) / chunk)
          << "total=" << total << " chunk=" << chunk;
      ExpectCovers(descriptors, 0, total);
    }
  }
}

TEST(RangePartitionerTest, OffsetAndFirstIndex) {
  vector<ChunkDescriptor> descriptors =
      Plan(TransferPlan(300, 128, 0, 1000, 1));
  ASSERT_EQ(descriptors.size(), 3u);
  EXPECT_EQ(descriptors[0], ChunkDescriptor(1, 1000, 128, false));
  EXPECT_EQ(descriptors[1], ChunkDescriptor(2, 1128, 128, false));
  EXPECT_EQ(descriptors[2], ChunkDescriptor(3, 1256, 44, true));
  ExpectCovers(descriptors, 1000, 300);
}

TEST(RangePartitionerTest, PlanIsIdempotent) {
  TransferPlan plan(10 * 1024 + 17, 1024, 512);
  EXPECT_EQ(Plan(plan), Plan(plan));
}

TEST(RangePartitionerTest, ZeroChunkSizeIsConfigurationError) {
  PlanOutcome outcome = PlanChunks(TransferPlan(2048, 0, 512));
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_EQ(ValidatePlan(TransferPlan(2048, 0, 512)).GetError(),
            TransferError::CONFIGURATION_ERROR);
  EXPECT_EQ(ValidatePlan(TransferPlan(2048, 1, 512)).GetError(),
            TransferError::GOOD);
}

TEST(RangePartitionerTest, UnknownSizeIsConfigurationError) {
  PlanOutcome outcome = PlanChunks(TransferPlan(boost::none, 1024, 512));
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
}

TEST(RangePartitionerTest, DescriptorToString) {
  EXPECT_EQ(ChunkDescriptor(2, 2048, 452, true).ToString(),
            string("[chunk=2 start=2048 length=452 final]"));
  EXPECT_EQ(ChunkDescriptor(0, 0, 1024, false).ToString(),
            string("[chunk=0 start=0 length=1024]"));
}

TEST(StreamingPartitionerTest, ShortFillIsFinal) {
  StreamingPartitioner partitioner(100);
  EXPECT_EQ(partitioner.Describe(100, false),
            ChunkDescriptor(0, 0, 100, false));
  EXPECT_EQ(partitioner.Describe(100, false),
            ChunkDescriptor(1, 100, 100, false));
  EXPECT_FALSE(partitioner.IsFinished());
  EXPECT_EQ(partitioner.Describe(30, false), ChunkDescriptor(2, 200, 30, true));
  EXPECT_TRUE(partitioner.IsFinished());
  EXPECT_EQ(partitioner.GetNextOffset(), 230u);
  EXPECT_EQ(partitioner.GetNextIndex(), 3u);
}

TEST(StreamingPartitionerTest, FullFillAtEndOfSourceIsFinal) {
  StreamingPartitioner partitioner(64, 10, 5);
  EXPECT_EQ(partitioner.Describe(64, true), ChunkDescriptor(5, 10, 64, true));
  EXPECT_TRUE(partitioner.IsFinished());
}

TEST(StreamingPartitionerTest, EmptySource) {
  StreamingPartitioner partitioner(64);
  ChunkDescriptor descriptor = partitioner.Describe(0, true);
  EXPECT_TRUE(descriptor.IsEmpty());
  EXPECT_TRUE(descriptor.IsFinal());
  EXPECT_EQ(partitioner.GetNextOffset(), 0u);
}

}  // namespace Transfer
}  // namespace CX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
