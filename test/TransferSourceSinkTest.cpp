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

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "data/TransferSink.h"
#include "data/TransferSource.h"

namespace CX {

namespace Data {

using boost::optional;
using boost::shared_ptr;
using std::string;
using std::stringstream;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/chunkxfer.test.logs/";
static const char *sinkFile = "/tmp/chunkxfer.test.logs/sink.data";

class TransferSourceSinkTest : public Test {
 protected:
  static void SetUpTestCase() {
    CX::Utils::CreateDirectoryIfNotExists(defaultLogDir);
    CX::Logging::Log::Instance().Initialize(defaultLogDir);
  }

  string ReadAt(TransferSource *source, uint64_t offset, size_t length) {
    vector<char> buf(length + 1);
    size_t count = source->ReadAt(offset, length, &buf[0]);
    return string(&buf[0], count);
  }
};

TEST_F(TransferSourceSinkTest, MemorySourceReadsAnyOffset) {
  MemorySource source("0123456789");
  EXPECT_EQ(source.GetKind(), SourceKind::InMemoryBuffer);
  EXPECT_TRUE(source.IsSeekable());
  ASSERT_TRUE(source.GetSize());
  EXPECT_EQ(*source.GetSize(), 10u);

  EXPECT_EQ(ReadAt(&source, 6, 4), string("6789"));
  EXPECT_EQ(ReadAt(&source, 0, 3), string("012"));
  EXPECT_EQ(ReadAt(&source, 8, 5), string("89"));
  EXPECT_EQ(ReadAt(&source, 10, 5), string());

  MemorySource empty((Buffer()));
  EXPECT_EQ(*empty.GetSize(), 0u);
}

TEST_F(TransferSourceSinkTest, SeekableSourceStartsAtCurrentPosition) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("header:payload");
  stream->seekg(7);
  SeekableStreamSource source(stream);
  EXPECT_EQ(source.GetKind(), SourceKind::SeekableStream);
  ASSERT_TRUE(source.GetSize());
  EXPECT_EQ(*source.GetSize(), 7u);

  EXPECT_EQ(ReadAt(&source, 3, 4), string("load"));
  EXPECT_EQ(ReadAt(&source, 0, 3), string("pay"));
  EXPECT_EQ(ReadAt(&source, 5, 10), string("ad"));
}

TEST_F(TransferSourceSinkTest, SeekableSourceWithGivenSize) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("0123456789");
  SeekableStreamSource source(stream, optional<uint64_t>(4));
  EXPECT_EQ(*source.GetSize(), 4u);
  EXPECT_EQ(ReadAt(&source, 2, 8), string("23"));
}

TEST_F(TransferSourceSinkTest, ForwardOnlySourceReadsInOrder) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("abcdefg");
  ForwardOnlyStreamSource source(stream);
  EXPECT_EQ(source.GetKind(), SourceKind::ForwardOnlyStream);
  EXPECT_FALSE(source.IsSeekable());
  EXPECT_FALSE(source.GetSize());

  char buf[8];
  EXPECT_EQ(source.ReadNext(3, buf), 3u);
  EXPECT_EQ(string(buf, 3), string("abc"));
  EXPECT_EQ(source.GetPosition(), 3u);
  EXPECT_FALSE(source.IsExhausted());

  // only the current offset can be read
  EXPECT_EQ(source.ReadAt(0, 3, buf), 0u);
  EXPECT_EQ(source.ReadAt(3, 3, buf), 3u);
  EXPECT_EQ(string(buf, 3), string("def"));

  EXPECT_EQ(source.ReadNext(3, buf), 1u);
  EXPECT_TRUE(source.IsExhausted());
  EXPECT_EQ(source.ReadNext(3, buf), 0u);
}

TEST_F(TransferSourceSinkTest, ForwardOnlySourceStopsAtGivenSize) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("abcdefg");
  ForwardOnlyStreamSource source(stream, optional<uint64_t>(4));
  char buf[8];
  EXPECT_EQ(source.ReadNext(8, buf), 4u);
  EXPECT_TRUE(source.IsExhausted());
}

TEST_F(TransferSourceSinkTest, MemorySinkOutOfOrderWrites) {
  MemorySink sink;
  EXPECT_EQ(sink.GetKind(), SinkKind::InMemoryBuffer);
  EXPECT_TRUE(sink.WriteAt(6, "6789", 4));
  EXPECT_TRUE(sink.WriteAt(0, "012", 3));
  EXPECT_TRUE(sink.WriteAt(3, "345", 3));
  EXPECT_EQ(sink.GetSize(), 10u);
  EXPECT_EQ(sink.GetData(), string("0123456789"));
}

TEST_F(TransferSourceSinkTest, SeekableSinkOutOfOrderWrites) {
  {
    shared_ptr<std::fstream> file = boost::make_shared<std::fstream>(
        sinkFile, std::ios_base::in | std::ios_base::out |
                      std::ios_base::binary | std::ios_base::trunc);
    ASSERT_TRUE(file->is_open());
    SeekableStreamSink sink(file);
    EXPECT_EQ(sink.GetKind(), SinkKind::SeekableStream);
    EXPECT_TRUE(sink.WriteAt(5, "fghij", 5));
    EXPECT_TRUE(sink.WriteAt(0, "abcde", 5));
  }
  std::ifstream in(sinkFile, std::ios_base::binary);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), string("abcdefghij"));
}

TEST_F(TransferSourceSinkTest, ForwardOnlySinkRejectsGaps) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>();
  ForwardOnlyStreamSink sink(stream);
  EXPECT_FALSE(sink.IsSeekable());
  EXPECT_TRUE(sink.WriteAt(0, "abc", 3));
  EXPECT_FALSE(sink.WriteAt(6, "ghi", 3));
  EXPECT_TRUE(sink.WriteAt(3, "def", 3));
  EXPECT_EQ(sink.GetPosition(), 6u);
  EXPECT_EQ(stream->str(), string("abcdef"));
}

TEST_F(TransferSourceSinkTest, KindNames) {
  EXPECT_EQ(SourceKindToString(SourceKind::ForwardOnlyStream),
            string("ForwardOnlyStream"));
  EXPECT_EQ(SinkKindToString(SinkKind::SeekableStream),
            string("SeekableStream"));
}

}  // namespace Data
}  // namespace CX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
