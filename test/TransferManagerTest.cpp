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

#include <sstream>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "FakeServiceTransport.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "client/Http.h"
#include "client/TransferError.h"
#include "configure/TransferConfigure.h"
#include "data/TransferSink.h"
#include "data/TransferSource.h"
#include "transfer/PagedResultCursor.hpp"
#include "transfer/ResourceEndpoint.h"
#include "transfer/TransferHandle.h"
#include "transfer/TransferManager.h"

namespace CX {

namespace Transfer {

using boost::optional;
using boost::shared_ptr;
using CX::Client::FakeServiceTransport;
using CX::Client::RecordedRequest;
using CX::Client::TransferError;
using CX::Client::Http::HttpMethod;
using CX::Configure::TransferConfigure;
using CX::Data::ForwardOnlyStreamSink;
using CX::Data::ForwardOnlyStreamSource;
using CX::Data::MemorySink;
using CX::Data::MemorySource;
using CX::Data::SeekableStreamSource;
using std::string;
using std::stringstream;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/chunkxfer.test.logs/";
static const char *containerUrl = "https://account.example.net/container";
static const char *blobUrl = "https://account.example.net/container/blob";
static const char *shareUrl = "https://account.example.net/share/dir";
static const char *fileUrl = "https://account.example.net/share/dir/file";

namespace {

string MakeContent(size_t size) {
  string content;
  for (size_t i = 0; i < size; ++i) {
    content.append(1, static_cast<char>('a' + (i * 7) % 26));
  }
  return content;
}

size_t CountQuery(const vector<RecordedRequest> &requests,
                  HttpMethod::Value method, const string &key,
                  const string &value) {
  size_t count = 0;
  BOOST_FOREACH(const RecordedRequest &request, requests) {
    if (request.m_method == method && request.GetQuery(key) == value) {
      ++count;
    }
  }
  return count;
}

struct ProgressRecorder {
  ProgressRecorder() : m_last(0), m_increasing(true), m_calls(0) {}
  void Record(uint64_t bytes, const optional<uint64_t> &total) {
    if (bytes < m_last) {
      m_increasing = false;
    }
    m_last = bytes;
    m_total = total;
    ++m_calls;
  }
  uint64_t m_last;
  optional<uint64_t> m_total;
  bool m_increasing;
  int m_calls;
};

}  // namespace

class TransferManagerTest : public Test {
 protected:
  static void SetUpTestCase() {
    CX::Utils::CreateDirectoryIfNotExists(defaultLogDir);
    CX::Logging::Log::Instance().Initialize(defaultLogDir);
  }

  void SetUp() {
    m_transport = boost::make_shared<FakeServiceTransport>();
    m_config.m_maxSinglePutSize = 16;
    m_config.m_maxBlockSize = 8;
    m_config.m_maxSingleGetSize = 8;
    m_config.m_maxChunkGetSize = 4;
    m_config.m_maxRangeSize = 8;
    m_config.m_maxConcurrency = 4;
    m_config.m_transactionRetries = 2;
    m_config.m_retryScaleFactor = 1;
    m_config.m_resultsPerPage = 2;
    m_blob = boost::make_shared<BlockBlobEndpoint>(blobUrl);
    m_file = boost::make_shared<FileRangeEndpoint>(fileUrl);
  }

  shared_ptr<TransferManager> MakeManager() {
    return boost::make_shared<TransferManager>(m_config, m_transport);
  }

  shared_ptr<FakeServiceTransport> m_transport;
  TransferConfigure m_config;
  shared_ptr<ResourceEndpoint> m_blob;
  shared_ptr<ResourceEndpoint> m_file;
};

// --------------------------------------------------------------------------
// upload

TEST_F(TransferManagerTest, SingleShotBlobUpload) {
  string content = MakeContent(10);
  MemorySource source(content);
  shared_ptr<TransferHandle> handle;
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, UploadOptions(), &handle);
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
  EXPECT_EQ(m_transport->GetRequests().size(), 1u);
  ASSERT_TRUE(outcome.GetResult().GetETag());
  EXPECT_EQ(*outcome.GetResult().GetETag(), m_transport->GetETag(blobUrl));
  EXPECT_EQ(outcome.GetResult().GetBytesTransferred(), 10u);
  EXPECT_EQ(outcome.GetResult().GetChunkCount(), 1u);
  ASSERT_TRUE(handle);
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
}

TEST_F(TransferManagerTest, EmptyBlobUpload) {
  MemorySource source("");
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_TRUE(m_transport->HasResource(blobUrl));
  EXPECT_TRUE(m_transport->GetContent(blobUrl).empty());
}

TEST_F(TransferManagerTest, ChunkedBlobUploadCommits) {
  string content = MakeContent(50);
  MemorySource source(content);
  m_transport->SetLatency(1, 5);
  UploadOptions options;
  options.m_validateContent = true;
  ProgressRecorder progress;
  options.m_progressCallback =
      boost::bind(&ProgressRecorder::Record, &progress, _1, _2);
  TransferOutcome outcome = MakeManager()->Upload(m_blob, &source, options);
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());

  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
  EXPECT_EQ(m_transport->GetStagedBlockCount(blobUrl), 0u);
  vector<RecordedRequest> requests = m_transport->GetRequests();
  EXPECT_EQ(CountQuery(requests, HttpMethod::Put, "comp", "block"), 7u);
  EXPECT_EQ(CountQuery(requests, HttpMethod::Put, "comp", "blocklist"), 1u);
  EXPECT_EQ(requests.back().GetQuery("comp"), string("blocklist"));
  EXPECT_LE(m_transport->GetMaxInFlight(), 4u);

  EXPECT_EQ(*outcome.GetResult().GetETag(), m_transport->GetETag(blobUrl));
  EXPECT_EQ(outcome.GetResult().GetChunkCount(), 7u);
  EXPECT_EQ(progress.m_last, 50u);
  EXPECT_EQ(*progress.m_total, 50u);
  EXPECT_EQ(progress.m_calls, 7);
  EXPECT_TRUE(progress.m_increasing);
}

TEST_F(TransferManagerTest, PreconditionsGuardCommitOnly) {
  string content = MakeContent(30);
  MemorySource source(content);
  UploadOptions options;
  options.m_preconditions.m_ifNoneMatch = string("*");
  TransferOutcome outcome = MakeManager()->Upload(m_blob, &source, options);
  ASSERT_TRUE(outcome.IsSuccess());
  BOOST_FOREACH(const RecordedRequest &request, m_transport->GetRequests()) {
    EXPECT_EQ(request.HasHeader("If-None-Match"),
              request.GetQuery("comp") == "blocklist");
  }

  // the blob exists now
  string etag = m_transport->GetETag(blobUrl);
  MemorySource other(MakeContent(40));
  outcome = MakeManager()->Upload(m_blob, &other, options);
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONDITION_NOT_MET);
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
  EXPECT_EQ(m_transport->GetETag(blobUrl), etag);
}

TEST_F(TransferManagerTest, SingleShotHonorsIfMatch) {
  m_transport->PutBlob(blobUrl, "old");
  MemorySource source("new");
  UploadOptions options;
  options.m_preconditions.m_ifMatch = string("\"0x0\"");
  TransferOutcome outcome = MakeManager()->Upload(m_blob, &source, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONDITION_NOT_MET);
  EXPECT_EQ(m_transport->GetContent(blobUrl), string("old"));

  options.m_preconditions.m_ifMatch = m_transport->GetETag(blobUrl);
  outcome = MakeManager()->Upload(m_blob, &source, options);
  EXPECT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(m_transport->GetContent(blobUrl), string("new"));
}

TEST_F(TransferManagerTest, FileUploadWritesRanges) {
  string content = MakeContent(20);
  MemorySource source(content);
  m_transport->SetLatency(0, 5);
  TransferOutcome outcome =
      MakeManager()->Upload(m_file, &source, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(m_transport->GetContent(fileUrl), content);

  vector<RecordedRequest> requests = m_transport->GetRequests();
  ASSERT_EQ(requests.size(), 4u);
  EXPECT_EQ(requests[0].GetHeader("x-ms-type"), string("file"));
  EXPECT_EQ(requests[0].GetHeader("x-ms-content-length"), string("20"));
  EXPECT_EQ(CountQuery(requests, HttpMethod::Put, "comp", "range"), 3u);
  // the range written last carries the final metadata
  EXPECT_EQ(*outcome.GetResult().GetETag(), m_transport->GetETag(fileUrl));
  EXPECT_EQ(*outcome.GetResult().GetLastModified(),
            m_transport->GetLastModified(fileUrl));
}

TEST_F(TransferManagerTest, EmptyFileUpload) {
  MemorySource source("");
  TransferOutcome outcome =
      MakeManager()->Upload(m_file, &source, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(m_transport->GetRequests().size(), 1u);
  EXPECT_TRUE(m_transport->HasResource(fileUrl));
  EXPECT_EQ(*outcome.GetResult().GetETag(), m_transport->GetETag(fileUrl));
}

TEST_F(TransferManagerTest, SeekableStreamUpload) {
  string content = MakeContent(33);
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>(content);
  SeekableStreamSource source(stream);
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
}

TEST_F(TransferManagerTest, UnknownLengthStreamUpload) {
  string content = MakeContent(21);
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>(content);
  ForwardOnlyStreamSource source(stream);
  UploadOptions options;
  options.m_maxConcurrency = 1;
  shared_ptr<TransferHandle> handle;
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, options, &handle);
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
  EXPECT_EQ(CountQuery(m_transport->GetRequests(), HttpMethod::Put, "comp",
                       "block"),
            3u);
  EXPECT_EQ(*handle->GetTotalBytes(), 21u);
}

TEST_F(TransferManagerTest, UnknownLengthNeedsBlob) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("data");
  ForwardOnlyStreamSource source(stream);
  UploadOptions options;
  options.m_maxConcurrency = 1;
  TransferOutcome outcome = MakeManager()->Upload(m_file, &source, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_TRUE(m_transport->GetRequests().empty());
}

TEST_F(TransferManagerTest, ForwardOnlySourceRejectsConcurrency) {
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>("data");
  ForwardOnlyStreamSource source(stream, optional<uint64_t>(4));
  UploadOptions options;
  options.m_maxConcurrency = 2;
  shared_ptr<TransferHandle> handle;
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, options, &handle);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_TRUE(m_transport->GetRequests().empty());
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
}

TEST_F(TransferManagerTest, ForwardOnlySourceSequentialByDefault) {
  // configured concurrency is 4, a stream without random access runs with 1
  string content = MakeContent(33);
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>(content);
  ForwardOnlyStreamSource source(stream, optional<uint64_t>(33));
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
  EXPECT_EQ(CountQuery(m_transport->GetRequests(), HttpMethod::Put, "comp",
                       "block"),
            5u);

  m_transport->ClearRequests();
  shared_ptr<stringstream> unsized = boost::make_shared<stringstream>(content);
  ForwardOnlyStreamSource unsizedSource(unsized);
  outcome = MakeManager()->Upload(m_blob, &unsizedSource, UploadOptions());
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(m_transport->GetContent(blobUrl), content);
}

TEST_F(TransferManagerTest, InvalidConfigureRejected) {
  m_config.m_maxBlockSize = 0;
  MemorySource source(MakeContent(40));
  TransferOutcome outcome =
      MakeManager()->Upload(m_blob, &source, UploadOptions());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_TRUE(m_transport->GetRequests().empty());
}

TEST_F(TransferManagerTest, FailedChunkStopsUpload) {
  MemorySource source(MakeContent(64));
  UploadOptions options;
  options.m_maxConcurrency = 1;
  m_transport->FailNextRequests(1, 403);
  TransferOutcome outcome = MakeManager()->Upload(m_blob, &source, options);
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(),
            TransferError::AUTHENTICATION_FAILED);
  EXPECT_EQ(m_transport->GetRequests().size(), 1u);
  EXPECT_FALSE(m_transport->HasResource(blobUrl));
}

// --------------------------------------------------------------------------
// download

TEST_F(TransferManagerTest, ChunkedDownload) {
  string content = MakeContent(50);
  m_transport->PutBlob(blobUrl, content);
  m_transport->SetLatency(1, 5);
  MemorySink sink;
  ProgressRecorder progress;
  DownloadOptions options;
  options.m_progressCallback =
      boost::bind(&ProgressRecorder::Record, &progress, _1, _2);
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(sink.GetData(), content);
  EXPECT_EQ(*outcome.GetResult().GetResourceSize(), 50u);
  EXPECT_EQ(*outcome.GetResult().GetETag(), m_transport->GetETag(blobUrl));
  EXPECT_EQ(outcome.GetResult().GetBytesTransferred(), 50u);
  EXPECT_EQ(progress.m_last, 50u);
  EXPECT_TRUE(progress.m_increasing);

  // first request of 8 bytes, the rest in chunks of 4 pinned to the etag
  vector<RecordedRequest> requests = m_transport->GetRequests();
  ASSERT_EQ(requests.size(), 12u);
  EXPECT_EQ(requests[0].GetHeader("Range"), string("bytes=0-7"));
  EXPECT_FALSE(requests[0].HasHeader("If-Match"));
  for (size_t i = 1; i < requests.size(); ++i) {
    EXPECT_EQ(requests[i].GetHeader("If-Match"),
              m_transport->GetETag(blobUrl));
  }
  EXPECT_LE(m_transport->GetMaxInFlight(), 4u);
}

TEST_F(TransferManagerTest, ValidatedDownload) {
  string content = MakeContent(30);
  m_transport->PutBlob(blobUrl, content);
  MemorySink sink;
  DownloadOptions options;
  options.m_validateContent = true;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(sink.GetData(), content);
  vector<RecordedRequest> requests = m_transport->GetRequests();
  // first request is capped at the chunk size when validating
  EXPECT_EQ(requests[0].GetHeader("Range"), string("bytes=0-3"));
  BOOST_FOREACH(const RecordedRequest &request, requests) {
    EXPECT_EQ(request.GetHeader(RANGE_GET_CONTENT_MD5_HEADER), string("true"));
  }
}

TEST_F(TransferManagerTest, CorruptDownloadFails) {
  m_transport->PutBlob(blobUrl, MakeContent(30));
  m_transport->SetCorruptDownloads(true);
  MemorySink sink;
  DownloadOptions options;
  options.m_validateContent = true;
  shared_ptr<TransferHandle> handle;
  TransferOutcome outcome =
      MakeManager()->Download(m_blob, &sink, options, &handle);
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::INTEGRITY_ERROR);
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
}

TEST_F(TransferManagerTest, EmptyResourceDownload) {
  m_transport->PutBlob(blobUrl, "");
  MemorySink sink;
  TransferOutcome outcome =
      MakeManager()->Download(m_blob, &sink, DownloadOptions());
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(sink.GetSize(), 0u);
  EXPECT_EQ(*outcome.GetResult().GetResourceSize(), 0u);
  vector<RecordedRequest> requests = m_transport->GetRequests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_FALSE(requests[1].HasHeader("Range"));
}

TEST_F(TransferManagerTest, RangeDownloadTrimmedToResource) {
  string content = MakeContent(50);
  m_transport->PutBlob(blobUrl, content);
  MemorySink sink;
  DownloadOptions options;
  options.m_offset = 10;
  options.m_length = 1000;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(sink.GetData(), content.substr(10));
  EXPECT_EQ(outcome.GetResult().GetBytesTransferred(), 40u);
}

TEST_F(TransferManagerTest, RangeDownloadWithinResource) {
  string content = MakeContent(50);
  m_transport->PutBlob(blobUrl, content);
  MemorySink sink;
  DownloadOptions options;
  options.m_offset = 5;
  options.m_length = 13;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(sink.GetData(), content.substr(5, 13));
}

TEST_F(TransferManagerTest, OffsetPastEndIsInvalidRange) {
  m_transport->PutBlob(blobUrl, MakeContent(50));
  MemorySink sink;
  DownloadOptions options;
  options.m_offset = 60;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::INVALID_RANGE);
}

TEST_F(TransferManagerTest, LengthWithoutOffsetRejected) {
  m_transport->PutBlob(blobUrl, MakeContent(50));
  MemorySink sink;
  DownloadOptions options;
  options.m_length = 10;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);

  options.m_offset = 0;
  options.m_length = 0;
  outcome = MakeManager()->Download(m_blob, &sink, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_TRUE(m_transport->GetRequests().empty());
}

TEST_F(TransferManagerTest, ResourceChangedMidDownload) {
  m_transport->PutBlob(blobUrl, MakeContent(50));
  m_transport->ReplaceAfterFirstRead(blobUrl, MakeContent(60));
  MemorySink sink;
  TransferOutcome outcome =
      MakeManager()->Download(m_blob, &sink, DownloadOptions());
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONDITION_NOT_MET);
}

TEST_F(TransferManagerTest, IfNoneMatchCurrentETag) {
  m_transport->PutBlob(blobUrl, MakeContent(50));
  MemorySink sink;
  DownloadOptions options;
  options.m_preconditions.m_ifNoneMatch = m_transport->GetETag(blobUrl);
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONDITION_NOT_MET);
  EXPECT_EQ(sink.GetSize(), 0u);
}

TEST_F(TransferManagerTest, MissingResource) {
  MemorySink sink;
  TransferOutcome outcome =
      MakeManager()->Download(m_blob, &sink, DownloadOptions());
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::NOT_FOUND);
}

TEST_F(TransferManagerTest, ForwardOnlySink) {
  string content = MakeContent(50);
  m_transport->PutBlob(blobUrl, content);
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>();
  ForwardOnlyStreamSink sink(stream);
  DownloadOptions options;
  options.m_maxConcurrency = 1;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(stream->str(), content);

  m_transport->ClearRequests();
  options.m_maxConcurrency = 3;
  outcome = MakeManager()->Download(m_blob, &sink, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::CONFIGURATION_ERROR);
  EXPECT_TRUE(m_transport->GetRequests().empty());
}

TEST_F(TransferManagerTest, ForwardOnlySinkSequentialByDefault) {
  string content = MakeContent(50);
  m_transport->PutBlob(blobUrl, content);
  m_transport->SetLatency(1, 5);
  shared_ptr<stringstream> stream = boost::make_shared<stringstream>();
  ForwardOnlyStreamSink sink(stream);
  TransferOutcome outcome =
      MakeManager()->Download(m_blob, &sink, DownloadOptions());
  ASSERT_TRUE(outcome.IsSuccess())
      << CX::Client::GetMessageForTransferError(outcome.GetError());
  EXPECT_EQ(stream->str(), content);
}

TEST_F(TransferManagerTest, TransientFailuresRetried) {
  string content = MakeContent(20);
  m_transport->PutBlob(blobUrl, content);
  m_transport->FailNextRequests(2, 503);
  MemorySink sink;
  DownloadOptions options;
  options.m_maxConcurrency = 1;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(sink.GetData(), content);
}

TEST_F(TransferManagerTest, DownloadTimeout) {
  m_transport->PutBlob(blobUrl, MakeContent(50));
  m_transport->SetLatency(30, 30);
  MemorySink sink;
  DownloadOptions options;
  options.m_timeoutInMs = 20;
  TransferOutcome outcome = MakeManager()->Download(m_blob, &sink, options);
  EXPECT_EQ(outcome.GetError().GetError(), TransferError::TIMEOUT);
}

// --------------------------------------------------------------------------
// listing

TEST_F(TransferManagerTest, ListContainerAcrossPages) {
  const char *names[] = {"e", "a", "d", "b", "c"};
  for (size_t i = 0; i < 5; ++i) {
    m_transport->PutBlob(string(containerUrl) + "/" + names[i], names[i]);
  }
  m_transport->AddDirectory(string(containerUrl) + "/logs");
  shared_ptr<ResourceEndpoint> container =
      boost::make_shared<BlockBlobEndpoint>(containerUrl);

  shared_ptr<TransferManager> manager = MakeManager();
  PagedResultCursor<ListedItem> cursor = manager->List(container);
  vector<ListedItem> items;
  EXPECT_EQ(cursor.CollectAll(&items).GetError(), TransferError::GOOD);
  ASSERT_EQ(items.size(), 6u);
  EXPECT_EQ(items[0].m_name, string("a"));
  EXPECT_EQ(items[4].m_name, string("e"));
  EXPECT_EQ(items[0].m_size, 1u);
  EXPECT_FALSE(items[0].m_isDirectory);
  EXPECT_EQ(items[0].m_eTag,
            m_transport->GetETag(string(containerUrl) + "/a"));
  EXPECT_EQ(items[5].m_name, string("logs"));
  EXPECT_TRUE(items[5].m_isDirectory);
  EXPECT_EQ(m_transport->GetRequests().size(), 3u);
  EXPECT_TRUE(cursor.IsExhausted());
}

TEST_F(TransferManagerTest, ListResumesFromToken) {
  m_transport->PutFile(string(shareUrl) + "/f1", "1");
  m_transport->PutFile(string(shareUrl) + "/f2", "22");
  m_transport->PutFile(string(shareUrl) + "/f3", "333");
  shared_ptr<ResourceEndpoint> share = boost::make_shared<FileRangeEndpoint>(shareUrl);
  shared_ptr<TransferManager> manager = MakeManager();

  PagedResultCursor<ListedItem> first = manager->List(share);
  PagedResultCursor<ListedItem>::ItemsOutcome page = first.NextPage();
  ASSERT_TRUE(page.IsSuccess());
  ASSERT_EQ(page.GetResult().size(), 2u);
  ASSERT_TRUE(first.GetContinuationToken());

  PagedResultCursor<ListedItem> resumed =
      manager->List(share, first.GetContinuationToken());
  page = resumed.NextPage();
  ASSERT_TRUE(page.IsSuccess());
  ASSERT_EQ(page.GetResult().size(), 1u);
  EXPECT_EQ(page.GetResult()[0].m_name, string("f3"));
  EXPECT_EQ(page.GetResult()[0].m_size, 3u);
  EXPECT_TRUE(resumed.IsExhausted());
  EXPECT_EQ(m_transport->GetRequests().back().GetQuery("restype"),
            string("directory"));
}

TEST_F(TransferManagerTest, ListFailureKeepsToken) {
  m_transport->PutBlob(string(containerUrl) + "/a", "a");
  m_transport->PutBlob(string(containerUrl) + "/b", "b");
  m_transport->PutBlob(string(containerUrl) + "/c", "c");
  shared_ptr<ResourceEndpoint> container =
      boost::make_shared<BlockBlobEndpoint>(containerUrl);
  m_config.m_transactionRetries = 0;
  shared_ptr<TransferManager> manager = MakeManager();
  PagedResultCursor<ListedItem> cursor = manager->List(container);
  ASSERT_TRUE(cursor.NextPage().IsSuccess());

  m_transport->FailNextRequests(1, 500);
  PagedResultCursor<ListedItem>::ItemsOutcome page = cursor.NextPage();
  EXPECT_FALSE(page.IsSuccess());
  EXPECT_EQ(page.GetError().GetError(), TransferError::SERVICE_ERROR);
  EXPECT_EQ(*cursor.GetContinuationToken(), string("c"));
  page = cursor.NextPage();
  ASSERT_TRUE(page.IsSuccess());
  EXPECT_EQ(page.GetResult()[0].m_name, string("c"));
}

}  // namespace Transfer
}  // namespace CX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
