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

#ifndef CHUNKXFER_TEST_FAKESERVICETRANSPORT_H_
#define CHUNKXFER_TEST_FAKESERVICETRANSPORT_H_

#include <stdint.h>
#include <time.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "client/Http.h"
#include "client/Transport.h"

namespace CX {

namespace Client {

// A request as the fake service saw it
struct RecordedRequest {
  Http::HttpMethod::Value m_method;
  std::string m_path;
  std::map<std::string, std::string> m_query;
  Http::HeaderMap m_headers;
  uint64_t m_bodyLength;

  bool HasQuery(const std::string &key) const {
    return m_query.find(key) != m_query.end();
  }
  std::string GetQuery(const std::string &key) const;
  bool HasHeader(const std::string &name) const {
    return m_headers.find(name) != m_headers.end();
  }
  std::string GetHeader(const std::string &name) const;
};

//
// FakeServiceTransport
//
// In memory storage service answering block blob and file range requests
// the way the remote service does: ranged reads with Content-Range and
// Content-MD5, ETag and Last-Modified on every resource, precondition
// checks (412 and 304), 416 for ranges past the end, staged blocks
// committed by a block list, files created at a size then written by
// ranges, and paged listings with NextMarker.
//
// Resources are keyed by the url path, a listing of a path returns the
// resources one level below it.
//
// Knobs for tests: random latency, corrupted or truncated download bodies,
// injected statuses and transport errors, and a hook replacing a resource
// right after its first read.
//
class FakeServiceTransport : public Transport {
 public:
  FakeServiceTransport();
  ~FakeServiceTransport() {}

  TransportOutcome Send(const Http::HttpRequest &request);

 public:
  // resources
  void PutBlob(const std::string &url, const std::string &data);
  void PutFile(const std::string &url, const std::string &data);
  void AddDirectory(const std::string &url);
  bool HasResource(const std::string &url) const;
  std::string GetContent(const std::string &url) const;
  std::string GetETag(const std::string &url) const;
  time_t GetLastModified(const std::string &url) const;
  size_t GetStagedBlockCount(const std::string &url) const;

  // Replace the content right after the first successful read of url
  void ReplaceAfterFirstRead(const std::string &url, const std::string &data);

  // knobs
  void SetLatency(uint32_t minMs, uint32_t maxMs);
  void SetCorruptDownloads(bool corrupt);
  void SetTruncateDownloads(bool truncate);
  void SetEchoContentMD5(bool echo);
  void SetSupportRangeMD5(bool support);
  // Next count requests get a response of this status
  void FailNextRequests(uint32_t count, int status);
  // Next count requests fail to send, as a dropped connection would
  void DropNextRequests(uint32_t count, bool retryable);

  // observations
  std::vector<RecordedRequest> GetRequests() const;
  size_t CountRequests(Http::HttpMethod::Value method,
                       const std::string &queryKey = std::string()) const;
  uint32_t GetMaxInFlight() const;
  void ClearRequests();

 private:
  struct Resource {
    Resource() : m_lastModified(0), m_isFile(false), m_isDirectory(false) {}
    std::string m_data;
    std::string m_eTag;
    time_t m_lastModified;
    bool m_isFile;
    bool m_isDirectory;
  };
  typedef std::map<std::string, Resource> ResourceMap;
  typedef std::map<std::string, std::string> BlockMap;

  Http::HttpResponse Handle(const RecordedRequest &request,
                            const std::string &body);
  Http::HttpResponse HandleGet(const RecordedRequest &request);
  Http::HttpResponse HandleList(const RecordedRequest &request);
  Http::HttpResponse HandlePut(const RecordedRequest &request,
                               const std::string &body);
  Http::HttpResponse HandleCommitBlocks(const RecordedRequest &request,
                                        const std::string &body);
  Http::HttpResponse HandleWriteRange(const RecordedRequest &request,
                                      const std::string &body);

  // @return : 0 if the preconditions hold, else the status to answer
  int CheckPreconditions(const RecordedRequest &request,
                         const Resource *resource) const;
  void Touch(Resource *resource);
  void SetMetadataHeaders(const Resource &resource,
                          Http::HttpResponse *response) const;
  uint32_t NextLatency();

 private:
  mutable boost::mutex m_lock;
  ResourceMap m_resources;
  std::map<std::string, BlockMap> m_stagedBlocks;
  std::map<std::string, std::string> m_replacements;
  std::vector<RecordedRequest> m_requests;
  uint64_t m_eTagCounter;
  time_t m_clock;
  uint32_t m_minLatencyMs;
  uint32_t m_maxLatencyMs;
  uint32_t m_randomState;
  bool m_corruptDownloads;
  bool m_truncateDownloads;
  bool m_echoContentMD5;
  bool m_supportRangeMD5;
  uint32_t m_failCount;
  int m_failStatus;
  uint32_t m_dropCount;
  bool m_dropRetryable;
  uint32_t m_inFlight;
  uint32_t m_maxInFlight;
};

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_TEST_FAKESERVICETRANSPORT_H_
