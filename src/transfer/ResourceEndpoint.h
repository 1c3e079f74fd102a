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

#ifndef CHUNKXFER_TRANSFER_RESOURCEENDPOINT_H_
#define CHUNKXFER_TRANSFER_RESOURCEENDPOINT_H_

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"

#include "client/ClientError.hpp"
#include "client/Http.h"
#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "configure/TransferConfigure.h"
#include "transfer/PagedResultCursor.hpp"
#include "transfer/RangePartitioner.h"
#include "transfer/TransferHandle.h"

namespace CX {

namespace Transfer {

// Ask the service for the MD5 of the returned range
extern const char *const RANGE_GET_CONTENT_MD5_HEADER;

// One entry of a listing page
struct ListedItem {
  ListedItem() : m_isDirectory(false), m_size(0) {}

  std::string m_name;
  bool m_isDirectory;  // a blob prefix or a file share directory
  uint64_t m_size;
  std::string m_eTag;
  boost::optional<time_t> m_lastModified;
};

typedef PageResult<ListedItem> ListPage;
typedef CX::Client::Outcome<
    ListPage, CX::Client::ClientError<CX::Client::TransferError::Value> >
    ListPageOutcome;

//
// ResourceEndpoint
//
// Builds the requests of one remote resource kind. Request bodies are
// attached by the chunk worker, builders only set method, url and headers.
//
class ResourceEndpoint : private boost::noncopyable {
 public:
  explicit ResourceEndpoint(const std::string &url) : m_url(url) {}

  virtual ~ResourceEndpoint() {}

 public:
  const std::string &GetURL() const { return m_url; }

  virtual std::string GetName() const = 0;
  virtual bool SupportsSingleShotUpload() const = 0;
  virtual bool SupportsUnknownLengthUpload() const = 0;

  // Chunk size of uploads
  virtual uint64_t GetUploadChunkSize(
      const CX::Configure::TransferConfigure &configure) const = 0;
  // Uploads up to this size go in one request, 0 if not supported
  virtual uint64_t GetSingleUploadThreshold(
      const CX::Configure::TransferConfigure &configure) const = 0;

  // Request sent once before any chunk upload
  //
  // @param  : total size of the upload, request to build
  // @return : false if the resource kind needs no such request
  virtual bool BuildPrepareUploadRequest(
      uint64_t totalSize, CX::Client::Http::HttpRequest *request) const = 0;

  // Upload of the whole content in one request
  //
  // @param  : content length, request to build
  // @return : void
  virtual void BuildSingleUploadRequest(
      uint64_t length, CX::Client::Http::HttpRequest *request) const = 0;

  virtual void BuildChunkUploadRequest(
      const ChunkDescriptor &descriptor,
      CX::Client::Http::HttpRequest *request) const = 0;

  // Request sent once after every chunk was uploaded
  //
  // @param  : chunk results in ascending index order, request to build
  // @return : false if the resource kind needs no such request
  virtual bool BuildCommitUploadRequest(
      const std::vector<ChunkResult> &results,
      CX::Client::Http::HttpRequest *request) const = 0;

  // Ranged read, an unset stop reads up to the end of the resource
  //
  // @param  : start offset, inclusive stop offset, whether to ask for the
  //           range MD5, request to build
  // @return : void
  virtual void BuildDownloadRequest(
      uint64_t start, const boost::optional<uint64_t> &stop,
      bool requestContentMD5, CX::Client::Http::HttpRequest *request) const;

  // Same as above without any Range header, the whole resource is returned
  void BuildFullDownloadRequest(CX::Client::Http::HttpRequest *request) const;

  virtual void BuildListRequest(
      const boost::optional<std::string> &marker, uint32_t maxResults,
      CX::Client::Http::HttpRequest *request) const = 0;

  virtual ListPageOutcome ParseListResponse(const std::string &body) const = 0;

 protected:
  // Parse an EnumerationResults document
  //
  // @param  : xml body, tag of the entries element, tag of a file entry,
  //           tag of a directory entry
  // @return : page with NextMarker as token
  static ListPageOutcome ParseEnumerationResults(
      const std::string &body, const std::string &entriesTag,
      const std::string &fileTag, const std::string &directoryTag);

 private:
  std::string m_url;
};

//
// BlockBlobEndpoint
//
// Small content goes up in one Put Blob request. Larger or unknown length
// content is staged as blocks named after the chunk index and made visible
// by committing the block list.
//
class BlockBlobEndpoint : public ResourceEndpoint {
 public:
  explicit BlockBlobEndpoint(const std::string &url);

 public:
  std::string GetName() const { return "BlockBlob"; }
  bool SupportsSingleShotUpload() const { return true; }
  bool SupportsUnknownLengthUpload() const { return true; }
  uint64_t GetUploadChunkSize(
      const CX::Configure::TransferConfigure &configure) const {
    return configure.m_maxBlockSize;
  }
  uint64_t GetSingleUploadThreshold(
      const CX::Configure::TransferConfigure &configure) const {
    return configure.m_maxSinglePutSize;
  }

  bool BuildPrepareUploadRequest(uint64_t totalSize,
                                 CX::Client::Http::HttpRequest *request) const;
  void BuildSingleUploadRequest(uint64_t length,
                                CX::Client::Http::HttpRequest *request) const;
  void BuildChunkUploadRequest(const ChunkDescriptor &descriptor,
                               CX::Client::Http::HttpRequest *request) const;
  bool BuildCommitUploadRequest(const std::vector<ChunkResult> &results,
                                CX::Client::Http::HttpRequest *request) const;
  void BuildListRequest(const boost::optional<std::string> &marker,
                        uint32_t maxResults,
                        CX::Client::Http::HttpRequest *request) const;
  ListPageOutcome ParseListResponse(const std::string &body) const;
};

// Block id of a chunk, base64 of the zero padded index
std::string MakeBlockId(uint32_t index);

//
// FileRangeEndpoint
//
// The file is created with its final size first, then written range by
// range. The size has to be known before the first request. A single
// upload is one range write over the whole, already created, file.
//
class FileRangeEndpoint : public ResourceEndpoint {
 public:
  explicit FileRangeEndpoint(const std::string &url);

 public:
  std::string GetName() const { return "FileRange"; }
  bool SupportsSingleShotUpload() const { return false; }
  bool SupportsUnknownLengthUpload() const { return false; }
  uint64_t GetUploadChunkSize(
      const CX::Configure::TransferConfigure &configure) const {
    return configure.m_maxRangeSize;
  }
  uint64_t GetSingleUploadThreshold(
      const CX::Configure::TransferConfigure &configure) const {
    return 0;
  }

  bool BuildPrepareUploadRequest(uint64_t totalSize,
                                 CX::Client::Http::HttpRequest *request) const;
  void BuildSingleUploadRequest(uint64_t length,
                                CX::Client::Http::HttpRequest *request) const;
  void BuildChunkUploadRequest(const ChunkDescriptor &descriptor,
                               CX::Client::Http::HttpRequest *request) const;
  bool BuildCommitUploadRequest(const std::vector<ChunkResult> &results,
                                CX::Client::Http::HttpRequest *request) const;
  void BuildListRequest(const boost::optional<std::string> &marker,
                        uint32_t maxResults,
                        CX::Client::Http::HttpRequest *request) const;
  ListPageOutcome ParseListResponse(const std::string &body) const;
};

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_RESOURCEENDPOINT_H_
