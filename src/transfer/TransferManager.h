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

#ifndef CHUNKXFER_TRANSFER_TRANSFERMANAGER_H_
#define CHUNKXFER_TRANSFER_TRANSFERMANAGER_H_

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/PreconditionSet.h"
#include "client/TransferError.h"
#include "client/Transport.h"
#include "configure/TransferConfigure.h"
#include "data/TransferSink.h"
#include "data/TransferSource.h"
#include "transfer/PagedResultCursor.hpp"
#include "transfer/ResourceEndpoint.h"
#include "transfer/TransferHandle.h"

namespace CX {

namespace Transfer {

// Per call settings, unset fields fall back to the manager's configure
struct UploadOptions {
  CX::Client::PreconditionSet m_preconditions;
  boost::optional<bool> m_validateContent;
  boost::optional<uint32_t> m_maxConcurrency;
  boost::optional<uint64_t> m_timeoutInMs;
  ProgressCallback m_progressCallback;
};

struct DownloadOptions {
  CX::Client::PreconditionSet m_preconditions;
  boost::optional<bool> m_validateContent;
  boost::optional<uint32_t> m_maxConcurrency;
  boost::optional<uint64_t> m_timeoutInMs;
  ProgressCallback m_progressCallback;
  boost::optional<uint64_t> m_offset;
  boost::optional<uint64_t> m_length;  // requires offset
};

class TransferResult {
 public:
  TransferResult() : m_bytesTransferred(0), m_chunkCount(0) {}

 public:
  const boost::optional<std::string> &GetETag() const { return m_eTag; }
  const boost::optional<time_t> &GetLastModified() const {
    return m_lastModified;
  }
  uint64_t GetBytesTransferred() const { return m_bytesTransferred; }
  size_t GetChunkCount() const { return m_chunkCount; }
  // Size of the remote resource, downloads only
  const boost::optional<uint64_t> &GetResourceSize() const {
    return m_resourceSize;
  }

  void SetETag(const boost::optional<std::string> &etag) { m_eTag = etag; }
  void SetLastModified(const boost::optional<time_t> &lastModified) {
    m_lastModified = lastModified;
  }
  void SetBytesTransferred(uint64_t bytes) { m_bytesTransferred = bytes; }
  void SetChunkCount(size_t count) { m_chunkCount = count; }
  void SetResourceSize(uint64_t size) { m_resourceSize = size; }

 private:
  boost::optional<std::string> m_eTag;
  boost::optional<time_t> m_lastModified;
  uint64_t m_bytesTransferred;
  size_t m_chunkCount;
  boost::optional<uint64_t> m_resourceSize;
};

typedef CX::Client::Outcome<
    TransferResult, CX::Client::ClientError<CX::Client::TransferError::Value> >
    TransferOutcome;

//
// TransferManager
//
// Entry point of uploads, downloads and listings. Requests go through a
// retrying decorator of the given transport, built from the configure.
//
class TransferManager : private boost::noncopyable {
 public:
  TransferManager(const CX::Configure::TransferConfigure &configure,
                  const boost::shared_ptr<CX::Client::Transport> &transport);

  ~TransferManager() {}

 public:
  const CX::Configure::TransferConfigure &GetConfigure() const {
    return m_configure;
  }

  // Upload the whole source to the resource
  //
  // @param  : endpoint, source, options, output handle of the transfer
  // @return : etag and modification time of the uploaded resource
  //
  // Content up to the single upload threshold of the endpoint goes in one
  // request. Otherwise chunks are uploaded and committed if the endpoint
  // needs it; without a commit the metadata of the chunk modified last is
  // reported.
  TransferOutcome Upload(const boost::shared_ptr<ResourceEndpoint> &endpoint,
                         CX::Data::TransferSource *source,
                         const UploadOptions &options,
                         boost::shared_ptr<TransferHandle> *handle = NULL) const;

  // Download the resource, or the range given by the options, into the sink
  //
  // @param  : endpoint, sink, options, output handle of the transfer
  // @return : etag and modification time of the first response
  //
  // A first request learns the resource size from Content-Range, the
  // remaining bytes are fetched in chunks pinned to its etag.
  TransferOutcome Download(const boost::shared_ptr<ResourceEndpoint> &endpoint,
                           CX::Data::TransferSink *sink,
                           const DownloadOptions &options,
                           boost::shared_ptr<TransferHandle> *handle = NULL) const;

  // Listing of the container or directory at the endpoint
  //
  // @param  : endpoint, continuation token to resume from
  // @return : cursor fetching pages of results per page items
  PagedResultCursor<ListedItem> List(
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      const boost::optional<std::string> &startToken = boost::none) const;

  // Fetch one listing page
  ListPageOutcome FetchListPage(
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      const boost::optional<std::string> &marker, uint32_t maxResults) const;

 private:
  TransferOutcome UploadKnownSize(
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      CX::Data::TransferSource *source, uint64_t size,
      const UploadOptions &options, uint32_t maxConcurrency,
      bool validateContent, uint64_t timeoutInMs,
      TransferHandle *handle) const;
  TransferOutcome UploadUnknownSize(
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      CX::Data::ForwardOnlyStreamSource *source, const UploadOptions &options,
      bool validateContent, uint64_t timeoutInMs,
      TransferHandle *handle) const;
  TransferOutcome CommitUpload(
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      const std::vector<ChunkResult> &results,
      const CX::Client::PreconditionSet &preconditions,
      TransferHandle *handle) const;
  TransferOutcome Fail(
      const CX::Client::ClientError<CX::Client::TransferError::Value> &err,
      TransferHandle *handle) const;

 private:
  CX::Configure::TransferConfigure m_configure;
  boost::shared_ptr<CX::Client::Transport> m_transport;
};

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_TRANSFERMANAGER_H_
