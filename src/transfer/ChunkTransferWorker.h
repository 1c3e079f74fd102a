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

#ifndef CHUNKXFER_TRANSFER_CHUNKTRANSFERWORKER_H_
#define CHUNKXFER_TRANSFER_CHUNKTRANSFERWORKER_H_

#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ClientError.hpp"
#include "client/Http.h"
#include "client/PreconditionSet.h"
#include "client/TransferError.h"
#include "client/Transport.h"
#include "data/StreamBuf.h"
#include "data/TransferSink.h"
#include "data/TransferSource.h"
#include "transfer/RangePartitioner.h"
#include "transfer/ResourceEndpoint.h"
#include "transfer/TransferHandle.h"

namespace CX {

namespace Transfer {

//
// ChunkTransferWorker
//
// Moves one chunk with one request. Every request is decorated with the
// worker's preconditions and its outcome translated into a transfer error
// carrying the chunk index. Retries happen in the transport beneath.
//
// After a successful chunk the worker adds its bytes to the progress of the
// handle, if one is given.
//
class ChunkTransferWorker : private boost::noncopyable {
 public:
  ChunkTransferWorker(
      const boost::shared_ptr<CX::Client::Transport> &transport,
      const boost::shared_ptr<ResourceEndpoint> &endpoint,
      const CX::Client::PreconditionSet &preconditions, bool validateContent,
      TransferHandle *handle = NULL);

  ~ChunkTransferWorker() {}

 public:
  const CX::Client::PreconditionSet &GetPreconditions() const {
    return m_preconditions;
  }
  bool IsValidateContent() const { return m_validateContent; }

  // Send a request decorated with the preconditions
  //
  // @param  : request, operation name for diagnostics, output response
  // @return : translated error, GOOD on a successful status
  CX::Client::ClientError<CX::Client::TransferError::Value> Send(
      CX::Client::Http::HttpRequest *request, const std::string &operationName,
      CX::Client::Http::HttpResponse *response) const;

  // Read the chunk from a random access source and upload it
  //
  // @param  : chunk, source, chunk buffer
  // @return : chunk result
  ChunkResult UploadChunk(const ChunkDescriptor &descriptor,
                          CX::Data::TransferSource *source,
                          const CX::Data::Buffer &buffer) const;

  // Upload a chunk whose bytes are already in the buffer
  ChunkResult UploadFilledChunk(const ChunkDescriptor &descriptor,
                                const CX::Data::Buffer &buffer) const;

  // Read the whole source and upload it in one request
  ChunkResult UploadSingle(const ChunkDescriptor &descriptor,
                           CX::Data::TransferSource *source,
                           const CX::Data::Buffer &buffer) const;

  // Fetch the chunk range and write it into the sink
  //
  // @param  : chunk, sink, offset of the first byte of the sink in the
  //           remote resource, chunk buffer
  // @return : chunk result
  ChunkResult DownloadChunk(const ChunkDescriptor &descriptor,
                            CX::Data::TransferSink *sink, uint64_t rangeBegin,
                            const CX::Data::Buffer &buffer) const;

  // Verify and store the body of a successful ranged response
  ChunkResult ReceiveChunk(const ChunkDescriptor &descriptor,
                           const CX::Client::Http::HttpResponse &response,
                           CX::Data::TransferSink *sink, uint64_t rangeBegin,
                           const CX::Data::Buffer &buffer) const;

 private:
  ChunkResult SendUpload(const ChunkDescriptor &descriptor,
                         const CX::Data::Buffer &buffer, bool singleShot) const;
  ChunkResult ReadAndSendUpload(const ChunkDescriptor &descriptor,
                                CX::Data::TransferSource *source,
                                const CX::Data::Buffer &buffer,
                                bool singleShot) const;
  ChunkResult MakeFailedResult(
      uint32_t index,
      const CX::Client::ClientError<CX::Client::TransferError::Value> &err)
      const;
  void OnChunkTransferred(const ChunkResult &result) const;

 private:
  boost::shared_ptr<CX::Client::Transport> m_transport;
  boost::shared_ptr<ResourceEndpoint> m_endpoint;
  CX::Client::PreconditionSet m_preconditions;
  bool m_validateContent;
  TransferHandle *m_handle;  // not owned, may be null
};

// Copy ETag and Last-Modified of a response into a chunk result
void SetResultMetadata(const CX::Client::Http::HttpResponse &response,
                       ChunkResult *result);

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_CHUNKTRANSFERWORKER_H_
