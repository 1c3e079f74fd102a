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

#ifndef CHUNKXFER_CONFIGURE_TRANSFERCONFIGURE_H_
#define CHUNKXFER_CONFIGURE_TRANSFERCONFIGURE_H_

#include <stdint.h>

#include <string>
#include <utility>

#include "client/ClientError.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Configure {

//
// TransferConfigure
//
// Thresholds and limits of one transfer call. Built by the caller and
// passed by const reference, nothing here is process wide.
//
struct TransferConfigure {
  TransferConfigure();

  uint64_t m_maxSinglePutSize;   // blob uploads up to this go in one request
  uint64_t m_maxBlockSize;       // chunk size of blob uploads
  uint64_t m_maxSingleGetSize;   // size of the first download request
  uint64_t m_maxChunkGetSize;    // chunk size of downloads
  uint64_t m_maxRangeSize;       // chunk size of file uploads
  uint32_t m_maxConcurrency;     // chunks in flight
  uint16_t m_transactionRetries;
  uint32_t m_retryScaleFactor;   // in milliseconds
  uint32_t m_timeout;            // in milliseconds, 0 for no limit
  uint32_t m_resultsPerPage;
  bool m_validateContent;

  // @return : GOOD or CONFIGURATION_ERROR naming the offending field
  CX::Client::ClientError<CX::Client::TransferError::Value> Validate() const;

  std::string ToString() const;
};

// Parse a size with an optional K, M or G suffix (powers of 1024)
//
// @param  : text, output
// @return : false if the text is not a size
bool ParseSize(const std::string &text, uint64_t *size);

// Load settings from a file of "key = value" lines.
// Blank lines and lines starting with '#' are ignored.
//
// @param  : file path, configure to update
// @return : {success, message naming the offending line}
//
// Keys: max_single_put_size, max_block_size, max_single_get_size,
// max_chunk_get_size, max_range_size, max_concurrency, retries,
// retry_scale_factor_ms, timeout_ms, results_per_page, validate_content.
std::pair<bool, std::string> LoadTransferConfigure(const std::string &file,
                                                   TransferConfigure *config);

}  // namespace Configure
}  // namespace CX

#endif  // CHUNKXFER_CONFIGURE_TRANSFERCONFIGURE_H_
