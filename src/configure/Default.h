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

#ifndef CHUNKXFER_CONFIGURE_DEFAULT_H_
#define CHUNKXFER_CONFIGURE_DEFAULT_H_

#include <stdint.h>  // for fixed width integer types

#include <string>

namespace CX {

namespace Configure {

namespace Default {

const char *GetProgramName();

std::string GetDefaultConfigureFile();
std::string GetDefaultLogLevelName();
uint32_t GetMaxLogSizeInMB();

// Blob uploads at or below this size go out in one request
uint64_t GetDefaultMaxSinglePutSize();
// Staged block size of chunked blob uploads
uint64_t GetDefaultMaxBlockSize();
// First request of a download fetches up to this many bytes
uint64_t GetDefaultMaxSingleGetSize();
// Chunk size of the rest of a download, and of its first request when
// validating content
uint64_t GetDefaultMaxChunkGetSize();
// Range size of file uploads
uint64_t GetDefaultMaxRangeSize();

uint32_t GetDefaultMaxConcurrency();
uint16_t GetDefaultTransactionRetries();
uint32_t GetDefaultRetryScaleFactor();  // in milliseconds
uint32_t GetDefaultTimeout();           // in milliseconds, 0 for no limit
uint32_t GetDefaultResultsPerPage();

}  // namespace Default
}  // namespace Configure
}  // namespace CX

#endif  // CHUNKXFER_CONFIGURE_DEFAULT_H_
