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

#include "configure/Default.h"

#include <stdint.h>

#include <string>

#include "base/Size.h"

namespace CX {

namespace Configure {

namespace Default {

using std::string;

static const char *const PROGRAM_NAME = "chunkxfer";
static const char *const CHUNKXFER_DEFAULT_CONFIGURE_FILE =
    "/etc/chunkxfer.conf";
static const char *const CHUNKXFER_DEFAULT_LOGLEVEL_NAME = "WARN";
static const uint16_t CHUNKXFER_DEFAULT_TRANSACTION_RETRIES = 3;

const char *GetProgramName() { return PROGRAM_NAME; }

string GetDefaultConfigureFile() { return CHUNKXFER_DEFAULT_CONFIGURE_FILE; }
string GetDefaultLogLevelName() { return CHUNKXFER_DEFAULT_LOGLEVEL_NAME; }
uint32_t GetMaxLogSizeInMB() { return 100; }

uint64_t GetDefaultMaxSinglePutSize() { return CX::Size::MB64; }
uint64_t GetDefaultMaxBlockSize() { return CX::Size::MB4; }
uint64_t GetDefaultMaxSingleGetSize() { return CX::Size::MB32; }
uint64_t GetDefaultMaxChunkGetSize() { return CX::Size::MB4; }

uint64_t GetDefaultMaxRangeSize() {
  // the service rejects file ranges larger than 4MB
  return CX::Size::MB4;
}

uint32_t GetDefaultMaxConcurrency() { return 1; }

uint16_t GetDefaultTransactionRetries() {
  return CHUNKXFER_DEFAULT_TRANSACTION_RETRIES;
}

uint32_t GetDefaultRetryScaleFactor() { return 25; }

uint32_t GetDefaultTimeout() { return 0; }

uint32_t GetDefaultResultsPerPage() { return CX::Size::K5; }

}  // namespace Default
}  // namespace Configure
}  // namespace CX
