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

#ifndef CHUNKXFER_BASE_TIMEUTILS_H_
#define CHUNKXFER_BASE_TIMEUTILS_H_

#include <stdint.h>
#include <time.h>

#include <string>
#include <utility>

namespace CX {

namespace TimeUtils {

// Convert HTTP date (RFC 1123, GMT) to time in seconds
//
// @param  : date string, e.g. "Tue, 15 Nov 1994 08:12:31 GMT"
// @return : {success, time in seconds}
std::pair<bool, time_t> HttpDateToSeconds(const std::string &date);

// Convert time to HTTP date (RFC 1123, GMT)
//
// @param  : time in seconds
// @return : date string
std::string SecondsToHttpDate(time_t time);

// Milliseconds elapsed since a monotonic starting point
//
// @param  : starting point returned by GetMonotonicMilliseconds
// @return : elapsed milliseconds
uint64_t GetElapsedMilliseconds(uint64_t startInMs);

// Current reading of the monotonic clock in milliseconds
uint64_t GetMonotonicMilliseconds();

}  // namespace TimeUtils
}  // namespace CX


#endif  // CHUNKXFER_BASE_TIMEUTILS_H_
