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

#ifndef CHUNKXFER_CLIENT_UTILS_H_
#define CHUNKXFER_CLIENT_UTILS_H_

#include <stdint.h>

#include <string>

#include "boost/optional.hpp"
#include "boost/tuple/tuple.hpp"

namespace CX {

namespace Client {

namespace Utils {

// Build request header of 'Range'
//
// @param  : start, stop (inclusive)
// @return : string with format of "bytes=start_offset-stop_offset"
std::string BuildRequestRange(uint64_t start, uint64_t stop);

// Build request header of 'Range' with no known end
//
// @param  : start
// @return : string with format of "bytes=start_offset-"
std::string BuildRequestRangeStart(uint64_t start);

// Parse response header of 'Content-Range'
//
// @param  : "bytes start_offset-stop_offset/resource_size"
// @return : success, start, stop (inclusive), resource size
//
// A resource size of "*" is rejected, the transfer needs the total.
boost::tuple<bool, uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const std::string &contentRange);

// Parse request header of 'Range'
//
// @param  : "bytes=start_offset-stop_offset" or "bytes=start_offset-"
// @return : success, start, stop if present
boost::tuple<bool, uint64_t, boost::optional<uint64_t> > ParseRequestRange(
    const std::string &requestRange);

}  // namespace Utils
}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_UTILS_H_
