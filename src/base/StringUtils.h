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

#ifndef CHUNKXFER_BASE_STRINGUTILS_H_
#define CHUNKXFER_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>

namespace CX {

namespace StringUtils {

std::string ToLower(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Trim blanks, tabs and line endings from both sides
std::string TrimWhitespace(const std::string &str);

// Percent-encode everything except unreserved characters (RFC 3986)
std::string URLEncode(const std::string &str);

// Format chunk context attached to diagnostics
//
// @param  : chunk index
// @return : "[chunk=<index>]"
std::string FormatChunk(uint32_t index);

}  // namespace StringUtils
}  // namespace CX

#endif  // CHUNKXFER_BASE_STRINGUTILS_H_
