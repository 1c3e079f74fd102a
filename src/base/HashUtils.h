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

#ifndef CHUNKXFER_BASE_HASHUTILS_H_
#define CHUNKXFER_BASE_HASHUTILS_H_

#include <stddef.h>

#include <functional>
#include <string>

#include "boost/functional/hash.hpp"

namespace CX {

namespace HashUtils {

// Hasher for enums wrapped in a struct, e.g. TransferError::Value
struct EnumHash {
  template <typename T>
  int operator()(T enumValue) const {
    return static_cast<int>(enumValue);
  }
};

struct StringHash {
  size_t operator()(const std::string &str) const {
    return boost::hash_range(str.begin(), str.end());
  }
};

// Compute MD5 digest
//
// @param  : data, length of data
// @return : raw 16 bytes digest, empty string on failure
std::string ComputeMD5(const char *data, size_t length);

// Encode bytes in base64 (RFC 4648, padded, no line breaks)
std::string Base64Encode(const std::string &bytes);

// Decode base64
//
// @param  : encoded string, output
// @return : false if the input is not valid base64
bool Base64Decode(const std::string &encoded, std::string *bytes);

// Base64 of the MD5 digest, the form carried by the Content-MD5 header
std::string ComputeContentMD5(const char *data, size_t length);

}  // namespace HashUtils
}  // namespace CX

#endif  // CHUNKXFER_BASE_HASHUTILS_H_
