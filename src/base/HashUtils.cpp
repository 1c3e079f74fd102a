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

#include "base/HashUtils.h"

#include <stddef.h>

#include <string>
#include <vector>

#include "openssl/evp.h"

namespace CX {

namespace HashUtils {

using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ComputeMD5(const char *data, size_t length) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == NULL) {
    return string();
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  bool success = EVP_DigestInit_ex(ctx, EVP_md5(), NULL) == 1 &&
                 EVP_DigestUpdate(ctx, data, length) == 1 &&
                 EVP_DigestFinal_ex(ctx, digest, &digestLen) == 1;
  EVP_MD_CTX_free(ctx);

  if (!success) {
    return string();
  }
  return string(reinterpret_cast<const char *>(digest), digestLen);
}

// --------------------------------------------------------------------------
string Base64Encode(const string &bytes) {
  if (bytes.empty()) {
    return string();
  }
  // 4 output chars per 3 input bytes, plus the trailing NUL
  vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(&out[0],
                            reinterpret_cast<const unsigned char *>(bytes.data()),
                            static_cast<int>(bytes.size()));
  if (len < 0) {
    return string();
  }
  return string(reinterpret_cast<const char *>(&out[0]), len);
}

// --------------------------------------------------------------------------
bool Base64Decode(const string &encoded, string *bytes) {
  if (bytes == NULL) {
    return false;
  }
  bytes->clear();
  if (encoded.empty()) {
    return true;
  }
  if (encoded.size() % 4 != 0) {
    return false;
  }

  vector<unsigned char> out(3 * (encoded.size() / 4) + 1);
  int len = EVP_DecodeBlock(
      &out[0], reinterpret_cast<const unsigned char *>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (len < 0) {
    return false;
  }
  // EVP_DecodeBlock keeps the bytes produced by padding
  string::size_type pos = encoded.find_last_not_of('=');
  if (pos == string::npos) {
    return false;
  }
  size_t padding = encoded.size() - 1 - pos;
  if (padding > 2 || padding > static_cast<size_t>(len)) {
    return false;
  }
  bytes->assign(reinterpret_cast<const char *>(&out[0]), len - padding);
  return true;
}

// --------------------------------------------------------------------------
string ComputeContentMD5(const char *data, size_t length) {
  return Base64Encode(ComputeMD5(data, length));
}

}  // namespace HashUtils
}  // namespace CX
