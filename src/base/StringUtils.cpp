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

#include "base/StringUtils.h"

#include <stdint.h>
#include <stdio.h>

#include <algorithm>
#include <cctype>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace CX {

namespace StringUtils {

using std::string;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string TrimWhitespace(const string &str) {
  static const char *blanks = " \t\r\n";
  string::size_type first = str.find_first_not_of(blanks);
  if (first == string::npos) {
    return string();
  }
  string::size_type last = str.find_last_not_of(blanks);
  return str.substr(first, last - first + 1);
}

// --------------------------------------------------------------------------
string URLEncode(const string &str) {
  string encoded;
  encoded.reserve(str.size());
  BOOST_FOREACH(char ch, str) {
    unsigned char uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) || ch == '-' || ch == '_' || ch == '.' ||
        ch == '~') {
      encoded.append(1, ch);
    } else {
      char buf[4];
      snprintf(buf, sizeof(buf), "%%%02X", uch);
      encoded.append(buf);
    }
  }
  return encoded;
}

// --------------------------------------------------------------------------
string FormatChunk(uint32_t index) {
  return "[chunk=" + boost::to_string(index) + "]";
}

}  // namespace StringUtils
}  // namespace CX
