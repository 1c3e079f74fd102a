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

#include "client/Utils.h"

#include <stdint.h>

#include <iostream>
#include <sstream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/optional.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace CX {

namespace Client {

namespace Utils {

using boost::make_tuple;
using boost::optional;
using boost::to_string;
using boost::tuple;
using std::istream;
using std::string;

namespace {

template <char C>
istream &expect(istream &in) {
  if (in.peek() == C) {
    in.ignore();
  } else {
    in.setstate(std::ios_base::failbit);
  }
  return in;
}

// Reads an unsigned number, rejects signs and blanks
bool ReadNumber(istream &in, uint64_t *value) {
  int next = in.peek();
  if (next < '0' || next > '9') {
    in.setstate(std::ios_base::failbit);
    return false;
  }
  return static_cast<bool>(in >> *value);
}

}  // namespace

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t stop) {
  DebugWarningIf(stop < start, "Invalid range with stop before start");
  // e.g. bytes=0-0 return the first byte
  return "bytes=" + to_string(start) + "-" + to_string(stop);
}

// --------------------------------------------------------------------------
string BuildRequestRangeStart(uint64_t start) {
  return "bytes=" + to_string(start) + "-";
}

// --------------------------------------------------------------------------
tuple<bool, uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const string &contentRange) {
  tuple<bool, uint64_t, uint64_t, uint64_t> invalid =
      make_tuple(false, 0, 0, 0);
  string cpy(CX::StringUtils::TrimWhitespace(contentRange));
  static const string prefix = "bytes ";
  if (cpy.compare(0, prefix.size(), prefix) != 0) {
    DebugWarning("Invalid content range: " << contentRange);
    return invalid;
  }

  std::istringstream in(cpy.substr(prefix.size()));
  uint64_t start = 0;
  uint64_t stop = 0;
  uint64_t size = 0;
  if (ReadNumber(in, &start) && (in >> expect<'-'>) && ReadNumber(in, &stop) &&
      (in >> expect<'/'>) && ReadNumber(in, &size) &&
      in.peek() == std::char_traits<char>::eof()) {
    if (stop >= start && stop < size) {
      return make_tuple(true, start, stop, size);
    }
  }
  DebugWarning("Invalid content range: " << contentRange);
  return invalid;
}

// --------------------------------------------------------------------------
tuple<bool, uint64_t, optional<uint64_t> > ParseRequestRange(
    const string &requestRange) {
  tuple<bool, uint64_t, optional<uint64_t> > invalid =
      make_tuple(false, 0, optional<uint64_t>());
  string cpy(CX::StringUtils::TrimWhitespace(requestRange));
  static const string prefix = "bytes=";
  if (cpy.compare(0, prefix.size(), prefix) != 0) {
    return invalid;
  }

  std::istringstream in(cpy.substr(prefix.size()));
  uint64_t start = 0;
  if (!ReadNumber(in, &start) || !(in >> expect<'-'>)) {
    return invalid;
  }
  if (in.peek() == std::char_traits<char>::eof()) {
    return make_tuple(true, start, optional<uint64_t>());
  }
  uint64_t stop = 0;
  if (!ReadNumber(in, &stop) || in.peek() != std::char_traits<char>::eof() ||
      stop < start) {
    return invalid;
  }
  return make_tuple(true, start, optional<uint64_t>(stop));
}

}  // namespace Utils
}  // namespace Client
}  // namespace CX
