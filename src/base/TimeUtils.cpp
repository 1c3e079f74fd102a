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

#include "base/TimeUtils.h"

#include <stdint.h>
#include <string.h>  // for memset
#include <time.h>    // for strftime

#include <string>
#include <utility>

namespace CX {

namespace TimeUtils {

using std::make_pair;
using std::pair;
using std::string;

static const char *HTTP_DATE_FORMAT = "%a, %d %b %Y %H:%M:%S GMT";

// --------------------------------------------------------------------------
pair<bool, time_t> HttpDateToSeconds(const string &date) {
  if (date.empty()) {
    return make_pair(false, static_cast<time_t>(0));
  }
  struct tm res;
  memset(&res, 0, sizeof(struct tm));
  const char *end = strptime(date.c_str(), HTTP_DATE_FORMAT, &res);
  if (end == NULL) {
    return make_pair(false, static_cast<time_t>(0));
  }
  return make_pair(true, timegm(&res));
}

// --------------------------------------------------------------------------
string SecondsToHttpDate(time_t time) {
  struct tm res;
  memset(&res, 0, sizeof(struct tm));
  gmtime_r(&time, &res);

  char date[64];
  memset(date, 0, sizeof(date));
  strftime(date, sizeof(date), HTTP_DATE_FORMAT, &res);
  return date;
}

// --------------------------------------------------------------------------
uint64_t GetMonotonicMilliseconds() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000 +
         static_cast<uint64_t>(ts.tv_nsec) / 1000000;
}

// --------------------------------------------------------------------------
uint64_t GetElapsedMilliseconds(uint64_t startInMs) {
  uint64_t now = GetMonotonicMilliseconds();
  return now > startInMs ? now - startInMs : 0;
}

}  // namespace TimeUtils
}  // namespace CX
