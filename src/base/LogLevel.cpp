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

#include "base/LogLevel.h"

#include <string>
#include <utility>

#include "base/StringUtils.h"

namespace CX {

namespace Logging {

using std::string;

namespace {

typedef std::pair<const char *, LogLevel::Value> NameLevelPair;

// Accepted spellings, lowercase
const NameLevelPair levelNames[] = {
    NameLevelPair("error", LogLevel::Error),
    NameLevelPair("fatal", LogLevel::Fatal),
    NameLevelPair("info", LogLevel::Info),
    NameLevelPair("warn", LogLevel::Warn),
    NameLevelPair("warning", LogLevel::Warn),
};

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  switch (logLevel) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    default:
      return string();
  }
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const std::string &name) {
  if (name.empty()) {
    return LogLevel::Info;
  }

  string lowercase = CX::StringUtils::ToLower(CX::StringUtils::Trim(name, ' '));
  size_t count = sizeof(levelNames) / sizeof(levelNames[0]);
  for (size_t i = 0; i < count; ++i) {
    if (lowercase == levelNames[i].first) {
      return levelNames[i].second;
    }
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace CX
