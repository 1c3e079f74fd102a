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

#ifndef CHUNKXFER_BASE_LOGGING_H_
#define CHUNKXFER_BASE_LOGGING_H_

#include <stdint.h>

#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace CX {

namespace Logging {

//
// Log
//
// Call Initialize once to get glog ready. With a directory the messages go
// to files under it, otherwise they go to stderr.
//
class Log : public Singleton<Log> {
 public:
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  //
  // Initialize
  // One-time initialization, later calls are ignored.
  //
  // @param  : log dir (empty to log to console), max size of log file in MB
  // @return : none
  //
  // Throw CXException if the log directory is unusable.
  void Initialize(const std::string &logdir = std::string(),
                  uint32_t maxLogSizeInMB = 0);

  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }

  // Remove the files left in the log directory
  void ClearLogDirectory() const;

 private:
  void DoInitialize(const std::string &logdir, uint32_t maxLogSizeInMB);

 private:
  Log()
      : m_logLevel(LogLevel::Info),
        m_logDirectory(std::string()),
        m_isDebug(false) {}

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // log to console if it's empty
  bool m_isDebug;

  friend class LoggingTest;
  friend class FatalLoggingDeathTest;
  friend class Singleton<Log>;
};

}  // namespace Logging
}  // namespace CX

#endif  // CHUNKXFER_BASE_LOGGING_H_
