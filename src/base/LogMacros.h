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

#ifndef CHUNKXFER_BASE_LOGMACROS_H_
#define CHUNKXFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_CHUNKXFER_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)
#define DebugFatal(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)
#define DebugFatalIf(condition, msg)

#else  // !DISABLE_CHUNKXFER_LOGGING

#define CHUNKXFER_LOG_PREFIX(level) \
  CX::Logging::GetLogLevelPrefix(CX::Logging::LogLevel::level)

// The INFO file receives every non-fatal severity, flush it after each
// message so readers of the log files always see the latest line.
#define CHUNKXFER_LOG_IF(severity, level, condition, msg)            \
  {                                                                  \
    LOG_IF(severity, (condition)) << CHUNKXFER_LOG_PREFIX(level) << msg; \
    google::FlushLogFiles(google::INFO);                             \
  }

#define CHUNKXFER_DEBUG_LOG_IF(severity, level, condition, msg) \
  {                                                             \
    if (CX::Logging::Log::Instance().IsDebug()) {               \
      CHUNKXFER_LOG_IF(severity, level, condition, msg)         \
    }                                                           \
  }

#define Info(msg) CHUNKXFER_LOG_IF(INFO, Info, true, msg)
#define Warning(msg) CHUNKXFER_LOG_IF(WARNING, Warn, true, msg)
#define Error(msg) CHUNKXFER_LOG_IF(ERROR, Error, true, msg)
#define Fatal(msg) \
  { LOG(FATAL) << CHUNKXFER_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) CHUNKXFER_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) \
  CHUNKXFER_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) CHUNKXFER_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << CHUNKXFER_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg) CHUNKXFER_DEBUG_LOG_IF(INFO, Info, true, msg)
#define DebugWarning(msg) CHUNKXFER_DEBUG_LOG_IF(WARNING, Warn, true, msg)
#define DebugError(msg) CHUNKXFER_DEBUG_LOG_IF(ERROR, Error, true, msg)
#define DebugFatal(msg)                                        \
  {                                                            \
    if (CX::Logging::Log::Instance().IsDebug()) {              \
      LOG(FATAL) << CHUNKXFER_LOG_PREFIX(Fatal) << msg;        \
    }                                                          \
  }

#define DebugInfoIf(condition, msg) \
  CHUNKXFER_DEBUG_LOG_IF(INFO, Info, condition, msg)
#define DebugWarningIf(condition, msg) \
  CHUNKXFER_DEBUG_LOG_IF(WARNING, Warn, condition, msg)
#define DebugErrorIf(condition, msg) \
  CHUNKXFER_DEBUG_LOG_IF(ERROR, Error, condition, msg)
#define DebugFatalIf(condition, msg)                                   \
  {                                                                    \
    if (CX::Logging::Log::Instance().IsDebug()) {                      \
      LOG_IF(FATAL, (condition)) << CHUNKXFER_LOG_PREFIX(Fatal) << msg; \
    }                                                                  \
  }

#endif  // DISABLE_CHUNKXFER_LOGGING

#endif  // CHUNKXFER_BASE_LOGMACROS_H_
