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

#include "base/Logging.h"

#include <stdint.h>

#include <iostream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace CX {

namespace Logging {

using CX::Exception::CXException;
using std::pair;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir, uint32_t maxLogSizeInMB) {
  boost::call_once(initOnce,
                   boost::bind(boost::type<void>(), &Log::DoInitialize, this,
                               logdir, maxLogSizeInMB));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir, uint32_t maxLogSizeInMB) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    if (!CX::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw CXException("Unable to create log directory " + logdir);
    }
    pair<bool, string> writable = CX::Utils::IsWritableDirectory(logdir);
    if (!writable.first) {
      throw CXException("Could not create logging file at " + logdir + " " +
                        writable.second);
    }

    m_logDirectory = logdir;
    // glog reads FLAGS_log_dir when opening the destination files,
    // so it must be set before google::InitGoogleLogging.
    FLAGS_log_dir = logdir.c_str();
    FLAGS_max_log_size = maxLogSizeInMB > 0
                             ? maxLogSizeInMB
                             : CX::Configure::Default::GetMaxLogSizeInMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  google::InitGoogleLogging(CX::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

// --------------------------------------------------------------------------
void Log::ClearLogDirectory() const {
  if (m_logDirectory.empty()) {
    std::cerr << "Log message to console, nothing to clear" << std::endl;
    return;
  }
  pair<bool, string> outcome =
      CX::Utils::DeleteFilesInDirectory(m_logDirectory, false);
  if (!outcome.first) {
    std::cerr << "Unable to clear log directory : " << outcome.second
              << std::endl;
  }
}

}  // namespace Logging
}  // namespace CX
