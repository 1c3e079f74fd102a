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

#include <getopt.h>
#include <stdint.h>

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "boost/foreach.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/TransferError.h"
#include "configure/Default.h"
#include "configure/TransferConfigure.h"
#include "transfer/RangePartitioner.h"

using CX::Client::GetMessageForTransferError;
using CX::Client::IsGoodTransferError;
using CX::Configure::Default::GetDefaultConfigureFile;
using CX::Configure::Default::GetDefaultLogLevelName;
using CX::Configure::Default::GetMaxLogSizeInMB;
using CX::Configure::Default::GetProgramName;
using CX::Configure::LoadTransferConfigure;
using CX::Configure::ParseSize;
using CX::Configure::TransferConfigure;
using CX::Exception::CXException;
using CX::Transfer::ChunkDescriptor;
using CX::Transfer::PlanChunks;
using CX::Transfer::PlanOutcome;
using CX::Transfer::TransferPlan;
using std::pair;
using std::string;
using std::vector;

namespace {

struct CommandLine {
  CommandLine()
      : configFile(GetDefaultConfigureFile()),
        logLevel(GetDefaultLogLevelName()),
        debug(false),
        clearLogDir(false),
        showHelp(false) {}

  string configFile;
  string logDirectory;
  string logLevel;
  bool debug;
  bool clearLogDir;
  bool showHelp;
  vector<string> sizes;
};

void ShowUsage() {
  std::cout
      << "Usage: " << GetProgramName() << " [OPTIONS] SIZE...\n"
      << "Print the effective transfer configure and the chunk plans of\n"
      << "uploads and downloads of each SIZE (K, M, G suffixes allowed).\n\n"
      << "  -c, --config=FILE    configure file, default "
      << GetDefaultConfigureFile() << "\n"
      << "  -l, --logdir=DIR     log directory, default to stderr\n"
      << "  -L, --loglevel=LEVEL INFO, WARN, ERROR or FATAL, default "
      << GetDefaultLogLevelName() << "\n"
      << "  -d, --debug          turn on debug messages\n"
      << "  -C, --clearlogdir    clear the log directory before start\n"
      << "  -h, --help           print this help\n";
}

CommandLine ParseCommandLine(int argc, char **argv) {
  static const struct option longOptions[] = {
      {"config", required_argument, NULL, 'c'},
      {"logdir", required_argument, NULL, 'l'},
      {"loglevel", required_argument, NULL, 'L'},
      {"debug", no_argument, NULL, 'd'},
      {"clearlogdir", no_argument, NULL, 'C'},
      {"help", no_argument, NULL, 'h'},
      {NULL, 0, NULL, 0}};

  CommandLine cmd;
  int opt = 0;
  while ((opt = getopt_long(argc, argv, "c:l:L:dCh", longOptions, NULL)) !=
         -1) {
    switch (opt) {
      case 'c':
        cmd.configFile = optarg;
        break;
      case 'l':
        cmd.logDirectory = optarg;
        break;
      case 'L':
        cmd.logLevel = optarg;
        break;
      case 'd':
        cmd.debug = true;
        break;
      case 'C':
        cmd.clearLogDir = true;
        break;
      case 'h':
        cmd.showHelp = true;
        break;
      default:
        throw CXException("Unknown option, try --help");
    }
  }
  for (int i = optind; i < argc; ++i) {
    cmd.sizes.push_back(argv[i]);
  }
  return cmd;
}

void PrintPlan(const string &title, const TransferPlan &plan) {
  PlanOutcome outcome = PlanChunks(plan);
  if (!outcome.IsSuccess()) {
    throw CXException(title + ": " +
                      GetMessageForTransferError(outcome.GetError()));
  }
  std::cout << title << ": " << outcome.GetResult().size() << " chunk(s)\n";
  BOOST_FOREACH(const ChunkDescriptor &descriptor, outcome.GetResult()) {
    std::cout << "  " << descriptor.ToString() << "\n";
  }
}

void PrintPlans(uint64_t size, const TransferConfigure &config) {
  std::cout << "\nsize " << size << "\n";
  PrintPlan("block blob upload",
            TransferPlan(size, config.m_maxBlockSize, config.m_maxSinglePutSize));
  PrintPlan("file upload", TransferPlan(size, config.m_maxRangeSize, 0));

  uint64_t firstSize = config.m_validateContent ? config.m_maxChunkGetSize
                                                : config.m_maxSingleGetSize;
  if (size <= firstSize) {
    PrintPlan("download", TransferPlan(size, config.m_maxChunkGetSize, size));
  } else {
    std::cout << "download: first request "
              << ChunkDescriptor(0, 0, firstSize, false).ToString() << "\n";
    PrintPlan("download remaining",
              TransferPlan(size - firstSize, config.m_maxChunkGetSize, 0,
                           firstSize, 1));
  }
}

}  // namespace

int main(int argc, char **argv) {
  try {
    CommandLine cmd = ParseCommandLine(argc, argv);
    if (cmd.showHelp) {
      ShowUsage();
      return 0;
    }

    CX::Logging::Log &log = CX::Logging::Log::Instance();
    log.Initialize(cmd.logDirectory, GetMaxLogSizeInMB());
    log.SetLogLevel(CX::Logging::GetLogLevelByName(cmd.logLevel));
    log.SetDebug(cmd.debug);
    if (cmd.clearLogDir) {
      log.ClearLogDirectory();
    }

    TransferConfigure config;
    if (CX::Utils::FileExists(cmd.configFile)) {
      pair<bool, string> res = LoadTransferConfigure(cmd.configFile, &config);
      if (!res.first) {
        throw CXException(res.second);
      }
    } else if (cmd.configFile != GetDefaultConfigureFile()) {
      throw CXException("Configure file " + cmd.configFile + " not exists");
    }

    CX::Client::ClientError<CX::Client::TransferError::Value> err =
        config.Validate();
    if (!IsGoodTransferError(err)) {
      throw CXException(GetMessageForTransferError(err));
    }
    std::cout << config.ToString() << "\n";

    BOOST_FOREACH(const string &text, cmd.sizes) {
      uint64_t size = 0;
      if (!ParseSize(text, &size)) {
        throw CXException("Invalid size " + text);
      }
      PrintPlans(size, config);
    }
  } catch (const CXException &err) {
    std::cerr << "[" << GetProgramName() << " ERROR] " << err.what() << "\n";
    return 1;
  } catch (const std::exception &err) {
    std::cerr << "[" << GetProgramName() << " ERROR] " << err.what() << "\n";
    return 1;
  }
  return 0;
}
