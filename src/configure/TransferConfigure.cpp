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

#include "configure/TransferConfigure.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>  // for strtoull
#include <string.h>  // for strerror

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace CX {

namespace Configure {

using boost::to_string;
using CX::Client::ClientError;
using CX::Client::TransferError;
using CX::StringUtils::ToLower;
using CX::StringUtils::TrimWhitespace;
using std::ifstream;
using std::make_pair;
using std::pair;
using std::string;

namespace {

pair<bool, string> ErrorOut(const string &str) { return make_pair(false, str); }

ClientError<TransferError::Value> InvalidField(const string &field) {
  return ClientError<TransferError::Value>(
      TransferError::CONFIGURATION_ERROR, "TransferConfigure",
      field + " must be greater than zero", false);
}

bool ParseBool(const string &text, bool *value) {
  string lower = ToLower(text);
  if (lower == "true" || lower == "yes" || lower == "1") {
    *value = true;
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "0") {
    *value = false;
    return true;
  }
  return false;
}

template <typename T>
bool ParseUnsigned(const string &text, T *value) {
  uint64_t size = 0;
  if (!ParseSize(text, &size) || size > std::numeric_limits<T>::max()) {
    return false;
  }
  *value = static_cast<T>(size);
  return true;
}

bool ApplySetting(const string &key, const string &value,
                  TransferConfigure *config) {
  if (key == "max_single_put_size") {
    return ParseSize(value, &config->m_maxSinglePutSize);
  } else if (key == "max_block_size") {
    return ParseSize(value, &config->m_maxBlockSize);
  } else if (key == "max_single_get_size") {
    return ParseSize(value, &config->m_maxSingleGetSize);
  } else if (key == "max_chunk_get_size") {
    return ParseSize(value, &config->m_maxChunkGetSize);
  } else if (key == "max_range_size") {
    return ParseSize(value, &config->m_maxRangeSize);
  } else if (key == "max_concurrency") {
    return ParseUnsigned(value, &config->m_maxConcurrency);
  } else if (key == "retries") {
    return ParseUnsigned(value, &config->m_transactionRetries);
  } else if (key == "retry_scale_factor_ms") {
    return ParseUnsigned(value, &config->m_retryScaleFactor);
  } else if (key == "timeout_ms") {
    return ParseUnsigned(value, &config->m_timeout);
  } else if (key == "results_per_page") {
    return ParseUnsigned(value, &config->m_resultsPerPage);
  } else if (key == "validate_content") {
    return ParseBool(value, &config->m_validateContent);
  }
  return false;
}

}  // namespace

// --------------------------------------------------------------------------
TransferConfigure::TransferConfigure()
    : m_maxSinglePutSize(Default::GetDefaultMaxSinglePutSize()),
      m_maxBlockSize(Default::GetDefaultMaxBlockSize()),
      m_maxSingleGetSize(Default::GetDefaultMaxSingleGetSize()),
      m_maxChunkGetSize(Default::GetDefaultMaxChunkGetSize()),
      m_maxRangeSize(Default::GetDefaultMaxRangeSize()),
      m_maxConcurrency(Default::GetDefaultMaxConcurrency()),
      m_transactionRetries(Default::GetDefaultTransactionRetries()),
      m_retryScaleFactor(Default::GetDefaultRetryScaleFactor()),
      m_timeout(Default::GetDefaultTimeout()),
      m_resultsPerPage(Default::GetDefaultResultsPerPage()),
      m_validateContent(false) {}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TransferConfigure::Validate() const {
  if (m_maxBlockSize == 0) {
    return InvalidField("max_block_size");
  }
  if (m_maxSingleGetSize == 0) {
    return InvalidField("max_single_get_size");
  }
  if (m_maxChunkGetSize == 0) {
    return InvalidField("max_chunk_get_size");
  }
  if (m_maxRangeSize == 0) {
    return InvalidField("max_range_size");
  }
  if (m_maxConcurrency == 0) {
    return InvalidField("max_concurrency");
  }
  if (m_resultsPerPage == 0) {
    return InvalidField("results_per_page");
  }
  return ClientError<TransferError::Value>(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
string TransferConfigure::ToString() const {
  std::stringstream ss;
  ss << "[max_single_put_size=" << m_maxSinglePutSize
     << " max_block_size=" << m_maxBlockSize
     << " max_single_get_size=" << m_maxSingleGetSize
     << " max_chunk_get_size=" << m_maxChunkGetSize
     << " max_range_size=" << m_maxRangeSize
     << " max_concurrency=" << m_maxConcurrency
     << " retries=" << m_transactionRetries
     << " retry_scale_factor_ms=" << m_retryScaleFactor
     << " timeout_ms=" << m_timeout
     << " results_per_page=" << m_resultsPerPage
     << " validate_content=" << std::boolalpha << m_validateContent << "]";
  return ss.str();
}

// --------------------------------------------------------------------------
bool ParseSize(const string &text, uint64_t *size) {
  string trimmed = TrimWhitespace(text);
  if (trimmed.empty() || size == NULL) {
    return false;
  }

  uint64_t multiplier = 1;
  int suffix =
      std::toupper(static_cast<unsigned char>(trimmed[trimmed.size() - 1]));
  if (suffix == 'K' || suffix == 'M' || suffix == 'G') {
    multiplier = suffix == 'K' ? 1024ULL
                               : (suffix == 'M' ? 1024ULL * 1024
                                                : 1024ULL * 1024 * 1024);
    trimmed.erase(trimmed.size() - 1);
  }
  if (trimmed.empty() ||
      trimmed.find_first_not_of("0123456789") != string::npos) {
    return false;
  }

  errno = 0;
  unsigned long long value = strtoull(trimmed.c_str(), NULL, 10);  // NOLINT
  if (errno == ERANGE ||
      value > std::numeric_limits<uint64_t>::max() / multiplier) {
    return false;
  }
  *size = static_cast<uint64_t>(value) * multiplier;
  return true;
}

// --------------------------------------------------------------------------
pair<bool, string> LoadTransferConfigure(const string &file,
                                         TransferConfigure *config) {
  if (config == NULL) {
    return ErrorOut("Null transfer configure");
  }
  if (file.empty()) {
    return ErrorOut("Configure file is not specified");
  }
  if (!CX::Utils::FileExists(file)) {
    return ErrorOut("Configure file " + file + " is not existing");
  }

  ifstream in(file.c_str());
  if (!in) {
    return ErrorOut("Unable to open configure file " + file + " : " +
                    strerror(errno));
  }

  // a rejected file leaves config unchanged
  TransferConfigure loaded = *config;
  int lineNumber = 0;
  for (string line; std::getline(in, line);) {
    ++lineNumber;
    string trimmed = TrimWhitespace(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }

    string::size_type pos = trimmed.find('=');
    string where = file + ":" + to_string(lineNumber);
    if (pos == string::npos) {
      return ErrorOut("Missing '=' at " + where);
    }
    string key = ToLower(TrimWhitespace(trimmed.substr(0, pos)));
    string value = TrimWhitespace(trimmed.substr(pos + 1));
    if (!ApplySetting(key, value, &loaded)) {
      DebugWarning("Reject configure line " << where << " : " << trimmed);
      return ErrorOut("Invalid setting '" + key + "' at " + where);
    }
  }

  *config = loaded;
  return make_pair(true, string());
}

}  // namespace Configure
}  // namespace CX
