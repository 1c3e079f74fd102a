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

#include "client/TransferError.h"

#include <string.h>

#include <string>
#include <utility>

#include "client/Http.h"

namespace CX {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

namespace {

typedef pair<TransferError::Value, const char *> ErrorNamePair;

const ErrorNamePair errToNames[] = {
    // keep in the order of TransferError::Value
    make_pair(TransferError::UNKNOWN, "Unknown"),
    make_pair(TransferError::GOOD, "Good"),
    make_pair(TransferError::CONDITION_NOT_MET, "ConditionNotMet"),
    make_pair(TransferError::INTEGRITY_ERROR, "IntegrityError"),
    make_pair(TransferError::CONFIGURATION_ERROR, "ConfigurationError"),
    make_pair(TransferError::TRANSPORT_ERROR, "TransportError"),
    make_pair(TransferError::TIMEOUT, "Timeout"),
    make_pair(TransferError::NOT_FOUND, "NotFound"),
    make_pair(TransferError::INVALID_RANGE, "InvalidRange"),
    make_pair(TransferError::RESOURCE_EXISTS, "ResourceExists"),
    make_pair(TransferError::AUTHENTICATION_FAILED, "AuthenticationFailed"),
    make_pair(TransferError::REQUEST_REJECTED, "RequestRejected"),
    make_pair(TransferError::THROTTLED, "Throttled"),
    make_pair(TransferError::SERVICE_ERROR, "ServiceError"),
    make_pair(TransferError::UNEXPECTED_RESPONSE, "UnexpectedResponse"),
};

const int errCount = sizeof(errToNames) / sizeof(errToNames[0]);

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value StringToTransferError(const string &name) {
  for (int i = 0; i < errCount; ++i) {
    if (strcmp(name.c_str(), errToNames[i].second) == 0) {
      return errToNames[i].first;
    }
  }
  return TransferError::UNKNOWN;
}

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  // binary search
  int low = 0;
  int high = errCount - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error) {
  return TransferErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const ClientError<TransferError::Value> &error) {
  return error.GetError() == TransferError::GOOD;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> MakeTransferError(TransferError::Value err,
                                                    const string &name,
                                                    const string &msg) {
  return ClientError<TransferError::Value>(err, name, msg, false);
}

// --------------------------------------------------------------------------
TransferError::Value HttpStatusToTransferError(int status) {
  using namespace CX::Client::Http;  // NOLINT
  if (IsSuccessStatus(status)) {
    return TransferError::GOOD;
  }
  switch (status) {
    case HttpStatus::PreconditionFailed:
      return TransferError::CONDITION_NOT_MET;
    case HttpStatus::NotFound:
      return TransferError::NOT_FOUND;
    case HttpStatus::RequestedRangeNotSatisfiable:
      return TransferError::INVALID_RANGE;
    case HttpStatus::Conflict:
      return TransferError::RESOURCE_EXISTS;
    case HttpStatus::Unauthorized:
    case HttpStatus::Forbidden:
      return TransferError::AUTHENTICATION_FAILED;
    case HttpStatus::TooManyRequests:
    case HttpStatus::ServiceUnavailable:
      return TransferError::THROTTLED;
    default:
      break;
  }
  if (status >= 400 && status < 500) {
    return TransferError::REQUEST_REJECTED;
  }
  if (status >= 500 && status < 600) {
    return TransferError::SERVICE_ERROR;
  }
  return TransferError::UNEXPECTED_RESPONSE;
}

// --------------------------------------------------------------------------
bool IsRetryableStatus(int status) {
  using namespace CX::Client::Http;  // NOLINT
  switch (status) {
    case HttpStatus::RequestTimeout:
    case HttpStatus::TooManyRequests:
    case HttpStatus::InternalServerError:
    case HttpStatus::BadGateway:
    case HttpStatus::ServiceUnavailable:
    case HttpStatus::GatewayTimeout:
      return true;
    default:
      return false;
  }
}

}  // namespace Client
}  // namespace CX
