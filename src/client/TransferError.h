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

#ifndef CHUNKXFER_CLIENT_TRANSFERERROR_H_
#define CHUNKXFER_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace CX {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,

    // reported by the transfer core
    CONDITION_NOT_MET,    // server rejected a precondition header
    INTEGRITY_ERROR,      // content digest mismatch
    CONFIGURATION_ERROR,  // invalid arguments, detected before any request
    TRANSPORT_ERROR,      // transport failed after its own retries
    TIMEOUT,              // wall-clock budget exhausted

    // mapped from http response status
    NOT_FOUND,              // 404
    INVALID_RANGE,          // 416
    RESOURCE_EXISTS,        // 409
    AUTHENTICATION_FAILED,  // 401, 403
    REQUEST_REJECTED,       // other 4xx
    THROTTLED,              // 429, 503
    SERVICE_ERROR,          // other 5xx
    UNEXPECTED_RESPONSE     // anything else not successful
  };
};

TransferError::Value StringToTransferError(const std::string &name);
std::string TransferErrorToString(TransferError::Value err);

std::string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error);
bool IsGoodTransferError(const ClientError<TransferError::Value> &error);

// Build an error ready to be returned
//
// @param  : error kind, operation name, message
// @return : non-retryable client error
ClientError<TransferError::Value> MakeTransferError(TransferError::Value err,
                                                    const std::string &name,
                                                    const std::string &msg);

// Generic status table, 412 maps to CONDITION_NOT_MET and 2xx to GOOD
//
// @param  : http status
// @return : error kind
TransferError::Value HttpStatusToTransferError(int status);

// Whether a response with this status is worth sending again
bool IsRetryableStatus(int status);

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_TRANSFERERROR_H_
