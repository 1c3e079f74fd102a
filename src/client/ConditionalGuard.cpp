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

#include "client/ConditionalGuard.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/TimeUtils.h"
#include "client/Http.h"

namespace CX {

namespace Client {

using boost::to_string;
using CX::Client::Http::HttpRequest;
using CX::Client::Http::HttpResponse;
using CX::Client::Http::HttpStatus;
using CX::TimeUtils::SecondsToHttpDate;
using std::string;

const char *const SERVICE_ERROR_CODE_HEADER = "x-ms-error-code";

// --------------------------------------------------------------------------
void ApplyPreconditions(const PreconditionSet &preconditions,
                        HttpRequest *request) {
  if (request == NULL) {
    return;
  }
  if (preconditions.m_ifModifiedSince) {
    request->SetHeader(Http::IF_MODIFIED_SINCE,
                       SecondsToHttpDate(*preconditions.m_ifModifiedSince));
  }
  if (preconditions.m_ifUnmodifiedSince) {
    request->SetHeader(Http::IF_UNMODIFIED_SINCE,
                       SecondsToHttpDate(*preconditions.m_ifUnmodifiedSince));
  }
  if (preconditions.m_ifMatch) {
    request->SetHeader(Http::IF_MATCH, *preconditions.m_ifMatch);
  }
  if (preconditions.m_ifNoneMatch) {
    request->SetHeader(Http::IF_NONE_MATCH, *preconditions.m_ifNoneMatch);
  }
}

// --------------------------------------------------------------------------
bool IsConditionalRequest(const HttpRequest &request) {
  return request.HasHeader(Http::IF_MODIFIED_SINCE) ||
         request.HasHeader(Http::IF_UNMODIFIED_SINCE) ||
         request.HasHeader(Http::IF_MATCH) ||
         request.HasHeader(Http::IF_NONE_MATCH);
}

// --------------------------------------------------------------------------
TransferError::Value ClassifyResponse(const HttpResponse &response,
                                      bool conditionalRequest) {
  int status = response.GetStatus();
  if (status == HttpStatus::NotModified && conditionalRequest) {
    return TransferError::CONDITION_NOT_MET;
  }
  return HttpStatusToTransferError(status);
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TranslateOutcome(
    const TransportOutcome &outcome, const HttpRequest &request,
    const string &operationName) {
  if (!outcome.IsSuccess()) {
    ClientError<TransferError::Value> err = outcome.GetError();
    if (err.GetExceptionName().empty()) {
      err.SetExceptionName(operationName);
    }
    return err;
  }

  const HttpResponse &response = outcome.GetResult();
  TransferError::Value kind =
      ClassifyResponse(response, IsConditionalRequest(request));
  if (kind == TransferError::GOOD) {
    return ClientError<TransferError::Value>(TransferError::GOOD, false);
  }

  string msg = Http::HttpStatusToName(response.GetStatus()) + " (" +
               to_string(response.GetStatus()) + ")";
  string serviceCode = response.GetHeader(SERVICE_ERROR_CODE_HEADER);
  if (!serviceCode.empty()) {
    msg += " " + serviceCode;
  }
  return ClientError<TransferError::Value>(kind, operationName, msg, false);
}

}  // namespace Client
}  // namespace CX
