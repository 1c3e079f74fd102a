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

#ifndef CHUNKXFER_CLIENT_CONDITIONALGUARD_H_
#define CHUNKXFER_CLIENT_CONDITIONALGUARD_H_

#include <string>

#include "client/ClientError.hpp"
#include "client/Http.h"
#include "client/PreconditionSet.h"
#include "client/TransferError.h"
#include "client/Transport.h"

namespace CX {

namespace Client {

// Header carrying the service specific error code of a failed response
extern const char *const SERVICE_ERROR_CODE_HEADER;

// Decorate request with the conditional headers of the set fields,
// modification times as HTTP dates, etags verbatim
//
// @param  : preconditions, request to decorate
// @return : none
void ApplyPreconditions(const PreconditionSet &preconditions,
                        Http::HttpRequest *request);

// Whether the request carries any conditional header
bool IsConditionalRequest(const Http::HttpRequest &request);

// Classify a response status
//
// @param  : response, whether the request was conditional
// @return : GOOD for success, CONDITION_NOT_MET for 412 (and for 304 when
//           the request was conditional), otherwise the generic status kind
TransferError::Value ClassifyResponse(const Http::HttpResponse &response,
                                      bool conditionalRequest);

// Translate the outcome of one network call into the error taxonomy.
// Transport failures pass through unchanged.
//
// @param  : transport outcome, the request sent, operation name
// @return : GOOD error if the response is a success
ClientError<TransferError::Value> TranslateOutcome(
    const TransportOutcome &outcome, const Http::HttpRequest &request,
    const std::string &operationName);

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_CONDITIONALGUARD_H_
