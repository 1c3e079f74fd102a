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

#include "client/NullTransport.h"

#include "client/ClientError.hpp"
#include "client/Http.h"
#include "client/TransferError.h"

namespace CX {

namespace Client {

using CX::Client::Http::HttpMethodToString;
using CX::Client::Http::HttpRequest;

// --------------------------------------------------------------------------
TransportOutcome NullTransport::Send(const HttpRequest &request) {
  return TransportOutcome(ClientError<TransferError::Value>(
      TransferError::TRANSPORT_ERROR, "RequestNotMade",
      "No transport configured for " + HttpMethodToString(request.GetMethod()) +
          " " + request.GetURL(),
      false));
}

}  // namespace Client
}  // namespace CX
