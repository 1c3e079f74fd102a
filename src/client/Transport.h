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

#ifndef CHUNKXFER_CLIENT_TRANSPORT_H_
#define CHUNKXFER_CLIENT_TRANSPORT_H_

#include "boost/noncopyable.hpp"

#include "client/ClientError.hpp"
#include "client/Http.h"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Client {

typedef Outcome<Http::HttpResponse, ClientError<TransferError::Value> >
    TransportOutcome;

//
// Transport
//
// Sends one http request and returns the response. Any status code counts
// as a successful send; the outcome only carries an error when no response
// was received (connection failures, broken streams and so on), and that
// error is TRANSPORT_ERROR marked retryable when resending may help.
//
class Transport : private boost::noncopyable {
 public:
  Transport() {}
  virtual ~Transport() {}

  virtual TransportOutcome Send(const Http::HttpRequest &request) = 0;
};

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_TRANSPORT_H_
