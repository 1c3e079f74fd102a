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

#include "client/RetryingTransport.h"

#include <stdint.h>

#include <iostream>
#include <string>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "client/NullTransport.h"
#include "client/TransferError.h"

namespace CX {

namespace Client {

using boost::shared_ptr;
using CX::Client::Http::HttpMethodToString;
using CX::Client::Http::HttpRequest;
using CX::Client::Http::HttpStatusToName;
using std::iostream;
using std::string;

// --------------------------------------------------------------------------
RetryingTransport::RetryingTransport(const shared_ptr<Transport> &transport,
                                     const RetryStrategy &retryStrategy)
    : m_transport(transport ? transport
                            : shared_ptr<Transport>(new NullTransport)),
      m_retryStrategy(retryStrategy) {}

// --------------------------------------------------------------------------
TransportOutcome RetryingTransport::Send(const HttpRequest &request) {
  const shared_ptr<iostream> &body = request.GetBody();
  std::streampos bodyStart = body ? body->tellg() : std::streampos(0);
  string requestName =
      HttpMethodToString(request.GetMethod()) + " " + request.GetURL();

  uint16_t attemptedRetries = 0;
  while (true) {
    if (attemptedRetries > 0 && body) {
      body->clear();
      body->seekg(bodyStart);
    }

    TransportOutcome outcome = m_transport->Send(request);
    if (outcome.IsSuccess()) {
      int status = outcome.GetResult().GetStatus();
      if (!m_retryStrategy.ShouldRetry(status, attemptedRetries)) {
        return outcome;
      }
      DebugWarning("Retry " << requestName << " after response "
                            << HttpStatusToName(status));
    } else {
      if (!m_retryStrategy.ShouldRetry(outcome.GetError(), attemptedRetries)) {
        return outcome;
      }
      DebugWarning("Retry " << requestName << " after "
                            << GetMessageForTransferError(outcome.GetError()));
    }

    ++attemptedRetries;
    RetryRequestSleep(boost::posix_time::milliseconds(
        m_retryStrategy.CalculateDelayBeforeNextRetry(attemptedRetries)));
  }
}

// --------------------------------------------------------------------------
void RetryingTransport::RetryRequestSleep(
    boost::posix_time::milliseconds sleepTime) const {
  boost::unique_lock<boost::mutex> lock(m_retryLock);
  m_retrySignal.timed_wait(lock, sleepTime);
}

}  // namespace Client
}  // namespace CX
