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

#ifndef CHUNKXFER_CLIENT_RETRYINGTRANSPORT_H_
#define CHUNKXFER_CLIENT_RETRYINGTRANSPORT_H_

#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/Http.h"
#include "client/RetryStrategy.h"
#include "client/Transport.h"

namespace CX {

namespace Client {

//
// RetryingTransport
//
// Decorates a transport with a retry strategy. Retryable transport errors
// and retryable statuses (408, 429, 500, 502, 503, 504) are sent again
// after an exponential delay, the request body is rewound before each
// resend. The caller only sees the outcome of the last attempt.
//
class RetryingTransport : public Transport {
 public:
  RetryingTransport(const boost::shared_ptr<Transport> &transport,
                    const RetryStrategy &retryStrategy);
  ~RetryingTransport() {}

  TransportOutcome Send(const Http::HttpRequest &request);

  const RetryStrategy &GetRetryStrategy() const { return m_retryStrategy; }

 private:
  void RetryRequestSleep(boost::posix_time::milliseconds sleepTime) const;

 private:
  boost::shared_ptr<Transport> m_transport;
  RetryStrategy m_retryStrategy;
  mutable boost::mutex m_retryLock;
  mutable boost::condition_variable m_retrySignal;
};

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_RETRYINGTRANSPORT_H_
