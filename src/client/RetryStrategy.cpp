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

#include "client/RetryStrategy.h"

#include <stdint.h>

#include "configure/Default.h"

namespace CX {

namespace Client {

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(const ClientError<TransferError::Value> &error,
                                uint16_t attemptedRetryTimes) const {
  return attemptedRetryTimes >= m_maxRetryTimes ? false : error.ShouldRetry();
}

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(int httpStatus,
                                uint16_t attemptedRetryTimes) const {
  return attemptedRetryTimes >= m_maxRetryTimes
             ? false
             : IsRetryableStatus(httpStatus);
}

// --------------------------------------------------------------------------
uint32_t RetryStrategy::CalculateDelayBeforeNextRetry(
    uint16_t attemptedRetryTimes) const {
  return attemptedRetryTimes == 0 ? 0
                                  : (1u << attemptedRetryTimes) * m_scaleFactor;
}

// --------------------------------------------------------------------------
RetryStrategy GetDefaultRetryStrategy() {
  return RetryStrategy(CX::Configure::Default::GetDefaultTransactionRetries(),
                       CX::Configure::Default::GetDefaultRetryScaleFactor());
}

}  // namespace Client
}  // namespace CX
