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

#ifndef CHUNKXFER_CLIENT_RETRYSTRATEGY_H_
#define CHUNKXFER_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "client/ClientError.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Client {

class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxRetryTimes, uint32_t scaleFactor)
      : m_maxRetryTimes(maxRetryTimes), m_scaleFactor(scaleFactor) {}

  // @param  : error of last attempt, retries done so far
  // @return : true if the error is retryable and retries remain
  bool ShouldRetry(const ClientError<TransferError::Value> &error,
                   uint16_t attemptedRetryTimes) const;

  // Same as above, for a received response status
  bool ShouldRetry(int httpStatus, uint16_t attemptedRetryTimes) const;

  // Exponential backoff in milliseconds, (2^n) * scale factor
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }

 private:
  uint16_t m_maxRetryTimes;
  uint32_t m_scaleFactor;
};

RetryStrategy GetDefaultRetryStrategy();

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_RETRYSTRATEGY_H_
