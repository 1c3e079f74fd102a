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

#ifndef CHUNKXFER_CLIENT_NULLTRANSPORT_H_
#define CHUNKXFER_CLIENT_NULLTRANSPORT_H_

#include "client/Http.h"
#include "client/Transport.h"

namespace CX {

namespace Client {

// Transport used when none is configured, every request fails
class NullTransport : public Transport {
 public:
  NullTransport() {}
  ~NullTransport() {}

  TransportOutcome Send(const Http::HttpRequest &request);
};

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_NULLTRANSPORT_H_
