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

#ifndef CHUNKXFER_CLIENT_PRECONDITIONSET_H_
#define CHUNKXFER_CLIENT_PRECONDITIONSET_H_

#include <time.h>

#include <string>

#include "boost/optional.hpp"

namespace CX {

namespace Client {

//
// PreconditionSet
//
// Conditions the server evaluates before serving a request, unset fields
// produce no header. If-Match and If-None-Match may be set together, both
// headers are sent and the server decides.
//
struct PreconditionSet {
  boost::optional<time_t> m_ifModifiedSince;
  boost::optional<time_t> m_ifUnmodifiedSince;
  boost::optional<std::string> m_ifMatch;      // etag or "*"
  boost::optional<std::string> m_ifNoneMatch;  // etag or "*"

  bool IsEmpty() const {
    return !m_ifModifiedSince && !m_ifUnmodifiedSince && !m_ifMatch &&
           !m_ifNoneMatch;
  }

  // Conditions for which a GET may be answered by 304 Not Modified
  bool HasNotModifiedConditions() const {
    return m_ifModifiedSince || m_ifNoneMatch;
  }
};

}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_PRECONDITIONSET_H_
