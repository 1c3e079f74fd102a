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

#include "data/StreamBuf.h"

#include <stddef.h>

#include "base/LogMacros.h"

namespace CX {

namespace Data {

// --------------------------------------------------------------------------
StreamBuf::StreamBuf(const Buffer &buf, size_t lengthToRead)
    : m_buffer(buf), m_lengthToRead(lengthToRead) {
  size_t bufSize = m_buffer ? m_buffer->size() : 0;
  if (m_lengthToRead > bufSize) {
    Error("Streambuf only have a " << bufSize
                                   << " bytes buffer, but want stream to see "
                                   << m_lengthToRead << " bytes of it");
    m_lengthToRead = bufSize;
  }

  setp(begin(), end());
  setg(begin(), begin(), end());
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                       std::ios_base::openmode which) {
  off_type base = 0;
  if (dir == std::ios_base::end) {
    base = static_cast<off_type>(m_lengthToRead);
  } else if (dir == std::ios_base::cur) {
    if (which == std::ios_base::in) {
      base = gptr() - eback();
    } else if (which == std::ios_base::out) {
      base = pptr() - pbase();
    } else {
      return pos_type(off_type(-1));  // ambiguous for both sequences
    }
  }
  return seekpos(pos_type(base + off), which);
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekpos(pos_type pos,
                                       std::ios_base::openmode which) {
  off_type offset = off_type(pos);
  if (offset < 0 || static_cast<size_t>(offset) > m_lengthToRead) {
    DebugError("Streambuf only allow stream to see "
               << m_lengthToRead << " bytes, but try to seek to " << offset);
    return pos_type(off_type(-1));
  }

  if (which & std::ios_base::in) {
    setg(begin(), begin() + offset, end());
  }
  if (which & std::ios_base::out) {
    setp(begin(), end());
    pbump(static_cast<int>(offset));
  }
  return pos;
}

}  // namespace Data
}  // namespace CX
