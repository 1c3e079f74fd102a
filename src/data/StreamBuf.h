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

#ifndef CHUNKXFER_DATA_STREAMBUF_H_
#define CHUNKXFER_DATA_STREAMBUF_H_

#include <stddef.h>  // for size_t

#include <streambuf>  // NOLINT
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

namespace CX {

namespace Data {

typedef boost::shared_ptr<std::vector<char> > Buffer;

/**
 * A stream buf over a shared buffer, to use with std::iostream.
 * Only the first lengthToRead bytes of the buffer are visible.
 */
class StreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  StreamBuf(const Buffer &buf, size_t lengthToRead);
  ~StreamBuf() {}

  const Buffer &GetBuffer() const { return m_buffer; }
  size_t GetLengthToRead() const { return m_lengthToRead; }

 protected:
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);

 private:
  char *begin() {
    return (m_buffer && !m_buffer->empty()) ? &(*m_buffer)[0] : NULL;
  }
  char *end() { return begin() + m_lengthToRead; }

 private:
  Buffer m_buffer;
  size_t m_lengthToRead;

  friend class StreamBufTest;
};

}  // namespace Data
}  // namespace CX

#endif  // CHUNKXFER_DATA_STREAMBUF_H_
