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

#include "data/TransferSource.h"

#include <stddef.h>
#include <stdint.h>
#include <string.h>  // for memcpy

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace CX {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::optional;
using boost::shared_ptr;
using std::istream;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string SourceKindToString(SourceKind::Value kind) {
  switch (kind) {
    case SourceKind::InMemoryBuffer:
      return "InMemoryBuffer";
    case SourceKind::SeekableStream:
      return "SeekableStream";
    case SourceKind::ForwardOnlyStream:
      return "ForwardOnlyStream";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
MemorySource::MemorySource(const string &data)
    : m_data(new vector<char>(data.begin(), data.end())) {}

// --------------------------------------------------------------------------
MemorySource::MemorySource(const Buffer &data)
    : m_data(data ? data : Buffer(new vector<char>)) {}

// --------------------------------------------------------------------------
optional<uint64_t> MemorySource::GetSize() const {
  return optional<uint64_t>(m_data->size());
}

// --------------------------------------------------------------------------
size_t MemorySource::ReadAt(uint64_t offset, size_t length, char *buf) {
  if (offset >= m_data->size() || length == 0) {
    return 0;
  }
  size_t count =
      std::min(static_cast<uint64_t>(length), m_data->size() - offset);
  memcpy(buf, &(*m_data)[offset], count);
  return count;
}

// --------------------------------------------------------------------------
SeekableStreamSource::SeekableStreamSource(const shared_ptr<istream> &stream,
                                           const optional<uint64_t> &size)
    : m_stream(stream), m_startPos(0), m_size(size) {
  if (!m_stream) {
    m_size = optional<uint64_t>(0);
    return;
  }
  m_startPos = m_stream->tellg();
  if (!m_size) {
    m_stream->seekg(0, std::ios_base::end);
    std::streampos endPos = m_stream->tellg();
    m_stream->seekg(m_startPos);
    if (endPos >= m_startPos) {
      m_size = static_cast<uint64_t>(endPos - m_startPos);
    } else {
      Warning("Unable to determine size of seekable stream");
    }
  }
}

// --------------------------------------------------------------------------
size_t SeekableStreamSource::ReadAt(uint64_t offset, size_t length,
                                    char *buf) {
  if (!m_stream || length == 0) {
    return 0;
  }
  if (m_size) {
    if (offset >= *m_size) {
      return 0;
    }
    length = std::min(static_cast<uint64_t>(length), *m_size - offset);
  }

  lock_guard<mutex> lock(m_streamLock);
  m_stream->clear();
  m_stream->seekg(m_startPos + static_cast<std::streamoff>(offset));
  if (!(*m_stream)) {
    Error("Unable to seek source stream to offset " << offset);
    return 0;
  }
  m_stream->read(buf, length);
  return static_cast<size_t>(m_stream->gcount());
}

// --------------------------------------------------------------------------
ForwardOnlyStreamSource::ForwardOnlyStreamSource(
    const shared_ptr<istream> &stream, const optional<uint64_t> &size)
    : m_stream(stream), m_size(size), m_position(0) {}

// --------------------------------------------------------------------------
size_t ForwardOnlyStreamSource::ReadAt(uint64_t offset, size_t length,
                                       char *buf) {
  if (offset != m_position) {
    Error("Forward only source is at offset " << m_position
                                              << ", unable to read at "
                                              << offset);
    return 0;
  }
  return ReadNext(length, buf);
}

// --------------------------------------------------------------------------
size_t ForwardOnlyStreamSource::ReadNext(size_t length, char *buf) {
  if (!m_stream || length == 0) {
    return 0;
  }
  if (m_size) {
    if (m_position >= *m_size) {
      return 0;
    }
    length = std::min(static_cast<uint64_t>(length), *m_size - m_position);
  }
  m_stream->read(buf, length);
  size_t count = static_cast<size_t>(m_stream->gcount());
  m_position += count;
  return count;
}

// --------------------------------------------------------------------------
bool ForwardOnlyStreamSource::IsExhausted() {
  if (!m_stream) {
    return true;
  }
  if (m_size && m_position >= *m_size) {
    return true;
  }
  return m_stream->peek() == std::char_traits<char>::eof();
}

}  // namespace Data
}  // namespace CX
