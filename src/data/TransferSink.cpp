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

#include "data/TransferSink.h"

#include <stddef.h>
#include <stdint.h>
#include <string.h>  // for memcpy

#include <iostream>
#include <string>

#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace CX {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
string SinkKindToString(SinkKind::Value kind) {
  switch (kind) {
    case SinkKind::InMemoryBuffer:
      return "InMemoryBuffer";
    case SinkKind::SeekableStream:
      return "SeekableStream";
    case SinkKind::ForwardOnlyStream:
      return "ForwardOnlyStream";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
bool MemorySink::WriteAt(uint64_t offset, const char *data, size_t length) {
  lock_guard<mutex> lock(m_dataLock);
  if (offset + length > m_data.size()) {
    m_data.resize(offset + length);
  }
  if (length > 0) {
    memcpy(&m_data[offset], data, length);
  }
  return true;
}

// --------------------------------------------------------------------------
string MemorySink::GetData() const {
  lock_guard<mutex> lock(m_dataLock);
  return string(m_data.begin(), m_data.end());
}

// --------------------------------------------------------------------------
size_t MemorySink::GetSize() const {
  lock_guard<mutex> lock(m_dataLock);
  return m_data.size();
}

// --------------------------------------------------------------------------
SeekableStreamSink::SeekableStreamSink(const shared_ptr<ostream> &stream)
    : m_stream(stream), m_startPos(0) {
  if (m_stream) {
    m_startPos = m_stream->tellp();
  }
}

// --------------------------------------------------------------------------
bool SeekableStreamSink::WriteAt(uint64_t offset, const char *data,
                                 size_t length) {
  if (!m_stream) {
    return false;
  }
  lock_guard<mutex> lock(m_streamLock);
  m_stream->seekp(m_startPos + static_cast<std::streamoff>(offset));
  m_stream->write(data, length);
  if (!(*m_stream)) {
    Error("Unable to write " << length << " bytes to sink at offset "
                             << offset);
    return false;
  }
  return true;
}

// --------------------------------------------------------------------------
ForwardOnlyStreamSink::ForwardOnlyStreamSink(const shared_ptr<ostream> &stream)
    : m_stream(stream), m_position(0) {}

// --------------------------------------------------------------------------
bool ForwardOnlyStreamSink::WriteAt(uint64_t offset, const char *data,
                                    size_t length) {
  if (!m_stream) {
    return false;
  }
  if (offset != m_position) {
    Error("Forward only sink is at offset " << m_position
                                            << ", unable to write at "
                                            << offset);
    return false;
  }
  m_stream->write(data, length);
  if (!(*m_stream)) {
    Error("Unable to write " << length << " bytes to sink");
    return false;
  }
  m_position += length;
  return true;
}

}  // namespace Data
}  // namespace CX
