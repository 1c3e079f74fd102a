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

#ifndef CHUNKXFER_DATA_TRANSFERSINK_H_
#define CHUNKXFER_DATA_TRANSFERSINK_H_

#include <stddef.h>
#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

namespace CX {

namespace Data {

struct SinkKind {
  enum Value { InMemoryBuffer, SeekableStream, ForwardOnlyStream };
};

std::string SinkKindToString(SinkKind::Value kind);

//
// TransferSink
//
// Download destination addressed by offset relative to the first byte of
// the requested range. Writes to in-memory and seekable sinks may come
// from several threads in any order; forward-only sinks need them in order.
//
class TransferSink : private boost::noncopyable {
 public:
  virtual ~TransferSink() {}

  virtual SinkKind::Value GetKind() const = 0;
  bool IsSeekable() const { return GetKind() != SinkKind::ForwardOnlyStream; }

  // @param  : offset, data, length
  // @return : false if the data could not be written
  virtual bool WriteAt(uint64_t offset, const char *data, size_t length) = 0;
};

class MemorySink : public TransferSink {
 public:
  MemorySink() {}

  SinkKind::Value GetKind() const { return SinkKind::InMemoryBuffer; }
  bool WriteAt(uint64_t offset, const char *data, size_t length);

  std::string GetData() const;
  size_t GetSize() const;

 private:
  std::vector<char> m_data;
  mutable boost::mutex m_dataLock;
};

// Stream supporting seekp, the current position receives offset 0
class SeekableStreamSink : public TransferSink {
 public:
  explicit SeekableStreamSink(const boost::shared_ptr<std::ostream> &stream);

  SinkKind::Value GetKind() const { return SinkKind::SeekableStream; }
  bool WriteAt(uint64_t offset, const char *data, size_t length);

 private:
  boost::shared_ptr<std::ostream> m_stream;
  std::streampos m_startPos;
  boost::mutex m_streamLock;
};

class ForwardOnlyStreamSink : public TransferSink {
 public:
  explicit ForwardOnlyStreamSink(
      const boost::shared_ptr<std::ostream> &stream);

  SinkKind::Value GetKind() const { return SinkKind::ForwardOnlyStream; }

  // Only accepts the offset right after the last write
  bool WriteAt(uint64_t offset, const char *data, size_t length);

  uint64_t GetPosition() const { return m_position; }

 private:
  boost::shared_ptr<std::ostream> m_stream;
  uint64_t m_position;
};

}  // namespace Data
}  // namespace CX

#endif  // CHUNKXFER_DATA_TRANSFERSINK_H_
