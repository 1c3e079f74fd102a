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

#ifndef CHUNKXFER_DATA_TRANSFERSOURCE_H_
#define CHUNKXFER_DATA_TRANSFERSOURCE_H_

#include <stddef.h>
#include <stdint.h>

#include <iostream>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "data/StreamBuf.h"

namespace CX {

namespace Data {

struct SourceKind {
  enum Value { InMemoryBuffer, SeekableStream, ForwardOnlyStream };
};

std::string SourceKindToString(SourceKind::Value kind);

//
// TransferSource
//
// Upload data. In-memory and seekable sources serve reads at any offset
// and from any thread. Forward-only sources are consumed strictly in
// order, one reader at a time.
//
class TransferSource : private boost::noncopyable {
 public:
  virtual ~TransferSource() {}

  virtual SourceKind::Value GetKind() const = 0;
  bool IsSeekable() const { return GetKind() != SourceKind::ForwardOnlyStream; }

  // Total bytes if known
  virtual boost::optional<uint64_t> GetSize() const = 0;

  // Read bytes at offset relative to the start of the source
  //
  // @param  : offset, length, output buffer of at least length bytes
  // @return : bytes read, less than length only at the end of data or
  //           on a read failure
  virtual size_t ReadAt(uint64_t offset, size_t length, char *buf) = 0;
};

class MemorySource : public TransferSource {
 public:
  explicit MemorySource(const std::string &data);
  explicit MemorySource(const Buffer &data);

  SourceKind::Value GetKind() const { return SourceKind::InMemoryBuffer; }
  boost::optional<uint64_t> GetSize() const;
  size_t ReadAt(uint64_t offset, size_t length, char *buf);

 private:
  Buffer m_data;
};

// Stream supporting seekg, the current position is the start of the data
class SeekableStreamSource : public TransferSource {
 public:
  // @param  : stream, size to upload (default: up to the end of stream)
  explicit SeekableStreamSource(
      const boost::shared_ptr<std::istream> &stream,
      const boost::optional<uint64_t> &size = boost::none);

  SourceKind::Value GetKind() const { return SourceKind::SeekableStream; }
  boost::optional<uint64_t> GetSize() const { return m_size; }
  size_t ReadAt(uint64_t offset, size_t length, char *buf);

 private:
  boost::shared_ptr<std::istream> m_stream;
  std::streampos m_startPos;
  boost::optional<uint64_t> m_size;
  boost::mutex m_streamLock;
};

// Stream that can only be read once in order, e.g. a pipe
class ForwardOnlyStreamSource : public TransferSource {
 public:
  explicit ForwardOnlyStreamSource(
      const boost::shared_ptr<std::istream> &stream,
      const boost::optional<uint64_t> &size = boost::none);

  SourceKind::Value GetKind() const { return SourceKind::ForwardOnlyStream; }
  boost::optional<uint64_t> GetSize() const { return m_size; }

  // Only accepts the offset the stream is at
  size_t ReadAt(uint64_t offset, size_t length, char *buf);

  // Read next bytes
  //
  // @param  : length, output buffer
  // @return : bytes read
  size_t ReadNext(size_t length, char *buf);

  // Whether no data remains, may block on the stream to find out
  bool IsExhausted();

  uint64_t GetPosition() const { return m_position; }

 private:
  boost::shared_ptr<std::istream> m_stream;
  boost::optional<uint64_t> m_size;
  uint64_t m_position;
};

}  // namespace Data
}  // namespace CX

#endif  // CHUNKXFER_DATA_TRANSFERSOURCE_H_
