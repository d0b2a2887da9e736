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

#include "data/ByteSource.h"

#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/LogMacros.h"
#include "client/MPUError.h"

namespace MPU {

namespace Data {

using MPU::Client::MakeUploadError;
using MPU::Client::MPUError;
using MPU::Threading::PollState;
using MPU::Threading::Waker;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::vector;

// --------------------------------------------------------------------------
StreamByteSource::StreamByteSource(const shared_ptr<std::istream> &stream,
                                   size_t chunkSize)
    : m_stream(stream),
      m_chunkSize(chunkSize > 0 ? chunkSize : 1),
      m_readBytes(0),
      m_done(false) {}

// --------------------------------------------------------------------------
StreamByteSource::StreamByteSource(size_t chunkSize)
    : StreamByteSource(shared_ptr<std::istream>(), chunkSize) {}

// --------------------------------------------------------------------------
PollState StreamByteSource::PollNext(const Waker &waker, ChunkOutcome *item) {
  if (m_done) {
    return PollState::Exhausted;
  }
  if (!m_stream) {
    return Fail("Null input stream", item);
  }

  vector<char> buffer(m_chunkSize);
  m_stream->read(&buffer[0], m_chunkSize);
  std::streamsize readSize = m_stream->gcount();
  if (m_stream->bad()) {
    return Fail("Fail to read input stream after " + to_string(m_readBytes) +
                    " bytes",
                item);
  }

  if (readSize > 0) {
    buffer.resize(static_cast<size_t>(readSize));
    m_readBytes += readSize;
    *item = ChunkOutcome(Chunk(std::move(buffer)));
    return PollState::Ready;
  }

  if (m_stream->eof()) {
    m_done = true;
    return PollState::Exhausted;
  }
  return Fail("Input stream failed without reaching end", item);
}

// --------------------------------------------------------------------------
PollState StreamByteSource::Fail(const string &message, ChunkOutcome *item) {
  m_done = true;
  DebugError(message);
  *item = ChunkOutcome(
      MakeUploadError(MPUError::SOURCE_READ_FAILED, "ReadSource", message));
  return PollState::Ready;
}

// --------------------------------------------------------------------------
FileByteSource::FileByteSource(const string &path, size_t chunkSize)
    : StreamByteSource(chunkSize), m_path(path), m_opened(false) {}

// --------------------------------------------------------------------------
PollState FileByteSource::PollNext(const Waker &waker, ChunkOutcome *item) {
  if (!m_opened) {
    m_opened = true;
    shared_ptr<std::ifstream> file = std::make_shared<std::ifstream>(
        m_path, std::ios_base::in | std::ios_base::binary);
    if (!file->is_open()) {
      return Fail("Unable to open file " + m_path, item);
    }
    SetStream(file);
  }
  return StreamByteSource::PollNext(waker, item);
}

// --------------------------------------------------------------------------
ChunkListByteSource::ChunkListByteSource(vector<ChunkOutcome> &&items)
    : m_items(std::move(items)), m_next(0) {}

// --------------------------------------------------------------------------
ChunkListByteSource::ChunkListByteSource(const vector<Chunk> &chunks)
    : m_items(chunks.begin(), chunks.end()), m_next(0) {}

// --------------------------------------------------------------------------
PollState ChunkListByteSource::PollNext(const Waker &waker,
                                        ChunkOutcome *item) {
  if (m_next >= m_items.size()) {
    return PollState::Exhausted;
  }
  *item = std::move(m_items[m_next++]);
  return PollState::Ready;
}

}  // namespace Data
}  // namespace MPU
