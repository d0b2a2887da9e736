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

#ifndef _MPU_INCLUDE_DATA_BYTESOURCE_H_  // NOLINT
#define _MPU_INCLUDE_DATA_BYTESOURCE_H_  // NOLINT

#include <stddef.h>
#include <stdint.h>

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "base/Outcome.h"
#include "base/Poll.h"
#include "client/MPUError.h"
#include "configure/Default.h"
#include "data/Chunk.h"

namespace MPU {

namespace Data {

// Ordered sequence of byte chunks of arbitrary size which may fail
using ChunkOutcome = Outcome<Chunk, MPU::Client::UploadError>;
using ByteSource = MPU::Threading::Stream<Chunk, MPU::Client::UploadError>;

// Read an input stream chunk by chunk
//
// A read failure is reported once as SOURCE_READ_FAILED, the source is
// exhausted afterwards.
class StreamByteSource : public ByteSource {
 public:
  explicit StreamByteSource(
      const std::shared_ptr<std::istream> &stream,
      size_t chunkSize = MPU::Configure::Default::GetDefaultSourceChunkSize());

  StreamByteSource(StreamByteSource &&) = delete;
  StreamByteSource(const StreamByteSource &) = delete;
  StreamByteSource &operator=(StreamByteSource &&) = delete;
  StreamByteSource &operator=(const StreamByteSource &) = delete;
  virtual ~StreamByteSource() = default;

 public:
  MPU::Threading::PollState PollNext(const MPU::Threading::Waker &waker,
                                     ChunkOutcome *item) override;

  uint64_t GetReadBytes() const { return m_readBytes; }

 protected:
  // Used by derived source which opens the stream lazily
  explicit StreamByteSource(size_t chunkSize);
  void SetStream(const std::shared_ptr<std::istream> &stream) {
    m_stream = stream;
  }
  MPU::Threading::PollState Fail(const std::string &message,
                                 ChunkOutcome *item);

 private:
  std::shared_ptr<std::istream> m_stream;
  size_t m_chunkSize;
  uint64_t m_readBytes;
  bool m_done;
};

// Read a local file chunk by chunk
//
// The file is opened at the first poll, failing to open it is reported as
// SOURCE_READ_FAILED.
class FileByteSource : public StreamByteSource {
 public:
  explicit FileByteSource(
      const std::string &path,
      size_t chunkSize = MPU::Configure::Default::GetDefaultSourceChunkSize());

  FileByteSource(FileByteSource &&) = delete;
  FileByteSource(const FileByteSource &) = delete;
  FileByteSource &operator=(FileByteSource &&) = delete;
  FileByteSource &operator=(const FileByteSource &) = delete;
  ~FileByteSource() = default;

 public:
  MPU::Threading::PollState PollNext(const MPU::Threading::Waker &waker,
                                     ChunkOutcome *item) override;

  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
  bool m_opened;
};

// Replay prepared chunks and errors in order
class ChunkListByteSource : public ByteSource {
 public:
  explicit ChunkListByteSource(std::vector<ChunkOutcome> &&items);
  explicit ChunkListByteSource(const std::vector<Chunk> &chunks);

  ChunkListByteSource(ChunkListByteSource &&) = delete;
  ChunkListByteSource(const ChunkListByteSource &) = delete;
  ChunkListByteSource &operator=(ChunkListByteSource &&) = delete;
  ChunkListByteSource &operator=(const ChunkListByteSource &) = delete;
  ~ChunkListByteSource() = default;

 public:
  MPU::Threading::PollState PollNext(const MPU::Threading::Waker &waker,
                                     ChunkOutcome *item) override;

  // Number of items handed out so far
  size_t GetPolledCount() const { return m_next; }

 private:
  std::vector<ChunkOutcome> m_items;
  size_t m_next;
};

}  // namespace Data
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_DATA_BYTESOURCE_H_
