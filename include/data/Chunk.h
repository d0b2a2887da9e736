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

#ifndef _MPU_INCLUDE_DATA_CHUNK_H_  // NOLINT
#define _MPU_INCLUDE_DATA_CHUNK_H_  // NOLINT

#include <stddef.h>

#include <memory>
#include <string>
#include <vector>

namespace MPU {

namespace Data {

// Immutable view over a shared byte buffer.
//
// Copies and sub-slices share the same buffer, so SplitTo and Slice are O(1)
// and never copy bytes. The buffer is released with the last view on it.
class Chunk {
 public:
  Chunk() : m_buffer(), m_offset(0), m_length(0) {}
  explicit Chunk(std::vector<char> &&bytes);
  explicit Chunk(const std::string &bytes);
  Chunk(const char *data, size_t len);

  Chunk(Chunk &&other) noexcept;
  Chunk(const Chunk &) = default;
  Chunk &operator=(Chunk &&other) noexcept;
  Chunk &operator=(const Chunk &) = default;
  ~Chunk() = default;

 public:
  size_t Size() const { return m_length; }
  bool Empty() const { return m_length == 0; }

  // Pointer to first byte, nullptr for an empty chunk
  const char *Data() const;

  // Split off the first bytes
  //
  // @param  : number of bytes
  // @return : chunk of the first 'at' bytes
  //
  // Afterwards this chunk holds the bytes from 'at' to the end.
  // Throw MPUException if 'at' is larger than the size.
  Chunk SplitTo(size_t at);

  // Sub view of this chunk
  //
  // @param  : offset, length
  // @return : chunk of [offset, offset + len)
  //
  // Throw MPUException if the range is out of this chunk.
  Chunk Slice(size_t offset, size_t len) const;

  // Whether the two chunks are views of the same buffer
  bool SharesBufferWith(const Chunk &other) const {
    return m_buffer && m_buffer == other.m_buffer;
  }

  std::string ToString() const;

  // Byte wise comparison
  bool operator==(const Chunk &other) const;
  bool operator!=(const Chunk &other) const { return !(*this == other); }

 private:
  Chunk(const std::shared_ptr<const std::vector<char>> &buffer, size_t offset,
        size_t length)
      : m_buffer(buffer), m_offset(offset), m_length(length) {}

 private:
  std::shared_ptr<const std::vector<char>> m_buffer;
  size_t m_offset;
  size_t m_length;
};

// Concatenate chunks into one string
std::string ConcatChunks(const std::vector<Chunk> &chunks);

// Total size in bytes of chunks
size_t GetChunksSize(const std::vector<Chunk> &chunks);

}  // namespace Data
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_DATA_CHUNK_H_
