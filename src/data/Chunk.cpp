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

#include "data/Chunk.h"

#include <string.h>  // for memcmp

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/Exception.h"

namespace MPU {

namespace Data {

using MPU::Exception::MPUException;
using std::make_shared;
using std::string;
using std::to_string;
using std::vector;

// --------------------------------------------------------------------------
Chunk::Chunk(vector<char> &&bytes)
    : m_buffer(make_shared<vector<char>>(std::move(bytes))),
      m_offset(0),
      m_length(m_buffer->size()) {}

// --------------------------------------------------------------------------
Chunk::Chunk(const string &bytes)
    : m_buffer(make_shared<vector<char>>(bytes.begin(), bytes.end())),
      m_offset(0),
      m_length(bytes.size()) {}

// --------------------------------------------------------------------------
Chunk::Chunk(const char *data, size_t len)
    : m_buffer(make_shared<vector<char>>(data, data + len)),
      m_offset(0),
      m_length(len) {}

// --------------------------------------------------------------------------
Chunk::Chunk(Chunk &&other) noexcept
    : m_buffer(std::move(other.m_buffer)),
      m_offset(other.m_offset),
      m_length(other.m_length) {
  other.m_offset = 0;
  other.m_length = 0;
}

// --------------------------------------------------------------------------
Chunk &Chunk::operator=(Chunk &&other) noexcept {
  if (&other != this) {
    m_buffer = std::move(other.m_buffer);
    m_offset = other.m_offset;
    m_length = other.m_length;
    other.m_offset = 0;
    other.m_length = 0;
  }
  return *this;
}

// --------------------------------------------------------------------------
const char *Chunk::Data() const {
  return m_length == 0 ? nullptr : m_buffer->data() + m_offset;
}

// --------------------------------------------------------------------------
Chunk Chunk::SplitTo(size_t at) {
  if (at > m_length) {
    throw MPUException("Split position out of chunk [at:size=" + to_string(at) +
                       ":" + to_string(m_length) + "]");
  }
  Chunk head(m_buffer, m_offset, at);
  m_offset += at;
  m_length -= at;
  return head;
}

// --------------------------------------------------------------------------
Chunk Chunk::Slice(size_t offset, size_t len) const {
  if (offset > m_length || len > m_length - offset) {
    throw MPUException("Slice out of chunk [offset:len:size=" +
                       to_string(offset) + ":" + to_string(len) + ":" +
                       to_string(m_length) + "]");
  }
  return Chunk(m_buffer, m_offset + offset, len);
}

// --------------------------------------------------------------------------
string Chunk::ToString() const {
  return m_length == 0 ? string() : string(Data(), m_length);
}

// --------------------------------------------------------------------------
bool Chunk::operator==(const Chunk &other) const {
  if (m_length != other.m_length) {
    return false;
  }
  return m_length == 0 || memcmp(Data(), other.Data(), m_length) == 0;
}

// --------------------------------------------------------------------------
string ConcatChunks(const vector<Chunk> &chunks) {
  string bytes;
  bytes.reserve(GetChunksSize(chunks));
  for (auto &chunk : chunks) {
    if (!chunk.Empty()) {
      bytes.append(chunk.Data(), chunk.Size());
    }
  }
  return bytes;
}

// --------------------------------------------------------------------------
size_t GetChunksSize(const vector<Chunk> &chunks) {
  size_t size = 0;
  for (auto &chunk : chunks) {
    size += chunk.Size();
  }
  return size;
}

}  // namespace Data
}  // namespace MPU
