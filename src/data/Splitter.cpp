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

#include "data/Splitter.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/Exception.h"
#include "base/LogMacros.h"

namespace MPU {

namespace Data {

using MPU::Client::GetMessageForMPUError;
using MPU::Exception::MPUException;
using MPU::Threading::PollState;
using MPU::Threading::Waker;
using std::string;
using std::to_string;
using std::unique_ptr;
using std::vector;

// --------------------------------------------------------------------------
Splitter::Splitter(unique_ptr<ByteSource> source, uint64_t minPartSize,
                   uint64_t maxPartSize)
    : m_source(std::move(source)),
      m_minPartSize(minPartSize),
      m_maxPartSize(maxPartSize),
      m_done(false),
      m_partContentLength(0),
      m_partNumber(0) {
  if (!m_source) {
    throw MPUException("Null byte source for splitter");
  }
  if (minPartSize == 0 || maxPartSize < minPartSize) {
    throw MPUException("Invalid part size range [" + to_string(minPartSize) +
                       ", " + to_string(maxPartSize) + "]");
  }
}

// --------------------------------------------------------------------------
PollState Splitter::PollNext(const Waker &waker, PartOutcome *part) {
  if (m_done) {
    return PollState::Exhausted;
  }

  while (true) {
    Part next;
    if (Pop(&next)) {
      *part = PartOutcome(std::move(next));
      return PollState::Ready;
    }

    ChunkOutcome chunk;
    PollState state = m_source->PollNext(waker, &chunk);
    if (state == PollState::Pending) {
      return PollState::Pending;
    } else if (state == PollState::Exhausted) {
      m_done = true;
      if (Finish(&next)) {
        *part = PartOutcome(std::move(next));
        return PollState::Ready;
      }
      return PollState::Exhausted;
    }

    if (!chunk.IsSuccess()) {
      m_done = true;
      DebugError("Discard " +
                 to_string(m_partContentLength + m_remaining.Size()) +
                 " bytes not emitted, " + GetMessageForMPUError(chunk.GetError()));
      m_remaining = Chunk();
      m_partBody.clear();
      m_partContentLength = 0;
      m_partContentMD5.Reset();
      *part = PartOutcome(chunk.GetError());
      return PollState::Ready;
    }
    Push(chunk.GetResultWithOwnership());
  }
}

// --------------------------------------------------------------------------
void Splitter::PushPart(Chunk &&chunk) {
  if (!chunk.Empty()) {
    m_partContentLength += chunk.Size();
    m_partContentMD5.Update(chunk.Data(), chunk.Size());
    m_partBody.push_back(std::move(chunk));
  }
}

// --------------------------------------------------------------------------
void Splitter::Push(Chunk &&chunk) {
  Chunk previous = std::move(m_remaining);
  m_remaining = std::move(chunk);
  PushPart(std::move(previous));
}

// --------------------------------------------------------------------------
bool Splitter::Pop(Part *part) {
  if (m_partContentLength + m_remaining.Size() < m_minPartSize) {
    return false;
  }
  // m_partContentLength < m_minPartSize <= m_maxPartSize holds here, as a
  // part is emitted as soon as it reaches the min part size.
  uint64_t room = m_maxPartSize - m_partContentLength;
  size_t len = static_cast<size_t>(
      std::min(static_cast<uint64_t>(m_remaining.Size()), room));
  PushPart(m_remaining.SplitTo(len));
  *part = TakePart();
  return true;
}

// --------------------------------------------------------------------------
bool Splitter::Finish(Part *part) {
  PushPart(std::move(m_remaining));
  m_remaining = Chunk();
  if (m_partBody.empty()) {
    return false;
  }
  *part = TakePart();
  return true;
}

// --------------------------------------------------------------------------
Part Splitter::TakePart() {
  Part part(std::move(m_partBody), m_partContentLength,
            m_partContentMD5.Finalize(), ++m_partNumber);
  m_partBody.clear();
  m_partContentLength = 0;
  DebugInfo("Split part " + to_string(part.partNumber) + " of " +
            to_string(part.contentLength) + " bytes in " +
            to_string(part.body.size()) + " slices");
  return part;
}

}  // namespace Data
}  // namespace MPU
