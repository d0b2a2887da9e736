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

#ifndef _MPU_INCLUDE_DATA_SPLITTER_H_  // NOLINT
#define _MPU_INCLUDE_DATA_SPLITTER_H_  // NOLINT

#include <stdint.h>

#include <memory>
#include <vector>

#include "base/HashUtils.h"
#include "base/Outcome.h"
#include "base/Poll.h"
#include "client/MPUError.h"
#include "data/ByteSource.h"
#include "data/Chunk.h"
#include "data/Part.h"

namespace MPU {

namespace Data {

using PartOutcome = Outcome<Part, MPU::Client::UploadError>;
using PartStream = MPU::Threading::Stream<Part, MPU::Client::UploadError>;

// Split a byte source into size bounded parts
//
// Every part except the last one has a size in [minPartSize, maxPartSize],
// the last one is never empty. Part numbers are 1, 2, ... in emission order.
// Parts reference slices of the source chunks, so bytes are never copied.
// The md5 of each part is computed incrementally while bytes are folded in.
//
// A source error is emitted as soon as it is seen and the bytes not yet
// emitted are discarded. The splitter is exhausted after that.
class Splitter : public PartStream {
 public:
  // Throw MPUException if source is null or the part size range is invalid.
  Splitter(std::unique_ptr<ByteSource> source, uint64_t minPartSize,
           uint64_t maxPartSize);

  Splitter(Splitter &&) = delete;
  Splitter(const Splitter &) = delete;
  Splitter &operator=(Splitter &&) = delete;
  Splitter &operator=(const Splitter &) = delete;
  ~Splitter() = default;

 public:
  MPU::Threading::PollState PollNext(const MPU::Threading::Waker &waker,
                                     PartOutcome *part) override;

  uint64_t GetMinPartSize() const { return m_minPartSize; }
  uint64_t GetMaxPartSize() const { return m_maxPartSize; }

  // Number of parts emitted so far
  int GetEmittedCount() const { return m_partNumber; }

 private:
  // Fold chunk into the part being built
  void PushPart(Chunk &&chunk);

  // Take a new chunk from source, fold the previous remaining into the part
  void Push(Chunk &&chunk);

  // Emit a part if the part and the remaining reach the min part size
  bool Pop(Part *part);

  // Emit the last part from what is left
  bool Finish(Part *part);

  Part TakePart();

 private:
  std::unique_ptr<ByteSource> m_source;
  uint64_t m_minPartSize;
  uint64_t m_maxPartSize;
  bool m_done;

  Chunk m_remaining;  // latest source chunk not yet folded
  std::vector<Chunk> m_partBody;
  uint64_t m_partContentLength;
  MPU::HashUtils::MD5Hash m_partContentMD5;
  int m_partNumber;  // number of the last emitted part
};

}  // namespace Data
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_DATA_SPLITTER_H_
