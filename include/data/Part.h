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

#ifndef _MPU_INCLUDE_DATA_PART_H_  // NOLINT
#define _MPU_INCLUDE_DATA_PART_H_  // NOLINT

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "base/HashUtils.h"
#include "data/Chunk.h"

namespace MPU {

namespace Data {

// One part of a multipart upload
//
// The body is the ordered list of chunk views making up the part, it is
// never copied into a contiguous buffer. contentMD5 is the digest of exactly
// the body bytes. Part numbers start from 1.
struct Part {
  Part() : contentLength(0), contentMD5(), partNumber(0) {}
  Part(std::vector<Chunk> &&partBody, uint64_t length,
       const MPU::HashUtils::MD5Digest &md5, int number)
      : body(std::move(partBody)),
        contentLength(length),
        contentMD5(md5),
        partNumber(number) {}

  std::vector<Chunk> body;
  uint64_t contentLength;
  MPU::HashUtils::MD5Digest contentMD5;
  int partNumber;

  std::string GetBodyAsString() const { return ConcatChunks(body); }
};

}  // namespace Data
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_DATA_PART_H_
