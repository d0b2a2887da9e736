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

#ifndef _MPU_INCLUDE_CONFIGURE_DEFAULT_H_  // NOLINT
#define _MPU_INCLUDE_CONFIGURE_DEFAULT_H_  // NOLINT

#include <stddef.h>
#include <stdint.h>

#include <sys/types.h>  // for mode_t

#include <string>

namespace MPU {

namespace Configure {

namespace Default {

const char *GetProgramName();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
mode_t GetDefineDirMode();

int GetClientDefaultPoolSize();
size_t GetDefaultParallelTransfers();  // 0 for no limit
size_t GetDefaultSourceChunkSize();    // bytes read from a source per chunk

// Part size range of multipart upload, inclusive
uint64_t GetUploadMultipartMinPartSize();
uint64_t GetUploadMultipartMaxPartSize();
int GetUploadMultipartMaxPartNumber();

}  // namespace Default
}  // namespace Configure
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CONFIGURE_DEFAULT_H_
