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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "data/Size.h"

namespace MPU {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "mpu";
static const char* const MPU_DEFAULT_LOG_DIR = "/tmp/mpu_log/";
static const char* const MPU_DEFAULT_LOGLEVEL_NAME = "INFO";

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogDirectory() { return MPU_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return MPU_DEFAULT_LOGLEVEL_NAME; }

mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

static const int CLIENT_DEFAULT_POOL_SIZE = 5;

int GetClientDefaultPoolSize() { return CLIENT_DEFAULT_POOL_SIZE; }

size_t GetDefaultParallelTransfers() { return 5; }

size_t GetDefaultSourceChunkSize() { return MPU::Data::Size::MB1; }

// Limits of the object storage multipart protocol
uint64_t GetUploadMultipartMinPartSize() { return MPU::Data::Size::MB5; }

uint64_t GetUploadMultipartMaxPartSize() { return MPU::Data::Size::GB5; }

int GetUploadMultipartMaxPartNumber() { return 10000; }

}  // namespace Default
}  // namespace Configure
}  // namespace MPU
