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

#ifndef _MPU_INCLUDE_CLIENT_MPUERROR_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_MPUERROR_H_  // NOLINT

#include <string>

#include "client/ClientError.h"

namespace MPU {

namespace Client {

// Default constructed ClientError<MPUError> holds UNKNOWN
enum class MPUError {
  UNKNOWN,
  GOOD,
  BAD_DIGEST,
  ENTITY_TOO_SMALL,
  INTERNAL_FAILURE,
  INVALID_PART,
  INVALID_PART_ORDER,
  KEY_NOT_EXIST,
  NO_SUCH_UPLOAD,
  PARAMETER_MISSING,
  PARAMETER_VALUE_INVALID,
  SERVICE_UNAVAILABLE,
  SOURCE_READ_FAILED,
  UPLOAD_ALREADY_SENT
};

using UploadError = ClientError<MPUError>;

MPUError StringToMPUError(const std::string &errorCode);
std::string MPUErrorToString(MPUError err);

UploadError GetMPUErrorForCode(const std::string &errorCode);
std::string GetMessageForMPUError(const UploadError &error);
bool IsGoodMPUError(const UploadError &error);

// Build a non-retryable error
//
// @param  : error type, name of failed operation, message
// @return : upload error
UploadError MakeUploadError(MPUError err, const std::string &exceptionName,
                            const std::string &message);

// Good error carrying no message
UploadError GoodUploadError();

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_MPUERROR_H_
