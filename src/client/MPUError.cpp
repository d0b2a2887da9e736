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

#include "client/MPUError.h"

#include <string>
#include <unordered_map>

#include "base/HashUtils.h"

namespace MPU {

namespace Client {

using MPU::HashUtils::EnumHash;
using MPU::HashUtils::StringHash;
using std::string;
using std::unordered_map;

// --------------------------------------------------------------------------
MPUError StringToMPUError(const string &errorCode) {
  static const unordered_map<string, MPUError, StringHash>
      errorCodeToTypeMap = {
          {"Unknown",               MPUError::UNKNOWN},
          {"Good",                  MPUError::GOOD},
          {"BadDigest",             MPUError::BAD_DIGEST},
          {"EntityTooSmall",        MPUError::ENTITY_TOO_SMALL},
          {"InternalFailure",       MPUError::INTERNAL_FAILURE},
          {"InvalidPart",           MPUError::INVALID_PART},
          {"InvalidPartOrder",      MPUError::INVALID_PART_ORDER},
          {"KeyNotExist",           MPUError::KEY_NOT_EXIST},
          {"NoSuchUpload",          MPUError::NO_SUCH_UPLOAD},
          {"ParameterMissing",      MPUError::PARAMETER_MISSING},
          {"ParameterValueInvalid", MPUError::PARAMETER_VALUE_INVALID},
          {"ServiceUnavailable",    MPUError::SERVICE_UNAVAILABLE},
          {"SourceReadFailed",      MPUError::SOURCE_READ_FAILED},
          {"UploadAlreadySent",     MPUError::UPLOAD_ALREADY_SENT},
          // Add other errors here.
      };
  auto it = errorCodeToTypeMap.find(errorCode);
  return it != errorCodeToTypeMap.end() ? it->second : MPUError::UNKNOWN;
}

// --------------------------------------------------------------------------
string MPUErrorToString(MPUError err) {
  static const unordered_map<MPUError, string, EnumHash>
      errorTypeToCodeMap = {
          {MPUError::UNKNOWN                , "Unknown"              },
          {MPUError::GOOD                   , "Good"                 },
          {MPUError::BAD_DIGEST             , "BadDigest"            },
          {MPUError::ENTITY_TOO_SMALL       , "EntityTooSmall"       },
          {MPUError::INTERNAL_FAILURE       , "InternalFailure"      },
          {MPUError::INVALID_PART           , "InvalidPart"          },
          {MPUError::INVALID_PART_ORDER     , "InvalidPartOrder"     },
          {MPUError::KEY_NOT_EXIST          , "KeyNotExist"          },
          {MPUError::NO_SUCH_UPLOAD         , "NoSuchUpload"         },
          {MPUError::PARAMETER_MISSING      , "ParameterMissing"     },
          {MPUError::PARAMETER_VALUE_INVALID, "ParameterValueInvalid"},
          {MPUError::SERVICE_UNAVAILABLE    , "ServiceUnavailable"   },
          {MPUError::SOURCE_READ_FAILED     , "SourceReadFailed"     },
          {MPUError::UPLOAD_ALREADY_SENT    , "UploadAlreadySent"    },
          // Add other errors here.
      };
  auto it = errorTypeToCodeMap.find(err);
  return it != errorTypeToCodeMap.end() ? it->second : "Unknown";
}

// --------------------------------------------------------------------------
UploadError GetMPUErrorForCode(const string &errorCode) {
  MPUError err = StringToMPUError(errorCode);
  return UploadError(err, err == MPUError::SERVICE_UNAVAILABLE);
}

// --------------------------------------------------------------------------
string GetMessageForMPUError(const UploadError &error) {
  return MPUErrorToString(error.GetError()) + ", " + error.GetExceptionName() +
         ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodMPUError(const UploadError &error) {
  return error.GetError() == MPUError::GOOD;
}

// --------------------------------------------------------------------------
UploadError MakeUploadError(MPUError err, const string &exceptionName,
                            const string &message) {
  return UploadError(err, exceptionName, message, false);
}

// --------------------------------------------------------------------------
UploadError GoodUploadError() { return UploadError(MPUError::GOOD, false); }

}  // namespace Client
}  // namespace MPU
