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

#ifndef _MPU_INCLUDE_BASE_LOGLEVEL_H_  // NOLINT
#define _MPU_INCLUDE_BASE_LOGLEVEL_H_  // NOLINT

#include <string>

namespace MPU {

namespace Logging {

// Values line up with glog severities so a level can be fed to
// FLAGS_minloglevel directly.
enum class LogLevel : int { Info = 0, Warn = 1, Error = 2, Fatal = 3 };

// Upper case name, e.g. "WARN"
const char *GetLogLevelName(LogLevel logLevel);

// Parse a log level name, case is ignored and "warning" is accepted too
//
// @param  : name, output level
// @return : false if name is not a log level, level is left untouched
bool ParseLogLevel(const std::string &name, LogLevel *level);

// Same as ParseLogLevel but fall back to Info for unknown names
LogLevel GetLogLevelByName(const std::string &name);

// Message prefix, e.g. "[WARN] "
std::string GetLogLevelPrefix(LogLevel logLevel);

}  // namespace Logging
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_LOGLEVEL_H_
