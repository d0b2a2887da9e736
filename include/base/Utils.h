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

#ifndef _MPU_INCLUDE_BASE_UTILS_H_  // NOLINT
#define _MPU_INCLUDE_BASE_UTILS_H_  // NOLINT

#include <string>
#include <utility>

namespace MPU {

namespace Utils {

// Create directory if it doesn't exists
//
// @param  : dir path
// @return : bool
//
// This will not print log, errors go to stderr.
bool CreateDirectoryIfNotExistsNoLog(const std::string &path);

// Delete files in dir recursively
//
// @param  : dir path, flag to delete dir itself
// @return : a pair of {true,""} or {false, message}
//
// This will not print log
std::pair<bool, std::string> DeleteFilesInDirectoryNoLog(
    const std::string &path, bool deleteDirectorySelf);

// Check if file exists
bool FileExists(const std::string &path, bool logOn = true);

// Check if file is a directory
bool IsDirectory(const std::string &path, bool logOn = true);

// Check if process could create and remove files in the directory
//
// @param  : dir path, log on flag
// @return : bool
//
// Do not set logOn when checking the log directory itself.
bool HavePermission(const std::string &path, bool logOn);

}  // namespace Utils
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_UTILS_H_
