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

#ifndef _MPU_INCLUDE_BASE_LOGGING_H_  // NOLINT
#define _MPU_INCLUDE_BASE_LOGGING_H_  // NOLINT

#include <memory>
#include <string>

#include "base/LogLevel.h"

namespace MPU {

namespace Logging {

class Log;

// Install the process wide log and initialize glog with it
//
// @param  : log instance, must not be null
// @return : void
//
// Only the first installation counts. GetLogInstance installs a DefaultLog
// at the default log directory when nothing has been installed yet.
void InitializeLogging(std::unique_ptr<Log> log);
Log *GetLogInstance();

// Destination of the glog streams plus the level and debug switches the
// logging macros consult.
class Log {
 public:
  Log() = default;
  virtual ~Log() = default;

  Log(Log &&) = delete;
  Log(const Log &) = delete;
  Log &operator=(Log &&) = delete;
  Log &operator=(const Log &) = delete;

 public:
  LogLevel GetLogLevel() const noexcept { return m_logLevel; }
  void SetLogLevel(LogLevel level) noexcept;

  // Debug* macros only write when debug is on
  bool IsDebug() const noexcept { return m_isDebug; }
  void SetDebug(bool debug) noexcept { m_isDebug = debug; }

  // Point glog at this destination. Called once on installation, before
  // glog is initialized.
  virtual void AttachToGlog() = 0;

 private:
  LogLevel m_logLevel = LogLevel::Info;
  bool m_isDebug = false;
};

// Everything goes to stderr
class ConsoleLog : public Log {
 public:
  ConsoleLog() = default;
  ~ConsoleLog() override = default;

  void AttachToGlog() override;
};

// glog files in a directory
class DefaultLog : public Log {
 public:
  // Create the directory if needed, an empty path means the default one.
  // Throw MPUException if it cannot be created or written.
  explicit DefaultLog(const std::string &path = "");
  ~DefaultLog() override = default;

  void AttachToGlog() override;
  const std::string &GetLogDirectory() const { return m_path; }

 private:
  std::string m_path;
};

}  // namespace Logging
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_LOGGING_H_
