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

#include "base/Logging.h"

#include <memory>
#include <mutex>  // NOLINT
#include <utility>

#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace MPU {

namespace Logging {

using MPU::Configure::Default::GetDefaultLogDirectory;
using MPU::Configure::Default::GetDefaultLogLevelName;
using MPU::Configure::Default::GetProgramName;
using MPU::Exception::MPUException;
using std::once_flag;
using std::unique_ptr;

namespace {

unique_ptr<Log> logInstance(nullptr);
once_flag logOnceFlag;

// Called once, inside call_once, so no logging from here
void Install(unique_ptr<Log> log) {
  logInstance = std::move(log);
  logInstance->AttachToGlog();
  logInstance->SetLogLevel(GetLogLevelByName(GetDefaultLogLevelName()));
  google::InitGoogleLogging(GetProgramName());
}

}  // namespace

// --------------------------------------------------------------------------
void InitializeLogging(unique_ptr<Log> log) {
  if (!log) {
    throw MPUException("Unable to initialize logging with a null log");
  }
  std::call_once(logOnceFlag, [&log] { Install(std::move(log)); });
}

// --------------------------------------------------------------------------
Log *GetLogInstance() {
  std::call_once(logOnceFlag, [] {
    Install(unique_ptr<Log>(new DefaultLog(GetDefaultLogDirectory())));
  });
  return logInstance.get();
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel level) noexcept {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void ConsoleLog::AttachToGlog() { FLAGS_logtostderr = true; }

// --------------------------------------------------------------------------
DefaultLog::DefaultLog(const std::string &path)
    : m_path(path.empty() ? GetDefaultLogDirectory() : path) {
  if (!MPU::Utils::CreateDirectoryIfNotExistsNoLog(m_path)) {
    throw MPUException("Unable to create log directory " + m_path);
  }
  // no logging here, the log is not installed yet
  if (!MPU::Utils::HavePermission(m_path, false)) {
    throw MPUException("Could not create logging file at " + m_path +
                       ": Permission denied");
  }
}

// --------------------------------------------------------------------------
void DefaultLog::AttachToGlog() {
  // glog reads the file destination only when it opens its files
  FLAGS_log_dir = m_path;
}

}  // namespace Logging
}  // namespace MPU
