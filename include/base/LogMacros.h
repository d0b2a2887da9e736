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

#ifndef _MPU_INCLUDE_BASE_LOGMACROS_H_  // NOLINT
#define _MPU_INCLUDE_BASE_LOGMACROS_H_  // NOLINT

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_MPU_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)
#define DebugFatal(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)
#define DebugFatalIf(condition, msg)

#else  // !DISABLE_MPU_LOGGING

// Write msg to glog stream 'severity' with the prefix of 'level' when
// 'condition' holds. Debug-only messages additionally require the log
// instance to be in debug mode.
//
// The INFO stream is flushed after every non-fatal message, so the log files
// always hold the latest messages. Unit tests read them back.
#define MPU_LOG_IF_(severity, level, condition, debugOnly, msg)            \
  {                                                                        \
    MPU::Logging::Log *log = MPU::Logging::GetLogInstance();               \
    if (log && (!(debugOnly) || log->IsDebug())) {                         \
      LOG_IF(severity, (condition))                                        \
          << MPU::Logging::GetLogLevelPrefix(MPU::Logging::LogLevel::level) \
          << msg;                                                          \
      google::FlushLogFiles(google::INFO);                                 \
    }                                                                      \
  }

// No flush for FATAL, glog aborts the program after writing it.
#define MPU_LOG_FATAL_IF_(condition, debugOnly, msg)                       \
  {                                                                        \
    MPU::Logging::Log *log = MPU::Logging::GetLogInstance();               \
    if (log && (!(debugOnly) || log->IsDebug())) {                         \
      LOG_IF(FATAL, (condition))                                           \
          << MPU::Logging::GetLogLevelPrefix(MPU::Logging::LogLevel::Fatal) \
          << msg;                                                          \
    }                                                                      \
  }

#define Info(msg) MPU_LOG_IF_(INFO, Info, true, false, msg)
#define Warning(msg) MPU_LOG_IF_(WARNING, Warn, true, false, msg)
#define Error(msg) MPU_LOG_IF_(ERROR, Error, true, false, msg)
#define Fatal(msg) MPU_LOG_FATAL_IF_(true, false, msg)

#define InfoIf(condition, msg) MPU_LOG_IF_(INFO, Info, condition, false, msg)
#define WarningIf(condition, msg) \
  MPU_LOG_IF_(WARNING, Warn, condition, false, msg)
#define ErrorIf(condition, msg) MPU_LOG_IF_(ERROR, Error, condition, false, msg)
#define FatalIf(condition, msg) MPU_LOG_FATAL_IF_(condition, false, msg)

#define DebugInfo(msg) MPU_LOG_IF_(INFO, Info, true, true, msg)
#define DebugWarning(msg) MPU_LOG_IF_(WARNING, Warn, true, true, msg)
#define DebugError(msg) MPU_LOG_IF_(ERROR, Error, true, true, msg)
#define DebugFatal(msg) MPU_LOG_FATAL_IF_(true, true, msg)

#define DebugInfoIf(condition, msg) \
  MPU_LOG_IF_(INFO, Info, condition, true, msg)
#define DebugWarningIf(condition, msg) \
  MPU_LOG_IF_(WARNING, Warn, condition, true, msg)
#define DebugErrorIf(condition, msg) \
  MPU_LOG_IF_(ERROR, Error, condition, true, msg)
#define DebugFatalIf(condition, msg) MPU_LOG_FATAL_IF_(condition, true, msg)

#endif  // DISABLE_MPU_LOGGING

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_LOGMACROS_H_
