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

#include "base/LogLevel.h"

#include <algorithm>
#include <cctype>

namespace MPU {

namespace Logging {

using std::string;

const char *GetLogLevelName(LogLevel logLevel) {
  switch (logLevel) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

// --------------------------------------------------------------------------
bool ParseLogLevel(const string &name, LogLevel *level) {
  string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "WARNING") {
    upper = "WARN";
  }

  for (auto candidate :
       {LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Fatal}) {
    if (upper == GetLogLevelName(candidate)) {
      if (level != nullptr) {
        *level = candidate;
      }
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
LogLevel GetLogLevelByName(const string &name) {
  LogLevel level = LogLevel::Info;
  ParseLogLevel(name, &level);
  return level;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel logLevel) {
  return string("[") + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace MPU
