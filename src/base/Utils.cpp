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

#include "base/Utils.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <dirent.h>  // for opendir readdir
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "base/LogMacros.h"
#include "configure/Default.h"

namespace MPU {

namespace Utils {

using std::cerr;
using std::pair;
using std::string;
using std::unique_ptr;
static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " [path=" + path + "]";
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExistsNoLog(const string &path) {
  int errorCode =
      mkdir(path.c_str(), MPU::Configure::Default::GetDefineDirMode());
  bool success = (errorCode == 0 || errno == EEXIST);
  if (!success) cerr << "Fail to create directory " + PostErrMsg(path) + "\n";
  return success;
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectoryNoLog(const string &path,
                                               bool deleteSelf) {
  bool success = true;
  string msg;
  auto ErrorOut = [&success, &msg](string &&str) {
    success = false;
    msg.assign(str);
  };

  unique_ptr<DIR, decltype(closedir) *> dir(opendir(path.c_str()), closedir);
  if (dir) {
    struct dirent *nextDir = nullptr;
    while ((nextDir = readdir(dir.get())) != nullptr) {
      if (strcmp(nextDir->d_name, ".") == 0 ||
          strcmp(nextDir->d_name, "..") == 0) {
        continue;
      }

      string fullPath(path);
      if (fullPath.empty() || fullPath.back() != PATH_DELIM) {
        fullPath.append(1, PATH_DELIM);
      }
      fullPath.append(nextDir->d_name);

      struct stat st;
      if (lstat(fullPath.c_str(), &st) != 0) {
        ErrorOut("Could not get stats of file " + PostErrMsg(fullPath));
        break;
      }

      if (S_ISDIR(st.st_mode)) {
        auto outcome = DeleteFilesInDirectoryNoLog(fullPath, true);
        if (!outcome.first) {
          ErrorOut(std::move(outcome.second));
          break;
        }
      } else if (unlink(fullPath.c_str()) != 0) {
        ErrorOut("Could not remove file " + PostErrMsg(fullPath));
        break;
      }
    }
  } else {
    ErrorOut("Could not open directory " + PostErrMsg(path));
  }

  if (success && deleteSelf && rmdir(path.c_str()) != 0) {
    ErrorOut("Could not remove dir " + PostErrMsg(path));
  }

  return {success, msg};
}

// --------------------------------------------------------------------------
bool FileExists(const string &path, bool logOn) {
  if (access(path.c_str(), F_OK) == 0) {
    return true;
  }
  if (logOn) {
    DebugInfo("File not exists " + PostErrMsg(path));
  }
  return false;
}

// --------------------------------------------------------------------------
bool IsDirectory(const string &path, bool logOn) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    if (logOn) {
      DebugWarning("Unable to access path " + PostErrMsg(path));
    }
    return false;
  }
  return S_ISDIR(stBuf.st_mode);
}

// --------------------------------------------------------------------------
bool HavePermission(const string &path, bool logOn) {
  if (!IsDirectory(path, logOn)) {
    return false;
  }
  if (access(path.c_str(), W_OK | X_OK) != 0) {
    if (logOn) {
      DebugWarning("No write permission " + PostErrMsg(path));
    }
    return false;
  }
  return true;
}

}  // namespace Utils
}  // namespace MPU
