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

#include <string>
#include <utility>

#include "boost/scope_exit.hpp"

namespace CX {

namespace Utils {

using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';
static const mode_t DIR_MODE = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " [path=" + path + "]";
}

// @return : {is directory, error message if unable to access the path}
pair<bool, string> IsDirectory(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(false, "Unable to access path " + PostErrMsg(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(st.st_mode)), string());
}

// Parent of a path, "/a/b/" gives "/a/", "a" gives "."
string GetDirName(const string &path) {
  string copy(path);
  while (copy.size() > 1 && copy[copy.size() - 1] == PATH_DELIM) {
    copy.erase(copy.size() - 1);
  }
  string::size_type pos = copy.find_last_of(PATH_DELIM);
  if (pos == string::npos) {
    return ".";
  }
  if (pos == 0) {
    return "/";
  }
  return copy.substr(0, pos + 1);
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (path == "/" || path == ".") {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  int errorCode = mkdir(path.c_str(), DIR_MODE);
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const string &path, bool deleteSelf) {
  bool success = true;
  string msg;

  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
      dir = NULL;
    }
  }
  BOOST_SCOPE_EXIT_END

  if (dir == NULL) {
    return make_pair(false, "Could not open directory " + PostErrMsg(path));
  }

  struct dirent *entry = NULL;
  while ((entry = readdir(dir)) != NULL) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
      continue;
    }

    string fullPath(path);
    if (fullPath[fullPath.size() - 1] != PATH_DELIM) {
      fullPath.append(1, PATH_DELIM);
    }
    fullPath.append(entry->d_name);

    struct stat st;
    if (lstat(fullPath.c_str(), &st) != 0) {
      success = false;
      msg.assign("Could not get stats of file " + PostErrMsg(fullPath));
      break;
    }

    if (S_ISDIR(st.st_mode)) {
      pair<bool, string> outcome = DeleteFilesInDirectory(fullPath, true);
      if (!outcome.first) {
        success = false;
        msg.assign(outcome.second);
        break;
      }
    } else if (unlink(fullPath.c_str()) != 0) {
      success = false;
      msg.assign("Could not remove file " + PostErrMsg(fullPath));
      break;
    }
  }

  if (success && deleteSelf && rmdir(path.c_str()) != 0) {
    success = false;
    msg.assign("Could not remove dir " + PostErrMsg(path));
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) { return access(path.c_str(), F_OK) == 0; }

// --------------------------------------------------------------------------
pair<bool, string> IsWritableDirectory(const string &path) {
  pair<bool, string> outcome = IsDirectory(path);
  if (!outcome.first) {
    return outcome;
  }
  if (access(path.c_str(), W_OK | X_OK) != 0) {
    return make_pair(false, "No write permission " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

}  // namespace Utils
}  // namespace CX
