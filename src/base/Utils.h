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

#ifndef CHUNKXFER_BASE_UTILS_H_
#define CHUNKXFER_BASE_UTILS_H_

#include <string>
#include <utility>

namespace CX {

namespace Utils {

// Create directory and its missing parents
//
// @param  : dir path
// @return : true if the directory exists afterwards
bool CreateDirectoryIfNotExists(const std::string &path);

// Delete the entries of a directory recursively
//
// @param  : dir path, flag to remove the directory itself too
// @return : {success, error message}
std::pair<bool, std::string> DeleteFilesInDirectory(const std::string &path,
                                                    bool deleteSelf);

bool FileExists(const std::string &path);

// Check if the process can create files under the directory
//
// @param  : dir path
// @return : {writable, error message}
std::pair<bool, std::string> IsWritableDirectory(const std::string &path);

}  // namespace Utils
}  // namespace CX


#endif  // CHUNKXFER_BASE_UTILS_H_
