/*
 * Copyright 2023 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "filepath.h"

#include <dirent.h>
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cstring>

namespace tjl {

// assumes that type != DT_UNKNOWN
static file_type dir_type_conv(unsigned char type) {
  switch (type) {
    case DT_BLK:
      return file_type::block;
    case DT_CHR:
      return file_type::character;
    case DT_DIR:
      return file_type::directory;
    case DT_FIFO:
      return file_type::fifo;
    case DT_LNK:
      return file_type::symlink;
    case DT_REG:
      return file_type::regular;
    case DT_SOCK:
      return file_type::socket;
  }
  return file_type::unknown;
}

static file_type stat_type_conv(mode_t mode) {
  switch (mode & S_IFMT) {
    case S_IFBLK:
      return file_type::block;
    case S_IFCHR:
      return file_type::character;
    case S_IFDIR:
      return file_type::directory;
    case S_IFIFO:
      return file_type::fifo;
    case S_IFLNK:
      return file_type::symlink;
    case S_IFREG:
      return file_type::regular;
    case S_IFSOCK:
      return file_type::socket;
  }
  return file_type::unknown;
}

void directory_iterator::step() {
  if (dir == nullptr) return;

  dirent *entry = nullptr;
  do {
    // readdir only reports errors through errno.
    errno = 0;
    entry = readdir(dir);
  } while (entry != nullptr &&
           (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0));

  if (entry == nullptr && errno != 0) {
    value = some(make_errno<directory_entry>());
    return;
  }

  // End of the directory, become the end iterator.
  if (entry == nullptr) {
    dir = nullptr;
    dir_path = "";
    value = some(make_error<directory_entry, posix_error_t>(EBADF));
    return;
  }

  directory_entry out;
  out.name = entry->d_name;

  // Some filesystems do not fill in d_type.
  if (entry->d_type == DT_UNKNOWN) {
    std::string path = join_paths(dir_path, out.name);
    struct stat buf;
    if (lstat(path.c_str(), &buf) == 0) {
      out.type = stat_type_conv(buf.st_mode);
    } else {
      out.type = file_type::unknown;
    }
  } else {
    out.type = dir_type_conv(entry->d_type);
  }

  value = some(make_result<directory_entry, posix_error_t>(std::move(out)));
}

posix_error_t mkdir_with_parents(const std::string& path, mode_t mode) {
  // A leading '/' always exists so the search starts past it.
  size_t slash_pos = 0;
  while (slash_pos != std::string::npos) {
    slash_pos = path.find('/', slash_pos + 1);
    std::string dir = path.substr(0, slash_pos);
    if (dir.empty() || dir.back() == '/') continue;
    if (mkdir(dir.c_str(), mode) != 0 && errno != EEXIST) return errno;
  }
  return 0;
}

}  // namespace tjl
