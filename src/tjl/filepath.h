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

#pragma once

#include <dirent.h>
#include <sys/types.h>

#include <string>

#include "result.h"

namespace tjl {

enum class file_type { block, character, directory, fifo, symlink, regular, socket, unknown };

struct directory_entry {
  std::string name;
  file_type type;
};

class directory_range;

// Iterates over the entries of an open DIR, skipping "." and "..".
// Each dereference yields either an entry or the errno readdir failed
// with.
class directory_iterator {
  friend class directory_range;

 private:
  std::string dir_path;
  DIR* dir = nullptr;
  optional<result<directory_entry, posix_error_t>> value;

  void step();
  directory_iterator(std::string dir_path, DIR* dir) : dir_path(std::move(dir_path)), dir(dir) {
    step();
  }

 public:
  directory_iterator() : dir_path(), dir(nullptr), value() {}
  directory_iterator(const directory_iterator&) = delete;
  directory_iterator(directory_iterator&& other)
      : dir_path(std::move(other.dir_path)), dir(other.dir), value(std::move(other.value)) {
    other.dir = nullptr;
  }

  result<directory_entry, posix_error_t> operator*() const {
    if (!value) {
      return make_error<directory_entry, posix_error_t>(EBADF);
    }
    return *value;
  }

  directory_iterator& operator++() {
    step();
    return *this;
  }

  bool operator!=(const directory_iterator& other) const { return dir != other.dir; }
};

class directory_range {
 private:
  DIR* dir = nullptr;
  std::string dir_path;

  directory_range(const std::string& path) : dir(nullptr), dir_path(path) {
    dir = opendir(path.c_str());
  }

 public:
  ~directory_range() {
    if (dir) {
      closedir(dir);
    }
  }
  directory_range(const directory_range&) = delete;
  directory_range(directory_range&& other) : dir(other.dir), dir_path(std::move(other.dir_path)) {
    other.dir = nullptr;
  }

  static result<directory_range, posix_error_t> open(const std::string& path) {
    directory_range out{path};
    if (out.dir == nullptr) {
      return make_errno<directory_range>();
    }

    return make_result<directory_range, posix_error_t>(std::move(out));
  }

  directory_iterator begin() { return directory_iterator(dir_path, dir); }

  directory_iterator end() { return directory_iterator{}; }
};

inline std::string join_paths(std::string a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  if (a.back() != '/') a += '/';
  auto begin = b.begin();
  if (*begin == '/') ++begin;
  a.insert(a.end(), begin, b.end());
  return a;
}

inline std::string join_paths(std::string a, const std::string& b, const std::string& c) {
  return join_paths(join_paths(std::move(a), b), c);
}

inline bool is_relative(const std::string& path) { return path.empty() || path[0] != '/'; }

// Like `mkdir -p`, an existing directory is not an error. Returns 0 or
// the errno of the first mkdir that failed.
posix_error_t mkdir_with_parents(const std::string& path, mode_t mode);

}  // namespace tjl
