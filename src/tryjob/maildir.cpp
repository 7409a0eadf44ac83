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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include "maildir.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include "tjl/defer.h"
#include "tjl/filepath.h"
#include "tjl/tracing.h"
#include "tjl/unique_fd.h"

namespace tryjob {

static tjl::result<std::string, tjl::posix_error_t> read_file(const std::string& path) {
  auto fd = tjl::unique_fd::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (!fd) {
    return tjl::make_error<std::string, tjl::posix_error_t>(fd.error());
  }

  std::string out;
  char buffer[4096];
  while (true) {
    ssize_t count = read(fd->get(), buffer, sizeof(buffer));
    if (count == 0) break;
    if (count < 0) {
      if (errno == EINTR) continue;
      return tjl::make_errno<std::string>();
    }
    out.append(buffer, count);
  }

  return tjl::result_value<tjl::posix_error_t>(std::move(out));
}

static tjl::posix_error_t write_all(int fd, const std::string& data) {
  const char* ptr = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t count = write(fd, ptr, left);
    if (count < 0) {
      if (errno == EINTR) continue;
      return errno;
    }
    ptr += count;
    left -= count;
  }
  return 0;
}

Maildir::Maildir(std::string root)
    : root(std::move(root)), rng(tjl::xoshiro_256::get_rng_seed()) {}

std::string Maildir::new_dir() const { return tjl::join_paths(root, "new"); }
std::string Maildir::tmp_dir() const { return tjl::join_paths(root, "tmp"); }
std::string Maildir::cur_dir() const { return tjl::join_paths(root, "cur"); }

tjl::result<Maildir, tjl::posix_error_t> Maildir::create(const std::string& root) {
  Maildir out(root);
  for (const std::string& dir : {out.new_dir(), out.tmp_dir(), out.cur_dir()}) {
    tjl::posix_error_t err = tjl::mkdir_with_parents(dir, 0755);
    if (err != 0) {
      return tjl::make_error<Maildir, tjl::posix_error_t>(err);
    }
  }
  return tjl::make_result<Maildir, tjl::posix_error_t>(std::move(out));
}

tjl::result<std::string, tjl::posix_error_t> Maildir::deliver(const Job& job) {
  return deliver_bytes(encode(job));
}

tjl::result<std::string, tjl::posix_error_t> Maildir::deliver_bytes(const std::string& bytes) {
  std::string name = rng.unique_name() + "." + std::to_string(getpid());
  std::string tmp_path = tjl::join_paths(tmp_dir(), name);
  std::string new_path = tjl::join_paths(new_dir(), name);

  auto fd = tjl::unique_fd::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (!fd) {
    return tjl::make_error<std::string, tjl::posix_error_t>(fd.error());
  }

  // Until the rename succeeds the temporary file is ours to remove.
  auto cleanup = tjl::make_defer([&tmp_path]() { unlink(tmp_path.c_str()); });

  tjl::posix_error_t err = write_all(fd->get(), bytes);
  if (err != 0) {
    return tjl::make_error<std::string, tjl::posix_error_t>(err);
  }

  if (fsync(fd->get()) != 0) {
    return tjl::make_errno<std::string>();
  }
  fd->reset();

  if (rename(tmp_path.c_str(), new_path.c_str()) != 0) {
    return tjl::make_errno<std::string>();
  }
  cleanup.nullify();

  tjl::log::info("maildir: delivered %s (%zu bytes)", new_path.c_str(), bytes.size())();
  return tjl::result_value<tjl::posix_error_t>(std::move(name));
}

PollResult Maildir::poll() {
  PollResult out;

  auto range = tjl::directory_range::open(new_dir());
  if (!range) {
    tjl::log::error("maildir: opendir(%s): %s", new_dir().c_str(), strerror(range.error()))();
    return out;
  }

  for (const auto& entry : *range) {
    if (!entry) {
      tjl::log::error("maildir: readdir(%s): %s", new_dir().c_str(), strerror(entry.error()))();
      break;
    }
    if (entry->type != tjl::file_type::regular) continue;

    std::string path = tjl::join_paths(new_dir(), entry->name);
    auto bytes = read_file(path);
    if (!bytes) {
      out.errors.push_back(MaildirEntryError{
          entry->name, MalformedJobError{std::string("read: ") + strerror(bytes.error())}});
      continue;
    }

    auto job = decode(*bytes);
    if (!job) {
      out.errors.push_back(MaildirEntryError{entry->name, job.error()});
      continue;
    }

    // A failed rename would make the next poll see the entry again.
    std::string cur_path = tjl::join_paths(cur_dir(), entry->name);
    if (rename(path.c_str(), cur_path.c_str()) != 0) {
      out.errors.push_back(MaildirEntryError{
          entry->name, MalformedJobError{std::string("rename to cur: ") + strerror(errno)}});
      continue;
    }

    out.jobs.emplace_back(std::move(*job));
  }

  return out;
}

}  // namespace tryjob
