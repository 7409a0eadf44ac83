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

#include <string>
#include <vector>

#include "tjl/result.h"
#include "tjl/xoshiro_256.h"
#include "tryjob/job.h"

namespace tryjob {

struct MaildirEntryError {
  std::string entry;
  MalformedJobError error;
};

struct PollResult {
  std::vector<Job> jobs;
  std::vector<MaildirEntryError> errors;
};

// A jobdir with the usual maildir layout. Writers fill a file under
// tmp/ and rename it into new/, so a reader never observes a partial
// file. The reader renames consumed entries into cur/.
class Maildir {
 private:
  std::string root;
  tjl::xoshiro_256 rng;

  Maildir(std::string root);

 public:
  // Creates root, new/, tmp/ and cur/ as needed.
  static tjl::result<Maildir, tjl::posix_error_t> create(const std::string& root);

  const std::string& path() const { return root; }
  std::string new_dir() const;
  std::string tmp_dir() const;
  std::string cur_dir() const;

  // Returns the name of the new entry.
  tjl::result<std::string, tjl::posix_error_t> deliver(const Job& job);
  tjl::result<std::string, tjl::posix_error_t> deliver_bytes(const std::string& bytes);

  // Consumes everything currently in new/. Never blocks. Entries that
  // fail to read or decode are reported and left in place.
  PollResult poll();
};

}  // namespace tryjob
