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
#include "tryjob/job.h"

namespace tryjob {

// Where the mailbox transport drops a job. With an empty host the
// jobdir is a local path, otherwise it lives on `host` and is reached
// by running the drop agent there over ssh.
struct MailboxTarget {
  std::string host;
  std::string username;
  std::string jobdir;
  std::string ssh_command = "ssh";
  std::string tryserver = "tryjob-server";
};

// `<ssh_command...> [-l user] host <tryserver> --jobdir <jobdir>`
std::vector<std::string> remote_command(const MailboxTarget& target);

// Returns the entry name for local deliveries and the host for remote
// ones. The error is a readable message.
tjl::result<std::string, std::string> deliver_to_mailbox(const MailboxTarget& target,
                                                         const Job& job);

}  // namespace tryjob
