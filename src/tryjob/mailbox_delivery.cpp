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

#include "mailbox_delivery.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <sstream>

#include "tjl/tracing.h"
#include "tjl/unique_fd.h"
#include "tryjob/maildir.h"

namespace tryjob {

std::vector<std::string> remote_command(const MailboxTarget& target) {
  std::vector<std::string> argv;
  std::stringstream words(target.ssh_command);
  std::string word;
  while (words >> word) argv.push_back(word);
  if (argv.empty()) argv.push_back("ssh");

  if (!target.username.empty()) {
    argv.push_back("-l");
    argv.push_back(target.username);
  }
  argv.push_back(target.host);
  argv.push_back(target.tryserver);
  argv.push_back("--jobdir");
  argv.push_back(target.jobdir);
  return argv;
}

static tjl::result<std::string, std::string> deliver_local(const MailboxTarget& target,
                                                           const Job& job) {
  auto maildir = Maildir::create(target.jobdir);
  if (!maildir) {
    return tjl::make_error<std::string, std::string>("jobdir " + target.jobdir + ": " +
                                                     strerror(maildir.error()));
  }

  auto entry = maildir->deliver(job);
  if (!entry) {
    return tjl::make_error<std::string, std::string>("delivering into " + target.jobdir + ": " +
                                                     strerror(entry.error()));
  }
  return tjl::result_value<std::string>(std::move(*entry));
}

static tjl::result<std::string, std::string> deliver_remote(const MailboxTarget& target,
                                                            const Job& job) {
  std::vector<std::string> args = remote_command(target);
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(&arg[0]);
  argv.push_back(nullptr);

  int pipefd[2];
  if (pipe(pipefd) == -1) {
    return tjl::make_error<std::string, std::string>(std::string("pipe: ") + strerror(errno));
  }
  tjl::unique_fd read_end(pipefd[0]);
  tjl::unique_fd write_end(pipefd[1]);
  if (fcntl(read_end.get(), F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(write_end.get(), F_SETFD, FD_CLOEXEC) == -1) {
    return tjl::make_error<std::string, std::string>(std::string("fcntl: ") + strerror(errno));
  }

  tjl::log::info("mailbox: running %s", args[0].c_str())();

  pid_t pid = fork();
  if (pid == -1) {
    return tjl::make_error<std::string, std::string>(std::string("fork: ") + strerror(errno));
  }
  if (pid == 0) {
    if (dup2(read_end.get(), 0) == -1) _exit(127);
    execvp(argv[0], argv.data());
    _exit(127);
  }
  read_end.reset();

  std::string data = encode(job);
  std::string write_error;
  size_t done = 0;
  while (done < data.size()) {
    ssize_t count = write(write_end.get(), data.data() + done, data.size() - done);
    if (count < 0 && errno == EINTR) continue;
    if (count < 0) {
      write_error = strerror(errno);
      break;
    }
    done += count;
  }
  write_end.reset();

  int status = 0;
  pid_t reaped;
  do {
    reaped = waitpid(pid, &status, 0);
  } while (reaped == -1 && errno == EINTR);
  if (reaped == -1) {
    return tjl::make_error<std::string, std::string>(std::string("waitpid: ") + strerror(errno));
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
    return tjl::make_error<std::string, std::string>("could not run " + args[0]);
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    return tjl::make_error<std::string, std::string>(
        args[0] + " exited with status " + std::to_string(WEXITSTATUS(status)));
  }
  if (WIFSIGNALED(status)) {
    return tjl::make_error<std::string, std::string>(
        args[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
  }
  if (!write_error.empty()) {
    return tjl::make_error<std::string, std::string>("writing job to " + args[0] + ": " +
                                                     write_error);
  }
  return tjl::result_value<std::string>(target.host);
}

tjl::result<std::string, std::string> deliver_to_mailbox(const MailboxTarget& target,
                                                         const Job& job) {
  if (target.jobdir.empty()) {
    return tjl::make_error<std::string, std::string>("no jobdir configured");
  }
  if (target.host.empty()) return deliver_local(target, job);
  return deliver_remote(target, job);
}

}  // namespace tryjob
