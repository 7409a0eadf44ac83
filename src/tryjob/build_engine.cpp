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

#include "build_engine.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "tjl/filepath.h"
#include "tjl/tracing.h"
#include "tjl/unique_fd.h"

namespace tryjob {

LocalBuildEngine::LocalBuildEngine(EventLoop& loop, BuildsetStore& store,
                                   const std::vector<BuilderConfig>& configs,
                                   LocalEngineOptions options)
    : loop(loop), store(store), options(std::move(options)) {
  for (const auto& builder : configs) builders[builder.name] = builder;
}

void LocalBuildEngine::start() {
  if (timer) return;
  timer = tjl::some(loop.call_every(options.poll_interval, [this]() { tick(); }));
}

void LocalBuildEngine::stop() {
  if (timer) {
    loop.cancel(*timer);
    timer = {};
  }

  for (const auto& child : running) {
    kill(child.first, SIGTERM);
  }
  for (const auto& child : running) {
    int status = 0;
    pid_t pid;
    do {
      pid = waitpid(child.first, &status, 0);
    } while (pid == -1 && errno == EINTR);
    if (pid == child.first) {
      record_exit(child.second, status);
    } else {
      finish(child.second.request, BuildResult::exception, "lost track of build process");
    }
  }
  running.clear();
}

void LocalBuildEngine::finish(const BuildRequest& request, BuildResult result,
                              const std::string& detail) {
  tjl::log::info("engine: %s #%ld: %s (%s)", request.builder.c_str(), (long)request.number,
                 result_name(result), detail.c_str())();
  store.finish_build_request(request.id, result, detail);
}

void LocalBuildEngine::record_exit(const Running& build, int status) {
  if (!build.patch_file.empty()) unlink(build.patch_file.c_str());

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    finish(build.request, BuildResult::success, "finished");
  } else if (WIFEXITED(status)) {
    finish(build.request, BuildResult::failure,
           "exit status " + std::to_string(WEXITSTATUS(status)));
  } else if (WIFSIGNALED(status)) {
    finish(build.request, BuildResult::exception,
           "killed by signal " + std::to_string(WTERMSIG(status)));
  } else {
    finish(build.request, BuildResult::exception, "unknown wait status");
  }
}

void LocalBuildEngine::tick() {
  std::vector<pid_t> done;
  for (const auto& child : running) {
    int status = 0;
    pid_t pid = waitpid(child.first, &status, WNOHANG);
    if (pid == 0) continue;
    if (pid == -1 && errno == EINTR) continue;
    if (pid == -1) {
      tjl::log::error("engine: waitpid(%d): %s", (int)child.first, strerror(errno))();
      finish(child.second.request, BuildResult::exception, "lost track of build process");
    } else {
      // Stopped children are still running.
      if (WIFSTOPPED(status)) continue;
      record_exit(child.second, status);
    }
    done.push_back(child.first);
  }
  for (pid_t pid : done) running.erase(pid);

  if (running.size() >= options.max_parallel) return;
  for (const auto& request : store.claim_pending(options.max_parallel - running.size())) {
    launch(request);
  }
}

static tjl::result<std::string, tjl::posix_error_t> write_patch(const Patch& patch) {
  std::string path = "/tmp/tryjob-patch-XXXXXX";
  int fd = mkstemp(&path[0]);
  if (fd == -1) return tjl::make_errno<std::string>();
  tjl::unique_fd owned(fd);

  const char* data = patch.body.data();
  size_t left = patch.body.size();
  while (left > 0) {
    ssize_t count = write(owned.get(), data, left);
    if (count < 0 && errno == EINTR) continue;
    if (count < 0) {
      int err = errno;
      unlink(path.c_str());
      return tjl::make_error<std::string, tjl::posix_error_t>(err);
    }
    data += count;
    left -= count;
  }

  return tjl::result_value<tjl::posix_error_t>(std::move(path));
}

void LocalBuildEngine::launch(const BuildRequest& request) {
  auto builder = builders.find(request.builder);
  if (builder == builders.end()) {
    finish(request, BuildResult::exception, "no such builder on this master");
    return;
  }

  if (builder->second.command.empty()) {
    finish(request, BuildResult::success, "finished");
    return;
  }

  auto buildset = store.get_buildset(request.buildset);
  if (!buildset) {
    finish(request, BuildResult::exception, "buildset vanished");
    return;
  }

  Running build;
  build.request = request;

  std::vector<std::pair<std::string, std::string>> env = {
      {"TRYJOB_BUILDSET", std::to_string(request.buildset)},
      {"TRYJOB_BUILDER", request.builder},
      {"TRYJOB_BRANCH", buildset->source.branch ? *buildset->source.branch : ""},
      {"TRYJOB_REVISION", buildset->source.revision},
      {"TRYJOB_PATCH_LEVEL",
       buildset->source.patch ? std::to_string(buildset->source.patch->level) : ""},
  };

  if (buildset->source.patch) {
    auto patch_file = write_patch(*buildset->source.patch);
    if (!patch_file) {
      finish(request, BuildResult::exception,
             std::string("writing patch: ") + strerror(patch_file.error()));
      return;
    }
    build.patch_file = std::move(*patch_file);
    env.emplace_back("TRYJOB_PATCH_FILE", build.patch_file);
  }

  std::string log_path = "/dev/null";
  if (!options.log_dir.empty()) {
    log_path = tjl::join_paths(options.log_dir,
                               request.builder + "-" + std::to_string(request.number) + ".log");
  }
  auto log = tjl::unique_fd::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (!log) {
    if (!build.patch_file.empty()) unlink(build.patch_file.c_str());
    finish(request, BuildResult::exception,
           "open " + log_path + ": " + strerror(log.error()));
    return;
  }

  const std::string& command = builder->second.command;
  const std::string& workdir = builder->second.workdir;

  pid_t pid = fork();
  if (pid == -1) {
    int err = errno;
    if (!build.patch_file.empty()) unlink(build.patch_file.c_str());
    finish(request, BuildResult::exception, std::string("fork: ") + strerror(err));
    return;
  }

  if (pid == 0) {
    // Only this thread exists, so the allocations below are safe.
    if (!workdir.empty() && chdir(workdir.c_str()) != 0) _exit(126);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull == -1 || dup2(devnull, 0) == -1) _exit(126);
    if (dup2(log->get(), 1) == -1 || dup2(log->get(), 2) == -1) _exit(126);
    for (const auto& var : env) {
      if (setenv(var.first.c_str(), var.second.c_str(), 1) != 0) _exit(126);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  tjl::log::info("engine: started %s #%ld as pid %d", request.builder.c_str(),
                 (long)request.number, (int)pid)();
  running.emplace(pid, std::move(build));
}

}  // namespace tryjob
