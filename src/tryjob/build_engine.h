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

#include <sys/types.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tryjob/buildset_store.h"
#include "tryjob/event_loop.h"

namespace tryjob {

struct BuilderConfig {
  std::string name;
  // Run with /bin/sh -c. Empty succeeds without running anything.
  std::string command;
  // Empty runs in the master's working directory.
  std::string workdir;
};

// Claims pending build requests from the store, runs them and records
// a terminal result with a detail string.
class BuildEngine {
 public:
  virtual ~BuildEngine() {}
  virtual void start() = 0;
  virtual void stop() = 0;
};

struct LocalEngineOptions {
  double poll_interval = 0.2;
  size_t max_parallel = 4;
  // Per build `<builder>-<number>.log` files, or /dev/null when empty.
  std::string log_dir;
};

// Runs each builder's command as a local child process. The child
// environment carries TRYJOB_BUILDSET, TRYJOB_BUILDER, TRYJOB_BRANCH,
// TRYJOB_REVISION, TRYJOB_PATCH_LEVEL and, with a patch, the path of a
// file holding it in TRYJOB_PATCH_FILE.
class LocalBuildEngine : public BuildEngine {
 private:
  struct Running {
    BuildRequest request;
    std::string patch_file;
  };

  EventLoop& loop;
  BuildsetStore& store;
  std::map<std::string, BuilderConfig> builders;
  LocalEngineOptions options;
  std::map<pid_t, Running> running;
  tjl::optional<EventLoop::TimerId> timer;

  void launch(const BuildRequest& request);
  void finish(const BuildRequest& request, BuildResult result, const std::string& detail);
  void record_exit(const Running& build, int status);

 public:
  LocalBuildEngine(EventLoop& loop, BuildsetStore& store, const std::vector<BuilderConfig>& builders,
                   LocalEngineOptions options = LocalEngineOptions());
  ~LocalBuildEngine() override { stop(); }

  LocalBuildEngine(const LocalBuildEngine&) = delete;
  LocalBuildEngine& operator=(const LocalBuildEngine&) = delete;

  void start() override;
  // Terminates running builds; they are recorded as exceptions.
  void stop() override;

  // Reaps finished children then claims more pending requests.
  void tick();
  size_t running_count() const { return running.size(); }
};

}  // namespace tryjob
