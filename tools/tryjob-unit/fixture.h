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

#include <cstdint>
#include <string>
#include <vector>

#include "tryjob/build_engine.h"
#include "tryjob/event_loop.h"
#include "tryjob/job.h"
#include "tryjob/sqlite_store.h"
#include "tryjob/try_client.h"
#include "tryjob/userpass_scheduler.h"

// A fresh directory under /tmp, removed with everything in it on
// destruction.
class TempDir {
 private:
  std::string root;

 public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return root; }
  std::string sub(const std::string& name) const;
};

class CollectingOutput : public tryjob::Output {
 public:
  std::vector<std::string> lines;
  void line(const std::string& text) override { lines.push_back(text); }
};

bool write_file(const std::string& path, const std::string& content);
tjl::optional<std::string> read_file(const std::string& path);
// Regular files only, sorted.
std::vector<std::string> list_dir(const std::string& path);

tryjob::Job sample_job(std::vector<std::string> builders);

// A complete master on one loop: a sqlite store under `dir`, a userpass
// scheduler on an ephemeral port with the single user alice/secret,
// and a local build engine that runs `builders`.
struct TestMaster {
  tryjob::SqliteBuildsetStore store;
  tryjob::UserpassScheduler scheduler;
  tryjob::LocalBuildEngine engine;
  uint16_t port = 0;

  TestMaster(tryjob::EventLoop& loop, const std::string& dir,
             const std::vector<tryjob::BuilderConfig>& builders);

  std::string endpoint() const { return "127.0.0.1:" + std::to_string(port); }
};

std::vector<tryjob::BuilderConfig> instant_builders(const std::vector<std::string>& names);

tryjob::DeliveryConfig pb_config(const TestMaster& master, std::vector<std::string> builders);
