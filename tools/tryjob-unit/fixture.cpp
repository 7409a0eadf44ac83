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

#include "fixture.h"

#include <errno.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "tjl/filepath.h"
#include "tjl/tracing.h"

TempDir::TempDir() {
  char templ[] = "/tmp/tryjob-unit-XXXXXX";
  if (mkdtemp(templ) == nullptr) {
    tjl::log::fatal("mkdtemp: %s", strerror(errno));
  }
  root = templ;
}

static int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
  return remove(path);
}

TempDir::~TempDir() {
  if (nftw(root.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
    tjl::log::warning("could not remove %s: %s", root.c_str(), strerror(errno))();
  }
}

std::string TempDir::sub(const std::string& name) const { return tjl::join_paths(root, name); }

bool write_file(const std::string& path, const std::string& content) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file) return false;
  file << content;
  return static_cast<bool>(file);
}

tjl::optional<std::string> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) return {};
  std::stringstream buff;
  buff << file.rdbuf();
  return tjl::some(buff.str());
}

std::vector<std::string> list_dir(const std::string& path) {
  std::vector<std::string> out;
  auto dir = tjl::directory_range::open(path);
  if (!dir) return out;
  for (const auto& entry : *dir) {
    if (!entry) break;
    if (entry->type == tjl::file_type::regular) out.push_back(entry->name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

tryjob::Job sample_job(std::vector<std::string> builders) {
  tryjob::Job job;
  job.jobid = "1700000000-test";
  job.source.branch = tjl::some(std::string("main"));
  job.source.revision = "1234abcd";
  job.source.patch = tjl::some(tryjob::Patch(1, "--- a/x\n+++ b/x\n@@ -1 +1 @@\n-a\n+b\n"));
  job.builder_names = std::move(builders);
  job.who = "alice";
  return job;
}

static tryjob::UserpassOptions test_options(const std::vector<tryjob::BuilderConfig>& builders) {
  tryjob::UserpassOptions options;
  options.name = "try";
  for (const auto& builder : builders) options.builders.push_back(builder.name);
  options.listen_address = "127.0.0.1";
  options.port = 0;
  options.users["alice"] = "secret";
  options.status_interval = 0.05;
  return options;
}

static tryjob::LocalEngineOptions test_engine_options() {
  tryjob::LocalEngineOptions options;
  options.poll_interval = 0.05;
  return options;
}

TestMaster::TestMaster(tryjob::EventLoop& loop, const std::string& dir,
                       const std::vector<tryjob::BuilderConfig>& builders)
    : store(tjl::join_paths(dir, "state.sqlite")),
      scheduler(loop, store, test_options(builders)),
      engine(loop, store, builders, test_engine_options()) {
  auto bound = scheduler.start();
  if (!bound) tjl::log::fatal("test master could not listen: %s", strerror(bound.error()));
  port = *bound;
  engine.start();
}

std::vector<tryjob::BuilderConfig> instant_builders(const std::vector<std::string>& names) {
  std::vector<tryjob::BuilderConfig> out;
  for (const auto& name : names) {
    tryjob::BuilderConfig builder;
    builder.name = name;
    out.push_back(builder);
  }
  return out;
}

tryjob::DeliveryConfig pb_config(const TestMaster& master, std::vector<std::string> builders) {
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::pb;
  config.master = master.endpoint();
  config.username = "alice";
  config.passwd = "secret";
  config.builders = std::move(builders);
  config.who = "alice";
  config.wait_interval = 0.05;
  config.connect_timeout = 5;
  return config;
}
