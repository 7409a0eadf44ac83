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

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "json/json5.h"
#include "tjl/result.h"
#include "tryjob/build_engine.h"

namespace tryjob {

static constexpr const char* TRY_USERPASS = "try_userpass";
static constexpr const char* TRY_JOBDIR = "try_jobdir";

struct SchedulerConfig {
  std::string type;
  std::string name;
  std::vector<std::string> builders;

  // try_userpass
  std::string listen;
  uint16_t port = 0;
  std::map<std::string, std::string> users;

  // try_jobdir, relative paths are taken from basedir
  std::string jobdir;
  double poll_interval = 10;
};

struct MasterConfig {
  std::string basedir = ".";
  // Defaults to <basedir>/state.sqlite
  std::string database;
  double status_interval = 1;
  double engine_interval = 0.2;
  size_t max_parallel = 4;
  std::vector<BuilderConfig> builders;
  std::vector<SchedulerConfig> schedulers;

  // Unknown keys, already logged.
  std::vector<std::string> warnings;
};

tjl::result<MasterConfig, std::string> parse_master_config(const JAST& json,
                                                           const std::string& origin);
tjl::result<MasterConfig, std::string> load_master_config(const std::string& path);

}  // namespace tryjob
