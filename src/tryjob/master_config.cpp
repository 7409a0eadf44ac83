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

#include "master_config.h"

#include <set>

#include "tjl/filepath.h"
#include "tjl/tracing.h"
#include "tryjob/json_file.h"

namespace tryjob {

using ConfigResult = tjl::result<MasterConfig, std::string>;

static ConfigResult config_error(const std::string& origin, const std::string& why) {
  return tjl::make_error<MasterConfig, std::string>(origin + ": " + why);
}

static void warn_unknown_keys(const JAST& json, const std::set<std::string>& keys,
                              const std::string& where, MasterConfig& config) {
  for (const auto& key : find_disallowed_keys(json, keys)) {
    std::string warning = where + ": unknown key '" + key + "' ignored";
    tjl::log::warning("%s", warning.c_str())();
    config.warnings.emplace_back(std::move(warning));
  }
}

// Reads an optional string. Returns false when present but not a string.
static bool read_string(const JAST& json, const char* key, std::string& out) {
  auto value = json.get_opt(key);
  if (!value) return true;
  auto str = (*value)->expect_string();
  if (!str) return false;
  out = std::move(*str);
  return true;
}

static bool read_number(const JAST& json, const char* key, double& out) {
  auto value = json.get_opt(key);
  if (!value) return true;
  auto num = (*value)->expect_number();
  if (!num || *num <= 0) return false;
  out = *num;
  return true;
}

static bool read_strings(const JAST& json, const char* key, std::vector<std::string>& out) {
  auto value = json.get_opt(key);
  if (!value) return true;
  if ((*value)->kind != JSON_ARRAY) return false;
  out.clear();
  for (const auto& child : (*value)->children) {
    auto str = child.second.expect_string();
    if (!str) return false;
    out.emplace_back(std::move(*str));
  }
  return true;
}

static tjl::optional<std::string> parse_builder(const JAST& json, size_t index,
                                                MasterConfig& config) {
  std::string where = "builders[" + std::to_string(index) + "]";
  if (json.kind != JSON_OBJECT) return tjl::some(where + " must be an object");
  warn_unknown_keys(json, {"name", "command", "workdir"}, where, config);

  BuilderConfig builder;
  if (!read_string(json, "name", builder.name) || builder.name.empty()) {
    return tjl::some(where + ".name must be a non-empty string");
  }
  if (!read_string(json, "command", builder.command)) {
    return tjl::some(where + ".command must be a string");
  }
  if (!read_string(json, "workdir", builder.workdir)) {
    return tjl::some(where + ".workdir must be a string");
  }
  if (!builder.workdir.empty() && tjl::is_relative(builder.workdir)) {
    builder.workdir = tjl::join_paths(config.basedir, builder.workdir);
  }

  for (const auto& other : config.builders) {
    if (other.name == builder.name) return tjl::some("duplicate builder '" + builder.name + "'");
  }
  config.builders.emplace_back(std::move(builder));
  return {};
}

static tjl::optional<std::string> parse_users(const JAST& json, const std::string& where,
                                              SchedulerConfig& scheduler) {
  auto users = json.get_opt("users");
  if (!users) return {};
  if ((*users)->kind != JSON_ARRAY) return tjl::some(where + ".users must be an array");

  for (const auto& child : (*users)->children) {
    auto username = child.second.get("username").expect_string();
    auto password = child.second.get("password").expect_string();
    if (!username || !password || username->empty()) {
      return tjl::some(where + ".users entries need a username and a password");
    }
    scheduler.users[*username] = *password;
  }
  return {};
}

static tjl::optional<std::string> parse_scheduler(const JAST& json, size_t index,
                                                  MasterConfig& config) {
  std::string where = "schedulers[" + std::to_string(index) + "]";
  if (json.kind != JSON_OBJECT) return tjl::some(where + " must be an object");
  warn_unknown_keys(
      json, {"type", "name", "builders", "port", "listen", "users", "jobdir", "poll_interval"},
      where, config);

  SchedulerConfig scheduler;
  if (!read_string(json, "type", scheduler.type)) {
    return tjl::some(where + ".type must be a string");
  }
  if (scheduler.type != TRY_USERPASS && scheduler.type != TRY_JOBDIR) {
    return tjl::some(where + ".type must be '" + TRY_USERPASS + "' or '" + TRY_JOBDIR + "'");
  }
  if (!read_string(json, "name", scheduler.name) || scheduler.name.empty()) {
    return tjl::some(where + ".name must be a non-empty string");
  }
  if (!read_strings(json, "builders", scheduler.builders)) {
    return tjl::some(where + ".builders must be an array of strings");
  }

  for (const auto& builder : scheduler.builders) {
    bool known = false;
    for (const auto& configured : config.builders) known = known || configured.name == builder;
    if (!known) return tjl::some(where + " names unknown builder '" + builder + "'");
  }

  if (scheduler.type == TRY_USERPASS) {
    auto port = json.get("port").expect_integer();
    if (!port || *port < 0 || *port > 65535) {
      return tjl::some(where + ".port must be an integer between 0 and 65535");
    }
    scheduler.port = static_cast<uint16_t>(*port);
    if (!read_string(json, "listen", scheduler.listen)) {
      return tjl::some(where + ".listen must be a string");
    }
    auto err = parse_users(json, where, scheduler);
    if (err) return err;
    if (scheduler.users.empty()) return tjl::some(where + " needs at least one user");
  } else {
    if (!read_string(json, "jobdir", scheduler.jobdir) || scheduler.jobdir.empty()) {
      return tjl::some(where + ".jobdir must be a non-empty string");
    }
    if (tjl::is_relative(scheduler.jobdir)) {
      scheduler.jobdir = tjl::join_paths(config.basedir, scheduler.jobdir);
    }
    if (!read_number(json, "poll_interval", scheduler.poll_interval)) {
      return tjl::some(where + ".poll_interval must be a positive number");
    }
  }

  for (const auto& other : config.schedulers) {
    if (other.name == scheduler.name) {
      return tjl::some("duplicate scheduler '" + scheduler.name + "'");
    }
  }
  config.schedulers.emplace_back(std::move(scheduler));
  return {};
}

ConfigResult parse_master_config(const JAST& json, const std::string& origin) {
  MasterConfig config;
  if (json.kind != JSON_OBJECT) return config_error(origin, "must be a JSON object");

  warn_unknown_keys(json,
                    {"basedir", "database", "status_interval", "engine_interval", "max_parallel",
                     "builders", "schedulers"},
                    origin, config);

  if (!read_string(json, "basedir", config.basedir) || config.basedir.empty()) {
    return config_error(origin, "basedir must be a non-empty string");
  }
  if (!read_string(json, "database", config.database)) {
    return config_error(origin, "database must be a string");
  }
  if (config.database.empty()) {
    config.database = tjl::join_paths(config.basedir, "state.sqlite");
  } else if (tjl::is_relative(config.database)) {
    config.database = tjl::join_paths(config.basedir, config.database);
  }
  if (!read_number(json, "status_interval", config.status_interval)) {
    return config_error(origin, "status_interval must be a positive number");
  }
  if (!read_number(json, "engine_interval", config.engine_interval)) {
    return config_error(origin, "engine_interval must be a positive number");
  }
  auto max_parallel = json.get_opt("max_parallel");
  if (max_parallel) {
    auto value = (*max_parallel)->expect_integer();
    if (!value || *value < 1) return config_error(origin, "max_parallel must be at least 1");
    config.max_parallel = static_cast<size_t>(*value);
  }

  const JAST& builders = json.get("builders");
  if (builders.kind != JSON_ARRAY || builders.children.empty()) {
    return config_error(origin, "builders must be a non-empty array");
  }
  for (size_t i = 0; i < builders.children.size(); ++i) {
    auto err = parse_builder(builders.children[i].second, i, config);
    if (err) return config_error(origin, *err);
  }

  const JAST& schedulers = json.get("schedulers");
  if (schedulers.kind != JSON_ARRAY) return config_error(origin, "schedulers must be an array");
  for (size_t i = 0; i < schedulers.children.size(); ++i) {
    auto err = parse_scheduler(schedulers.children[i].second, i, config);
    if (err) return config_error(origin, *err);
  }

  return tjl::result_value<std::string>(std::move(config));
}

ConfigResult load_master_config(const std::string& path) {
  auto json = read_json_file(path);
  if (!json) return tjl::make_error<MasterConfig, std::string>(json.error().second);
  return parse_master_config(*json, path);
}

}  // namespace tryjob
