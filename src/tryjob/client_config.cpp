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

#include "client_config.h"

#include <cstdlib>
#include <sstream>

#include "tjl/filepath.h"
#include "tryjob/json_file.h"

namespace tryjob {

#define POLICY_STATIC_DEFINES(Policy)                                    \
  constexpr const char* Policy::key;                                     \
  constexpr bool Policy::allowed_in_userconfig;                          \
  constexpr typename Policy::type Policy::*Policy::value;                \
  constexpr Override<typename Policy::input_type> Policy::override_value; \
  constexpr const char* Policy::env_var;

/********************************************************************
 * Definition boilerplate
 *********************************************************************/

POLICY_STATIC_DEFINES(UserConfigPolicy)
POLICY_STATIC_DEFINES(ConnectPolicy)
POLICY_STATIC_DEFINES(MasterPolicy)
POLICY_STATIC_DEFINES(UsernamePolicy)
POLICY_STATIC_DEFINES(PasswdPolicy)
POLICY_STATIC_DEFINES(HostPolicy)
POLICY_STATIC_DEFINES(JobdirPolicy)
POLICY_STATIC_DEFINES(SshCommandPolicy)
POLICY_STATIC_DEFINES(TryserverPolicy)
POLICY_STATIC_DEFINES(WhoPolicy)
POLICY_STATIC_DEFINES(BuildersPolicy)
POLICY_STATIC_DEFINES(WaitIntervalPolicy)
POLICY_STATIC_DEFINES(ConnectTimeoutPolicy)

/********************************************************************
 * Non-Trivial Defaults
 *********************************************************************/

// $XDG_CONFIG_HOME/tryjob.json, else ~/.config/tryjob.json
static std::string default_user_config() {
  const char* xdg_config_home = getenv("XDG_CONFIG_HOME");
  if (xdg_config_home != nullptr && *xdg_config_home != '\0') {
    return tjl::join_paths(std::string(xdg_config_home), "tryjob.json");
  }

  const char* home_dir = getenv("HOME");
  if (home_dir == nullptr) return "";
  return tjl::join_paths(std::string(home_dir), ".config", "tryjob.json");
}

UserConfigPolicy::UserConfigPolicy() { user_config = default_user_config(); }

WhoPolicy::WhoPolicy() {
  const char* user = getenv("USER");
  if (user != nullptr) who = user;
}

/********************************************************************
 * Setter implementations
 ********************************************************************/

void set_string(std::string& out, const JAST& json) {
  auto str = json.expect_string();
  if (str) out = *str;
}

void set_seconds(double& out, const JAST& json) {
  auto num = json.expect_number();
  if (num && *num > 0) out = *num;
}

void set_seconds_env(double& out, const char* env_var) {
  char* end = nullptr;
  double x = strtod(env_var, &end);
  if (end != env_var && *end == '\0' && x > 0) out = x;
}

void set_string_list(std::vector<std::string>& out, const JAST& json) {
  if (json.kind == JSON_STR) {
    out = split_list(json.value);
    return;
  }
  if (json.kind != JSON_ARRAY) return;

  std::vector<std::string> list;
  for (const auto& child : json.children) {
    auto str = child.second.expect_string();
    if (!str) return;
    list.emplace_back(std::move(*str));
  }
  out = std::move(list);
}

std::vector<std::string> split_list(const std::string& list) {
  std::vector<std::string> out;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.emplace_back(std::move(item));
  }
  return out;
}

/********************************************************************
 * Core Implementation
 ********************************************************************/

tjl::result<std::unique_ptr<ClientConfig>, std::string> ClientConfig::load(
    const ClientConfigOverrides& overrides, std::ostream& warnings) {
  // The constructor is private, so std::make_unique is out.
  std::unique_ptr<ClientConfig> config(new ClientConfig());

  // Where the user config lives has to be known before reading it.
  config->settle_early<UserConfigPolicy>(overrides);

  if (!config->user_config.empty()) {
    auto user_config_res = read_json_file(config->user_config);
    if (!user_config_res) {
      // A missing user config is fine, a broken one is not.
      if (user_config_res.error().first != ReadJsonFileError::BadFile) {
        return tjl::make_error<std::unique_ptr<ClientConfig>, std::string>(
            user_config_res.error().second);
      }
    } else {
      JAST user_config_json = std::move(*user_config_res);
      for (const auto& key :
           find_disallowed_keys(user_config_json, ClientConfigImplFull::userconfig_allowed_keys())) {
        warnings << config->user_config << ": Key '" << key << "' may not be set in user config."
                 << std::endl;
      }
      config->set_all(user_config_json);
    }
  }

  config->set_all_env_var();
  config->override_all(overrides);

  return tjl::result_value<std::string>(std::move(config));
}

tjl::result<DeliveryConfig, std::string> ClientConfig::delivery() const {
  auto method = parse_connect_method(connect);
  if (!method) {
    return tjl::make_error<DeliveryConfig, std::string>("connect method must be 'pb' or 'ssh', not '" +
                                                        connect + "'");
  }

  DeliveryConfig out;
  out.connect = *method;
  out.master = master;
  out.username = username;
  out.passwd = passwd;
  out.host = host;
  out.jobdir = jobdir;
  out.ssh_command = ssh_command;
  out.tryserver = tryserver;
  out.who = who;
  out.builders = builders;
  out.wait_interval = wait_interval;
  out.connect_timeout = connect_timeout;
  return tjl::result_value<std::string>(std::move(out));
}

std::ostream& operator<<(std::ostream& os, const ClientConfig& config) {
  config.emit(os);
  return os;
}

}  // namespace tryjob
