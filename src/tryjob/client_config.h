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

#include <cstdlib>
#include <map>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "json/json5.h"
#include "tjl/optional.h"
#include "tjl/result.h"
#include "tryjob/try_client.h"

namespace tryjob {

// Values given on the command line. They win over everything else.
struct ClientConfigOverrides {
  tjl::optional<std::string> user_config;
  tjl::optional<std::string> connect;
  tjl::optional<std::string> master;
  tjl::optional<std::string> username;
  tjl::optional<std::string> passwd;
  tjl::optional<std::string> host;
  tjl::optional<std::string> jobdir;
  tjl::optional<std::string> ssh_command;
  tjl::optional<std::string> tryserver;
  tjl::optional<std::string> who;
  tjl::optional<std::vector<std::string>> builders;
  tjl::optional<double> wait_interval;
  tjl::optional<double> connect_timeout;
};

template <class T>
using Override = tjl::optional<T> ClientConfigOverrides::*;

// Shared setters for the policies below.
void set_string(std::string& out, const JAST& json);
void set_seconds(double& out, const JAST& json);
void set_seconds_env(double& out, const char* env_var);
void set_string_list(std::vector<std::string>& out, const JAST& json);
// "a,b,c"
std::vector<std::string> split_list(const std::string& list);

/********************************************************************
 * Policies
 ********************************************************************/

struct UserConfigPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "user_config";
  static constexpr bool allowed_in_userconfig = false;
  type user_config;
  static constexpr type UserConfigPolicy::*value = &UserConfigPolicy::user_config;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::user_config;
  static constexpr const char* env_var = "TRYJOB_USER_CONFIG";

  UserConfigPolicy();
  static void set(UserConfigPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(UserConfigPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const UserConfigPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(UserConfigPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct ConnectPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "connect";
  static constexpr bool allowed_in_userconfig = true;
  type connect = "pb";
  static constexpr type ConnectPolicy::*value = &ConnectPolicy::connect;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::connect;
  static constexpr const char* env_var = "TRYJOB_CONNECT";

  static void set(ConnectPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(ConnectPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const ConnectPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(ConnectPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct MasterPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "master";
  static constexpr bool allowed_in_userconfig = true;
  type master;
  static constexpr type MasterPolicy::*value = &MasterPolicy::master;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::master;
  static constexpr const char* env_var = "TRYJOB_MASTER";

  static void set(MasterPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(MasterPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const MasterPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(MasterPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct UsernamePolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "username";
  static constexpr bool allowed_in_userconfig = true;
  type username;
  static constexpr type UsernamePolicy::*value = &UsernamePolicy::username;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::username;
  static constexpr const char* env_var = "TRYJOB_USERNAME";

  static void set(UsernamePolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(UsernamePolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const UsernamePolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(UsernamePolicy& p, const char* env_var) { p.*value = env_var; }
};

struct PasswdPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "passwd";
  static constexpr bool allowed_in_userconfig = true;
  type passwd;
  static constexpr type PasswdPolicy::*value = &PasswdPolicy::passwd;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::passwd;
  static constexpr const char* env_var = "TRYJOB_PASSWD";

  static void set(PasswdPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(PasswdPolicy& p, const input_type& v) { p.*value = v; }
  // Never print the secret itself.
  static void emit(const PasswdPolicy& p, std::ostream& os) {
    if (!p.passwd.empty()) os << "********";
  }
  static void set_env_var(PasswdPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct HostPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "host";
  static constexpr bool allowed_in_userconfig = true;
  type host;
  static constexpr type HostPolicy::*value = &HostPolicy::host;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::host;
  static constexpr const char* env_var = "TRYJOB_HOST";

  static void set(HostPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(HostPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const HostPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(HostPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct JobdirPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "jobdir";
  static constexpr bool allowed_in_userconfig = true;
  type jobdir;
  static constexpr type JobdirPolicy::*value = &JobdirPolicy::jobdir;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::jobdir;
  static constexpr const char* env_var = "TRYJOB_JOBDIR";

  static void set(JobdirPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(JobdirPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const JobdirPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(JobdirPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct SshCommandPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "ssh_command";
  static constexpr bool allowed_in_userconfig = true;
  type ssh_command = "ssh";
  static constexpr type SshCommandPolicy::*value = &SshCommandPolicy::ssh_command;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::ssh_command;
  static constexpr const char* env_var = "TRYJOB_SSH";

  static void set(SshCommandPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(SshCommandPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const SshCommandPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(SshCommandPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct TryserverPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "tryserver";
  static constexpr bool allowed_in_userconfig = true;
  type tryserver = "tryjob-server";
  static constexpr type TryserverPolicy::*value = &TryserverPolicy::tryserver;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::tryserver;
  static constexpr const char* env_var = "TRYJOB_TRYSERVER";

  static void set(TryserverPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(TryserverPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const TryserverPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(TryserverPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct WhoPolicy {
  using type = std::string;
  using input_type = type;
  static constexpr const char* key = "who";
  static constexpr bool allowed_in_userconfig = true;
  type who;
  static constexpr type WhoPolicy::*value = &WhoPolicy::who;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::who;
  static constexpr const char* env_var = "TRYJOB_WHO";

  // Defaults to $USER
  WhoPolicy();
  static void set(WhoPolicy& p, const JAST& json) { set_string(p.*value, json); }
  static void set_input(WhoPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const WhoPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(WhoPolicy& p, const char* env_var) { p.*value = env_var; }
};

struct BuildersPolicy {
  using type = std::vector<std::string>;
  using input_type = type;
  static constexpr const char* key = "builders";
  static constexpr bool allowed_in_userconfig = true;
  type builders;
  static constexpr type BuildersPolicy::*value = &BuildersPolicy::builders;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::builders;
  static constexpr const char* env_var = "TRYJOB_BUILDERS";

  static void set(BuildersPolicy& p, const JAST& json) { set_string_list(p.*value, json); }
  static void set_input(BuildersPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const BuildersPolicy& p, std::ostream& os) {
    for (size_t i = 0; i < p.builders.size(); ++i) {
      if (i != 0) os << ",";
      os << p.builders[i];
    }
  }
  static void set_env_var(BuildersPolicy& p, const char* env_var) {
    p.*value = split_list(env_var);
  }
};

struct WaitIntervalPolicy {
  using type = double;
  using input_type = type;
  static constexpr const char* key = "wait_interval";
  static constexpr bool allowed_in_userconfig = true;
  type wait_interval = 1;
  static constexpr type WaitIntervalPolicy::*value = &WaitIntervalPolicy::wait_interval;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::wait_interval;
  static constexpr const char* env_var = "TRYJOB_WAIT_INTERVAL";

  static void set(WaitIntervalPolicy& p, const JAST& json) { set_seconds(p.*value, json); }
  static void set_input(WaitIntervalPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const WaitIntervalPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(WaitIntervalPolicy& p, const char* env_var) {
    set_seconds_env(p.*value, env_var);
  }
};

struct ConnectTimeoutPolicy {
  using type = double;
  using input_type = type;
  static constexpr const char* key = "connect_timeout";
  static constexpr bool allowed_in_userconfig = true;
  type connect_timeout = 30;
  static constexpr type ConnectTimeoutPolicy::*value = &ConnectTimeoutPolicy::connect_timeout;
  static constexpr Override<input_type> override_value = &ClientConfigOverrides::connect_timeout;
  static constexpr const char* env_var = "TRYJOB_CONNECT_TIMEOUT";

  static void set(ConnectTimeoutPolicy& p, const JAST& json) { set_seconds(p.*value, json); }
  static void set_input(ConnectTimeoutPolicy& p, const input_type& v) { p.*value = v; }
  static void emit(const ConnectTimeoutPolicy& p, std::ostream& os) { os << p.*value; }
  static void set_env_var(ConnectTimeoutPolicy& p, const char* env_var) {
    set_seconds_env(p.*value, env_var);
  }
};

/********************************************************************
 * Generic ClientConfig implementation
 *********************************************************************/

enum class ClientConfigProvenance { Default, UserConfig, EnvVar, CommandLine };

static inline const char* to_string(ClientConfigProvenance p) {
  switch (p) {
    case ClientConfigProvenance::Default:
      return "Default";
    case ClientConfigProvenance::UserConfig:
      return "UserConfig";
    case ClientConfigProvenance::EnvVar:
      return "EnvVar";
    case ClientConfigProvenance::CommandLine:
      return "Commandline";
  }
  return "Unknown";
}

template <class... Policies>
struct ClientConfigImpl : public Policies... {
  ClientConfigImpl(const ClientConfigImpl&) = delete;
  ClientConfigImpl(ClientConfigImpl&&) = delete;
  ClientConfigImpl() = default;

  std::map<std::string, ClientConfigProvenance> provenance;

 private:
  static void call_all() {}

  template <class F, class... Args>
  static void call_all(F f, Args... fs) {
    f();
    call_all(fs...);
  }

  template <class P>
  auto emit_each(std::ostream& os) const {
    return [&os, this]() {
      auto iter = provenance.find(P::key);
      auto p = ClientConfigProvenance::Default;
      if (iter != provenance.end()) {
        p = iter->second;
      }
      os << "  " << P::key << " = '";
      P::emit(*this, os);
      os << "' (" << to_string(p) << ")" << std::endl;
    };
  }

  template <class P>
  static auto add_userconfig_key(std::set<std::string>& out) {
    return [&out]() {
      if (P::allowed_in_userconfig) {
        out.emplace(P::key);
      }
    };
  }

  template <class P>
  auto set_policy(const JAST& json) {
    return [&json, this]() {
      if (!P::allowed_in_userconfig) return;
      auto opt_value = json.get_opt(P::key);
      if (opt_value) {
        provenance[P::key] = ClientConfigProvenance::UserConfig;
        P::set(*this, **opt_value);
      }
    };
  }

  template <class P>
  auto set_env_var() {
    return [this]() {
      if (P::env_var == nullptr) return;
      const char* env_var = getenv(P::env_var);
      if (env_var == nullptr) return;
      provenance[P::key] = ClientConfigProvenance::EnvVar;
      P::set_env_var(*this, env_var);
    };
  }

  template <class P>
  auto override_policy(const ClientConfigOverrides& overrides) {
    return [&overrides, this]() {
      if (P::override_value && overrides.*P::override_value) {
        provenance[P::key] = ClientConfigProvenance::CommandLine;
        P::set_input(*this, *(overrides.*P::override_value));
      }
    };
  }

 protected:
  static std::set<std::string> userconfig_allowed_keys() {
    std::set<std::string> out;
    call_all(add_userconfig_key<Policies>(out)...);
    return out;
  }

  void set_all(const JAST& json) { call_all(set_policy<Policies>(json)...); }
  void set_all_env_var() { call_all(set_env_var<Policies>()...); }
  void override_all(const ClientConfigOverrides& overrides) {
    call_all(override_policy<Policies>(overrides)...);
  }

  // Settles a single policy from the environment and the command line,
  // for values needed before the user config is read.
  template <class P>
  void settle_early(const ClientConfigOverrides& overrides) {
    set_env_var<P>()();
    override_policy<P>(overrides)();
  }

 public:
  void emit(std::ostream& os) const {
    os << "Tryjob config:" << std::endl;
    call_all(emit_each<Policies>(os)...);
  }
};

using ClientConfigImplFull =
    ClientConfigImpl<UserConfigPolicy, ConnectPolicy, MasterPolicy, UsernamePolicy, PasswdPolicy,
                     HostPolicy, JobdirPolicy, SshCommandPolicy, TryserverPolicy, WhoPolicy,
                     BuildersPolicy, WaitIntervalPolicy, ConnectTimeoutPolicy>;

struct ClientConfig final : public ClientConfigImplFull {
  // Defaults, then the user config, then TRYJOB_* variables, then
  // `overrides`. A missing user config is fine, an unreadable one is
  // an error. Unknown keys are reported on `warnings`.
  static tjl::result<std::unique_ptr<ClientConfig>, std::string> load(
      const ClientConfigOverrides& overrides, std::ostream& warnings);

  // Fills the transport part of a DeliveryConfig. Fails on a connect
  // method other than pb or ssh.
  tjl::result<DeliveryConfig, std::string> delivery() const;

  ClientConfig(const ClientConfig&) = delete;
  ClientConfig(ClientConfig&&) = delete;

 private:
  ClientConfig() = default;
};

std::ostream& operator<<(std::ostream& os, const ClientConfig& config);

}  // namespace tryjob
