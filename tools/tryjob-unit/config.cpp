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

#include <stdlib.h>

#include <sstream>

#include "fixture.h"
#include "tryjob/client_config.h"
#include "tryjob/json_file.h"
#include "tryjob/master_config.h"
#include "unit.h"

using tryjob::ClientConfigProvenance;

static JAST parse_or_die(const std::string& text) {
  JAST out;
  std::stringstream errs;
  if (!JAST::parse(text, errs, out)) tjl::log::fatal("bad test json: %s", errs.str().c_str());
  return out;
}

static std::string master_error(const std::string& text) {
  auto config = tryjob::parse_master_config(parse_or_die(text), "cfg");
  if (config) return "";
  return config.error();
}

static const char* full_master = R"({
  basedir: "/srv/try",
  max_parallel: 2,
  colour: "blue",
  builders: [
    {name: "a", command: "make check", workdir: "src"},
    {name: "b"},
  ],
  schedulers: [
    {type: "try_userpass", name: "pb", builders: ["a"], port: 8031,
     users: [{username: "alice", password: "s3cret"}]},
    {type: "try_jobdir", name: "ssh", builders: ["a", "b"], jobdir: "jobs", poll_interval: 5},
  ],
})";

TEST(master_config_full) {
  auto config = tryjob::parse_master_config(parse_or_die(full_master), "cfg");
  ASSERT_TRUE((bool)config);

  EXPECT_EQUAL("/srv/try", config->basedir);
  EXPECT_EQUAL("/srv/try/state.sqlite", config->database);
  EXPECT_EQUAL(size_t(2), config->max_parallel);
  EXPECT_EQUAL(std::vector<std::string>({"cfg: unknown key 'colour' ignored"}), config->warnings);

  ASSERT_EQUAL(size_t(2), config->builders.size());
  EXPECT_EQUAL("make check", config->builders[0].command);
  EXPECT_EQUAL("/srv/try/src", config->builders[0].workdir);
  EXPECT_EQUAL("", config->builders[1].command);
  EXPECT_EQUAL("", config->builders[1].workdir);

  ASSERT_EQUAL(size_t(2), config->schedulers.size());
  const tryjob::SchedulerConfig& pb = config->schedulers[0];
  EXPECT_EQUAL(tryjob::TRY_USERPASS, pb.type);
  EXPECT_EQUAL(8031, pb.port);
  EXPECT_EQUAL(std::vector<std::string>({"a"}), pb.builders);
  ASSERT_EQUAL(size_t(1), pb.users.size());
  EXPECT_EQUAL("s3cret", pb.users.at("alice"));

  const tryjob::SchedulerConfig& ssh = config->schedulers[1];
  EXPECT_EQUAL(tryjob::TRY_JOBDIR, ssh.type);
  EXPECT_EQUAL("/srv/try/jobs", ssh.jobdir);
  EXPECT_TRUE(ssh.poll_interval == 5);
}

TEST(master_config_defaults) {
  auto config = tryjob::parse_master_config(
      parse_or_die(R"({"builders": [{"name": "a"}], "schedulers": []})"), "cfg");
  ASSERT_TRUE((bool)config);
  EXPECT_EQUAL(".", config->basedir);
  EXPECT_EQUAL("./state.sqlite", config->database);
  EXPECT_TRUE(config->status_interval == 1);
  EXPECT_EQUAL(size_t(4), config->max_parallel);
  EXPECT_TRUE(config->warnings.empty());
}

TEST(master_config_rejects) {
  EXPECT_EQUAL("cfg: must be a JSON object", master_error("[]"));
  EXPECT_EQUAL("cfg: builders must be a non-empty array",
               master_error(R"({"builders": [], "schedulers": []})"));
  EXPECT_EQUAL("cfg: duplicate builder 'a'",
               master_error(R"({"builders": [{"name": "a"}, {"name": "a"}], "schedulers": []})"));
  EXPECT_EQUAL("cfg: schedulers must be an array", master_error(R"({"builders": [{"name": "a"}]})"));
  EXPECT_EQUAL("cfg: max_parallel must be at least 1",
               master_error(R"({"max_parallel": 0, "builders": [{"name": "a"}], "schedulers": []})"));
  EXPECT_EQUAL(
      "cfg: schedulers[0] names unknown builder 'z'",
      master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "try_jobdir", "name": "s", "builders": ["z"], "jobdir": "/j"}]})"));
  EXPECT_EQUAL("cfg: schedulers[0].type must be 'try_userpass' or 'try_jobdir'",
               master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "periodic", "name": "s"}]})"));
  EXPECT_EQUAL("cfg: schedulers[0].port must be an integer between 0 and 65535",
               master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "try_userpass", "name": "s", "port": 70000,
         "users": [{"username": "u", "password": "p"}]}]})"));
  EXPECT_EQUAL("cfg: schedulers[0] needs at least one user",
               master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "try_userpass", "name": "s", "port": 0}]})"));
  EXPECT_EQUAL("cfg: schedulers[0].jobdir must be a non-empty string",
               master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "try_jobdir", "name": "s"}]})"));
  EXPECT_EQUAL("cfg: duplicate scheduler 's'",
               master_error(R"({"builders": [{"name": "a"}], "schedulers": [
        {"type": "try_jobdir", "name": "s", "jobdir": "/a"},
        {"type": "try_jobdir", "name": "s", "jobdir": "/b"}]})"));
}

TEST(master_config_from_file) {
  TempDir dir;
  std::string path = dir.sub("master.json");
  ASSERT_TRUE(write_file(path, std::string("// try master\n") + full_master));
  auto config = tryjob::load_master_config(path);
  ASSERT_TRUE((bool)config);
  EXPECT_EQUAL(size_t(2), config->schedulers.size());

  auto missing = tryjob::load_master_config(dir.sub("missing.json"));
  ASSERT_FALSE((bool)missing);
  EXPECT_EQUAL("Failed to read '" + dir.sub("missing.json") + "'", missing.error());

  ASSERT_TRUE(write_file(path, "{ builders: "));
  EXPECT_FALSE((bool)tryjob::load_master_config(path));
}

TEST(json_file_disallowed_keys) {
  JAST json = parse_or_die(R"({"a": 1, "b": 2, "c": 3})");
  EXPECT_EQUAL(std::vector<std::string>({"b", "c"}), tryjob::find_disallowed_keys(json, {"a"}));
  EXPECT_TRUE(tryjob::find_disallowed_keys(parse_or_die("[1]"), {}).empty());
}

namespace {

// Clears every TRYJOB_* variable the client reads for the duration of
// a test.
struct CleanEnv {
  static constexpr const char* names[] = {
      "TRYJOB_USER_CONFIG", "TRYJOB_CONNECT", "TRYJOB_MASTER",  "TRYJOB_USERNAME",
      "TRYJOB_PASSWD",      "TRYJOB_HOST",    "TRYJOB_JOBDIR",  "TRYJOB_SSH",
      "TRYJOB_TRYSERVER",   "TRYJOB_WHO",     "TRYJOB_BUILDERS", "TRYJOB_WAIT_INTERVAL",
      "TRYJOB_CONNECT_TIMEOUT"};

  CleanEnv() {
    for (const char* name : names) unsetenv(name);
  }
  ~CleanEnv() {
    for (const char* name : names) unsetenv(name);
  }
};

constexpr const char* CleanEnv::names[];

}  // namespace

TEST(client_config_defaults) {
  CleanEnv env;
  TempDir dir;
  tryjob::ClientConfigOverrides overrides;
  overrides.user_config = tjl::some(dir.sub("absent.json"));

  std::stringstream warnings;
  auto config = tryjob::ClientConfig::load(overrides, warnings);
  ASSERT_TRUE((bool)config);
  EXPECT_EQUAL("", warnings.str());
  EXPECT_EQUAL("pb", (*config)->connect);
  EXPECT_EQUAL("ssh", (*config)->ssh_command);
  EXPECT_EQUAL("tryjob-server", (*config)->tryserver);
  EXPECT_TRUE((*config)->wait_interval == 1);
  EXPECT_TRUE((*config)->connect_timeout == 30);
  EXPECT_TRUE((*config)->builders.empty());
  EXPECT_TRUE((*config)->provenance["user_config"] == ClientConfigProvenance::CommandLine);
  EXPECT_EQUAL(size_t(0), (*config)->provenance.count("master"));
}

TEST(client_config_layers) {
  CleanEnv env;
  TempDir dir;
  std::string path = dir.sub("tryjob.json");
  ASSERT_TRUE(write_file(path, R"({
    // comments are fine
    master: "localhost:1111",
    username: "alice",
    passwd: "hunter2",
    builders: "a,b",
    wait_interval: 2,
    user_config: "/elsewhere.json",
    colour: "blue",
  })"));

  setenv("TRYJOB_USER_CONFIG", path.c_str(), 1);
  setenv("TRYJOB_MASTER", "localhost:2222", 1);
  setenv("TRYJOB_USERNAME", "bob", 1);
  setenv("TRYJOB_CONNECT_TIMEOUT", "nonsense", 1);

  tryjob::ClientConfigOverrides overrides;
  overrides.username = tjl::some(std::string("carol"));
  overrides.builders = tjl::some(std::vector<std::string>({"c"}));

  std::stringstream warnings;
  auto config = tryjob::ClientConfig::load(overrides, warnings);
  ASSERT_TRUE((bool)config);
  tryjob::ClientConfig& c = **config;

  EXPECT_EQUAL(path, c.user_config);
  EXPECT_EQUAL("localhost:2222", c.master);
  EXPECT_EQUAL("carol", c.username);
  EXPECT_EQUAL("hunter2", c.passwd);
  EXPECT_EQUAL(std::vector<std::string>({"c"}), c.builders);
  EXPECT_TRUE(c.wait_interval == 2);
  // Unparsable numbers keep the previous value.
  EXPECT_TRUE(c.connect_timeout == 30);

  EXPECT_TRUE(c.provenance["user_config"] == ClientConfigProvenance::EnvVar);
  EXPECT_TRUE(c.provenance["master"] == ClientConfigProvenance::EnvVar);
  EXPECT_TRUE(c.provenance["username"] == ClientConfigProvenance::CommandLine);
  EXPECT_TRUE(c.provenance["passwd"] == ClientConfigProvenance::UserConfig);
  EXPECT_TRUE(c.provenance["builders"] == ClientConfigProvenance::CommandLine);

  EXPECT_EQUAL(path + ": Key 'user_config' may not be set in user config.\n" + path +
                   ": Key 'colour' may not be set in user config.\n",
               warnings.str());

  std::stringstream shown;
  shown << c;
  EXPECT_TRUE(shown.str().find("Tryjob config:\n") == 0) << shown.str();
  EXPECT_TRUE(shown.str().find("  master = 'localhost:2222' (EnvVar)\n") != std::string::npos)
      << shown.str();
  EXPECT_TRUE(shown.str().find("  passwd = '********' (UserConfig)\n") != std::string::npos)
      << shown.str();
  EXPECT_EQUAL(std::string::npos, shown.str().find("hunter2"));
}

TEST(client_config_env_builders_and_delivery) {
  CleanEnv env;
  TempDir dir;
  setenv("TRYJOB_BUILDERS", "x,,y", 1);
  setenv("TRYJOB_CONNECT", "ssh", 1);
  setenv("TRYJOB_WAIT_INTERVAL", "0.5", 1);

  tryjob::ClientConfigOverrides overrides;
  overrides.user_config = tjl::some(dir.sub("absent.json"));
  overrides.jobdir = tjl::some(std::string("/srv/jobs"));
  overrides.who = tjl::some(std::string("dana"));

  std::stringstream warnings;
  auto config = tryjob::ClientConfig::load(overrides, warnings);
  ASSERT_TRUE((bool)config);

  auto delivery = (*config)->delivery();
  ASSERT_TRUE((bool)delivery);
  EXPECT_TRUE(delivery->connect == tryjob::ConnectMethod::ssh);
  EXPECT_EQUAL(std::vector<std::string>({"x", "y"}), delivery->builders);
  EXPECT_EQUAL("/srv/jobs", delivery->jobdir);
  EXPECT_EQUAL("dana", delivery->who);
  EXPECT_TRUE(delivery->wait_interval == 0.5);
  EXPECT_FALSE(delivery->wait);
}

TEST(client_config_bad_connect_method) {
  CleanEnv env;
  TempDir dir;
  tryjob::ClientConfigOverrides overrides;
  overrides.user_config = tjl::some(dir.sub("absent.json"));
  overrides.connect = tjl::some(std::string("smtp"));

  std::stringstream warnings;
  auto config = tryjob::ClientConfig::load(overrides, warnings);
  ASSERT_TRUE((bool)config);
  auto delivery = (*config)->delivery();
  ASSERT_FALSE((bool)delivery);
  EXPECT_EQUAL("connect method must be 'pb' or 'ssh', not 'smtp'", delivery.error());
}

TEST(client_config_broken_user_config) {
  CleanEnv env;
  TempDir dir;
  std::string path = dir.sub("tryjob.json");
  ASSERT_TRUE(write_file(path, "{ master: "));

  tryjob::ClientConfigOverrides overrides;
  overrides.user_config = tjl::some(path);
  std::stringstream warnings;
  auto config = tryjob::ClientConfig::load(overrides, warnings);
  ASSERT_FALSE((bool)config);
  EXPECT_TRUE(config.error().find(path) == 0) << config.error();
}
