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
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tjl/result.h"
#include "tryjob/event_loop.h"
#include "tryjob/job.h"

namespace tryjob {

enum class ConnectMethod { pb, ssh };

const char* method_name(ConnectMethod method);
tjl::optional<ConnectMethod> parse_connect_method(const std::string& name);

// Everything one invocation of the try client needs to know.
struct DeliveryConfig {
  ConnectMethod connect = ConnectMethod::pb;

  // pb
  std::string master;
  std::string username;
  std::string passwd;

  // ssh
  std::string host;
  std::string jobdir;
  std::string ssh_command = "ssh";
  std::string tryserver = "tryjob-server";

  bool wait = false;
  bool list_builders = false;
  bool dryrun = false;

  std::vector<std::string> builders;
  tjl::optional<std::string> comment;
  std::string who;
  std::map<std::string, std::string> properties;

  double wait_interval = 1;
  double connect_timeout = 30;
};

class SourceStampProvider {
 public:
  virtual ~SourceStampProvider() {}
  virtual tjl::result<SourceStamp, std::string> get() = 0;
};

class FixedSourceStamp : public SourceStampProvider {
 private:
  SourceStamp stamp;

 public:
  explicit FixedSourceStamp(SourceStamp stamp) : stamp(std::move(stamp)) {}
  tjl::result<SourceStamp, std::string> get() override {
    return tjl::result_value<std::string>(stamp);
  }
};

// Builds the source stamp from command line values. The diff is read
// from `diff_path`, or stdin for "-". No path means no patch.
class DiffSourceStamp : public SourceStampProvider {
 private:
  SourceStamp base;
  std::string diff_path;
  int64_t patch_level;

 public:
  DiffSourceStamp(SourceStamp base, std::string diff_path, int64_t patch_level)
      : base(std::move(base)), diff_path(std::move(diff_path)), patch_level(patch_level) {}

  tjl::result<SourceStamp, std::string> get() override;
};

// Receives the client's contract output, one line at a time.
class Output {
 public:
  virtual ~Output() {}
  virtual void line(const std::string& text) = 0;
};

class StreamOutput : public Output {
 private:
  std::ostream& os;

 public:
  explicit StreamOutput(std::ostream& os = std::cout) : os(os) {}
  void line(const std::string& text) override { os << text << std::endl; }
};

// "<seconds since epoch>-<random hex>"
std::string make_jobid();

class TryClient {
 private:
  const DeliveryConfig& config;
  EventLoop& loop;
  SourceStampProvider& source;
  Output& output;

  int fail(const std::string& why);
  int list_builders();
  int deliver_pb(const Job& job);
  int deliver_ssh(const Job& job);
  void print_dryrun(const Job& job);

 public:
  TryClient(const DeliveryConfig& config, EventLoop& loop, SourceStampProvider& source,
            Output& output)
      : config(config), loop(loop), source(source), output(output) {}

  // Returns the process exit code.
  int run();
};

}  // namespace tryjob
