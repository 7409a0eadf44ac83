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
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tjl/result.h"

namespace tryjob {

struct Patch {
  int64_t level = 0;
  std::string body;

  Patch() = default;
  Patch(int64_t level, std::string body) : level(level), body(std::move(body)) {}
};

// Identifies the source a build should run against. An empty revision
// means the tip of the branch.
struct SourceStamp {
  tjl::optional<std::string> branch;
  std::string revision;
  tjl::optional<Patch> patch;
  std::string repository;
  std::string project;
};

// The unit a try client hands to a scheduler. Immutable once created.
struct Job {
  std::string jobid;
  SourceStamp source;
  std::vector<std::string> builder_names;
  tjl::optional<std::string> comment;
  std::string who;
  std::map<std::string, std::string> properties;
};

bool operator==(const Patch& a, const Patch& b);
bool operator==(const SourceStamp& a, const SourceStamp& b);
bool operator==(const Job& a, const Job& b);
inline bool operator!=(const Job& a, const Job& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, const Patch& patch);

struct MalformedJobError {
  std::string why;
};

// The only encoding version written and accepted.
static constexpr const char* JOB_VERSION = "5";

// `<decimal length>:<bytes>,`
std::string netstring(const std::string& payload);

// Reads one netstring starting at `pos` and advances `pos` past it.
tjl::result<std::string, MalformedJobError> read_netstring(const std::string& data, size_t& pos);

// The version netstring followed by the netstring of a JSON object.
// Deterministic: equal jobs always encode to the same bytes.
std::string encode(const Job& job);

tjl::result<Job, MalformedJobError> decode(const std::string& data);

}  // namespace tryjob
