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
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tryjob/job.h"

namespace tryjob {

enum class BuildResult { pending, running, success, failure, exception };

const char* result_name(BuildResult result);
tjl::optional<BuildResult> parse_build_result(const std::string& name);

inline bool is_terminal(BuildResult result) {
  return result == BuildResult::success || result == BuildResult::failure ||
         result == BuildResult::exception;
}

// Why a buildset exists and who asked for it.
struct BuildsetInfo {
  std::string reason;
  tjl::optional<std::string> comment;
  std::string jobid;
  std::string who;
  std::string scheduler;
  std::map<std::string, std::string> properties;
};

struct Buildset {
  int64_t id = 0;
  SourceStamp source;
  BuildsetInfo info;
  int64_t submitted_at = 0;
  bool complete = false;
};

// One builder's share of a buildset. Numbers count up per builder.
struct BuildRequest {
  int64_t id = 0;
  int64_t buildset = 0;
  std::string builder;
  int64_t number = 0;
  BuildResult result = BuildResult::pending;
  std::string detail;
};

// Persistence for buildsets and their build requests. Schedulers only
// create buildsets and read status back; the build engine claims and
// finishes requests.
class BuildsetStore {
 public:
  virtual ~BuildsetStore() {}

  // Creates the buildset and one pending request per builder in a
  // single transaction. Returns the buildset id.
  virtual int64_t create_buildset(const SourceStamp& source,
                                  const std::vector<std::string>& builders,
                                  const BuildsetInfo& info) = 0;

  virtual std::vector<Buildset> get_buildsets() = 0;
  virtual tjl::optional<Buildset> get_buildset(int64_t id) = 0;
  virtual std::vector<BuildRequest> get_build_requests(int64_t buildset) = 0;

  // Moves up to `limit` pending requests, oldest first, to running.
  virtual std::vector<BuildRequest> claim_pending(size_t limit) = 0;

  // Records a terminal result. The owning buildset is marked complete
  // once none of its requests is left unfinished.
  virtual void finish_build_request(int64_t id, BuildResult result, const std::string& detail) = 0;
};

}  // namespace tryjob
