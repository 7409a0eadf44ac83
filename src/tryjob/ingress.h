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

#include "tjl/result.h"
#include "tryjob/buildset_store.h"
#include "tryjob/job.h"

namespace tryjob {

struct UnknownBuilderError {
  std::vector<std::string> unknown;
};

std::string describe(const UnknownBuilderError& err);

struct IngressAck {
  int64_t buildset;
  std::vector<std::string> builders;
};

// Turns an accepted Job into exactly one buildset. Shared by both try
// schedulers so that they validate builders the same way.
class JobIngress {
 private:
  BuildsetStore& store;
  std::string scheduler_name;
  std::vector<std::string> whitelist;

 public:
  JobIngress(BuildsetStore& store, std::string scheduler_name, std::vector<std::string> whitelist)
      : store(store), scheduler_name(std::move(scheduler_name)), whitelist(std::move(whitelist)) {}

  const std::vector<std::string>& builders() const { return whitelist; }
  const std::string& name() const { return scheduler_name; }

  // An empty selection means every whitelisted builder. Any name not
  // on the whitelist, or an empty whitelist, rejects the whole
  // selection.
  tjl::result<std::vector<std::string>, UnknownBuilderError> resolve(
      const std::vector<std::string>& requested) const;

  // Validates and records the job. Nothing is written on rejection.
  tjl::result<IngressAck, UnknownBuilderError> submit(const Job& job);
};

}  // namespace tryjob
