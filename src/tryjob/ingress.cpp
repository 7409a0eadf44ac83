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

#include "ingress.h"

#include <algorithm>

#include "tjl/tracing.h"

namespace tryjob {

std::string describe(const UnknownBuilderError& err) {
  if (err.unknown.empty()) return "no builders are configured for this scheduler";
  std::string out = "unknown builder";
  if (err.unknown.size() > 1) out += "s";
  for (size_t i = 0; i < err.unknown.size(); ++i) {
    out += (i == 0) ? " " : ", ";
    out += err.unknown[i];
  }
  return out;
}

tjl::result<std::vector<std::string>, UnknownBuilderError> JobIngress::resolve(
    const std::vector<std::string>& requested) const {
  using out_t = std::vector<std::string>;
  if (whitelist.empty()) {
    return tjl::make_error<out_t, UnknownBuilderError>(UnknownBuilderError{requested});
  }
  if (requested.empty()) {
    return tjl::make_result<out_t, UnknownBuilderError>(whitelist);
  }

  UnknownBuilderError err;
  for (const auto& name : requested) {
    if (std::find(whitelist.begin(), whitelist.end(), name) == whitelist.end()) {
      err.unknown.push_back(name);
    }
  }
  if (!err.unknown.empty()) {
    return tjl::make_error<out_t, UnknownBuilderError>(std::move(err));
  }
  return tjl::make_result<out_t, UnknownBuilderError>(requested);
}

tjl::result<IngressAck, UnknownBuilderError> JobIngress::submit(const Job& job) {
  auto builders = resolve(job.builder_names);
  if (!builders) {
    tjl::log::warning("%s: rejected job %s: %s", scheduler_name.c_str(), job.jobid.c_str(),
                      describe(builders.error()).c_str())();
    return tjl::make_error<IngressAck, UnknownBuilderError>(std::move(builders.error()));
  }

  BuildsetInfo info;
  info.reason = "'try' job";
  if (!job.who.empty()) info.reason += " by user " + job.who;
  info.comment = job.comment;
  info.jobid = job.jobid;
  info.who = job.who;
  info.scheduler = scheduler_name;
  info.properties = job.properties;

  int64_t id = store.create_buildset(job.source, *builders, info);
  tjl::log::info("%s: job %s became buildset %ld", scheduler_name.c_str(), job.jobid.c_str(),
                 (long)id)();
  return tjl::make_result<IngressAck, UnknownBuilderError>(IngressAck{id, std::move(*builders)});
}

}  // namespace tryjob
