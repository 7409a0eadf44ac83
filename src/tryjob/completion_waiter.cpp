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

#include "completion_waiter.h"

#include <map>

#include "tjl/tracing.h"

namespace tryjob {

bool WaitSummary::all_succeeded() const {
  for (const auto& build : builds) {
    if (build.result != BuildResult::success) return false;
  }
  return true;
}

tjl::result<WaitSummary, RpcError> CompletionWaiter::wait() {
  std::map<std::string, BuilderOutcome> outcomes;
  for (const auto& builder : builders) {
    BuilderOutcome pending;
    pending.builder = builder;
    outcomes.emplace(builder, std::move(pending));
  }

  size_t remaining = outcomes.size();
  bool buildset_finished = false;
  while (remaining > 0 && !buildset_finished) {
    // Suspends in the event loop for up to one interval.
    if (!transport.ready()) {
      loop.run_until([this]() { return transport.ready(); }, interval);
    }
    auto next = transport.next_notification(0);
    if (!next) return tjl::result_error<WaitSummary>(next.error());
    if (!*next) continue;

    const Notification& note = **next;
    if (note.kind == NotificationKind::buildset_finished) {
      buildset_finished = true;
      continue;
    }

    auto it = outcomes.find(note.build.builder);
    if (it == outcomes.end()) {
      tjl::log::warning("waiter: result for unexpected builder %s", note.build.builder.c_str())();
      continue;
    }
    if (is_terminal(it->second.result)) continue;
    if (!is_terminal(note.build.result)) continue;

    it->second.number = note.build.number;
    it->second.result = note.build.result;
    it->second.detail = note.build.detail;
    --remaining;
  }

  WaitSummary summary;
  for (auto& outcome : outcomes) {
    if (!is_terminal(outcome.second.result)) outcome.second.detail = "no result";
    summary.builds.emplace_back(std::move(outcome.second));
  }
  return tjl::result_value<RpcError>(std::move(summary));
}

std::vector<std::string> CompletionWaiter::render(const WaitSummary& summary) {
  std::map<std::string, const BuilderOutcome*> sorted;
  for (const auto& build : summary.builds) sorted[build.builder] = &build;

  std::vector<std::string> lines;
  lines.emplace_back("All Builds Complete");
  for (const auto& entry : sorted) {
    const BuilderOutcome& build = *entry.second;
    lines.emplace_back(build.builder + ": " + result_name(build.result) + " (" + build.detail +
                       ")");
  }
  return lines;
}

}  // namespace tryjob
