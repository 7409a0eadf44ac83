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
#include "tryjob/event_loop.h"
#include "tryjob/network_transport.h"

namespace tryjob {

struct BuilderOutcome {
  std::string builder;
  int64_t number = 0;
  BuildResult result = BuildResult::pending;
  std::string detail;
};

// Final state of every requested builder, sorted by builder name.
struct WaitSummary {
  std::vector<BuilderOutcome> builds;

  bool all_succeeded() const;
};

// Follows the notifications of a submitted buildset until every
// requested builder reached a terminal result.
class CompletionWaiter {
 private:
  EventLoop& loop;
  NetworkTransport& transport;
  std::vector<std::string> builders;
  double interval;

 public:
  CompletionWaiter(EventLoop& loop, NetworkTransport& transport, std::vector<std::string> builders,
                   double interval)
      : loop(loop), transport(transport), builders(std::move(builders)), interval(interval) {}

  tjl::result<WaitSummary, RpcError> wait();

  static std::vector<std::string> render(const WaitSummary& summary);
};

}  // namespace tryjob
