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

#include <cstddef>
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tryjob/event_loop.h"
#include "tryjob/ingress.h"
#include "tryjob/maildir.h"

namespace tryjob {

struct JobdirOptions {
  std::string name;
  std::vector<std::string> builders;
  double poll_interval = 10;
};

// Polls a maildir for jobs dropped by `tryjob --connect ssh` and turns
// each one into a buildset. Waiting for results is not offered over
// this path.
class JobdirScheduler {
 private:
  EventLoop& loop;
  Maildir maildir;
  JobIngress ingress;
  double poll_interval;
  tjl::optional<EventLoop::TimerId> timer;

 public:
  JobdirScheduler(EventLoop& loop, BuildsetStore& store, Maildir maildir, JobdirOptions options);
  ~JobdirScheduler() { stop(); }

  JobdirScheduler(const JobdirScheduler&) = delete;
  JobdirScheduler& operator=(const JobdirScheduler&) = delete;

  void start();
  // Unconsumed entries stay in new/ for the next start.
  void stop();
  bool active() const { return static_cast<bool>(timer); }

  // One tick: returns how many buildsets were created. Bad entries are
  // logged and skipped.
  size_t poll();

  const Maildir& jobdir() const { return maildir; }
  const std::string& name() const { return ingress.name(); }
};

}  // namespace tryjob
