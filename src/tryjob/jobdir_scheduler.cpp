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

#include "jobdir_scheduler.h"

#include "tjl/tracing.h"

namespace tryjob {

JobdirScheduler::JobdirScheduler(EventLoop& loop, BuildsetStore& store, Maildir maildir,
                                 JobdirOptions options)
    : loop(loop),
      maildir(std::move(maildir)),
      ingress(store, std::move(options.name), std::move(options.builders)),
      poll_interval(options.poll_interval) {}

void JobdirScheduler::start() {
  if (timer) return;
  tjl::log::info("%s: watching %s every %.1fs", name().c_str(), maildir.new_dir().c_str(),
                 poll_interval)();
  timer = tjl::some(loop.call_every(poll_interval, [this]() { poll(); }));
}

void JobdirScheduler::stop() {
  if (!timer) return;
  loop.cancel(*timer);
  timer = {};
  tjl::log::info("%s: stopped", name().c_str())();
}

size_t JobdirScheduler::poll() {
  PollResult found = maildir.poll();

  for (const auto& bad : found.errors) {
    tjl::log::error("%s: skipping malformed job %s: %s", name().c_str(), bad.entry.c_str(),
                    bad.error.why.c_str())();
  }

  size_t created = 0;
  for (const auto& job : found.jobs) {
    // Rejections are logged by the ingress; the entry is already in cur/.
    if (ingress.submit(job)) ++created;
  }

  return created;
}

}  // namespace tryjob
