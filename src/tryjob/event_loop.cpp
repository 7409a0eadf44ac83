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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include "event_loop.h"

#include <time.h>

#include <cmath>
#include <vector>

namespace tryjob {

double monotonic_now() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return ts.tv_sec + ts.tv_nsec / 1e9;
}

void EventLoop::watch(int fd, uint32_t events, FdCallback callback) {
  poll.add(fd, events);
  watchers[fd] = std::make_shared<FdCallback>(std::move(callback));
}

void EventLoop::unwatch(int fd) {
  auto it = watchers.find(fd);
  if (it == watchers.end()) return;
  poll.remove(fd);
  watchers.erase(it);
}

EventLoop::TimerId EventLoop::call_later(double seconds, std::function<void()> fn) {
  TimerId id = next_timer++;
  timers.emplace(id, Timer{monotonic_now() + seconds, 0, std::move(fn)});
  return id;
}

EventLoop::TimerId EventLoop::call_every(double seconds, std::function<void()> fn) {
  TimerId id = next_timer++;
  timers.emplace(id, Timer{monotonic_now() + seconds, seconds, std::move(fn)});
  return id;
}

void EventLoop::cancel(TimerId id) { timers.erase(id); }

void EventLoop::fire_timers() {
  double now = monotonic_now();

  std::vector<TimerId> due;
  for (const auto& timer : timers) {
    if (timer.second.when <= now) due.push_back(timer.first);
  }

  for (TimerId id : due) {
    // An earlier callback may have cancelled this one.
    auto it = timers.find(id);
    if (it == timers.end()) continue;

    if (it->second.interval > 0) {
      it->second.when = now + it->second.interval;
      // Copy so the timer may cancel itself.
      std::function<void()> fn = it->second.fn;
      fn();
    } else {
      std::function<void()> fn = std::move(it->second.fn);
      timers.erase(it);
      fn();
    }
  }
}

void EventLoop::run_once(double max_wait) {
  double wait = max_wait;
  if (!timers.empty()) {
    double now = monotonic_now();
    for (const auto& timer : timers) {
      double left = timer.second.when - now;
      if (left < 0) left = 0;
      if (wait < 0 || left < wait) wait = left;
    }
  }

  struct timespec timeout;
  struct timespec* timeout_ptr = nullptr;
  if (wait >= 0) {
    timeout.tv_sec = static_cast<time_t>(wait);
    timeout.tv_nsec = static_cast<long>((wait - std::floor(wait)) * 1e9);
    timeout_ptr = &timeout;
  }

  for (const auto& event : poll.wait(timeout_ptr)) {
    auto it = watchers.find(event.data.fd);
    if (it == watchers.end()) continue;
    // Hold a reference in case the callback unwatches itself.
    std::shared_ptr<FdCallback> callback = it->second;
    (*callback)(event.events);
  }

  fire_timers();
}

bool EventLoop::run_until(const std::function<bool()>& done, double timeout) {
  double deadline = monotonic_now() + timeout;
  while (!done()) {
    double left = -1;
    if (timeout >= 0) {
      left = deadline - monotonic_now();
      if (left <= 0) return done();
    }
    run_once(left);
  }
  return true;
}

void EventLoop::run() {
  running = true;
  while (running) run_once(-1);
}

}  // namespace tryjob
