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
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>

#include "util/poll.h"

namespace tryjob {

// Seconds on the monotonic clock.
double monotonic_now();

// A single threaded reactor shared by every component of a process.
// Components never block: they register fds and timers and let the
// loop call back into them. Nothing here is thread safe.
class EventLoop {
 public:
  using TimerId = uint64_t;
  using FdCallback = std::function<void(uint32_t events)>;

 private:
  struct Timer {
    double when;
    double interval;  // 0 for one-shot timers
    std::function<void()> fn;
  };

  EPoll poll;
  std::unordered_map<int, std::shared_ptr<FdCallback>> watchers;
  std::map<TimerId, Timer> timers;
  TimerId next_timer = 1;
  bool running = false;

  void fire_timers();

 public:
  EventLoop() = default;
  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // `events` are epoll flags. A callback may unwatch its own fd.
  void watch(int fd, uint32_t events, FdCallback callback);
  void unwatch(int fd);
  bool watching(int fd) const { return watchers.count(fd) != 0; }

  TimerId call_later(double seconds, std::function<void()> fn);
  TimerId call_every(double seconds, std::function<void()> fn);
  // Cancelling an unknown or already fired timer does nothing.
  void cancel(TimerId id);

  // Waits at most `max_wait` seconds (forever when negative) for the
  // next fd event or due timer, then dispatches everything ready.
  void run_once(double max_wait);

  // Dispatches events until `done` holds or `timeout` seconds pass.
  // A negative timeout never expires. Returns the final value of
  // `done`.
  bool run_until(const std::function<bool()>& done, double timeout);

  // Dispatches events until stop() is called.
  void run();
  void stop() { running = false; }
};

}  // namespace tryjob
