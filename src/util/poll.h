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

#ifndef POLL_H
#define POLL_H

#include <signal.h>
#include <sys/epoll.h>
#include <time.h>

#include <cstdint>
#include <vector>

// EPoll is a thin wrapper around the linux epoll interface. It
// allows for read and write polling as well as level or edge
// triggered polling. Failures of the epoll syscalls themselves are
// fatal.
struct EPoll {
  int epfd;

  EPoll();
  ~EPoll();

  EPoll(const EPoll &) = delete;
  EPoll &operator=(const EPoll &) = delete;

  void add(int fd, uint32_t events);
  void remove(int fd);

  // A null timeout blocks until an event arrives. EINTR yields an
  // empty vector.
  std::vector<epoll_event> wait(struct timespec *timeout);
};

#endif
