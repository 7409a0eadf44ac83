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

#include "poll.h"

#include <errno.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>

#include "tjl/tracing.h"

#define EVENTS 512

EPoll::EPoll() {
  epfd = epoll_create1(EPOLL_CLOEXEC);
  if (epfd == -1) {
    tjl::log::error("epoll_create1: %s", strerror(errno)).urgent()();
    exit(1);
  }
}

EPoll::~EPoll() { close(epfd); }

void EPoll::add(int fd, uint32_t events) {
  struct epoll_event ev;
  ev.events = events;
  ev.data.fd = fd;

  if (epoll_ctl(epfd, EPOLL_CTL_ADD, fd, &ev) == -1) {
    tjl::log::error("epoll_ctl(EPOLL_CTL_ADD): %s", strerror(errno)).urgent()();
    exit(1);
  }
}

void EPoll::remove(int fd) {
  // epoll_event is ignored on EPOLL_CTL_DEL
  struct epoll_event ev;
  if (epoll_ctl(epfd, EPOLL_CTL_DEL, fd, &ev) == -1) {
    tjl::log::error("epoll_ctl(EPOLL_CTL_DEL): %s", strerror(errno)).urgent()();
    exit(1);
  }
}

std::vector<epoll_event> EPoll::wait(struct timespec *timeout) {
  struct epoll_event events[EVENTS];
  int ptimeout;

  if (timeout) {
    ptimeout = timeout->tv_sec * 1000 + (timeout->tv_nsec + 999999) / 1000000;
  } else {
    ptimeout = -1;
  }

  int nfds = epoll_pwait(epfd, &events[0], EVENTS, ptimeout, nullptr);
  if (nfds == -1 && errno != EINTR) {
    tjl::log::error("epoll_pwait: %s", strerror(errno)).urgent()();
    exit(1);
  }

  std::vector<epoll_event> ready;
  for (int i = 0; i < nfds; ++i) ready.push_back(events[i]);
  return ready;
}
