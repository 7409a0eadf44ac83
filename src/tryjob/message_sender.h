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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include <errno.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <cstdint>
#include <string>

#include "tjl/tracing.h"

namespace tryjob {

enum class MessageSenderState {
  Continue,
  StopSuccess,
  StopFail,
  Timeout,
};

// The write side twin of MessageParser. Keeps writing until the data
// is gone or the fd would block, so it must be used on a non-blocking
// fd, preferably under edge triggered polling. A deadline of 0 never
// expires.
class MessageSender {
 private:
  std::string data;
  size_t start = 0;
  time_t deadline = 0;
  int fd = -1;
  MessageSenderState state = MessageSenderState::Continue;

 public:
  MessageSender() = delete;
  MessageSender(const MessageSender&) = delete;
  MessageSender(MessageSender&& sender)
      : data(std::move(sender.data)),
        start(sender.start),
        deadline(sender.deadline),
        fd(sender.fd),
        state(sender.state) {
    sender.start = 0;
    sender.fd = -1;
    sender.state = MessageSenderState::StopFail;
  }

  MessageSender(std::string data_, int fd) : data(std::move(data_)), fd(fd) {}
  MessageSender(std::string data_, int fd, uint64_t timeout_seconds)
      : data(std::move(data_)), deadline(time(nullptr) + timeout_seconds), fd(fd) {}

  bool has_timed_out() const { return deadline != 0 && time(nullptr) > deadline; }
  size_t remaining() const { return data.size() - start; }

  // errno from the call to `write` remains set if StopFail is returned
  MessageSenderState send() {
    if (state != MessageSenderState::Continue) {
      return state;
    }

    if (has_timed_out()) {
      state = MessageSenderState::Timeout;
      return state;
    }

    while (start < data.size()) {
      ssize_t res = write(fd, data.data() + start, data.size() - start);
      if (res == -1) {
        if (errno == EINTR) continue;

        // More to do, but not right now.
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return MessageSenderState::Continue;
        }

        tjl::log::info("MessageSender::send(): write(%d): %s", fd, strerror(errno))();
        state = MessageSenderState::StopFail;
        return state;
      }
      start += res;
    }

    state = MessageSenderState::StopSuccess;
    return state;
  }
};

}  // namespace tryjob
