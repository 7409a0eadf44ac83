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
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace tryjob {

enum class MessageParserState { Continue, StopSuccess, StopFail, Timeout, TooLarge };

// Holds the state needed to keep reading null terminated messages from
// a non-blocking fd across wakeups. It reads until EAGAIN so it works
// with edge triggered polling. A deadline of 0 never expires and a
// max_size of 0 lets a message grow without bound.
struct MessageParser {
  std::string message_buff;
  int fd;
  time_t deadline;
  size_t max_size = 0;

  MessageParser() = delete;
  explicit MessageParser(int fd) : fd(fd), deadline(0) {}
  MessageParser(int fd, uint64_t timeout) : fd(fd), deadline(time(nullptr) + timeout) {}

  void clear_deadline() { deadline = 0; }
  bool has_timed_out() const { return deadline != 0 && time(nullptr) > deadline; }

  // `messages` receives every complete message read by this call, also
  // when the peer closed the stream right after sending them.
  MessageParserState read_messages(std::vector<std::string>& messages) {
    messages.clear();

    if (has_timed_out()) {
      return MessageParserState::Timeout;
    }

    while (true) {
      char buffer[4096];
      ssize_t count = read(fd, buffer, sizeof(buffer));
      if (count == 0) {
        return MessageParserState::StopSuccess;
      }

      if (count < 0) {
        // A reset peer is the same as a closed one.
        if (errno == ECONNRESET) return MessageParserState::StopSuccess;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return MessageParserState::Continue;
        return MessageParserState::StopFail;
      }

      const char* iter = buffer;
      const char* buffer_end = buffer + count;
      while (iter < buffer_end) {
        const char* end = std::find(iter, buffer_end, '\0');
        message_buff.append(iter, end);
        if (max_size != 0 && message_buff.size() > max_size) {
          message_buff.clear();
          return MessageParserState::TooLarge;
        }
        if (end != buffer_end) {
          messages.emplace_back(std::move(message_buff));
          message_buff.clear();
        }
        iter = end + 1;
      }
    }
  }
};

}  // namespace tryjob
