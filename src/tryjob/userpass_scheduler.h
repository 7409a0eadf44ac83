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
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "json/json5.h"
#include "tjl/optional.h"
#include "tjl/result.h"
#include "tjl/unique_fd.h"
#include "tryjob/event_loop.h"
#include "tryjob/ingress.h"
#include "tryjob/message_parser.h"
#include "tryjob/message_sender.h"
#include "tryjob/protocol.h"

namespace tryjob {

struct UserpassOptions {
  std::string name;
  std::vector<std::string> builders;
  // Empty listens on every interface.
  std::string listen_address;
  // 0 picks an ephemeral port, see UserpassScheduler::port().
  uint16_t port = 0;
  // username -> password
  std::map<std::string, std::string> users;
  double status_interval = 1;
};

// Accepts try jobs over TCP from authenticated users. Each connection
// logs in, then makes exactly one request: a submit or a builder
// listing. A submit with wait=true keeps the connection open and
// streams a notification per finished build.
class UserpassScheduler {
 private:
  // Bytes a connection may send before it has logged in.
  static constexpr size_t max_anonymous_request = 1 << 20;

  struct Session {
    tjl::unique_fd sock;
    MessageParser parser;
    std::deque<MessageSender> outbox;
    bool authenticated = false;
    bool answered = false;
    // Close once the outbox drains.
    bool closing = false;
    tjl::optional<int64_t> watched;
    std::set<int64_t> reported;
    bool finished_sent = false;

    explicit Session(tjl::unique_fd&& fd) : sock(std::move(fd)), parser(sock.get()) {
      parser.max_size = max_anonymous_request;
    }
  };

  EventLoop& loop;
  BuildsetStore& store;
  JobIngress ingress;
  std::string listen_address;
  uint16_t requested_port;
  std::map<std::string, std::string> users;
  double status_interval;

  tjl::unique_fd listener;
  uint16_t bound_port = 0;
  std::unordered_map<int, std::unique_ptr<Session>> sessions;
  tjl::optional<EventLoop::TimerId> status_timer;

  void handle_new_client();
  void handle_read_msg(int fd);
  void handle_write(int fd);
  void close_client(int fd);

  void handle_request(int fd, Session& session, const JAST& request);
  void handle_submit(int fd, Session& session, const JAST& params);
  // Returns false when the session was closed by a failed write.
  bool queue(int fd, Session& session, const JAST& message);
  void refuse(int fd, Session& session, protocol::ErrorKind kind, const std::string& why);

  void check_status();

 public:
  UserpassScheduler(EventLoop& loop, BuildsetStore& store, UserpassOptions options);
  ~UserpassScheduler() { stop(); }

  UserpassScheduler(const UserpassScheduler&) = delete;
  UserpassScheduler& operator=(const UserpassScheduler&) = delete;

  // Binds and listens. Returns the bound port.
  tjl::result<uint16_t, tjl::posix_error_t> start();
  // Closes the listener and every session. Buildsets already created
  // keep building.
  void stop();

  bool active() const { return listener.valid(); }
  uint16_t port() const { return bound_port; }
  size_t session_count() const { return sessions.size(); }
  const std::string& name() const { return ingress.name(); }
  const std::vector<std::string>& builders() const { return ingress.builders(); }
};

}  // namespace tryjob
