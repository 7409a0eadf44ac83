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
#include <memory>
#include <string>
#include <vector>

#include "json/json5.h"
#include "tjl/optional.h"
#include "tjl/result.h"
#include "tjl/unique_fd.h"
#include "tryjob/event_loop.h"
#include "tryjob/job.h"
#include "tryjob/message_parser.h"
#include "tryjob/message_sender.h"
#include "tryjob/protocol.h"

namespace tryjob {

enum class RpcErrorKind {
  ConnectFailed,
  AuthenticationFailed,
  UnknownBuilder,
  MalformedJob,
  ProtocolError,
  ConnectionLost,
  Timeout
};

const char* rpc_error_name(RpcErrorKind kind);

struct RpcError {
  RpcErrorKind kind;
  std::string message;
};

// "<kind>: <message>"
std::string describe(const RpcError& err);

struct SubmitAck {
  int64_t buildset = 0;
  std::vector<std::string> builders;
};

enum class NotificationKind { build_finished, buildset_finished };

// A message the master pushed without being asked. For
// buildset_finished only `build.buildset` is meaningful.
struct Notification {
  NotificationKind kind = NotificationKind::build_finished;
  protocol::BuildNotification build;
};

// The client end of a userpass scheduler session. Every call drives
// the shared event loop until its answer arrives, so a master running
// on the same loop keeps making progress meanwhile.
class NetworkTransport {
 private:
  EventLoop& loop;
  double timeout;

  tjl::unique_fd sock;
  std::unique_ptr<MessageParser> parser;
  std::deque<MessageSender> outbox;
  std::deque<JAST> replies;
  std::deque<Notification> notifications;
  bool peer_closed = false;
  tjl::optional<RpcError> failure;

  void on_event(uint32_t events);
  void read_messages();
  void flush();
  void fail(RpcErrorKind kind, std::string message);
  tjl::result<JAST, RpcError> round_trip(const JAST& request);

 public:
  // `timeout` bounds every request and reply in seconds.
  explicit NetworkTransport(EventLoop& loop, double timeout = 30);
  ~NetworkTransport() { close(); }

  NetworkTransport(const NetworkTransport&) = delete;
  NetworkTransport& operator=(const NetworkTransport&) = delete;

  tjl::optional<RpcError> connect(const std::string& host, uint16_t port);
  tjl::optional<RpcError> login(const std::string& username, const std::string& password);
  tjl::result<SubmitAck, RpcError> submit(const Job& job, bool wait);
  tjl::result<std::vector<std::string>, RpcError> list_builders();

  // Returns an empty optional when nothing arrived within `wait_for`
  // seconds. A closed connection is ConnectionLost.
  tjl::result<tjl::optional<Notification>, RpcError> next_notification(double wait_for);

  // True when next_notification would return without waiting.
  bool ready() const { return !notifications.empty() || peer_closed || static_cast<bool>(failure); }
  bool connected() const { return sock.valid() && !peer_closed; }
  void close();
};

}  // namespace tryjob
