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

#include "network_transport.h"

#include <errno.h>
#include <string.h>
#include <sys/epoll.h>

#include <sstream>

#include "tjl/tracing.h"
#include "tryjob/socket.h"

namespace tryjob {

const char* rpc_error_name(RpcErrorKind kind) {
  switch (kind) {
    case RpcErrorKind::ConnectFailed:
      return "connect failed";
    case RpcErrorKind::AuthenticationFailed:
      return "authentication failed";
    case RpcErrorKind::UnknownBuilder:
      return "unknown builder";
    case RpcErrorKind::MalformedJob:
      return "malformed job";
    case RpcErrorKind::ProtocolError:
      return "protocol error";
    case RpcErrorKind::ConnectionLost:
      return "connection lost";
    case RpcErrorKind::Timeout:
      return "timeout";
  }
  return "protocol error";
}

std::string describe(const RpcError& err) {
  if (err.message.empty()) return rpc_error_name(err.kind);
  return std::string(rpc_error_name(err.kind)) + ": " + err.message;
}

template <class T>
static tjl::result<T, RpcError> rpc_error(RpcErrorKind kind, std::string message) {
  return tjl::make_error<T, RpcError>(RpcError{kind, std::move(message)});
}

NetworkTransport::NetworkTransport(EventLoop& loop, double timeout)
    : loop(loop), timeout(timeout) {}

void NetworkTransport::fail(RpcErrorKind kind, std::string message) {
  if (!failure) failure = tjl::some(RpcError{kind, std::move(message)});
}

tjl::optional<RpcError> NetworkTransport::connect(const std::string& host, uint16_t port) {
  close();
  peer_closed = false;
  failure = {};
  replies.clear();
  notifications.clear();

  std::string endpoint = host + ":" + std::to_string(port);
  auto addresses = resolve_tcp(host, port);
  if (!addresses) {
    return tjl::some(RpcError{RpcErrorKind::ConnectFailed, addresses.error()});
  }

  double deadline = monotonic_now() + timeout;
  std::string why;
  for (const auto& address : *addresses) {
    auto fd = start_connect(address);
    if (!fd) {
      why = "connect(" + endpoint + "): " + strerror(fd.error());
      continue;
    }

    // The connect runs in the background while the loop keeps serving
    // everything else. Writable means it either finished or failed.
    int pending = fd->get();
    bool writable = false;
    loop.watch(pending, EPOLLOUT, [&writable](uint32_t) { writable = true; });
    double left = -1;
    if (timeout >= 0) {
      left = deadline - monotonic_now();
      if (left < 0) left = 0;
    }
    loop.run_until([&writable]() { return writable; }, left);
    loop.unwatch(pending);

    if (!writable) {
      return tjl::some(RpcError{RpcErrorKind::Timeout, "no connection to " + endpoint + " within " +
                                                          std::to_string((int)timeout) +
                                                          " seconds"});
    }

    tjl::posix_error_t err = connect_result(pending);
    if (err != 0) {
      why = "connect(" + endpoint + "): " + strerror(err);
      continue;
    }

    sock = std::move(*fd);
    parser.reset(new MessageParser(sock.get()));
    loop.watch(sock.get(), EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET,
               [this](uint32_t events) { on_event(events); });
    tjl::log::info("transport: connected to %s", endpoint.c_str())();
    return {};
  }

  return tjl::some(RpcError{RpcErrorKind::ConnectFailed, why});
}

void NetworkTransport::close() {
  if (!sock.valid()) return;
  if (loop.watching(sock.get())) loop.unwatch(sock.get());
  outbox.clear();
  parser.reset();
  sock.reset();
}

void NetworkTransport::on_event(uint32_t events) {
  if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
    read_messages();
  }
  if ((events & EPOLLOUT) && sock.valid() && !peer_closed) {
    flush();
  }
}

void NetworkTransport::read_messages() {
  if (!parser) return;

  std::vector<std::string> msgs;
  MessageParserState state = parser->read_messages(msgs);

  for (const auto& msg : msgs) {
    JAST json;
    std::stringstream errs;
    if (!JAST::parse(msg, errs, json) || json.kind != JSON_OBJECT) {
      fail(RpcErrorKind::ProtocolError, "master sent something other than a JSON object");
      continue;
    }

    if (!protocol::is_notification(json)) {
      replies.emplace_back(std::move(json));
      continue;
    }

    const std::string& method = json.get("method").value;
    const JAST& params = json.get("params");
    Notification note;
    if (method == protocol::BUILD_FINISHED) {
      auto build = protocol::parse_build_finished(params);
      if (!build) {
        fail(RpcErrorKind::ProtocolError, "malformed build/finished notification");
        continue;
      }
      note.kind = NotificationKind::build_finished;
      note.build = std::move(*build);
    } else if (method == protocol::BUILDSET_FINISHED) {
      auto buildset = params.get("buildset").expect_integer();
      if (!buildset) {
        fail(RpcErrorKind::ProtocolError, "malformed buildset/finished notification");
        continue;
      }
      note.kind = NotificationKind::buildset_finished;
      note.build.buildset = *buildset;
    } else {
      tjl::log::warning("transport: ignoring unknown notification '%s'", method.c_str())();
      continue;
    }
    notifications.emplace_back(std::move(note));
  }

  if (state == MessageParserState::StopSuccess) {
    tjl::log::info("transport: master closed the connection")();
    peer_closed = true;
    loop.unwatch(sock.get());
  } else if (state == MessageParserState::StopFail) {
    fail(RpcErrorKind::ConnectionLost, std::string("read: ") + strerror(errno));
    peer_closed = true;
    loop.unwatch(sock.get());
  } else if (state == MessageParserState::TooLarge) {
    fail(RpcErrorKind::ProtocolError, "master sent an oversized message");
    peer_closed = true;
    loop.unwatch(sock.get());
  }
}

void NetworkTransport::flush() {
  while (!outbox.empty()) {
    MessageSenderState state = outbox.front().send();
    if (state == MessageSenderState::Continue) return;
    if (state != MessageSenderState::StopSuccess) {
      fail(RpcErrorKind::ConnectionLost, std::string("write: ") + strerror(errno));
      outbox.clear();
      return;
    }
    outbox.pop_front();
  }
}

tjl::result<JAST, RpcError> NetworkTransport::round_trip(const JAST& request) {
  if (!sock.valid()) {
    return rpc_error<JAST>(RpcErrorKind::ConnectionLost, "not connected");
  }
  if (failure) return tjl::result_error<JAST>(*failure);
  if (peer_closed) {
    return rpc_error<JAST>(RpcErrorKind::ConnectionLost, "master closed the connection");
  }

  outbox.emplace_back(protocol::frame(request), sock.get());
  flush();

  bool done = loop.run_until(
      [this]() { return !replies.empty() || peer_closed || static_cast<bool>(failure); },
      timeout);

  // A reply sent just before the master hung up still counts.
  if (!replies.empty()) {
    JAST reply = std::move(replies.front());
    replies.pop_front();

    auto ok = reply.get("ok").expect_boolean();
    if (!ok) {
      return rpc_error<JAST>(RpcErrorKind::ProtocolError, "reply without 'ok'");
    }
    if (*ok) return tjl::result_value<RpcError>(std::move(reply));

    std::string message = reply.get("message").value;
    auto kind_name = reply.get("kind").expect_string();
    auto kind = kind_name ? protocol::parse_kind(*kind_name) : tjl::optional<protocol::ErrorKind>();
    if (!kind) return rpc_error<JAST>(RpcErrorKind::ProtocolError, message);
    switch (*kind) {
      case protocol::ErrorKind::authentication:
        return rpc_error<JAST>(RpcErrorKind::AuthenticationFailed, message);
      case protocol::ErrorKind::unknown_builder:
        return rpc_error<JAST>(RpcErrorKind::UnknownBuilder, message);
      case protocol::ErrorKind::malformed_job:
        return rpc_error<JAST>(RpcErrorKind::MalformedJob, message);
      case protocol::ErrorKind::protocol:
        return rpc_error<JAST>(RpcErrorKind::ProtocolError, message);
    }
    return rpc_error<JAST>(RpcErrorKind::ProtocolError, message);
  }

  if (failure) return tjl::result_error<JAST>(*failure);
  if (peer_closed) {
    return rpc_error<JAST>(RpcErrorKind::ConnectionLost, "master closed the connection");
  }
  if (!done) {
    return rpc_error<JAST>(RpcErrorKind::Timeout, "no reply within " +
                                                      std::to_string((int)timeout) + " seconds");
  }
  return rpc_error<JAST>(RpcErrorKind::ProtocolError, "no reply");
}

tjl::optional<RpcError> NetworkTransport::login(const std::string& username,
                                                const std::string& password) {
  auto reply = round_trip(protocol::login_request(username, password));
  if (!reply) return tjl::some(reply.error());
  return {};
}

tjl::result<SubmitAck, RpcError> NetworkTransport::submit(const Job& job, bool wait) {
  auto reply = round_trip(protocol::submit_request(encode(job), wait));
  if (!reply) return tjl::result_error<SubmitAck>(reply.error());

  auto buildset = reply->get("buildset").expect_integer();
  auto builders = protocol::parse_string_array(reply->get("builders"));
  if (!buildset || !builders) {
    return rpc_error<SubmitAck>(RpcErrorKind::ProtocolError, "malformed submit reply");
  }

  SubmitAck ack;
  ack.buildset = *buildset;
  ack.builders = std::move(*builders);
  return tjl::result_value<RpcError>(std::move(ack));
}

tjl::result<std::vector<std::string>, RpcError> NetworkTransport::list_builders() {
  auto reply = round_trip(protocol::builders_request());
  if (!reply) return tjl::result_error<std::vector<std::string>>(reply.error());

  auto builders = protocol::parse_string_array(reply->get("builders"));
  if (!builders) {
    return rpc_error<std::vector<std::string>>(RpcErrorKind::ProtocolError,
                                               "malformed builders reply");
  }
  return tjl::result_value<RpcError>(std::move(*builders));
}

tjl::result<tjl::optional<Notification>, RpcError> NetworkTransport::next_notification(
    double wait_for) {
  using Out = tjl::optional<Notification>;

  if (notifications.empty() && sock.valid() && !peer_closed && !failure) {
    loop.run_until(
        [this]() { return !notifications.empty() || peer_closed || static_cast<bool>(failure); },
        wait_for);
  }

  if (!notifications.empty()) {
    Notification note = std::move(notifications.front());
    notifications.pop_front();
    return tjl::result_value<RpcError>(tjl::some(std::move(note)));
  }

  if (failure) return tjl::result_error<Out>(*failure);
  if (!sock.valid() || peer_closed) {
    return rpc_error<Out>(RpcErrorKind::ConnectionLost, "master closed the connection");
  }
  return tjl::result_value<RpcError>(Out());
}

}  // namespace tryjob
