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

#include "userpass_scheduler.h"

#include <errno.h>
#include <string.h>
#include <sys/epoll.h>

#include <sstream>

#include "tjl/tracing.h"
#include "tryjob/socket.h"

namespace tryjob {

using protocol::ErrorKind;

UserpassScheduler::UserpassScheduler(EventLoop& loop, BuildsetStore& store,
                                     UserpassOptions options)
    : loop(loop),
      store(store),
      ingress(store, std::move(options.name), std::move(options.builders)),
      listen_address(std::move(options.listen_address)),
      requested_port(options.port),
      users(std::move(options.users)),
      status_interval(options.status_interval) {}

tjl::result<uint16_t, tjl::posix_error_t> UserpassScheduler::start() {
  if (active()) {
    return tjl::make_result<uint16_t, tjl::posix_error_t>(bound_port);
  }

  auto fd = listen_tcp(listen_address, requested_port, 64);
  if (!fd) {
    return tjl::make_error<uint16_t, tjl::posix_error_t>(fd.error());
  }

  auto port = local_port(fd->get());
  if (!port) {
    return tjl::make_error<uint16_t, tjl::posix_error_t>(port.error());
  }

  listener = std::move(*fd);
  bound_port = *port;
  loop.watch(listener.get(), EPOLLIN, [this](uint32_t) { handle_new_client(); });
  status_timer = tjl::some(loop.call_every(status_interval, [this]() { check_status(); }));

  tjl::log::info("%s: listening on port %u", name().c_str(), (unsigned)bound_port)();
  return tjl::make_result<uint16_t, tjl::posix_error_t>(bound_port);
}

void UserpassScheduler::stop() {
  if (!active()) return;

  if (status_timer) {
    loop.cancel(*status_timer);
    status_timer = {};
  }

  std::vector<int> fds;
  for (const auto& session : sessions) fds.push_back(session.first);
  for (int fd : fds) close_client(fd);

  loop.unwatch(listener.get());
  listener.reset();
  tjl::log::info("%s: stopped listening on port %u", name().c_str(), (unsigned)bound_port)();
}

void UserpassScheduler::handle_new_client() {
  // The listener is level triggered, so one accept per wakeup is enough.
  auto fd = accept_client(listener.get());
  if (!fd) {
    if (fd.error() != EAGAIN && fd.error() != EWOULDBLOCK && fd.error() != ECONNABORTED) {
      tjl::log::error("%s: accept: %s", name().c_str(), strerror(fd.error())).urgent()();
    }
    return;
  }

  int client_fd = fd->get();
  sessions.emplace(client_fd, std::unique_ptr<Session>(new Session(std::move(*fd))));

  // Edge triggered, so every read and write must run until EAGAIN.
  loop.watch(client_fd, EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET, [this, client_fd](uint32_t ev) {
    if (ev & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
      handle_read_msg(client_fd);
    }
    if ((ev & EPOLLOUT) && sessions.count(client_fd)) {
      handle_write(client_fd);
    }
  });
  tjl::log::info("%s: new client connected: %d", name().c_str(), client_fd)();
}

void UserpassScheduler::close_client(int fd) {
  auto it = sessions.find(fd);
  if (it == sessions.end()) return;
  tjl::log::info("%s: closing client fd = %d", name().c_str(), fd)();
  loop.unwatch(fd);
  sessions.erase(it);
}

void UserpassScheduler::handle_write(int fd) {
  auto it = sessions.find(fd);
  if (it == sessions.end()) return;
  Session& session = *it->second;

  while (!session.outbox.empty()) {
    MessageSenderState state = session.outbox.front().send();
    if (state == MessageSenderState::Continue) return;
    if (state != MessageSenderState::StopSuccess) {
      tjl::log::warning("%s: write to client %d failed, dropping it", name().c_str(), fd)();
      close_client(fd);
      return;
    }
    session.outbox.pop_front();
  }

  if (session.closing) close_client(fd);
}

bool UserpassScheduler::queue(int fd, Session& session, const JAST& message) {
  session.outbox.emplace_back(protocol::frame(message), fd);
  // The socket is probably writable already and edge triggering will
  // not tell us again, so start writing right away.
  handle_write(fd);
  return sessions.count(fd) != 0;
}

void UserpassScheduler::refuse(int fd, Session& session, ErrorKind kind, const std::string& why) {
  tjl::log::warning("%s: client %d: %s: %s", name().c_str(), fd, protocol::kind_name(kind),
                    why.c_str())();
  session.closing = true;
  queue(fd, session, protocol::error_reply(kind, why));
}

void UserpassScheduler::handle_read_msg(int fd) {
  auto it = sessions.find(fd);
  if (it == sessions.end()) return;
  Session& session = *it->second;

  std::vector<std::string> msgs;
  MessageParserState state = session.parser.read_messages(msgs);

  for (const auto& msg : msgs) {
    // Anything after a refusal or a final reply is ignored.
    if (session.closing) break;

    JAST json;
    std::stringstream parse_errors;
    if (!JAST::parse(msg, parse_errors, json) || json.kind != JSON_OBJECT) {
      refuse(fd, session, ErrorKind::protocol, "request is not a JSON object");
      break;
    }

    handle_request(fd, session, json);
    if (!sessions.count(fd)) return;
  }

  if (state == MessageParserState::StopSuccess) {
    tjl::log::info("%s: client %d disconnected", name().c_str(), fd)();
    close_client(fd);
    return;
  }

  if (state == MessageParserState::StopFail) {
    tjl::log::warning("%s: read(%d): %s", name().c_str(), fd, strerror(errno))();
    close_client(fd);
    return;
  }

  if (state == MessageParserState::TooLarge) {
    if (session.closing) {
      close_client(fd);
    } else {
      refuse(fd, session, ErrorKind::protocol, "request too large");
    }
  }
}

void UserpassScheduler::handle_request(int fd, Session& session, const JAST& request) {
  auto method = request.get("method").expect_string();
  const JAST& params = request.get("params");

  if (method && *method == protocol::LOGIN) {
    if (session.authenticated) {
      refuse(fd, session, ErrorKind::protocol, "already logged in");
      return;
    }
    auto username = params.get("username").expect_string();
    auto password = params.get("password").expect_string();
    auto user = username ? users.find(*username) : users.end();
    if (user == users.end() || !password || user->second != *password) {
      refuse(fd, session, ErrorKind::authentication, "invalid login");
      return;
    }
    session.authenticated = true;
    session.parser.max_size = 0;
    tjl::log::info("%s: client %d logged in as %s", name().c_str(), fd, username->c_str())();
    queue(fd, session, protocol::ok_reply());
    return;
  }

  if (!session.authenticated) {
    refuse(fd, session, ErrorKind::authentication, "login required");
    return;
  }

  if (session.answered) {
    refuse(fd, session, ErrorKind::protocol, "only one request is allowed per connection");
    return;
  }

  if (method && *method == protocol::SUBMIT) {
    session.answered = true;
    handle_submit(fd, session, params);
    return;
  }

  if (method && *method == protocol::BUILDERS) {
    session.answered = true;
    session.closing = true;
    queue(fd, session, protocol::builders_reply(ingress.builders()));
    return;
  }

  refuse(fd, session, ErrorKind::protocol,
         "unknown method '" + (method ? *method : std::string()) + "'");
}

void UserpassScheduler::handle_submit(int fd, Session& session, const JAST& params) {
  auto encoded = params.get("job").expect_string();
  if (!encoded) {
    refuse(fd, session, ErrorKind::malformed_job, "missing 'job'");
    return;
  }

  auto job = decode(*encoded);
  if (!job) {
    refuse(fd, session, ErrorKind::malformed_job, job.error().why);
    return;
  }

  auto ack = ingress.submit(*job);
  if (!ack) {
    refuse(fd, session, ErrorKind::unknown_builder, describe(ack.error()));
    return;
  }

  auto wait = params.get("wait").expect_boolean();
  if (wait && *wait) {
    session.watched = tjl::some(ack->buildset);
  } else {
    session.closing = true;
  }
  queue(fd, session, protocol::submit_reply(ack->buildset, ack->builders));
}

void UserpassScheduler::check_status() {
  std::vector<int> watching;
  for (const auto& session : sessions) {
    if (session.second->watched && !session.second->finished_sent) {
      watching.push_back(session.first);
    }
  }

  for (int fd : watching) {
    auto it = sessions.find(fd);
    if (it == sessions.end()) continue;
    Session& session = *it->second;
    int64_t buildset = *session.watched;

    bool all_terminal = true;
    std::vector<BuildRequest> requests = store.get_build_requests(buildset);
    for (const auto& request : requests) {
      if (!is_terminal(request.result)) {
        all_terminal = false;
        continue;
      }
      if (session.reported.count(request.id)) continue;
      session.reported.insert(request.id);

      protocol::BuildNotification note;
      note.buildset = buildset;
      note.builder = request.builder;
      note.number = request.number;
      note.result = request.result;
      note.detail = request.detail;
      if (!queue(fd, session, protocol::build_finished(note))) break;
    }

    if (!sessions.count(fd)) continue;
    if (all_terminal && !requests.empty()) {
      session.finished_sent = true;
      queue(fd, session, protocol::buildset_finished(buildset));
    }
  }
}

}  // namespace tryjob
