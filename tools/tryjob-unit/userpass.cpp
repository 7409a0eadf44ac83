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

#include "tryjob/userpass_scheduler.h"

#include <errno.h>
#include <sys/socket.h>

#include <set>

#include "fixture.h"
#include "tryjob/message_parser.h"
#include "tryjob/network_transport.h"
#include "tryjob/socket.h"
#include "unit.h"

using tryjob::RpcErrorKind;

TEST(userpass_lists_builders) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a", "b"}));
  EXPECT_TRUE(master.scheduler.active());
  EXPECT_EQUAL("try", master.scheduler.name());

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));
  auto builders = transport.list_builders();
  ASSERT_TRUE((bool)builders);
  EXPECT_EQUAL(std::vector<std::string>({"a", "b"}), *builders);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(userpass_rejects_bad_password) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  auto err = transport.login("alice", "wrong");
  ASSERT_TRUE((bool)err);
  EXPECT_TRUE(err->kind == RpcErrorKind::AuthenticationFailed) << tryjob::describe(*err);

  // The master hangs up after refusing.
  auto ack = transport.submit(sample_job({"a"}), false);
  EXPECT_FALSE((bool)ack);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(userpass_rejects_unknown_user) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  auto err = transport.login("mallory", "secret");
  ASSERT_TRUE((bool)err);
  EXPECT_TRUE(err->kind == RpcErrorKind::AuthenticationFailed);
}

TEST(userpass_requires_login) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  auto ack = transport.submit(sample_job({"a"}), false);
  ASSERT_FALSE((bool)ack);
  EXPECT_TRUE(ack.error().kind == RpcErrorKind::AuthenticationFailed) << ack.error().message;
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(userpass_submit_creates_buildset) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a", "b"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));

  tryjob::Job job = sample_job({"b"});
  auto ack = transport.submit(job, false);
  ASSERT_TRUE((bool)ack);
  EXPECT_EQUAL(std::vector<std::string>({"b"}), ack->builders);

  auto buildset = master.store.get_buildset(ack->buildset);
  ASSERT_TRUE((bool)buildset);
  EXPECT_EQUAL(job.jobid, buildset->info.jobid);
  EXPECT_EQUAL("try", buildset->info.scheduler);
  EXPECT_TRUE(buildset->source == job.source);

  // Without wait the session ends with the reply.
  auto note = transport.next_notification(5);
  ASSERT_FALSE((bool)note);
  EXPECT_TRUE(note.error().kind == RpcErrorKind::ConnectionLost);
  EXPECT_TRUE(loop.run_until([&]() { return master.scheduler.session_count() == 0; }, 5));
}

TEST(userpass_unknown_builder_creates_nothing) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));
  auto ack = transport.submit(sample_job({"a", "nope"}), false);
  ASSERT_FALSE((bool)ack);
  EXPECT_TRUE(ack.error().kind == RpcErrorKind::UnknownBuilder);
  EXPECT_EQUAL("unknown builder nope", ack.error().message);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(userpass_malformed_job) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));
  // Encodes fine but the master refuses duplicate builders.
  auto ack = transport.submit(sample_job({"a", "a"}), false);
  ASSERT_FALSE((bool)ack);
  EXPECT_TRUE(ack.error().kind == RpcErrorKind::MalformedJob);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(userpass_one_request_per_connection) {
  TempDir dir;
  tryjob::EventLoop loop;
  std::vector<tryjob::BuilderConfig> builders = instant_builders({"a"});
  builders[0].command = "exec sleep 30";
  TestMaster master(loop, dir.path(), builders);

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));
  ASSERT_TRUE((bool)transport.submit(sample_job({"a"}), true));

  auto again = transport.list_builders();
  ASSERT_FALSE((bool)again);
  EXPECT_TRUE(again.error().kind == RpcErrorKind::ProtocolError);
  EXPECT_EQUAL(size_t(1), master.store.get_buildsets().size());
}

TEST(userpass_streams_notifications) {
  TempDir dir;
  tryjob::EventLoop loop;
  std::vector<tryjob::BuilderConfig> builders = instant_builders({"a", "b"});
  builders[1].command = "exit 2";
  TestMaster master(loop, dir.path(), builders);

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)transport.login("alice", "secret"));
  auto ack = transport.submit(sample_job({}), true);
  ASSERT_TRUE((bool)ack);
  EXPECT_EQUAL(std::vector<std::string>({"a", "b"}), ack->builders);

  std::set<std::string> finished;
  bool buildset_done = false;
  while (!buildset_done) {
    auto note = transport.next_notification(10);
    ASSERT_TRUE((bool)note);
    ASSERT_TRUE((bool)*note);
    const tryjob::Notification& got = **note;
    EXPECT_EQUAL(ack->buildset, got.build.buildset);
    if (got.kind == tryjob::NotificationKind::buildset_finished) {
      buildset_done = true;
      continue;
    }
    // Every build is reported once.
    EXPECT_TRUE(finished.insert(got.build.builder).second) << got.build.builder;
    if (got.build.builder == "a") {
      EXPECT_TRUE(got.build.result == tryjob::BuildResult::success);
      EXPECT_EQUAL("finished", got.build.detail);
    } else {
      EXPECT_TRUE(got.build.result == tryjob::BuildResult::failure);
      EXPECT_EQUAL("exit status 2", got.build.detail);
    }
    EXPECT_EQUAL(int64_t(1), got.build.number);
  }
  EXPECT_EQUAL(size_t(2), finished.size());
}

TEST(userpass_sessions_are_independent) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a", "b"}));

  tryjob::NetworkTransport alice(loop, 5);
  tryjob::NetworkTransport stranger(loop, 5);
  ASSERT_FALSE((bool)alice.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)stranger.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)alice.login("alice", "secret"));

  // A login on one connection does not authenticate another.
  auto sneaky = stranger.submit(sample_job({"a"}), false);
  ASSERT_FALSE((bool)sneaky);
  EXPECT_TRUE(sneaky.error().kind == RpcErrorKind::AuthenticationFailed)
      << sneaky.error().message;
  EXPECT_TRUE(master.store.get_buildsets().empty());

  auto ack = alice.submit(sample_job({}), true);
  ASSERT_TRUE((bool)ack);

  tryjob::NetworkTransport other(loop, 5);
  ASSERT_FALSE((bool)other.connect("127.0.0.1", master.port));
  ASSERT_FALSE((bool)other.login("alice", "secret"));
  auto builders = other.list_builders();
  ASSERT_TRUE((bool)builders);
  EXPECT_EQUAL(std::vector<std::string>({"a", "b"}), *builders);

  std::set<std::string> finished;
  bool buildset_done = false;
  while (!buildset_done) {
    auto note = alice.next_notification(10);
    ASSERT_TRUE((bool)note);
    ASSERT_TRUE((bool)*note);
    const tryjob::Notification& got = **note;
    EXPECT_EQUAL(ack->buildset, got.build.buildset);
    if (got.kind == tryjob::NotificationKind::buildset_finished) {
      buildset_done = true;
    } else {
      EXPECT_TRUE(finished.insert(got.build.builder).second) << got.build.builder;
    }
  }
  EXPECT_EQUAL(size_t(2), finished.size());
  EXPECT_EQUAL(size_t(1), master.store.get_buildsets().size());
}

TEST(userpass_stop_closes_sessions) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));
  uint16_t port = master.port;

  tryjob::NetworkTransport transport(loop, 5);
  ASSERT_FALSE((bool)transport.connect("127.0.0.1", port));
  ASSERT_TRUE(loop.run_until([&]() { return master.scheduler.session_count() == 1; }, 5));

  master.scheduler.stop();
  EXPECT_FALSE(master.scheduler.active());
  EXPECT_EQUAL(size_t(0), master.scheduler.session_count());

  auto err = transport.login("alice", "secret");
  ASSERT_TRUE((bool)err);
  EXPECT_TRUE(err->kind == RpcErrorKind::ConnectionLost);

  tryjob::NetworkTransport late(loop, 5);
  auto refused = late.connect("127.0.0.1", port);
  ASSERT_TRUE((bool)refused);
  EXPECT_TRUE(refused->kind == RpcErrorKind::ConnectFailed);
}

TEST(message_parser_size_limit) {
  int fds[2];
  ASSERT_EQUAL(0, socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds));
  tjl::unique_fd reader(fds[0]);
  tjl::unique_fd writer(fds[1]);

  tryjob::MessageParser parser(reader.get());
  parser.max_size = 16;
  std::vector<std::string> msgs;

  std::string fits(16, 'y');
  fits.push_back('\0');
  ASSERT_EQUAL(int64_t(fits.size()), int64_t(write(writer.get(), fits.data(), fits.size())));
  EXPECT_TRUE(parser.read_messages(msgs) == tryjob::MessageParserState::Continue);
  EXPECT_EQUAL(std::vector<std::string>({std::string(16, 'y')}), msgs);

  std::string big = "{}";
  big.push_back('\0');
  big.append(100, 'x');
  ASSERT_EQUAL(int64_t(big.size()), int64_t(write(writer.get(), big.data(), big.size())));
  EXPECT_TRUE(parser.read_messages(msgs) == tryjob::MessageParserState::TooLarge);
  EXPECT_EQUAL(std::vector<std::string>({"{}"}), msgs);
  EXPECT_TRUE(parser.message_buff.empty());
}

TEST(userpass_drops_oversized_anonymous_request) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  auto addresses = tryjob::resolve_tcp("127.0.0.1", master.port);
  ASSERT_TRUE((bool)addresses);
  ASSERT_FALSE(addresses->empty());
  auto client = tryjob::start_connect(addresses->front());
  ASSERT_TRUE((bool)client);
  ASSERT_TRUE(loop.run_until([&]() { return master.scheduler.session_count() == 1; }, 5));

  // One endless request with no terminator, well past the limit.
  std::string chunk(64 * 1024, 'x');
  size_t sent = 0;
  double give_up = tryjob::monotonic_now() + 10;
  while (sent < 2 * 1024 * 1024 && tryjob::monotonic_now() < give_up) {
    ssize_t n = send(client->get(), chunk.data(), chunk.size(), MSG_NOSIGNAL);
    if (n > 0) {
      sent += n;
    } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      loop.run_once(0.01);
    } else {
      // The master hung up on us.
      break;
    }
    if (master.scheduler.session_count() == 0) break;
  }

  EXPECT_TRUE(loop.run_until([&]() { return master.scheduler.session_count() == 0; }, 5));
  EXPECT_TRUE(master.scheduler.active());
  EXPECT_TRUE(master.store.get_buildsets().empty());
}
