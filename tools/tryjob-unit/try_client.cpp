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

#include "tryjob/try_client.h"

#include <sys/stat.h>

#include "fixture.h"
#include "tjl/filepath.h"
#include "tryjob/mailbox_delivery.h"
#include "tryjob/maildir.h"
#include "tryjob/network_transport.h"
#include "tryjob/socket.h"
#include "unit.h"

namespace {

std::vector<std::string> pb_preamble() {
  return {"using 'pb' connect method", "job created", "Delivering job; comment= None",
          "job has been delivered"};
}

std::vector<std::string> plus(std::vector<std::string> a, const std::vector<std::string>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

bool starts_with(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

struct ClientRun {
  CollectingOutput output;
  int code = -1;

  ClientRun(const tryjob::DeliveryConfig& config, tryjob::EventLoop& loop) {
    tryjob::FixedSourceStamp source(sample_job({}).source);
    tryjob::TryClient client(config, loop, source, output);
    code = client.run();
  }
};

}  // namespace

TEST(client_connect_method_names) {
  EXPECT_EQUAL("pb", tryjob::method_name(tryjob::ConnectMethod::pb));
  EXPECT_EQUAL("ssh", tryjob::method_name(tryjob::ConnectMethod::ssh));
  auto ssh = tryjob::parse_connect_method("ssh");
  ASSERT_TRUE((bool)ssh);
  EXPECT_TRUE(*ssh == tryjob::ConnectMethod::ssh);
  EXPECT_FALSE((bool)tryjob::parse_connect_method("PB"));
}

TEST(client_jobids_are_unique) {
  std::string a = tryjob::make_jobid();
  std::string b = tryjob::make_jobid();
  EXPECT_TRUE(a != b);
  size_t dash = a.find('-');
  ASSERT_TRUE(dash != std::string::npos && dash > 0) << a;
  EXPECT_EQUAL(std::string::npos, a.substr(0, dash).find_first_not_of("0123456789")) << a;
}

TEST(client_pb_without_wait) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a", "b"}));

  ClientRun run(pb_config(master, {"a"}), loop);
  EXPECT_EQUAL(0, run.code);
  EXPECT_EQUAL(plus(pb_preamble(), {"not waiting for builds to finish"}), run.output.lines);

  auto buildsets = master.store.get_buildsets();
  ASSERT_EQUAL(size_t(1), buildsets.size());
  EXPECT_EQUAL("alice", buildsets[0].info.who);
  EXPECT_EQUAL(size_t(1), master.store.get_build_requests(buildsets[0].id).size());
}

TEST(client_pb_waits_for_results) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::DeliveryConfig config = pb_config(master, {"a"});
  config.wait = true;
  ClientRun run(config, loop);
  EXPECT_EQUAL(0, run.code);
  EXPECT_EQUAL(plus(pb_preamble(), {"All Builds Complete", "a: success (finished)"}),
               run.output.lines);
}

TEST(client_pb_failed_build_exits_nonzero) {
  TempDir dir;
  tryjob::EventLoop loop;
  std::vector<tryjob::BuilderConfig> builders = instant_builders({"a", "b"});
  builders[0].command = "false";
  TestMaster master(loop, dir.path(), builders);

  tryjob::DeliveryConfig config = pb_config(master, {});
  config.wait = true;
  config.comment = tjl::some(std::string("please"));
  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_EQUAL(std::vector<std::string>({"using 'pb' connect method", "job created",
                                         "Delivering job; comment= please",
                                         "job has been delivered", "All Builds Complete",
                                         "a: failure (exit status 1)", "b: success (finished)"}),
               run.output.lines);
}

TEST(client_pb_lists_builders) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a", "b"}));

  tryjob::DeliveryConfig config = pb_config(master, {});
  config.list_builders = true;
  ClientRun run(config, loop);
  EXPECT_EQUAL(0, run.code);
  EXPECT_EQUAL(std::vector<std::string>(
                   {"using 'pb' connect method",
                    "The following builders are available for the try scheduler: ", "a", "b"}),
               run.output.lines);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(client_pb_unknown_builder) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  ClientRun run(pb_config(master, {"a", "nope"}), loop);
  EXPECT_EQUAL(1, run.code);
  ASSERT_EQUAL(size_t(4), run.output.lines.size());
  EXPECT_EQUAL("error: unknown builder: unknown builder nope", run.output.lines[3]);
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(client_pb_bad_password) {
  TempDir dir;
  tryjob::EventLoop loop;
  TestMaster master(loop, dir.path(), instant_builders({"a"}));

  tryjob::DeliveryConfig config = pb_config(master, {"a"});
  config.passwd = "guess";
  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_EQUAL("error: authentication failed: invalid login", run.output.lines.back());
  EXPECT_TRUE(master.store.get_buildsets().empty());
}

TEST(client_pb_unreachable_master) {
  TempDir dir;
  tryjob::EventLoop loop;
  uint16_t port;
  {
    TestMaster master(loop, dir.path(), instant_builders({"a"}));
    port = master.port;
  }

  tryjob::DeliveryConfig config;
  config.master = "127.0.0.1:" + std::to_string(port);
  config.connect_timeout = 5;
  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_TRUE(starts_with(run.output.lines.back(), "error: connect failed"))
      << run.output.lines.back();

  config.master = "no-port-here";
  ClientRun bad(config, loop);
  EXPECT_EQUAL(1, bad.code);
  EXPECT_TRUE(starts_with(bad.output.lines.back(), "error: ")) << bad.output.lines.back();
}

TEST(client_pb_connect_timeout) {
  tryjob::EventLoop loop;
  // Nothing ever accepts, so once the backlog is full a new connect
  // stays in progress.
  auto listener = tryjob::listen_tcp("127.0.0.1", 0, 0);
  ASSERT_TRUE((bool)listener);
  auto port = tryjob::local_port(listener->get());
  ASSERT_TRUE((bool)port);
  auto addresses = tryjob::resolve_tcp("127.0.0.1", *port);
  ASSERT_TRUE((bool)addresses);
  ASSERT_FALSE(addresses->empty());
  std::vector<tjl::unique_fd> queued;
  for (int i = 0; i < 4; ++i) {
    auto fd = tryjob::start_connect(addresses->front());
    ASSERT_TRUE((bool)fd);
    queued.emplace_back(std::move(*fd));
  }

  tryjob::NetworkTransport transport(loop, 1);
  double start = tryjob::monotonic_now();
  auto err = transport.connect("127.0.0.1", *port);
  double took = tryjob::monotonic_now() - start;
  ASSERT_TRUE((bool)err);
  EXPECT_TRUE(err->kind == tryjob::RpcErrorKind::Timeout) << tryjob::describe(*err);
  EXPECT_TRUE(took < 4) << took;
  EXPECT_FALSE(transport.connected());

  tryjob::DeliveryConfig config;
  config.master = "127.0.0.1:" + std::to_string(*port);
  config.connect_timeout = 1;
  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_TRUE(starts_with(run.output.lines.back(), "error: timeout")) << run.output.lines.back();
}

TEST(client_master_endpoint_forms) {
  auto named = tryjob::split_host_port("build.example.com:8031");
  ASSERT_TRUE((bool)named);
  EXPECT_EQUAL("build.example.com", named->first);
  EXPECT_EQUAL(int64_t(8031), int64_t(named->second));

  auto v6 = tryjob::split_host_port("[::1]:8010");
  ASSERT_TRUE((bool)v6);
  EXPECT_EQUAL("::1", v6->first);
  EXPECT_EQUAL(int64_t(8010), int64_t(v6->second));

  EXPECT_FALSE((bool)tryjob::split_host_port("[::1]"));
  EXPECT_FALSE((bool)tryjob::split_host_port("host:99999"));
}

TEST(client_ssh_local_jobdir) {
  TempDir dir;
  tryjob::EventLoop loop;
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::ssh;
  config.jobdir = dir.sub("jobdir");
  config.builders = {"a"};

  ClientRun run(config, loop);
  EXPECT_EQUAL(0, run.code);
  EXPECT_EQUAL(std::vector<std::string>({"using 'ssh' connect method", "job created",
                                         "job has been delivered",
                                         "not waiting for builds to finish"}),
               run.output.lines);

  auto maildir = tryjob::Maildir::create(config.jobdir);
  ASSERT_TRUE((bool)maildir);
  tryjob::PollResult found = maildir->poll();
  ASSERT_EQUAL(size_t(1), found.jobs.size());
  EXPECT_EQUAL(std::vector<std::string>({"a"}), found.jobs[0].builder_names);
  EXPECT_TRUE(found.jobs[0].source == sample_job({}).source);
}

TEST(client_ssh_wait_is_not_supported) {
  TempDir dir;
  tryjob::EventLoop loop;
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::ssh;
  config.jobdir = dir.sub("jobdir");
  config.wait = true;

  ClientRun run(config, loop);
  EXPECT_EQUAL(0, run.code);
  EXPECT_EQUAL("waiting for builds with ssh is not supported", run.output.lines.back());
}

TEST(client_ssh_cannot_list) {
  tryjob::EventLoop loop;
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::ssh;
  config.list_builders = true;

  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_EQUAL(std::vector<std::string>(
                   {"using 'ssh' connect method", "Cannot get available builders over ssh."}),
               run.output.lines);
}

TEST(client_ssh_without_jobdir) {
  tryjob::EventLoop loop;
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::ssh;

  ClientRun run(config, loop);
  EXPECT_EQUAL(1, run.code);
  EXPECT_EQUAL("error: no jobdir configured", run.output.lines.back());
}

TEST(client_ssh_remote_runs_tryserver) {
  TempDir dir;
  std::string fake = dir.sub("fake-ssh");
  ASSERT_TRUE(write_file(fake, "#!/bin/sh\necho \"$@\" > " + dir.sub("args") + "\ncat > " +
                                   dir.sub("received") + "\n"));
  ASSERT_EQUAL(0, chmod(fake.c_str(), 0755));

  tryjob::MailboxTarget target;
  target.host = "try.example.com";
  target.username = "alice";
  target.jobdir = "/srv/jobdir";
  target.ssh_command = fake + " -q";
  EXPECT_EQUAL(std::vector<std::string>({fake, "-q", "-l", "alice", "try.example.com",
                                         "tryjob-server", "--jobdir", "/srv/jobdir"}),
               tryjob::remote_command(target));

  tryjob::Job job = sample_job({"a"});
  auto delivered = tryjob::deliver_to_mailbox(target, job);
  ASSERT_TRUE((bool)delivered);
  EXPECT_EQUAL("try.example.com", *delivered);

  auto args = read_file(dir.sub("args"));
  ASSERT_TRUE((bool)args);
  EXPECT_EQUAL("-q -l alice try.example.com tryjob-server --jobdir /srv/jobdir\n", *args);
  auto received = read_file(dir.sub("received"));
  ASSERT_TRUE((bool)received);
  EXPECT_EQUAL(tryjob::encode(job), *received);
}

TEST(client_ssh_remote_failure) {
  TempDir dir;
  std::string fake = dir.sub("fake-ssh");
  ASSERT_TRUE(write_file(fake, "#!/bin/sh\ncat > /dev/null\nexit 5\n"));
  ASSERT_EQUAL(0, chmod(fake.c_str(), 0755));

  tryjob::MailboxTarget target;
  target.host = "try.example.com";
  target.jobdir = "/srv/jobdir";
  target.ssh_command = fake;
  auto delivered = tryjob::deliver_to_mailbox(target, sample_job({"a"}));
  ASSERT_FALSE((bool)delivered);
  EXPECT_EQUAL(fake + " exited with status 5", delivered.error());

  target.ssh_command = dir.sub("missing-ssh");
  auto missing = tryjob::deliver_to_mailbox(target, sample_job({"a"}));
  ASSERT_FALSE((bool)missing);
  EXPECT_EQUAL("could not run " + dir.sub("missing-ssh"), missing.error());
}

TEST(client_dryrun_delivers_nothing) {
  TempDir dir;
  tryjob::EventLoop loop;
  tryjob::DeliveryConfig config;
  config.connect = tryjob::ConnectMethod::ssh;
  config.jobdir = dir.sub("jobdir");
  config.dryrun = true;
  config.builders = {"a", "b"};
  config.who = "alice";

  ClientRun run(config, loop);
  EXPECT_EQUAL(0, run.code);
  ASSERT_TRUE(run.output.lines.size() > 3);
  EXPECT_EQUAL("job created", run.output.lines[1]);
  EXPECT_EQUAL("Job:", run.output.lines[2]);
  bool saw_builders = false;
  for (const auto& line : run.output.lines) {
    if (line == "Job: builders: a, b") saw_builders = true;
  }
  EXPECT_TRUE(saw_builders);
  EXPECT_EQUAL("Job: comment: None", run.output.lines.back());
  EXPECT_TRUE(list_dir(tjl::join_paths(config.jobdir, "new")).empty());
}

TEST(client_diff_source_stamp) {
  TempDir dir;
  tryjob::SourceStamp base;
  base.branch = tjl::some(std::string("dev"));
  base.revision = "abc";

  tryjob::DiffSourceStamp none(base, "", 1);
  auto plain = none.get();
  ASSERT_TRUE((bool)plain);
  EXPECT_FALSE((bool)plain->patch);
  EXPECT_EQUAL("abc", plain->revision);

  std::string diff = dir.sub("change.diff");
  ASSERT_TRUE(write_file(diff, "--- a\n+++ b\n"));
  tryjob::DiffSourceStamp file(base, diff, 2);
  auto patched = file.get();
  ASSERT_TRUE((bool)patched);
  ASSERT_TRUE((bool)patched->patch);
  EXPECT_EQUAL(int64_t(2), patched->patch->level);
  EXPECT_EQUAL("--- a\n+++ b\n", patched->patch->body);

  tryjob::DiffSourceStamp missing(base, dir.sub("nope.diff"), 1);
  auto err = missing.get();
  ASSERT_FALSE((bool)err);
  EXPECT_EQUAL("cannot read diff " + dir.sub("nope.diff"), err.error());
}
