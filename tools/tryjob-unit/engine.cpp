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

#include "tryjob/build_engine.h"

#include <sys/stat.h>

#include <algorithm>

#include "fixture.h"
#include "tjl/filepath.h"
#include "tryjob/sqlite_store.h"
#include "unit.h"

using tryjob::BuildResult;

namespace {

struct EngineRig {
  TempDir dir;
  tryjob::EventLoop loop;
  tryjob::SqliteBuildsetStore store;
  tryjob::LocalBuildEngine engine;

  static tryjob::LocalEngineOptions fast(size_t max_parallel) {
    tryjob::LocalEngineOptions options;
    options.poll_interval = 0.02;
    options.max_parallel = max_parallel;
    return options;
  }

  EngineRig(const std::vector<tryjob::BuilderConfig>& builders, size_t max_parallel = 4)
      : store(dir.sub("state.sqlite")), engine(loop, store, builders, fast(max_parallel)) {}

  int64_t submit(const std::vector<std::string>& builders) {
    tryjob::Job job = sample_job(builders);
    return store.create_buildset(job.source, builders, tryjob::BuildsetInfo());
  }

  bool wait_complete(int64_t buildset) {
    return loop.run_until([&]() { return store.get_buildset(buildset)->complete; }, 10);
  }
};

tryjob::BuilderConfig shell_builder(const std::string& name, const std::string& command) {
  tryjob::BuilderConfig out;
  out.name = name;
  out.command = command;
  return out;
}

}  // namespace

TEST(engine_instant_builder_succeeds) {
  EngineRig rig(instant_builders({"a"}));
  int64_t id = rig.submit({"a"});
  rig.engine.start();
  ASSERT_TRUE(rig.wait_complete(id));

  auto requests = rig.store.get_build_requests(id);
  ASSERT_EQUAL(size_t(1), requests.size());
  EXPECT_TRUE(requests[0].result == BuildResult::success);
  EXPECT_EQUAL("finished", requests[0].detail);
}

TEST(engine_records_exit_status) {
  EngineRig rig({shell_builder("ok", "true"), shell_builder("bad", "exit 3")});
  int64_t id = rig.submit({"ok", "bad"});
  rig.engine.start();
  ASSERT_TRUE(rig.wait_complete(id));

  auto requests = rig.store.get_build_requests(id);
  ASSERT_EQUAL(size_t(2), requests.size());
  // Ordered by builder name.
  EXPECT_EQUAL("bad", requests[0].builder);
  EXPECT_TRUE(requests[0].result == BuildResult::failure);
  EXPECT_EQUAL("exit status 3", requests[0].detail);
  EXPECT_EQUAL("ok", requests[1].builder);
  EXPECT_TRUE(requests[1].result == BuildResult::success);
  EXPECT_EQUAL(size_t(0), rig.engine.running_count());
}

TEST(engine_unknown_builder_is_an_exception) {
  EngineRig rig(instant_builders({"a"}));
  int64_t id = rig.submit({"ghost"});
  rig.engine.start();
  ASSERT_TRUE(rig.wait_complete(id));

  auto requests = rig.store.get_build_requests(id);
  ASSERT_EQUAL(size_t(1), requests.size());
  EXPECT_TRUE(requests[0].result == BuildResult::exception);
  EXPECT_EQUAL("no such builder on this master", requests[0].detail);
}

TEST(engine_passes_source_to_command) {
  TempDir out;
  std::string report = out.sub("report");
  EngineRig rig({shell_builder(
      "env", "echo \"$TRYJOB_BUILDER $TRYJOB_BRANCH $TRYJOB_REVISION $TRYJOB_PATCH_LEVEL\" > " +
                 report + " && cat \"$TRYJOB_PATCH_FILE\" >> " + report)});
  int64_t id = rig.submit({"env"});
  rig.engine.start();
  ASSERT_TRUE(rig.wait_complete(id));

  auto requests = rig.store.get_build_requests(id);
  ASSERT_EQUAL(size_t(1), requests.size());
  EXPECT_TRUE(requests[0].result == BuildResult::success) << requests[0].detail;

  tryjob::Job job = sample_job({"env"});
  auto content = read_file(report);
  ASSERT_TRUE((bool)content);
  EXPECT_EQUAL("env main 1234abcd 1\n" + job.source.patch->body, *content);
}

TEST(engine_runs_in_workdir_and_logs) {
  TempDir work;
  tryjob::BuilderConfig builder = shell_builder("w", "pwd; echo to-stderr >&2");
  builder.workdir = work.path();

  TempDir logs;
  tryjob::EventLoop loop;
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::LocalEngineOptions options;
  options.poll_interval = 0.02;
  options.log_dir = logs.path();
  tryjob::LocalBuildEngine engine(loop, store, {builder}, options);

  tryjob::Job job = sample_job({"w"});
  int64_t id = store.create_buildset(job.source, {"w"}, tryjob::BuildsetInfo());
  engine.start();
  ASSERT_TRUE(loop.run_until([&]() { return store.get_buildset(id)->complete; }, 10));

  auto log = read_file(logs.sub("w-1.log"));
  ASSERT_TRUE((bool)log);
  EXPECT_TRUE(log->find("to-stderr\n") != std::string::npos) << *log;
  EXPECT_TRUE(log->find(work.path()) != std::string::npos) << *log;
}

TEST(engine_respects_max_parallel) {
  EngineRig rig({shell_builder("a", "sleep 0.1"), shell_builder("b", "sleep 0.1"),
                 shell_builder("c", "sleep 0.1")},
                1);
  int64_t id = rig.submit({"a", "b", "c"});

  size_t most = 0;
  auto watcher =
      rig.loop.call_every(0.01, [&]() { most = std::max(most, rig.engine.running_count()); });
  rig.engine.start();
  ASSERT_TRUE(rig.wait_complete(id));
  rig.loop.cancel(watcher);

  EXPECT_EQUAL(size_t(1), most);
  for (const auto& request : rig.store.get_build_requests(id)) {
    EXPECT_TRUE(request.result == BuildResult::success);
  }
}

TEST(engine_stop_kills_running_builds) {
  EngineRig rig({shell_builder("slow", "exec sleep 30")});
  int64_t id = rig.submit({"slow"});
  rig.engine.start();
  ASSERT_TRUE(rig.loop.run_until([&]() { return rig.engine.running_count() == 1; }, 10));

  rig.engine.stop();
  EXPECT_EQUAL(size_t(0), rig.engine.running_count());

  auto requests = rig.store.get_build_requests(id);
  ASSERT_EQUAL(size_t(1), requests.size());
  EXPECT_TRUE(requests[0].result == BuildResult::exception);
  EXPECT_EQUAL("killed by signal 15", requests[0].detail);
  EXPECT_TRUE(rig.store.get_buildset(id)->complete);
}
