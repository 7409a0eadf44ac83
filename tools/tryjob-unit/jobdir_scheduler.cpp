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

#include "tryjob/jobdir_scheduler.h"

#include "fixture.h"
#include "tryjob/sqlite_store.h"
#include "unit.h"

namespace {

struct JobdirRig {
  TempDir dir;
  tryjob::EventLoop loop;
  tryjob::SqliteBuildsetStore store;
  tryjob::Maildir inbox;
  tryjob::JobdirScheduler scheduler;

  static tryjob::Maildir make_inbox(const std::string& path) {
    auto maildir = tryjob::Maildir::create(path);
    if (!maildir) tjl::log::fatal("could not create %s", path.c_str());
    return std::move(*maildir);
  }

  static tryjob::JobdirOptions options() {
    tryjob::JobdirOptions out;
    out.name = "try-ssh";
    out.builders = {"a", "b"};
    out.poll_interval = 0.02;
    return out;
  }

  JobdirRig()
      : store(dir.sub("state.sqlite")),
        inbox(make_inbox(dir.sub("jobdir"))),
        scheduler(loop, store, make_inbox(dir.sub("jobdir")), options()) {}
};

}  // namespace

TEST(jobdir_one_buildset_per_job) {
  JobdirRig rig;
  ASSERT_TRUE((bool)rig.inbox.deliver(sample_job({"a"})));
  tryjob::Job other = sample_job({"a", "b"});
  other.jobid = "other";
  ASSERT_TRUE((bool)rig.inbox.deliver(other));

  EXPECT_EQUAL(size_t(2), rig.scheduler.poll());
  auto buildsets = rig.store.get_buildsets();
  ASSERT_EQUAL(size_t(2), buildsets.size());
  for (const auto& buildset : buildsets) {
    EXPECT_EQUAL("try-ssh", buildset.info.scheduler);
  }

  // Consumed entries are not seen twice.
  EXPECT_EQUAL(size_t(0), rig.scheduler.poll());
  EXPECT_EQUAL(size_t(2), rig.store.get_buildsets().size());
  EXPECT_TRUE(list_dir(rig.inbox.new_dir()).empty());
}

TEST(jobdir_unknown_builder_is_consumed) {
  JobdirRig rig;
  ASSERT_TRUE((bool)rig.inbox.deliver(sample_job({"a", "zzz"})));

  EXPECT_EQUAL(size_t(0), rig.scheduler.poll());
  EXPECT_TRUE(rig.store.get_buildsets().empty());
  EXPECT_TRUE(list_dir(rig.inbox.new_dir()).empty());
  EXPECT_EQUAL(size_t(1), list_dir(rig.inbox.cur_dir()).size());

  EXPECT_EQUAL(size_t(0), rig.scheduler.poll());
}

TEST(jobdir_malformed_entry_does_not_block) {
  JobdirRig rig;
  ASSERT_TRUE((bool)rig.inbox.deliver_bytes("5:garbage"));
  ASSERT_TRUE((bool)rig.inbox.deliver(sample_job({})));

  EXPECT_EQUAL(size_t(1), rig.scheduler.poll());
  EXPECT_EQUAL(size_t(1), list_dir(rig.inbox.new_dir()).size());

  auto buildsets = rig.store.get_buildsets();
  ASSERT_EQUAL(size_t(1), buildsets.size());
  EXPECT_EQUAL(size_t(2), rig.store.get_build_requests(buildsets[0].id).size());
}

TEST(jobdir_timer_polls) {
  JobdirRig rig;
  EXPECT_FALSE(rig.scheduler.active());
  rig.scheduler.start();
  EXPECT_TRUE(rig.scheduler.active());

  ASSERT_TRUE((bool)rig.inbox.deliver(sample_job({"b"})));
  EXPECT_TRUE(rig.loop.run_until([&]() { return rig.store.get_buildsets().size() == 1; }, 10));

  rig.scheduler.stop();
  EXPECT_FALSE(rig.scheduler.active());

  // Jobs arriving while stopped wait in new/.
  ASSERT_TRUE((bool)rig.inbox.deliver(sample_job({"a"})));
  rig.loop.run_until([]() { return false; }, 0.1);
  EXPECT_EQUAL(size_t(1), rig.store.get_buildsets().size());
  EXPECT_EQUAL(size_t(1), list_dir(rig.inbox.new_dir()).size());
}
