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

#include "tryjob/ingress.h"
#include "tryjob/sqlite_store.h"

#include "fixture.h"
#include "unit.h"

using tryjob::BuildResult;

TEST(store_result_names) {
  EXPECT_EQUAL("pending", tryjob::result_name(BuildResult::pending));
  EXPECT_EQUAL("exception", tryjob::result_name(BuildResult::exception));
  auto parsed = tryjob::parse_build_result("failure");
  ASSERT_TRUE((bool)parsed);
  EXPECT_TRUE(*parsed == BuildResult::failure);
  EXPECT_FALSE((bool)tryjob::parse_build_result("warnings"));
  EXPECT_FALSE(tryjob::is_terminal(BuildResult::running));
  EXPECT_TRUE(tryjob::is_terminal(BuildResult::exception));
}

TEST(store_buildset_keeps_source_and_info) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));

  tryjob::Job job = sample_job({"a", "b"});
  tryjob::BuildsetInfo info;
  info.reason = "testing";
  info.comment = tjl::some(std::string("a comment"));
  info.jobid = job.jobid;
  info.who = "alice";
  info.scheduler = "try";
  info.properties["k"] = "v";

  int64_t id = store.create_buildset(job.source, job.builder_names, info);
  auto buildset = store.get_buildset(id);
  ASSERT_TRUE((bool)buildset);
  EXPECT_EQUAL(id, buildset->id);
  EXPECT_TRUE(buildset->source == job.source);
  EXPECT_EQUAL("testing", buildset->info.reason);
  EXPECT_TRUE(buildset->info.comment == info.comment);
  EXPECT_EQUAL(job.jobid, buildset->info.jobid);
  EXPECT_EQUAL("try", buildset->info.scheduler);
  EXPECT_TRUE(buildset->info.properties == info.properties);
  EXPECT_FALSE(buildset->complete);

  auto requests = store.get_build_requests(id);
  ASSERT_EQUAL(size_t(2), requests.size());
  EXPECT_EQUAL("a", requests[0].builder);
  EXPECT_EQUAL("b", requests[1].builder);
  for (const auto& request : requests) {
    EXPECT_TRUE(request.result == BuildResult::pending);
    EXPECT_EQUAL(id, request.buildset);
  }

  EXPECT_FALSE((bool)store.get_buildset(id + 100));
}

TEST(store_survives_reopen) {
  TempDir dir;
  int64_t id;
  {
    tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
    tryjob::Job job = sample_job({"a"});
    id = store.create_buildset(job.source, job.builder_names, tryjob::BuildsetInfo());
  }
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  EXPECT_EQUAL(size_t(1), store.get_buildsets().size());
  EXPECT_TRUE((bool)store.get_buildset(id));
}

TEST(store_numbers_count_per_builder) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::Job job = sample_job({"a"});

  int64_t first = store.create_buildset(job.source, {"a"}, tryjob::BuildsetInfo());
  int64_t second = store.create_buildset(job.source, {"a", "b"}, tryjob::BuildsetInfo());
  int64_t third = store.create_buildset(job.source, {"a"}, tryjob::BuildsetInfo());

  EXPECT_EQUAL(int64_t(1), store.get_build_requests(first)[0].number);
  auto two = store.get_build_requests(second);
  ASSERT_EQUAL(size_t(2), two.size());
  EXPECT_EQUAL(int64_t(2), two[0].number);
  EXPECT_EQUAL(int64_t(1), two[1].number);
  EXPECT_EQUAL(int64_t(3), store.get_build_requests(third)[0].number);
}

TEST(store_claim_and_finish) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::Job job = sample_job({"a", "b"});

  int64_t one = store.create_buildset(job.source, {"a", "b"}, tryjob::BuildsetInfo());
  int64_t two = store.create_buildset(job.source, {"a"}, tryjob::BuildsetInfo());

  EXPECT_TRUE(store.claim_pending(0).empty());

  auto claimed = store.claim_pending(2);
  ASSERT_EQUAL(size_t(2), claimed.size());
  for (const auto& request : claimed) {
    EXPECT_EQUAL(one, request.buildset);
    EXPECT_TRUE(request.result == BuildResult::running);
  }

  store.finish_build_request(claimed[0].id, BuildResult::success, "finished");
  EXPECT_FALSE(store.get_buildset(one)->complete);
  store.finish_build_request(claimed[1].id, BuildResult::failure, "exit status 1");
  EXPECT_TRUE(store.get_buildset(one)->complete);
  EXPECT_FALSE(store.get_buildset(two)->complete);

  auto requests = store.get_build_requests(one);
  ASSERT_EQUAL(size_t(2), requests.size());
  for (const auto& request : requests) {
    EXPECT_TRUE(tryjob::is_terminal(request.result));
  }

  auto rest = store.claim_pending(10);
  ASSERT_EQUAL(size_t(1), rest.size());
  EXPECT_EQUAL(two, rest[0].buildset);
  EXPECT_TRUE(store.claim_pending(10).empty());
}

TEST(ingress_resolves_builders) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::JobIngress ingress(store, "try", {"a", "b"});

  auto all = ingress.resolve({});
  ASSERT_TRUE((bool)all);
  EXPECT_EQUAL(std::vector<std::string>({"a", "b"}), *all);

  auto some = ingress.resolve({"b"});
  ASSERT_TRUE((bool)some);
  EXPECT_EQUAL(std::vector<std::string>({"b"}), *some);

  auto bad = ingress.resolve({"a", "x", "y"});
  ASSERT_FALSE((bool)bad);
  EXPECT_EQUAL(std::vector<std::string>({"x", "y"}), bad.error().unknown);
  EXPECT_EQUAL("unknown builders x, y", tryjob::describe(bad.error()));

  tryjob::JobIngress empty(store, "none", {});
  auto nothing = empty.resolve({});
  ASSERT_FALSE((bool)nothing);
  EXPECT_EQUAL("no builders are configured for this scheduler", tryjob::describe(nothing.error()));
}

TEST(ingress_submit_creates_one_buildset) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::JobIngress ingress(store, "try", {"a", "b"});

  tryjob::Job job = sample_job({"a"});
  auto ack = ingress.submit(job);
  ASSERT_TRUE((bool)ack);
  EXPECT_EQUAL(std::vector<std::string>({"a"}), ack->builders);

  auto buildsets = store.get_buildsets();
  ASSERT_EQUAL(size_t(1), buildsets.size());
  EXPECT_EQUAL(ack->buildset, buildsets[0].id);
  EXPECT_EQUAL("'try' job by user alice", buildsets[0].info.reason);
  EXPECT_EQUAL(job.jobid, buildsets[0].info.jobid);
  EXPECT_EQUAL("try", buildsets[0].info.scheduler);
  EXPECT_TRUE(buildsets[0].source == job.source);
}

TEST(ingress_rejection_writes_nothing) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::JobIngress ingress(store, "try", {"a"});

  auto ack = ingress.submit(sample_job({"a", "nope"}));
  ASSERT_FALSE((bool)ack);
  EXPECT_EQUAL(std::vector<std::string>({"nope"}), ack.error().unknown);
  EXPECT_TRUE(store.get_buildsets().empty());
}

TEST(ingress_empty_selection_uses_whitelist) {
  TempDir dir;
  tryjob::SqliteBuildsetStore store(dir.sub("state.sqlite"));
  tryjob::JobIngress ingress(store, "try", {"a", "b"});

  auto ack = ingress.submit(sample_job({}));
  ASSERT_TRUE((bool)ack);
  auto requests = store.get_build_requests(ack->buildset);
  ASSERT_EQUAL(size_t(2), requests.size());
  EXPECT_EQUAL("a", requests[0].builder);
  EXPECT_EQUAL("b", requests[1].builder);
}
