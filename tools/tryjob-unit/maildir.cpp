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

#include "tryjob/maildir.h"

#include <sys/stat.h>

#include <set>

#include "fixture.h"
#include "tjl/filepath.h"
#include "unit.h"

TEST(maildir_create_makes_layout) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.sub("jobs/inbox"));
  ASSERT_TRUE((bool)maildir);

  for (const char* sub : {"new", "tmp", "cur"}) {
    struct stat buf;
    std::string path = dir.sub(std::string("jobs/inbox/") + sub);
    ASSERT_EQUAL(0, stat(path.c_str(), &buf)) << path;
    EXPECT_TRUE(S_ISDIR(buf.st_mode));
  }

  // Creating it again over the existing layout is fine.
  EXPECT_TRUE((bool)tryjob::Maildir::create(dir.sub("jobs/inbox")));
}

TEST(maildir_deliver_lands_in_new) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.path());
  ASSERT_TRUE((bool)maildir);

  tryjob::Job job = sample_job({"a"});
  auto entry = maildir->deliver(job);
  ASSERT_TRUE((bool)entry);

  EXPECT_EQUAL(std::vector<std::string>({*entry}), list_dir(maildir->new_dir()));
  EXPECT_TRUE(list_dir(maildir->tmp_dir()).empty());

  auto content = read_file(tjl::join_paths(maildir->new_dir(), *entry));
  ASSERT_TRUE((bool)content);
  EXPECT_EQUAL(tryjob::encode(job), *content);
}

TEST(maildir_names_never_collide) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.path());
  ASSERT_TRUE((bool)maildir);

  std::set<std::string> names;
  for (int i = 0; i < 50; ++i) {
    auto entry = maildir->deliver_bytes("x");
    ASSERT_TRUE((bool)entry);
    names.insert(*entry);
  }
  EXPECT_EQUAL(size_t(50), names.size());
  EXPECT_EQUAL(size_t(50), list_dir(maildir->new_dir()).size());
}

TEST(maildir_poll_moves_to_cur) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.path());
  ASSERT_TRUE((bool)maildir);

  tryjob::Job one = sample_job({"a"});
  tryjob::Job two = sample_job({"b"});
  two.jobid = "second";
  ASSERT_TRUE((bool)maildir->deliver(one));
  ASSERT_TRUE((bool)maildir->deliver(two));

  tryjob::PollResult result = maildir->poll();
  EXPECT_TRUE(result.errors.empty());
  ASSERT_EQUAL(size_t(2), result.jobs.size());
  std::set<std::string> ids;
  for (const auto& job : result.jobs) ids.insert(job.jobid);
  EXPECT_TRUE(ids.count(one.jobid) == 1);
  EXPECT_TRUE(ids.count("second") == 1);

  EXPECT_TRUE(list_dir(maildir->new_dir()).empty());
  EXPECT_EQUAL(size_t(2), list_dir(maildir->cur_dir()).size());

  // Nothing left, nothing found.
  tryjob::PollResult again = maildir->poll();
  EXPECT_TRUE(again.jobs.empty());
  EXPECT_TRUE(again.errors.empty());
}

TEST(maildir_poll_leaves_malformed_entries) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.path());
  ASSERT_TRUE((bool)maildir);

  auto bad = maildir->deliver_bytes("this is not a job");
  ASSERT_TRUE((bool)bad);
  ASSERT_TRUE((bool)maildir->deliver(sample_job({"a"})));

  tryjob::PollResult result = maildir->poll();
  ASSERT_EQUAL(size_t(1), result.jobs.size());
  ASSERT_EQUAL(size_t(1), result.errors.size());
  EXPECT_EQUAL(*bad, result.errors[0].entry);
  EXPECT_FALSE(result.errors[0].error.why.empty());

  EXPECT_EQUAL(std::vector<std::string>({*bad}), list_dir(maildir->new_dir()));
  EXPECT_EQUAL(size_t(1), list_dir(maildir->cur_dir()).size());
}

TEST(maildir_poll_skips_directories) {
  TempDir dir;
  auto maildir = tryjob::Maildir::create(dir.path());
  ASSERT_TRUE((bool)maildir);
  ASSERT_EQUAL(0, tjl::mkdir_with_parents(tjl::join_paths(maildir->new_dir(), "subdir"), 0755));

  tryjob::PollResult result = maildir->poll();
  EXPECT_TRUE(result.jobs.empty());
  EXPECT_TRUE(result.errors.empty());
}
