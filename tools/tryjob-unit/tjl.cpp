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

#include <errno.h>
#include <sys/stat.h>
#include <tjl/defer.h>
#include <tjl/filepath.h>
#include <tjl/optional.h>
#include <tjl/result.h>
#include <tjl/tracing.h>
#include <tjl/unique_fd.h>
#include <tjl/xoshiro_256.h>

#include <memory>
#include <set>
#include <sstream>

#include "fixture.h"
#include "unit.h"
#include "util/arg_parser.h"

TEST(result_error_and_value) {
  tjl::result<int, std::string> err = tjl::result_error<int>(std::string("nope"));
  EXPECT_FALSE((bool)err);
  EXPECT_EQUAL("nope", err.error());

  tjl::result<int, std::string> value = tjl::result_value<std::string>(10);
  ASSERT_TRUE((bool)value);
  EXPECT_EQUAL(10, *value);
}

TEST(result_move_only_value) {
  auto res = tjl::make_result<std::unique_ptr<int>, int>(new int(5));
  ASSERT_TRUE((bool)res);
  std::unique_ptr<int> owned = std::move(*res);
  EXPECT_EQUAL(5, *owned);

  tjl::result<std::unique_ptr<int>, int> moved = std::move(res);
  EXPECT_TRUE((bool)moved);
}

TEST(result_move_assign) {
  tjl::result<std::string, int> a = tjl::result_value<int>(std::string("a"));
  tjl::result<std::string, int> b = tjl::result_error<std::string>(3);
  a = std::move(b);
  ASSERT_FALSE((bool)a);
  EXPECT_EQUAL(3, a.error());
}

TEST(optional_some_and_reset) {
  tjl::optional<std::string> x = tjl::some(std::string("hi"));
  ASSERT_TRUE((bool)x);
  EXPECT_EQUAL("hi", *x);
  EXPECT_EQUAL(size_t(2), x->size());

  tjl::optional<std::string> y = x;
  EXPECT_TRUE(x == y);
  x = {};
  EXPECT_FALSE((bool)x);
  EXPECT_FALSE(x == y);
}

TEST(defer_runs_unless_nullified) {
  int runs = 0;
  {
    auto d = tjl::make_defer([&runs]() { ++runs; });
  }
  EXPECT_EQUAL(1, runs);
  {
    auto d = tjl::make_defer([&runs]() { ++runs; });
    d.nullify();
  }
  EXPECT_EQUAL(1, runs);
}

TEST(unique_fd_open_missing_file) {
  auto fd = tjl::unique_fd::open("/nonexistent/tryjob/file", O_RDONLY);
  ASSERT_FALSE((bool)fd);
  EXPECT_EQUAL(ENOENT, fd.error());
}

TEST(log_error_event_fields) {
  tjl::log::Event ev = tjl::log::error("disk %s at %d%%", "full", 97);
  ASSERT_TRUE(ev.get(tjl::log::LOG_MESSAGE) != nullptr);
  EXPECT_EQUAL("disk full at 97%", *ev.get(tjl::log::LOG_MESSAGE));
  ASSERT_TRUE(ev.get(tjl::log::LOG_LEVEL) != nullptr);
  EXPECT_EQUAL("error", *ev.get(tjl::log::LOG_LEVEL));
  EXPECT_TRUE(ev.get(tjl::log::LOG_PID) != nullptr);
  EXPECT_TRUE(ev.get(tjl::log::LOG_TIME) != nullptr);
  EXPECT_FALSE(ev.is_urgent());
  EXPECT_EQUAL(size_t(4), ev.items.size());
}

TEST(join_paths_slashes) {
  EXPECT_EQUAL("a/b", tjl::join_paths("a", "b"));
  EXPECT_EQUAL("a/b", tjl::join_paths("a/", "b"));
  EXPECT_EQUAL("a/b", tjl::join_paths("a", "/b"));
  EXPECT_EQUAL("b", tjl::join_paths("", "b"));
  EXPECT_EQUAL("/x/y/z", tjl::join_paths("/x", "y", "z"));
  EXPECT_TRUE(tjl::is_relative("x/y"));
  EXPECT_FALSE(tjl::is_relative("/x"));
}

TEST(mkdir_with_parents_nested) {
  TempDir dir;
  std::string deep = dir.sub("a/b/c");
  EXPECT_EQUAL(0, tjl::mkdir_with_parents(deep, 0755));

  struct stat buf;
  ASSERT_EQUAL(0, stat(deep.c_str(), &buf));
  EXPECT_TRUE(S_ISDIR(buf.st_mode));

  // Already existing is fine.
  EXPECT_EQUAL(0, tjl::mkdir_with_parents(deep, 0755));

  ASSERT_TRUE(write_file(dir.sub("file"), "x"));
  EXPECT_EQUAL(ENOTDIR, tjl::mkdir_with_parents(dir.sub("file/sub"), 0755));
}

TEST(directory_range_lists_entries) {
  TempDir dir;
  ASSERT_TRUE(write_file(dir.sub("one"), "1"));
  ASSERT_TRUE(write_file(dir.sub("two"), "2"));
  ASSERT_EQUAL(0, tjl::mkdir_with_parents(dir.sub("sub"), 0755));

  auto range = tjl::directory_range::open(dir.path());
  ASSERT_TRUE((bool)range);
  std::set<std::string> files;
  std::set<std::string> dirs;
  for (const auto& entry : *range) {
    ASSERT_TRUE((bool)entry);
    if (entry->type == tjl::file_type::regular) files.insert(entry->name);
    if (entry->type == tjl::file_type::directory) dirs.insert(entry->name);
  }
  EXPECT_EQUAL(size_t(2), files.size());
  EXPECT_EQUAL(size_t(1), dirs.size());
  EXPECT_TRUE(dirs.count("sub") == 1);
}

TEST(unique_name_is_hex) {
  tjl::xoshiro_256 rng(std::make_tuple(1, 2, 3, 4));
  std::string a = rng.unique_name();
  std::string b = rng.unique_name();
  EXPECT_EQUAL(size_t(32), a.size());
  EXPECT_TRUE(a != b);
  EXPECT_EQUAL(std::string::npos, a.find_first_not_of("0123456789abcdef"));
}

TEST(arg_parser_forms) {
  tjl::Argument master("--master");
  tjl::ListArgument builder("--builder");
  tjl::Flag wait("--wait");
  tjl::ArgParser parser;
  parser.arg(master).list(builder).flag(wait);

  const char* argv[] = {"tryjob", "--master=host:1", "--builder", "a", "--wait", "--builder=b"};
  std::stringstream errs;
  ASSERT_TRUE(parser.parse(6, argv, errs)) << errs.str();
  ASSERT_TRUE((bool)master.value);
  EXPECT_EQUAL("host:1", *master.value);
  EXPECT_EQUAL(std::vector<std::string>({"a", "b"}), builder.values);
  EXPECT_TRUE(wait.value);
}

TEST(arg_parser_rejects_unknown_and_missing) {
  tjl::Argument master("--master");
  tjl::Flag wait("--wait");
  tjl::ArgParser parser;
  parser.arg(master).flag(wait);

  std::stringstream errs;
  const char* unknown[] = {"tryjob", "--bogus"};
  EXPECT_FALSE(parser.parse(2, unknown, errs));
  EXPECT_TRUE(errs.str().find("--bogus") != std::string::npos);

  const char* missing[] = {"tryjob", "--master"};
  EXPECT_FALSE(parser.parse(2, missing, errs));

  const char* flag_value[] = {"tryjob", "--wait=yes"};
  EXPECT_FALSE(parser.parse(2, flag_value, errs));
}
