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

#include <csetjmp>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "json/json5.h"
#include "tjl/tracing.h"
#include "util/term.h"

// One failed expectation.
struct ErrorMessage {
  const char* test_name;
  const char* file;
  int line;

  // What the harness found
  std::stringstream predicate_error;

  // Extra context streamed in by the test
  std::stringstream user_error;
};

// Returned by every EXPECT_* and ASSERT_*. Tests can stream extra
// context into it. A failed ASSERT_* longjmps back to the runner when
// this goes out of scope.
struct TestStream {
  std::stringstream* ss;
  std::jmp_buf* assert_throw;
  TestStream(std::stringstream* ss_, std::jmp_buf* assert_) : ss(ss_), assert_throw(assert_) {}
  ~TestStream() {
    if (assert_throw) std::longjmp(*assert_throw, 1);
  }
  template <class T>
  TestStream& operator<<(T&& x) {
    if (ss) *ss << x;
    return *this;
  }
};

inline std::string show_value(const std::string& x) {
  return "(" + std::to_string(x.size()) + ")\"" + json_escape(x) + "\"";
}
inline std::string show_value(const char* x) { return show_value(std::string(x)); }
inline std::string show_value(int x) { return std::to_string(x); }
inline std::string show_value(long x) { return std::to_string(x); }
inline std::string show_value(long long x) { return std::to_string(x); }
inline std::string show_value(unsigned x) { return std::to_string(x); }
inline std::string show_value(unsigned long x) { return std::to_string(x); }
inline std::string show_value(unsigned long long x) { return std::to_string(x); }
inline std::string show_value(bool x) { return x ? "true" : "false"; }

struct TestLogger {
  // stringstream is not copyable on every libstdc++, hence unique_ptr.
  std::vector<std::unique_ptr<ErrorMessage>> errors;
  std::jmp_buf return_jmp_buffer;
  const char* test_name = nullptr;

 private:
  ErrorMessage& record(int line, const char* file) {
    errors.emplace_back(new ErrorMessage);
    ErrorMessage& err = *errors.back();
    err.test_name = test_name;
    err.file = file;
    err.line = line;
    return err;
  }

  TestStream fail(ErrorMessage& err, bool assert) {
    return TestStream(&err.user_error, assert ? &return_jmp_buffer : nullptr);
  }

  TestStream mismatch(bool assert, const std::string& expected, const std::string& actual,
                      int line, const char* file) {
    ErrorMessage& err = record(line, file);
    err.predicate_error << "Expected:\n\t" << term_colour(TERM_MAGENTA) << expected;
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual;
    err.predicate_error << term_normal() << std::endl;
    tjl::log::info("expected %s but got %s at %s:%d", expected.c_str(), actual.c_str(), file,
                   line)();
    return fail(err, assert);
  }

 public:
  TestStream expect(bool assert, bool expected, bool cond, const char* cond_str, int line,
                    const char* file) {
    if (cond == expected) return TestStream(nullptr, nullptr);
    ErrorMessage& err = record(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << cond_str << "`";
    err.predicate_error << term_normal() << " to be " << term_colour(TERM_MAGENTA)
                        << show_value(expected);
    err.predicate_error << term_normal() << std::endl;
    tjl::log::info("expected `%s` to be %s", cond_str, show_value(expected).c_str())();
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, const std::string& expected, const std::string& actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    return mismatch(assert, show_value(expected), show_value(actual), line, file);
  }

  TestStream expect_equal(bool assert, const char* expected, const std::string& actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    return expect_equal(assert, std::string(expected), actual, expected_str, actual_str, line,
                        file);
  }

  TestStream expect_equal(bool assert, int64_t expected, int64_t actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    return mismatch(assert, show_value((long long)expected), show_value((long long)actual), line,
                    file);
  }

  TestStream expect_equal(bool assert, const std::vector<std::string>& expected,
                          const std::vector<std::string>& actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected.size() != actual.size()) {
      ErrorMessage& err = record(line, file);
      err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << actual_str
                          << term_normal() << " to have " << expected.size()
                          << " elements, but it has " << actual.size() << ":\n";
      for (const auto& item : actual) err.predicate_error << "\t" << show_value(item) << "\n";
      tjl::log::info("expected %zu elements in %s but found %zu", expected.size(), actual_str,
                     actual.size())();
      return fail(err, assert);
    }

    for (size_t i = 0; i < expected.size(); ++i) {
      if (expected[i] == actual[i]) continue;
      ErrorMessage& err = record(line, file);
      err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << expected_str
                          << term_normal() << " and " << term_colour(TERM_MAGENTA) << actual_str
                          << term_normal() << " to be equal, but at index " << i << ":\n\t"
                          << show_value(expected[i]) << "\n\t" << show_value(actual[i])
                          << std::endl;
      tjl::log::info("%s and %s differ at index %zu", expected_str, actual_str, i)();
      return fail(err, assert);
    }

    return TestStream(nullptr, nullptr);
  }

  // Anything else with an operator==.
  template <class T1, class T2>
  TestStream expect_equal(bool assert, T1&& expected, T2&& actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    ErrorMessage& err = record(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << expected_str << "`";
    err.predicate_error << term_normal() << " to be equal to `";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
    err.predicate_error << "`" << term_normal() << ", but was found to differ" << std::endl;
    tjl::log::info("expected `%s` == `%s` at %s:%d", expected_str, actual_str, file, line)();
    return fail(err, assert);
  }
};

#define NUM_ERRORS() (logger__.errors.size())

#define EXPECT_TRUE(cond) (logger__.expect(false, true, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_TRUE(cond) (logger__.expect(true, true, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_FALSE(cond) (logger__.expect(false, false, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_FALSE(cond) (logger__.expect(true, false, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_EQUAL(x, y) (logger__.expect_equal(false, (x), (y), #x, #y, __LINE__, __FILE__))
#define ASSERT_EQUAL(x, y) (logger__.expect_equal(true, (x), (y), #x, #y, __LINE__, __FILE__))

using TestFunc = void (*)(TestLogger&);

struct TestRegister {
  TestRegister(const char* test_name, TestFunc test, std::initializer_list<const char*> tags);
};

#define TEST_FUNC(ret_type, name, ...) static ret_type name(TestLogger& logger__, __VA_ARGS__)

#define TEST_FUNC_CALL(func, ...) func(logger__, __VA_ARGS__)

#define TEST(name, ...)                                                          \
  static void Test__##name(TestLogger&);                                         \
  static TestRegister Test__Unique__##name(#name, &Test__##name, {__VA_ARGS__}); \
  static void Test__##name(TestLogger& logger__)
