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

#ifndef JSON5_H
#define JSON5_H

#include <fcntl.h>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "tjl/optional.h"
#include "tjl/result.h"
#include "tjl/tracing.h"
#include "tjl/unique_fd.h"

enum SymbolJSON {
  // appear in JAST and JSymbol
  JSON_NULLVAL,
  JSON_TRUE,
  JSON_FALSE,
  JSON_NAN,
  JSON_INTEGER,
  JSON_DOUBLE,
  JSON_INFINITY,
  JSON_STR,
  // appear only in JAST
  JSON_OBJECT,
  JSON_ARRAY,
  // appear only in JSymbol
  JSON_ERROR,
  JSON_END,
  JSON_SOPEN,
  JSON_SCLOSE,
  JSON_BOPEN,
  JSON_BCLOSE,
  JSON_COLON,
  JSON_ID,
  JSON_COMMA
};

extern const char *jsymbolTable[];

struct JAST;
typedef std::pair<std::string, JAST> JChild;
typedef std::vector<JChild> JChildren;

struct JAST {
  SymbolJSON kind;
  std::string value;
  JChildren children;

  JAST() : kind(JSON_ERROR) {}
  JAST(SymbolJSON kind_) : kind(kind_) {}
  JAST(SymbolJSON kind_, std::string &&value_) : kind(kind_), value(std::move(value_)) {}
  JAST(SymbolJSON kind_, JChildren &&children_) : kind(kind_), children(std::move(children_)) {}

  static bool parse(const char *file, std::ostream &errs, JAST &out);
  static bool parse(const std::string &body, std::ostream &errs, JAST &out);
  static bool parse(const char *body, size_t len, std::ostream &errs, JAST &out);

  const JAST &get(const std::string &key) const;
  JAST &get(const std::string &key);

  // Like get, but distinguishes a missing key from an explicit null.
  tjl::optional<const JAST *> get_opt(const std::string &key) const;

  tjl::optional<std::string> expect_string() const;
  tjl::optional<int64_t> expect_integer() const;
  tjl::optional<bool> expect_boolean() const;
  tjl::optional<double> expect_number() const;

  // Add a child to a JObject
  JAST &add(std::string key, SymbolJSON kind, std::string &&value);
  JAST &add(std::string key, int value) {
    return add(std::move(key), JSON_INTEGER, std::to_string(value));
  }
  JAST &add(std::string key, long value) {
    return add(std::move(key), JSON_INTEGER, std::to_string(value));
  }
  JAST &add(std::string key, long long value) {
    return add(std::move(key), JSON_INTEGER, std::to_string(value));
  }
  JAST &add(std::string key, double value) {
    return add(std::move(key), JSON_DOUBLE, std::to_string(value));
  }
  JAST &add(std::string key, std::string &&value) {
    return add(std::move(key), JSON_STR, std::move(value));
  }
  JAST &add(std::string key, const std::string &value) {
    return add(std::move(key), JSON_STR, std::string(value));
  }
  JAST &add(std::string key, const char *value) {
    return add(std::move(key), JSON_STR, std::string(value));
  }
  JAST &add(std::string key, bool value) { return add(std::move(key), value ? JSON_TRUE : JSON_FALSE); }
  JAST &add(std::string key, SymbolJSON kind) { return add(std::move(key), kind, std::string()); }
  JAST &add(std::string key, JAST &&child) {
    children.emplace_back(std::move(key), std::move(child));
    return children.back().second;
  }
  // Add a child to a JArray
  JAST &add(SymbolJSON kind, std::string &&value) {
    return add(std::string(), kind, std::move(value));
  }
  JAST &add(SymbolJSON kind) { return add(std::string(), kind, std::string()); }
  JAST &add(std::string &&value) { return add(std::string(), JSON_STR, std::move(value)); }
  JAST &add(JAST &&child) { return add(std::string(), std::move(child)); }
};

std::ostream &operator<<(std::ostream &os, const JAST &jast);

struct JLocation {
  const char *filename;
  int row, column;

  JLocation(const char *filename_, int row_ = 1, int column_ = 1)
      : filename(filename_), row(row_), column(column_) {}
};

std::ostream &operator<<(std::ostream &os, const JLocation &location);

struct JSymbol {
  SymbolJSON type;
  JLocation location;
  std::string value;

  JSymbol(SymbolJSON type_, const JLocation &location_) : type(type_), location(location_) {}
  JSymbol(SymbolJSON type_, const JLocation &location_, std::string &&value_)
      : type(type_), location(location_), value(std::move(value_)) {}
};

struct jinput_t;

struct JLexer {
  std::unique_ptr<jinput_t> engine;
  JSymbol next;
  bool fail;

  JLexer(const char *file);
  JLexer(const std::string &body);
  JLexer(const char *body, size_t len);
  ~JLexer();

  void consume();
};

std::string json_escape(const char *str, size_t len);
inline std::string json_escape(const std::string &x) { return json_escape(x.c_str(), x.size()); }

// Appends every log event as one JSON object per line.
class JsonSubscriber : public tjl::log::Subscriber {
 public:
  using fd_t = tjl::precise_unique_fd<O_APPEND | O_CREAT | O_WRONLY | O_CLOEXEC, 0644>;

 private:
  fd_t to_append;

 public:
  JsonSubscriber(fd_t &&fd) : to_append(std::move(fd)) {}
  JsonSubscriber(JsonSubscriber &&) = default;

  static tjl::result<JsonSubscriber, tjl::posix_error_t> create(const char *log_path);

  void receive(const tjl::log::Event &e) override;
  ~JsonSubscriber() override {}
};

#endif
