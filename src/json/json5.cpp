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

#include "json5.h"

#include <errno.h>
#include <unistd.h>

#include <cstdlib>
#include <map>
#include <sstream>

const char *jsymbolTable[] = {
    // appear in JAST and JSymbol
    "NULLVAL", "TRUE", "FALSE", "NAN", "INTEGER", "DOUBLE", "INFINITY", "STR",
    // appear only in JAST
    "OBJECT", "ARRAY",
    // appear only in JSymbol
    "ERROR", "END", "SOPEN", "SCLOSE", "BOPEN", "BCLOSE", "COLON", "ID", "COMMA"};

static JAST null(JSON_NULLVAL);

const JAST &JAST::get(const std::string &key) const {
  if (kind == JSON_OBJECT)
    for (auto &x : children)
      if (x.first == key) return x.second;
  return null;
}

JAST &JAST::get(const std::string &key) {
  if (kind == JSON_OBJECT)
    for (auto &x : children)
      if (x.first == key) return x.second;
  return null;
}

tjl::optional<const JAST *> JAST::get_opt(const std::string &key) const {
  const JAST &item = get(key);
  if (&item == &null) {
    return {};
  }
  return tjl::some(&item);
}

tjl::optional<std::string> JAST::expect_string() const {
  if (kind != JSON_STR) return {};
  return tjl::some(value);
}

tjl::optional<int64_t> JAST::expect_integer() const {
  if (kind != JSON_INTEGER) return {};
  errno = 0;
  char *end = nullptr;
  long long x = strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') return {};
  return tjl::some(static_cast<int64_t>(x));
}

tjl::optional<bool> JAST::expect_boolean() const {
  if (kind == JSON_TRUE) return tjl::some(true);
  if (kind == JSON_FALSE) return tjl::some(false);
  return {};
}

tjl::optional<double> JAST::expect_number() const {
  if (kind != JSON_INTEGER && kind != JSON_DOUBLE) return {};
  char *end = nullptr;
  double x = strtod(value.c_str(), &end);
  if (end == value.c_str()) return {};
  return tjl::some(x);
}

JAST &JAST::add(std::string key, SymbolJSON kind, std::string &&value) {
  children.emplace_back(std::move(key), JAST(kind, std::move(value)));
  return children.back().second;
}

static char hex(unsigned char x) {
  if (x < 10) return '0' + x;
  return 'a' + x - 10;
}

std::string json_escape(const char *str, size_t len) {
  std::string out;
  char escape[] = "\\u0000";
  const char *end = str + len;
  for (const char *i = str; i != end; ++i) {
    char z = *i;
    unsigned char c = z;
    if (z == '"')
      out.append("\\\"");
    else if (z == '\\')
      out.append("\\\\");
    else if (c >= 0x20) {
      out.push_back(c);
    } else if (z == '\b') {
      out.append("\\b");
    } else if (z == '\f') {
      out.append("\\f");
    } else if (z == '\n') {
      out.append("\\n");
    } else if (z == '\r') {
      out.append("\\r");
    } else if (z == '\t') {
      out.append("\\t");
    } else {
      escape[4] = hex(c >> 4);
      escape[5] = hex(c & 0xf);
      out.append(escape);
    }
  }
  return out;
}

static std::ostream &formatObject(std::ostream &os, const JAST &jast) {
  os << "{";
  for (size_t i = 0; i < jast.children.size(); ++i) {
    if (i != 0) os << ',';
    const JChild &child = jast.children[i];
    os << '"' << json_escape(child.first) << "\":" << child.second;
  }
  return os << "}";
}

static std::ostream &formatArray(std::ostream &os, const JAST &jast) {
  os << "[";
  for (size_t i = 0; i < jast.children.size(); ++i) {
    if (i != 0) os << ',';
    os << jast.children[i].second;
  }
  return os << "]";
}

std::ostream &operator<<(std::ostream &os, const JAST &jast) {
  switch (jast.kind) {
    case JSON_NULLVAL:
      return os << "null";
    case JSON_TRUE:
      return os << "true";
    case JSON_FALSE:
      return os << "false";
    case JSON_NAN:
      return os << "NaN";
    case JSON_INTEGER:
      return os << jast.value;
    case JSON_DOUBLE:
      return os << jast.value;
    case JSON_INFINITY:
      return os << jast.value << "Infinity";
    case JSON_STR:
      return os << '"' << json_escape(jast.value) << '"';
    case JSON_OBJECT:
      return formatObject(os, jast);
    case JSON_ARRAY:
      return formatArray(os, jast);
    default:
      return os << "corrupt";
  }
}

std::ostream &operator<<(std::ostream &os, const JLocation &location) {
  return os << location.filename << ":" << location.row << ":" << location.column;
}

tjl::result<JsonSubscriber, tjl::posix_error_t> JsonSubscriber::create(const char *log_path) {
  auto res = fd_t::open(log_path);
  if (!res) {
    return tjl::make_error<JsonSubscriber, tjl::posix_error_t>(res.error());
  }
  return tjl::make_result<JsonSubscriber, tjl::posix_error_t>(JsonSubscriber(std::move(*res)));
}

void JsonSubscriber::receive(const tjl::log::Event &e) {
  // Sort the keys so that log lines are stable and greppable.
  std::map<std::string, std::string> sorted(e.items.begin(), e.items.end());
  JAST out(JSON_OBJECT);
  for (const auto &item : sorted) {
    out.add(item.first, item.second);
  }

  std::stringstream ss;
  ss << out << "\n";
  std::string line = ss.str();

  // Lines beyond PIPE_BUF may interleave with other writers.
  if (line.size() > 4095) {
    static const char warning_msg[] = "{\"message\": \"warning: The next line may be corrupted\"}\n";
    if (write(to_append.get(), warning_msg, sizeof(warning_msg) - 1) == -1) return;
  }

  const char *data = line.data();
  size_t left = line.size();
  while (left > 0) {
    ssize_t n = write(to_append.get(), data, left);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;
    data += n;
    left -= n;
  }
}
