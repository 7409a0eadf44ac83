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

#include "protocol.h"

#include <sstream>

namespace tryjob {
namespace protocol {

const char* kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::authentication:
      return "authentication";
    case ErrorKind::unknown_builder:
      return "unknown_builder";
    case ErrorKind::malformed_job:
      return "malformed_job";
    case ErrorKind::protocol:
      return "protocol";
  }
  return "protocol";
}

tjl::optional<ErrorKind> parse_kind(const std::string& name) {
  for (ErrorKind kind : {ErrorKind::authentication, ErrorKind::unknown_builder,
                         ErrorKind::malformed_job, ErrorKind::protocol}) {
    if (name == kind_name(kind)) return tjl::some(kind);
  }
  return {};
}

std::string frame(const JAST& message) {
  std::stringstream ss;
  ss << message << '\0';
  return ss.str();
}

static JAST string_array(const std::vector<std::string>& items) {
  JAST out(JSON_ARRAY);
  for (const auto& item : items) out.add(std::string(item));
  return out;
}

JAST request(const char* method, JAST&& params) {
  JAST out(JSON_OBJECT);
  out.add("method", method);
  out.add("params", std::move(params));
  return out;
}

JAST login_request(const std::string& username, const std::string& password) {
  JAST params(JSON_OBJECT);
  params.add("username", username);
  params.add("password", password);
  return request(LOGIN, std::move(params));
}

JAST submit_request(const std::string& encoded_job, bool wait) {
  JAST params(JSON_OBJECT);
  params.add("job", encoded_job);
  params.add("wait", wait);
  return request(SUBMIT, std::move(params));
}

JAST builders_request() { return request(BUILDERS, JAST(JSON_OBJECT)); }

JAST ok_reply() {
  JAST out(JSON_OBJECT);
  out.add("ok", true);
  return out;
}

JAST submit_reply(int64_t buildset, const std::vector<std::string>& builders) {
  JAST out = ok_reply();
  out.add("buildset", static_cast<long long>(buildset));
  out.add("builders", string_array(builders));
  return out;
}

JAST builders_reply(const std::vector<std::string>& builders) {
  JAST out = ok_reply();
  out.add("builders", string_array(builders));
  return out;
}

JAST error_reply(ErrorKind kind, const std::string& message) {
  JAST out(JSON_OBJECT);
  out.add("ok", false);
  out.add("kind", kind_name(kind));
  out.add("message", message);
  return out;
}

JAST build_finished(const BuildNotification& note) {
  JAST params(JSON_OBJECT);
  params.add("buildset", static_cast<long long>(note.buildset));
  params.add("builder", note.builder);
  params.add("number", static_cast<long long>(note.number));
  params.add("result", result_name(note.result));
  params.add("detail", note.detail);
  return request(BUILD_FINISHED, std::move(params));
}

JAST buildset_finished(int64_t buildset) {
  JAST params(JSON_OBJECT);
  params.add("buildset", static_cast<long long>(buildset));
  return request(BUILDSET_FINISHED, std::move(params));
}

tjl::optional<BuildNotification> parse_build_finished(const JAST& params) {
  auto buildset = params.get("buildset").expect_integer();
  auto builder = params.get("builder").expect_string();
  auto number = params.get("number").expect_integer();
  auto result = params.get("result").expect_string();
  if (!buildset || !builder || !number || !result) return {};

  auto parsed = parse_build_result(*result);
  if (!parsed) return {};

  BuildNotification out;
  out.buildset = *buildset;
  out.builder = std::move(*builder);
  out.number = *number;
  out.result = *parsed;
  auto detail = params.get("detail").expect_string();
  if (detail) out.detail = std::move(*detail);
  return tjl::some(std::move(out));
}

tjl::optional<std::vector<std::string>> parse_string_array(const JAST& array) {
  if (array.kind != JSON_ARRAY) return {};
  std::vector<std::string> out;
  for (const auto& child : array.children) {
    auto item = child.second.expect_string();
    if (!item) return {};
    out.emplace_back(std::move(*item));
  }
  return tjl::some(std::move(out));
}

}  // namespace protocol
}  // namespace tryjob
