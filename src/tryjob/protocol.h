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

#include <cstdint>
#include <string>
#include <vector>

#include "json/json5.h"
#include "tjl/optional.h"
#include "tryjob/buildset_store.h"

// Messages exchanged between `tryjob --connect pb` and a userpass
// scheduler. Every message is one JSON object followed by a '\0'.
namespace tryjob {
namespace protocol {

static constexpr const char* LOGIN = "auth/login";
static constexpr const char* SUBMIT = "try/submit";
static constexpr const char* BUILDERS = "try/builders";
static constexpr const char* BUILD_FINISHED = "build/finished";
static constexpr const char* BUILDSET_FINISHED = "buildset/finished";

enum class ErrorKind { authentication, unknown_builder, malformed_job, protocol };

const char* kind_name(ErrorKind kind);
tjl::optional<ErrorKind> parse_kind(const std::string& name);

// Serializes and appends the terminating null byte.
std::string frame(const JAST& message);

JAST request(const char* method, JAST&& params);
JAST login_request(const std::string& username, const std::string& password);
JAST submit_request(const std::string& encoded_job, bool wait);
JAST builders_request();

JAST ok_reply();
JAST submit_reply(int64_t buildset, const std::vector<std::string>& builders);
JAST builders_reply(const std::vector<std::string>& builders);
JAST error_reply(ErrorKind kind, const std::string& message);

struct BuildNotification {
  int64_t buildset = 0;
  std::string builder;
  int64_t number = 0;
  BuildResult result = BuildResult::pending;
  std::string detail;
};

JAST build_finished(const BuildNotification& note);
JAST buildset_finished(int64_t buildset);

tjl::optional<BuildNotification> parse_build_finished(const JAST& params);

// Replies carry "ok", pushed notifications carry "method".
inline bool is_notification(const JAST& message) {
  return message.get("method").kind == JSON_STR;
}

tjl::optional<std::vector<std::string>> parse_string_array(const JAST& array);

}  // namespace protocol
}  // namespace tryjob
