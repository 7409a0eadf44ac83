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

#include "job.h"

#include <json/json5.h>

#include <set>
#include <sstream>

namespace tryjob {

bool operator==(const Patch& a, const Patch& b) { return a.level == b.level && a.body == b.body; }

bool operator==(const SourceStamp& a, const SourceStamp& b) {
  return a.branch == b.branch && a.revision == b.revision && a.patch == b.patch &&
         a.repository == b.repository && a.project == b.project;
}

bool operator==(const Job& a, const Job& b) {
  return a.jobid == b.jobid && a.source == b.source && a.builder_names == b.builder_names &&
         a.comment == b.comment && a.who == b.who && a.properties == b.properties;
}

std::ostream& operator<<(std::ostream& os, const Patch& patch) {
  return os << "-p" << patch.level << " (" << patch.body.size() << " bytes)";
}

std::string netstring(const std::string& payload) {
  std::string out = std::to_string(payload.size());
  out.push_back(':');
  out.append(payload);
  out.push_back(',');
  return out;
}

static tjl::result<std::string, MalformedJobError> malformed(std::string why) {
  return tjl::make_error<std::string, MalformedJobError>(MalformedJobError{std::move(why)});
}

tjl::result<std::string, MalformedJobError> read_netstring(const std::string& data, size_t& pos) {
  size_t colon = data.find(':', pos);
  if (colon == std::string::npos) {
    return malformed("no complete netstring at offset " + std::to_string(pos));
  }
  if (colon == pos || colon - pos > 19) {
    return malformed("bad netstring length at offset " + std::to_string(pos));
  }

  uint64_t len = 0;
  for (size_t i = pos; i < colon; ++i) {
    char c = data[i];
    if (c < '0' || c > '9') {
      return malformed("bad netstring length at offset " + std::to_string(pos));
    }
    len = len * 10 + (c - '0');
  }

  size_t start = colon + 1;
  if (len > data.size() - start || data.size() - start - len < 1) {
    return malformed("truncated netstring at offset " + std::to_string(pos));
  }
  if (data[start + len] != ',') {
    return malformed("netstring missing ',' terminator at offset " + std::to_string(start + len));
  }

  pos = start + len + 1;
  return tjl::result_value<MalformedJobError>(data.substr(start, len));
}

std::string encode(const Job& job) {
  JAST json(JSON_OBJECT);
  json.add("jobid", job.jobid);
  if (job.source.branch) {
    json.add("branch", *job.source.branch);
  } else {
    json.add("branch", JSON_NULLVAL);
  }
  json.add("baserev", job.source.revision);
  if (job.source.patch) {
    json.add("patch_level", static_cast<long long>(job.source.patch->level));
    json.add("patch_body", job.source.patch->body);
  }
  json.add("repository", job.source.repository);
  json.add("project", job.source.project);
  json.add("who", job.who);
  if (job.comment) {
    json.add("comment", *job.comment);
  } else {
    json.add("comment", JSON_NULLVAL);
  }

  JAST& builders = json.add("builderNames", JSON_ARRAY);
  for (const auto& name : job.builder_names) {
    builders.add(std::string(name));
  }

  JAST& properties = json.add("properties", JSON_OBJECT);
  for (const auto& prop : job.properties) {
    properties.add(prop.first, prop.second);
  }

  std::stringstream ss;
  ss << json;
  return netstring(JOB_VERSION) + netstring(ss.str());
}

// Fetches a string that may be absent or null.
static bool optional_string(const JAST& json, const char* key, tjl::optional<std::string>& out,
                            std::string& why) {
  auto item = json.get_opt(key);
  if (!item || (*item)->kind == JSON_NULLVAL) {
    out = {};
    return true;
  }
  auto str = (*item)->expect_string();
  if (!str) {
    why = std::string("'") + key + "' must be a string";
    return false;
  }
  out = std::move(str);
  return true;
}

tjl::result<Job, MalformedJobError> decode(const std::string& data) {
  auto fail = [](std::string why) {
    return tjl::make_error<Job, MalformedJobError>(MalformedJobError{std::move(why)});
  };

  size_t pos = 0;
  auto version = read_netstring(data, pos);
  if (!version) return fail(version.error().why);
  if (*version != JOB_VERSION) return fail("unsupported job version '" + *version + "'");

  auto body = read_netstring(data, pos);
  if (!body) return fail(body.error().why);
  if (pos != data.size()) return fail("trailing bytes after job body");

  JAST json;
  std::stringstream errs;
  if (!JAST::parse(*body, errs, json)) return fail("invalid JSON: " + errs.str());
  if (json.kind != JSON_OBJECT) return fail("job body is not a JSON object");

  Job job;
  std::string why;

  auto jobid = json.get("jobid").expect_string();
  if (!jobid) return fail("missing or non-string 'jobid'");
  job.jobid = std::move(*jobid);

  auto baserev = json.get("baserev").expect_string();
  if (!baserev) return fail("missing or non-string 'baserev'");
  job.source.revision = std::move(*baserev);

  if (!optional_string(json, "branch", job.source.branch, why)) return fail(why);
  if (!optional_string(json, "comment", job.comment, why)) return fail(why);

  auto level = json.get_opt("patch_level");
  auto patch_body = json.get_opt("patch_body");
  bool has_level = level && (*level)->kind != JSON_NULLVAL;
  bool has_body = patch_body && (*patch_body)->kind != JSON_NULLVAL;
  if (has_level != has_body) return fail("'patch_level' and 'patch_body' must appear together");
  if (has_level) {
    auto lvl = (*level)->expect_integer();
    if (!lvl) return fail("'patch_level' must be an integer");
    auto diff = (*patch_body)->expect_string();
    if (!diff) return fail("'patch_body' must be a string");
    job.source.patch = tjl::make_some<Patch>(*lvl, std::move(*diff));
  }

  tjl::optional<std::string> text;
  if (!optional_string(json, "repository", text, why)) return fail(why);
  if (text) job.source.repository = std::move(*text);
  if (!optional_string(json, "project", text, why)) return fail(why);
  if (text) job.source.project = std::move(*text);
  if (!optional_string(json, "who", text, why)) return fail(why);
  if (text) job.who = std::move(*text);

  auto builders = json.get_opt("builderNames");
  if (!builders) return fail("missing 'builderNames'");
  if ((*builders)->kind != JSON_ARRAY) return fail("'builderNames' must be an array");
  std::set<std::string> seen;
  for (const auto& child : (*builders)->children) {
    auto name = child.second.expect_string();
    if (!name) return fail("'builderNames' must only contain strings");
    if (!seen.insert(*name).second) return fail("duplicate builder '" + *name + "'");
    job.builder_names.emplace_back(std::move(*name));
  }

  auto properties = json.get_opt("properties");
  if (properties && (*properties)->kind != JSON_NULLVAL) {
    if ((*properties)->kind != JSON_OBJECT) return fail("'properties' must be an object");
    for (const auto& child : (*properties)->children) {
      auto value = child.second.expect_string();
      if (!value) return fail("property '" + child.first + "' must be a string");
      job.properties[child.first] = std::move(*value);
    }
  }

  return tjl::result_value<MalformedJobError>(std::move(job));
}

}  // namespace tryjob
