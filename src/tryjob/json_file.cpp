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

#include "json_file.h"

#include <fstream>
#include <sstream>

namespace tryjob {

tjl::result<JAST, std::pair<ReadJsonFileError, std::string>> read_json_file(
    const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return tjl::make_error<JAST, std::pair<ReadJsonFileError, std::string>>(
        ReadJsonFileError::BadFile, "Failed to read '" + path + "'");
  }

  std::stringstream buff;
  buff << file.rdbuf();
  std::string contents = buff.str();

  JAST json;
  std::stringstream errors;
  if (!JAST::parse(contents, errors, json) || json.kind != JSON_OBJECT) {
    return tjl::make_error<JAST, std::pair<ReadJsonFileError, std::string>>(
        ReadJsonFileError::InvalidJson, path + " must be a valid JSON object: " + errors.str());
  }

  return tjl::result_value<std::pair<ReadJsonFileError, std::string>>(std::move(json));
}

std::vector<std::string> find_disallowed_keys(const JAST& json, const std::set<std::string>& keys) {
  std::vector<std::string> disallowed;
  if (json.kind != JSON_OBJECT) return disallowed;

  for (const auto& entry : json.children) {
    if (keys.count(entry.first) > 0) continue;
    disallowed.push_back(entry.first);
  }
  return disallowed;
}

}  // namespace tryjob
