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

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "json/json5.h"
#include "tjl/result.h"

namespace tryjob {

enum class ReadJsonFileError {
  BadFile,
  InvalidJson,
};

tjl::result<JAST, std::pair<ReadJsonFileError, std::string>> read_json_file(
    const std::string& path);

// Returns the keys present in `json` that are not listed in `keys`.
// `json` must be of kind JSON_OBJECT to return any results.
std::vector<std::string> find_disallowed_keys(const JAST& json, const std::set<std::string>& keys);

}  // namespace tryjob
