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

#include "buildset_store.h"

namespace tryjob {

const char* result_name(BuildResult result) {
  switch (result) {
    case BuildResult::pending:
      return "pending";
    case BuildResult::running:
      return "running";
    case BuildResult::success:
      return "success";
    case BuildResult::failure:
      return "failure";
    case BuildResult::exception:
      return "exception";
  }
  return "unknown";
}

tjl::optional<BuildResult> parse_build_result(const std::string& name) {
  for (BuildResult r : {BuildResult::pending, BuildResult::running, BuildResult::success,
                        BuildResult::failure, BuildResult::exception}) {
    if (name == result_name(r)) return tjl::some(r);
  }
  return {};
}

}  // namespace tryjob
