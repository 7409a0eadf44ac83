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

#include <memory>
#include <string>

#include "tryjob/buildset_store.h"

namespace tryjob {

struct SqliteStoreImpl;

// A BuildsetStore kept in a single sqlite file. Safe to share with
// other processes; writers serialize on `begin immediate`.
class SqliteBuildsetStore : public BuildsetStore {
 private:
  std::unique_ptr<SqliteStoreImpl> impl;  // pimpl

 public:
  // Creates the file and schema when missing. Failing to open the
  // database is fatal.
  explicit SqliteBuildsetStore(const std::string& db_path);
  ~SqliteBuildsetStore() override;

  SqliteBuildsetStore(const SqliteBuildsetStore&) = delete;
  SqliteBuildsetStore& operator=(const SqliteBuildsetStore&) = delete;

  int64_t create_buildset(const SourceStamp& source, const std::vector<std::string>& builders,
                          const BuildsetInfo& info) override;

  std::vector<Buildset> get_buildsets() override;
  tjl::optional<Buildset> get_buildset(int64_t id) override;
  std::vector<BuildRequest> get_build_requests(int64_t buildset) override;

  std::vector<BuildRequest> claim_pending(size_t limit) override;
  void finish_build_request(int64_t id, BuildResult result, const std::string& detail) override;
};

}  // namespace tryjob
