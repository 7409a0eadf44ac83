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

#include "sqlite_store.h"

#include <time.h>

#include "db_helpers.h"

namespace tryjob {

namespace {

class BuildsetTable {
 private:
  std::shared_ptr<Database> db;
  PreparedStatement add_buildset;
  PreparedStatement all_buildsets;
  PreparedStatement one_buildset;
  PreparedStatement mark_complete;

  static Buildset read_row(PreparedStatement& stmt) {
    Buildset out;
    out.id = stmt.read_integer(0);
    out.info.jobid = stmt.read_string(1);
    out.info.reason = stmt.read_string(2);
    if (!stmt.read_is_null(3)) out.info.comment = tjl::some(stmt.read_string(3));
    out.info.who = stmt.read_string(4);
    out.info.scheduler = stmt.read_string(5);
    if (!stmt.read_is_null(6)) out.source.branch = tjl::some(stmt.read_string(6));
    out.source.revision = stmt.read_string(7);
    if (!stmt.read_is_null(8)) {
      out.source.patch = tjl::make_some<Patch>(stmt.read_integer(8), stmt.read_blob(9));
    }
    out.source.repository = stmt.read_string(10);
    out.source.project = stmt.read_string(11);
    out.submitted_at = stmt.read_integer(12);
    out.complete = stmt.read_integer(13) != 0;
    return out;
  }

 public:
  static constexpr const char* insert_query =
      "insert into buildsets"
      " (jobid, reason, comment, who, scheduler, branch, revision, patch_level, patch_body,"
      "  repository, project, submitted_at)"
      " values (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

  static constexpr const char* select_columns =
      "select buildset_id, jobid, reason, comment, who, scheduler, branch, revision,"
      " patch_level, patch_body, repository, project, submitted_at, complete from buildsets";

  static constexpr const char* complete_query =
      "update buildsets set complete = 1 where buildset_id = ?";

  BuildsetTable(std::shared_ptr<Database> db)
      : db(db),
        add_buildset(db, insert_query),
        all_buildsets(db, std::string(select_columns) + " order by buildset_id"),
        one_buildset(db, std::string(select_columns) + " where buildset_id = ?"),
        mark_complete(db, complete_query) {
    add_buildset.set_why("Could not insert buildset");
    all_buildsets.set_why("Could not list buildsets");
    one_buildset.set_why("Could not find buildset");
    mark_complete.set_why("Could not mark buildset complete");
  }

  int64_t insert(const SourceStamp& source, const BuildsetInfo& info) {
    add_buildset.bind_string(1, info.jobid);
    add_buildset.bind_string(2, info.reason);
    if (info.comment) {
      add_buildset.bind_string(3, *info.comment);
    } else {
      add_buildset.bind_null(3);
    }
    add_buildset.bind_string(4, info.who);
    add_buildset.bind_string(5, info.scheduler);
    if (source.branch) {
      add_buildset.bind_string(6, *source.branch);
    } else {
      add_buildset.bind_null(6);
    }
    add_buildset.bind_string(7, source.revision);
    if (source.patch) {
      add_buildset.bind_integer(8, source.patch->level);
      add_buildset.bind_blob(9, source.patch->body);
    } else {
      add_buildset.bind_null(8);
      add_buildset.bind_null(9);
    }
    add_buildset.bind_string(10, source.repository);
    add_buildset.bind_string(11, source.project);
    add_buildset.bind_integer(12, time(nullptr));
    add_buildset.step();
    int64_t id = sqlite3_last_insert_rowid(db->get());
    add_buildset.reset();
    return id;
  }

  std::vector<Buildset> all() {
    std::vector<Buildset> out;
    while (all_buildsets.step() == SQLITE_ROW) {
      out.emplace_back(read_row(all_buildsets));
    }
    all_buildsets.reset();
    return out;
  }

  tjl::optional<Buildset> find(int64_t id) {
    tjl::optional<Buildset> out;
    one_buildset.bind_integer(1, id);
    if (one_buildset.step() == SQLITE_ROW) {
      out = tjl::some(read_row(one_buildset));
    }
    one_buildset.reset();
    return out;
  }

  void complete(int64_t id) {
    mark_complete.bind_integer(1, id);
    mark_complete.step();
    mark_complete.reset();
  }
};

class PropertyTable {
 private:
  PreparedStatement add_property;
  PreparedStatement find_properties;

 public:
  static constexpr const char* insert_query =
      "insert into buildset_properties (buildset_id, name, value) values (?, ?, ?)";
  static constexpr const char* find_query =
      "select name, value from buildset_properties where buildset_id = ? order by name";

  PropertyTable(std::shared_ptr<Database> db)
      : add_property(db, insert_query), find_properties(db, find_query) {
    add_property.set_why("Could not insert buildset property");
    find_properties.set_why("Could not read buildset properties");
  }

  void insert(int64_t buildset, const std::string& name, const std::string& value) {
    add_property.bind_integer(1, buildset);
    add_property.bind_string(2, name);
    add_property.bind_string(3, value);
    add_property.step();
    add_property.reset();
  }

  std::map<std::string, std::string> find(int64_t buildset) {
    std::map<std::string, std::string> out;
    find_properties.bind_integer(1, buildset);
    while (find_properties.step() == SQLITE_ROW) {
      out[find_properties.read_string(0)] = find_properties.read_string(1);
    }
    find_properties.reset();
    return out;
  }
};

class RequestTable {
 private:
  std::shared_ptr<Database> db;
  PreparedStatement next_number;
  PreparedStatement add_request;
  PreparedStatement by_buildset;
  PreparedStatement pending;
  PreparedStatement mark_running;
  PreparedStatement mark_finished;
  PreparedStatement owner;
  PreparedStatement unfinished;

  static BuildRequest read_row(PreparedStatement& stmt) {
    BuildRequest out;
    out.id = stmt.read_integer(0);
    out.buildset = stmt.read_integer(1);
    out.builder = stmt.read_string(2);
    out.number = stmt.read_integer(3);
    out.result = static_cast<BuildResult>(stmt.read_integer(4));
    out.detail = stmt.read_string(5);
    return out;
  }

 public:
  static constexpr const char* select_columns =
      "select request_id, buildset_id, builder, number, result, detail from buildrequests";

  RequestTable(std::shared_ptr<Database> db)
      : db(db),
        next_number(db, "select coalesce(max(number), 0) + 1 from buildrequests where builder = ?"),
        add_request(db,
                    "insert into buildrequests (buildset_id, builder, number) values (?, ?, ?)"),
        by_buildset(db, std::string(select_columns) +
                            " where buildset_id = ? order by builder, request_id"),
        pending(db, std::string(select_columns) + " where result = 0 order by request_id limit ?"),
        mark_running(db,
                     "update buildrequests set result = 1, claimed_at = ? where request_id = ?"),
        mark_finished(db,
                      "update buildrequests set result = ?, detail = ?, finished_at = ?"
                      " where request_id = ?"),
        owner(db, "select buildset_id from buildrequests where request_id = ?"),
        unfinished(db,
                   "select count(*) from buildrequests where buildset_id = ? and result < 2") {
    next_number.set_why("Could not number build request");
    add_request.set_why("Could not insert build request");
    by_buildset.set_why("Could not read build requests");
    pending.set_why("Could not read pending build requests");
    mark_running.set_why("Could not claim build request");
    mark_finished.set_why("Could not finish build request");
    owner.set_why("Could not find build request");
    unfinished.set_why("Could not count unfinished build requests");
  }

  void insert(int64_t buildset, const std::string& builder) {
    next_number.bind_string(1, builder);
    next_number.step();
    int64_t number = next_number.read_integer(0);
    next_number.reset();

    add_request.bind_integer(1, buildset);
    add_request.bind_string(2, builder);
    add_request.bind_integer(3, number);
    add_request.step();
    add_request.reset();
  }

  std::vector<BuildRequest> find(int64_t buildset) {
    std::vector<BuildRequest> out;
    by_buildset.bind_integer(1, buildset);
    while (by_buildset.step() == SQLITE_ROW) {
      out.emplace_back(read_row(by_buildset));
    }
    by_buildset.reset();
    return out;
  }

  std::vector<BuildRequest> oldest_pending(size_t limit) {
    std::vector<BuildRequest> out;
    pending.bind_integer(1, limit);
    while (pending.step() == SQLITE_ROW) {
      out.emplace_back(read_row(pending));
    }
    pending.reset();
    return out;
  }

  void claim(int64_t id) {
    mark_running.bind_integer(1, time(nullptr));
    mark_running.bind_integer(2, id);
    mark_running.step();
    mark_running.reset();
  }

  // Returns the owning buildset or 0 when the request does not exist.
  int64_t finish(int64_t id, BuildResult result, const std::string& detail) {
    mark_finished.bind_integer(1, static_cast<int64_t>(result));
    mark_finished.bind_string(2, detail);
    mark_finished.bind_integer(3, time(nullptr));
    mark_finished.bind_integer(4, id);
    mark_finished.step();
    mark_finished.reset();

    int64_t buildset = 0;
    owner.bind_integer(1, id);
    if (owner.step() == SQLITE_ROW) buildset = owner.read_integer(0);
    owner.reset();
    return buildset;
  }

  int64_t count_unfinished(int64_t buildset) {
    unfinished.bind_integer(1, buildset);
    unfinished.step();
    int64_t count = unfinished.read_integer(0);
    unfinished.reset();
    return count;
  }
};

}  // namespace

struct SqliteStoreImpl {
 private:
  std::shared_ptr<Database> db;

 public:
  BuildsetTable buildsets;
  PropertyTable properties;
  RequestTable requests;
  Transaction transact;

  SqliteStoreImpl(const std::string& path)
      : db(std::make_shared<Database>(path)),
        buildsets(db),
        properties(db),
        requests(db),
        transact(db) {}
};

SqliteBuildsetStore::SqliteBuildsetStore(const std::string& db_path)
    : impl(new SqliteStoreImpl(db_path)) {}

SqliteBuildsetStore::~SqliteBuildsetStore() {}

int64_t SqliteBuildsetStore::create_buildset(const SourceStamp& source,
                                             const std::vector<std::string>& builders,
                                             const BuildsetInfo& info) {
  int64_t id = 0;
  impl->transact.run([&]() {
    id = impl->buildsets.insert(source, info);
    for (const auto& prop : info.properties) {
      impl->properties.insert(id, prop.first, prop.second);
    }
    for (const auto& builder : builders) {
      impl->requests.insert(id, builder);
    }
  });
  tjl::log::info("store: buildset %ld created for %zu builders", (long)id, builders.size())();
  return id;
}

std::vector<Buildset> SqliteBuildsetStore::get_buildsets() {
  std::vector<Buildset> out = impl->buildsets.all();
  for (auto& buildset : out) {
    buildset.info.properties = impl->properties.find(buildset.id);
  }
  return out;
}

tjl::optional<Buildset> SqliteBuildsetStore::get_buildset(int64_t id) {
  auto out = impl->buildsets.find(id);
  if (out) out->info.properties = impl->properties.find(id);
  return out;
}

std::vector<BuildRequest> SqliteBuildsetStore::get_build_requests(int64_t buildset) {
  return impl->requests.find(buildset);
}

std::vector<BuildRequest> SqliteBuildsetStore::claim_pending(size_t limit) {
  std::vector<BuildRequest> out;
  if (limit == 0) return out;
  impl->transact.run([&]() {
    out = impl->requests.oldest_pending(limit);
    for (auto& request : out) {
      impl->requests.claim(request.id);
      request.result = BuildResult::running;
    }
  });
  return out;
}

void SqliteBuildsetStore::finish_build_request(int64_t id, BuildResult result,
                                               const std::string& detail) {
  impl->transact.run([&]() {
    int64_t buildset = impl->requests.finish(id, result, detail);
    if (buildset != 0 && impl->requests.count_unfinished(buildset) == 0) {
      impl->buildsets.complete(buildset);
    }
  });
}

}  // namespace tryjob
