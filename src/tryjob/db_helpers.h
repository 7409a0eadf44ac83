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

// NOTE: Only include this from .cpp files. It exposes sqlite3 which the
//       headers of this directory keep abstracted away.
#include <sqlite3.h>
#include <unistd.h>

#include <memory>
#include <random>
#include <string>

#include "tjl/tracing.h"

namespace tryjob {

class Database {
 private:
  sqlite3 *db = nullptr;

  // Exponential back off plus randomization so that the master and a
  // second reader do not retry in lock step.
  static inline int wait_handle(void *, int retries) {
    // Give up after roughly 4 seconds.
    constexpr int start_pow_2 = 6;
    constexpr int end_pow_2 = 22;
    if (retries > end_pow_2 - start_pow_2) return 0;

    useconds_t base_wait = 1 << start_pow_2;
    std::random_device rd;
    useconds_t wait = base_wait << retries;
    wait += rd() & (wait - 1);
    usleep(wait);

    // Tell sqlite to retry
    return 1;
  }

 public:
  Database(const Database &) = delete;
  Database(Database &&) = delete;
  Database() = delete;
  ~Database() {
    if (db && sqlite3_close(db) != SQLITE_OK) {
      tjl::log::fatal("Could not close database: %s", sqlite3_errmsg(db));
    }
  }

  explicit Database(const std::string &db_path) {
    // schema.sql starts with `--dummy, R"(` which is a comment to sql
    // and a decrement followed by a raw string to C++. The comma binds
    // looser than '=' hence the parens around the include.
    // clang-format off
    int dummy = 0;
    const char* schema = (
        #include "schema.sql"
    );
    // clang-format on

    if (sqlite3_open_v2(db_path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                        nullptr) != SQLITE_OK) {
      tjl::log::fatal("error: sqlite3_open_v2(%s): %s", db_path.c_str(), sqlite3_errmsg(db));
    }

    if (sqlite3_busy_handler(db, wait_handle, nullptr)) {
      tjl::log::fatal("error: failed to set sqlite3_busy_handler: %s", sqlite3_errmsg(db));
    }

    char *fail = nullptr;
    int ret = sqlite3_exec(db, schema, nullptr, nullptr, &fail);
    if (ret == SQLITE_BUSY) {
      tjl::log::fatal("error: %s is locked by another process, is a second master running?",
                      db_path.c_str());
    }
    if (ret != SQLITE_OK) {
      tjl::log::fatal("error: failed init stmt: %s: %s", fail ? fail : "", sqlite3_errmsg(db));
    }
  }

  sqlite3 *get() const { return db; }
};

class PreparedStatement {
 private:
  std::shared_ptr<Database> db = nullptr;
  sqlite3_stmt *query_stmt = nullptr;
  std::string why = "";

 public:
  PreparedStatement() = delete;
  PreparedStatement(const PreparedStatement &) = delete;
  PreparedStatement(PreparedStatement &&pstmt)
      : db(std::move(pstmt.db)), query_stmt(pstmt.query_stmt), why(std::move(pstmt.why)) {
    pstmt.query_stmt = nullptr;
  }

  PreparedStatement(std::shared_ptr<Database> db, const std::string &sql_str) : db(db) {
    if (sqlite3_prepare_v2(db->get(), sql_str.c_str(), sql_str.size(), &query_stmt, nullptr) !=
        SQLITE_OK) {
      tjl::log::fatal("error: failed to prepare statement: %s", sqlite3_errmsg(db->get()));
    }
  }

  ~PreparedStatement() {
    if (query_stmt) {
      int ret = sqlite3_finalize(query_stmt);
      if (ret != SQLITE_OK) {
        tjl::log::fatal("sqlite3_finalize: %s", sqlite3_errmsg(db->get()));
      }
      query_stmt = nullptr;
    }
  }

  void set_why(std::string why) { this->why = std::move(why); }

  void bind_integer(int64_t index, int64_t value) {
    int ret = sqlite3_bind_int64(query_stmt, index, value);
    if (ret != SQLITE_OK) {
      tjl::log::fatal("%s: sqlite3_bind_int64(%ld, %ld): %s", why.c_str(), (long)index,
                      (long)value, sqlite3_errmsg(db->get()));
    }
  }

  void bind_string(int64_t index, const std::string &value) {
    int ret = sqlite3_bind_text(query_stmt, index, value.c_str(), value.size(), SQLITE_TRANSIENT);
    if (ret != SQLITE_OK) {
      tjl::log::fatal("%s: sqlite3_bind_text(%ld): %s", why.c_str(), (long)index,
                      sqlite3_errmsg(db->get()));
    }
  }

  // Patch bodies are stored as blobs so that any byte survives.
  void bind_blob(int64_t index, const std::string &value) {
    int ret = sqlite3_bind_blob(query_stmt, index, value.data(), value.size(), SQLITE_TRANSIENT);
    if (ret != SQLITE_OK) {
      tjl::log::fatal("%s: sqlite3_bind_blob(%ld): %s", why.c_str(), (long)index,
                      sqlite3_errmsg(db->get()));
    }
  }

  void bind_null(int64_t index) {
    int ret = sqlite3_bind_null(query_stmt, index);
    if (ret != SQLITE_OK) {
      tjl::log::fatal("%s: sqlite3_bind_null(%ld): %s", why.c_str(), (long)index,
                      sqlite3_errmsg(db->get()));
    }
  }

  bool read_is_null(int64_t index) { return sqlite3_column_type(query_stmt, index) == SQLITE_NULL; }

  int64_t read_integer(int64_t index) { return sqlite3_column_int64(query_stmt, index); }

  std::string read_string(int64_t index) {
    const char *str = reinterpret_cast<const char *>(sqlite3_column_text(query_stmt, index));
    size_t size = sqlite3_column_bytes(query_stmt, index);
    if (str == nullptr) return "";
    return std::string(str, size);
  }

  std::string read_blob(int64_t index) {
    const char *data = reinterpret_cast<const char *>(sqlite3_column_blob(query_stmt, index));
    size_t size = sqlite3_column_bytes(query_stmt, index);
    if (data == nullptr) return "";
    return std::string(data, size);
  }

  void reset() {
    int ret = sqlite3_reset(query_stmt);
    if (ret == SQLITE_LOCKED) {
      tjl::log::fatal("error: sqlite3_reset: SQLITE_LOCKED");
    }

    if (ret != SQLITE_OK) {
      tjl::log::fatal("error: %s; sqlite3_reset: %s", why.c_str(), sqlite3_errmsg(db->get()));
    }

    if (sqlite3_clear_bindings(query_stmt) != SQLITE_OK) {
      tjl::log::fatal("error: %s; sqlite3_clear_bindings: %s", why.c_str(),
                      sqlite3_errmsg(db->get()));
    }
  }

  int step() {
    int ret = sqlite3_step(query_stmt);
    if (ret != SQLITE_DONE && ret != SQLITE_ROW) {
      tjl::log::fatal("error: %s; sqlite3_step: %s", why.c_str(), sqlite3_errmsg(db->get()));
    }
    return ret;
  }
};

class Transaction {
 private:
  PreparedStatement begin_txn_query;
  PreparedStatement commit_txn_query;

 public:
  static constexpr const char *sql_begin_txn = "begin immediate transaction";
  static constexpr const char *sql_commit_txn = "commit transaction";

  explicit Transaction(std::shared_ptr<Database> db)
      : begin_txn_query(db, sql_begin_txn), commit_txn_query(db, sql_commit_txn) {
    begin_txn_query.set_why("Could not begin a transaction");
    commit_txn_query.set_why("Could not commit a transaction");
  }

  template <class F>
  void run(F f) {
    begin_txn_query.step();
    begin_txn_query.reset();
    f();
    commit_txn_query.step();
    commit_txn_query.reset();
  }
};

}  // namespace tryjob
