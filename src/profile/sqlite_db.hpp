#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace freigent::profile {

// Prepared statement, finalized on destruction
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, const std::string& sql);

  void bind(int idx, const std::string& value);
  void bind(int idx, int64_t value);

  // Returns true while a row is available, false when done
  bool step();

  // Run to completion, for statements without results
  void run();

  std::string column_text(int col) const;
  int64_t column_int(int col) const;

 private:
  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_;
};

// Thin RAII wrapper around a sqlite3 connection
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&) = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* handle() const {
    return db_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void exec(const std::string& sql);

  SqliteStatement prepare(const std::string& sql) {
    return SqliteStatement(db_, sql);
  }

 private:
  void configure();

  sqlite3* db_ = nullptr;
  std::string path_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void commit();

 private:
  SqliteDB& db_;
  bool done_ = false;
};

}  // namespace freigent::profile
