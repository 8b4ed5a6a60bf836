#include "profile/sqlite_db.hpp"

#include <spdlog/spdlog.h>

#include "freigent/profile/profile_store.hpp"

namespace freigent::profile {

static void throw_if(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

static sqlite3_stmt* prepare_raw(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  throw_if(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr), db, "sqlite prepare");
  return stmt;
}

// --- SqliteStatement ---

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : db_(db), stmt_(prepare_raw(db, sql), &sqlite3_finalize) {}

void SqliteStatement::bind(int idx, const std::string& value) {
  throw_if(sqlite3_bind_text(stmt_.get(), idx, value.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
}

void SqliteStatement::bind(int idx, int64_t value) {
  throw_if(sqlite3_bind_int64(stmt_.get(), idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
}

bool SqliteStatement::step() {
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

void SqliteStatement::run() {
  while (step()) {
  }
}

std::string SqliteStatement::column_text(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_.get(), col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t SqliteStatement::column_int(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_.get(), col));
}

// --- SqliteDB ---

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("Failed to open " + path_ + ": " + msg);
  }

  try {
    configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw StoreError(msg);
  }
}

void SqliteDB::configure() {
  // WAL lets readers proceed while a writer holds the lock
  exec("PRAGMA journal_mode=WAL;");
  exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  exec("PRAGMA foreign_keys=ON;");

  throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

// --- SqliteTransaction ---

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_.exec("ROLLBACK;");
  } catch (const StoreError& e) {
    spdlog::error("sqlite rollback failed: {}", e.what());
  }
}

void SqliteTransaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

}  // namespace freigent::profile
