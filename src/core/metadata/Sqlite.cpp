#include "core/metadata/Sqlite.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace uds::sqlite {

void DbCloser::operator()(sqlite3* db) const { sqlite3_close(db); }
void StmtCloser::operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }

DbPtr open(const std::string& dbPath, bool create) {
  sqlite3* raw = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (create) flags |= SQLITE_OPEN_CREATE;
  int rc = sqlite3_open_v2(dbPath.c_str(), &raw, flags, nullptr);
  DbPtr db(raw);
  if (rc != SQLITE_OK) {
    std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
    throw StorageFailure("Failed to open DB " + dbPath + ": " + msg);
  }
  // Pragmas: concurrency + durability + integrity
  exec(db.get(), "PRAGMA journal_mode=WAL;");
  exec(db.get(), "PRAGMA synchronous=NORMAL;");
  exec(db.get(), "PRAGMA foreign_keys=ON;");
  exec(db.get(), "PRAGMA busy_timeout=5000;");
  return db;
}

void exec(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageFailure("SQLite exec failed: " + msg);
  }
}

// -------- Statement --------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw StorageFailure(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
  }
  st_.reset(st);
}

Statement& Statement::bind(int idx, const std::string& v) {
  if (sqlite3_bind_text(st_.get(), idx, v.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
    throw StorageFailure(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
  return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
  if (sqlite3_bind_int64(st_.get(), idx, v) != SQLITE_OK)
    throw StorageFailure(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
  return *this;
}

bool Statement::step() {
  int rc = sqlite3_step(st_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StorageFailure(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
}

void Statement::run() {
  if (step()) throw StorageFailure("SQLite statement unexpectedly returned rows");
}

std::string Statement::text(int col) const {
  auto* p = sqlite3_column_text(st_.get(), col);
  return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

int64_t Statement::int64(int col) const {
  return sqlite3_column_int64(st_.get(), col);
}

// -------- Transaction --------

Transaction::Transaction(sqlite3* db) : db_(db) {
  exec(db_, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("rollback failed: {}", err ? err : "unknown error");
    sqlite3_free(err);
  }
}

void Transaction::commit() {
  exec(db_, "COMMIT;");
  done_ = true;
}

} // namespace uds::sqlite
