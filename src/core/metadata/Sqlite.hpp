#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace uds::sqlite {

struct DbCloser   { void operator()(sqlite3* db) const; };
struct StmtCloser { void operator()(sqlite3_stmt* st) const; };

using DbPtr = std::unique_ptr<sqlite3, DbCloser>;

// Opens (creating when asked) a connection with the pragmas every store
// relies on: WAL, busy_timeout, foreign keys.
DbPtr open(const std::string& dbPath, bool create);

// Runs one or more statements; throws uds::StorageFailure on error.
void exec(sqlite3* db, const std::string& sql);

// Prepared statement with 1-based binds and 0-based column reads.
class Statement {
public:
  Statement(sqlite3* db, const char* sql);

  Statement& bind(int idx, const std::string& v);
  Statement& bind(int idx, int64_t v);

  // true while a row is available; false once done. Throws on error.
  bool step();
  // Steps a statement that must not return rows.
  void run();

  std::string text(int col) const;
  int64_t     int64(int col) const;

private:
  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtCloser> st_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called.
class Transaction {
public:
  explicit Transaction(sqlite3* db);
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  void commit();

private:
  sqlite3* db_;
  bool done_ = false;
};

} // namespace uds::sqlite
