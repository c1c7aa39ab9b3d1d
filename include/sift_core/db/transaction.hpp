#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace sift_core {

// Scoped write transaction; rolls back unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db) : db_(db), active_(true) {
    db_ << "BEGIN IMMEDIATE;";
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "[Transaction] Rollback failed: " << e.errstr() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool active_;
};

// Opens (creating if needed) a single-writer SQLite file. Durable files fsync
// on every commit so a returned write survives a crash.
inline sqlite::database open_database_file(const std::string &path, bool durable) {
  sqlite::database db(path);
  db << "PRAGMA journal_mode = DELETE;";
  if (durable) {
    db << "PRAGMA synchronous = FULL;";
  } else {
    db << "PRAGMA synchronous = NORMAL;";
  }
  return db;
}

}  // namespace sift_core
