#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <string>

#include "errors.hpp"

// Owner of one sqlite3 connection used for daemon state (queue, file index).
class StateDatabase {
public:
  StateDatabase() = default;
  ~StateDatabase();

  StateDatabase(const StateDatabase&) = delete;
  StateDatabase& operator=(const StateDatabase&) = delete;

  // Creates the parent directory and the file if needed. With synchronous off
  // a commit is not flushed to disk before returning.
  Result<void> open(const std::filesystem::path& path, bool synchronous);
  void close();
  bool is_open() const { return db_ != nullptr; }

  Result<void> exec(const std::string& sql);
  SyncError failure(const std::string& what) const;

  sqlite3* handle() const { return db_; }
  const std::filesystem::path& path() const { return path_; }

private:
  sqlite3* db_ = nullptr;
  std::filesystem::path path_;
};

// Prepared statement, finalized on destruction. Text is bound and read with
// explicit lengths so arbitrary path bytes round-trip unchanged.
class Statement {
public:
  Statement(StateDatabase& db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool prepared() const { return stmt_ != nullptr; }

  void bind_text(int index, const std::string& value);
  void bind_int(int index, int64_t value);
  void bind_null(int index);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int step();
  Result<void> run(const std::string& what);

  std::string column_text(int column) const;
  int64_t column_int(int column) const;
  bool column_null(int column) const;

private:
  StateDatabase& db_;
  sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolled back unless commit() succeeded.
class Transaction {
public:
  explicit Transaction(StateDatabase& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  const Result<void>& begun() const { return begun_; }
  Result<void> commit();

private:
  StateDatabase& db_;
  Result<void> begun_;
  bool done_ = false;
};
