#include "state_db.hpp"

#include <system_error>

StateDatabase::~StateDatabase() {
  close();
}

void StateDatabase::close() {
  if(db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SyncError StateDatabase::failure(const std::string& what) const {
  std::string detail = db_ ? sqlite3_errmsg(db_) : "database is not open";
  return make_error(ErrorKind::StateStoreFailure, what + ": " + detail, path_.string());
}

Result<void> StateDatabase::open(const std::filesystem::path& path, bool synchronous) {
  close();
  path_ = path;
  if(path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      return Result<void>::Error(make_error(ErrorKind::StateStoreFailure,
                                            "cannot create state directory: " + ec.message(),
                                            path.parent_path().string()));
    }
  }

  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if(rc != SQLITE_OK) {
    auto error = failure("cannot open database");
    close();
    return Result<void>::Error(error);
  }
  sqlite3_busy_timeout(db_, 5000);

  // the first statement to read the file is where a non-database is detected
  auto pragmas = exec(std::string("PRAGMA journal_mode=WAL; PRAGMA synchronous=") +
                      (synchronous ? "FULL;" : "OFF;"));
  if(!pragmas.success) {
    close();
    return pragmas;
  }
  return Result<void>::Ok();
}

Result<void> StateDatabase::exec(const std::string& sql) {
  if(!db_) return Result<void>::Error(failure("exec"));
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if(rc != SQLITE_OK) {
    std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    return Result<void>::Error(make_error(ErrorKind::StateStoreFailure,
                                          "SQL error: " + message, path_.string()));
  }
  return Result<void>::Ok();
}

Statement::Statement(StateDatabase& db, const char* sql) : db_(db) {
  if(db.handle() && sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if(stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind_text(int index, const std::string& value) {
  if(stmt_) sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_int(int index, int64_t value) {
  if(stmt_) sqlite3_bind_int64(stmt_, index, value);
}

void Statement::bind_null(int index) {
  if(stmt_) sqlite3_bind_null(stmt_, index);
}

int Statement::step() {
  if(!stmt_) return SQLITE_MISUSE;
  return sqlite3_step(stmt_);
}

Result<void> Statement::run(const std::string& what) {
  if(!stmt_) return Result<void>::Error(db_.failure(what + " (prepare)"));
  if(step() != SQLITE_DONE) return Result<void>::Error(db_.failure(what));
  return Result<void>::Ok();
}

std::string Statement::column_text(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if(!text) return std::string();
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

int64_t Statement::column_int(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

bool Statement::column_null(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Transaction::Transaction(StateDatabase& db) : db_(db) {
  begun_ = db_.exec("BEGIN IMMEDIATE;");
  if(!begun_.success) done_ = true;
}

Transaction::~Transaction() {
  if(!done_) {
    auto rolled_back = db_.exec("ROLLBACK;");
    (void)rolled_back;
  }
}

Result<void> Transaction::commit() {
  if(done_) return begun_.success ? Result<void>::Ok() : begun_;
  auto committed = db_.exec("COMMIT;");
  if(committed.success) done_ = true;
  return committed;
}
