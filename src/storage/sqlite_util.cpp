#include "sqlite_util.hpp"

#include "sailcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace sailcpp::storage {
namespace {

[[noreturn]] void Fail(sqlite3* db, const char* what) {
  throw StorageError(std::string("sqlite ") + what + " failed: " + (db != nullptr ? sqlite3_errmsg(db) : "no handle"));
}

}  // namespace

Database::Database(const std::filesystem::path& path) {
  const auto path_string = path.string();
  if (sqlite3_open_v2(path_string.c_str(),
                      &db_,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string message = "sqlite open failed for " + path_string;
    if (db_ != nullptr) {
      message += ": ";
      message += sqlite3_errmsg(db_);
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw StorageError(message);
  }
  sqlite3_busy_timeout(db_, 5000);
}

Database::~Database() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    Fail(db_, "prepare");
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::BindText(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    Fail(db_, "bind");
  }
}

void Statement::BindOptionalText(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(index, *value);
  } else {
    BindNull(index);
  }
}

void Statement::BindInt(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    Fail(db_, "bind");
  }
}

void Statement::BindBlob(int index, std::span<const std::byte> value) {
  if (sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    Fail(db_, "bind");
  }
}

void Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    Fail(db_, "bind");
  }
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  Fail(db_, "step");
}

void Statement::Run() {
  while (Step()) {
  }
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string Statement::ColumnText(int index) const {
  const auto* text = sqlite3_column_text(stmt_, index);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::ColumnOptionalText(int index) const {
  if (ColumnIsNull(index)) {
    return std::nullopt;
  }
  return ColumnText(index);
}

std::int64_t Statement::ColumnInt(int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

std::vector<std::byte> Statement::ColumnBlob(int index) const {
  const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, index));
  const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index));
  if (data == nullptr || size == 0) {
    return {};
  }
  return std::vector<std::byte>(data, data + size);
}

bool Statement::ColumnIsNull(int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw StorageError(message);
}

Transaction::Transaction(sqlite3* db) : db_(db) {
  Exec(db_, "BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("sqlite rollback failed: {}", err != nullptr ? err : "unknown error");
  }
  if (err != nullptr) {
    sqlite3_free(err);
  }
}

void Transaction::Commit() {
  Exec(db_, "COMMIT;");
  done_ = true;
}

}  // namespace sailcpp::storage
