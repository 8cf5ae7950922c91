#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace sailcpp::storage {

// Owns one sqlite3 connection. Opened in serialized threading mode so the
// handle may be shared between a writer and concurrent readers.
class Database final {
 public:
  explicit Database(const std::filesystem::path& path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  sqlite3* get() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void BindText(int index, const std::string& value);
  void BindOptionalText(int index, const std::optional<std::string>& value);
  void BindInt(int index, std::int64_t value);
  void BindBlob(int index, std::span<const std::byte> value);
  void BindNull(int index);

  // true while rows remain; throws StorageError on any other result.
  bool Step();
  void Run();
  void Reset();

  [[nodiscard]] std::string ColumnText(int index) const;
  [[nodiscard]] std::optional<std::string> ColumnOptionalText(int index) const;
  [[nodiscard]] std::int64_t ColumnInt(int index) const;
  [[nodiscard]] std::vector<std::byte> ColumnBlob(int index) const;
  [[nodiscard]] bool ColumnIsNull(int index) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql);

// BEGIN IMMEDIATE on construction; rolls back on destruction unless Commit ran.
class Transaction final {
 public:
  explicit Transaction(sqlite3* db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit();

 private:
  sqlite3* db_ = nullptr;
  bool done_ = false;
};

}  // namespace sailcpp::storage
