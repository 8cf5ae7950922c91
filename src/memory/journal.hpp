#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace sailcpp::memory {

// Frame layout: u32 payload length, 8-byte SHA-256 prefix of the payload,
// payload. Payload: "SAILM1", u32 item count, then per item
// u8 tier, key, value, u64 created_at, u8 has_session, [session id].
[[nodiscard]] std::vector<std::byte> EncodeJournalRecord(const std::vector<MemoryItem>& items);

struct JournalScan {
  std::vector<std::vector<MemoryItem>> records;
  std::uint64_t valid_bytes = 0;
  std::uint64_t file_bytes = 0;
};

// Reads frames until EOF or the first torn/corrupt frame. A missing file is an
// empty journal.
[[nodiscard]] JournalScan ScanJournal(const std::filesystem::path& path);

// Holds the journal open for one append. Anything past valid_bytes (a torn
// tail left by an interrupted write) is truncated before appending.
class JournalWriter final {
 public:
  JournalWriter(const std::filesystem::path& path, std::uint64_t valid_bytes);
  ~JournalWriter();

  JournalWriter(const JournalWriter&) = delete;
  JournalWriter& operator=(const JournalWriter&) = delete;

  // Returns the journal size after the append.
  std::uint64_t Append(const std::vector<std::byte>& frame);

 private:
  std::filesystem::path path_;
  std::uint64_t offset_ = 0;
  std::ofstream out_;
};

}  // namespace sailcpp::memory
