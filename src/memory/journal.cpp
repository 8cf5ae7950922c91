#include "journal.hpp"

#include "sailcpp/errors.hpp"

#include "../core/byte_codec.hpp"
#include "../core/sha256.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <system_error>

namespace sailcpp::memory {
namespace {

constexpr std::array<char, 6> kMagic = {'S', 'A', 'I', 'L', 'M', '1'};
constexpr std::size_t kChecksumBytes = 8;
constexpr std::size_t kFrameHeaderBytes = 4 + kChecksumBytes;

std::array<std::byte, kChecksumBytes> Checksum(std::span<const std::byte> payload) {
  const auto digest = core::Sha256Digest(payload);
  std::array<std::byte, kChecksumBytes> out{};
  std::copy_n(digest.begin(), kChecksumBytes, out.begin());
  return out;
}

std::optional<std::vector<MemoryItem>> DecodePayload(std::span<const std::byte> payload) {
  core::ByteReader reader(payload);
  const auto magic = reader.ReadBytes(kMagic.size());
  if (!magic.has_value()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < kMagic.size(); ++i) {
    if (std::to_integer<char>((*magic)[i]) != kMagic[i]) {
      return std::nullopt;
    }
  }
  const auto count = reader.ReadU32();
  if (!count.has_value()) {
    return std::nullopt;
  }

  std::vector<MemoryItem> items{};
  for (std::uint32_t i = 0; i < *count; ++i) {
    const auto tier = reader.ReadU8();
    auto key = reader.ReadString();
    auto value = reader.ReadString();
    const auto created_at = reader.ReadU64();
    const auto has_session = reader.ReadU8();
    if (!tier.has_value() || *tier > static_cast<std::uint8_t>(MemoryTier::kAgent) || !key.has_value() ||
        !value.has_value() || !created_at.has_value() || !has_session.has_value()) {
      return std::nullopt;
    }
    MemoryItem item{};
    item.tier = static_cast<MemoryTier>(*tier);
    item.key = std::move(*key);
    item.value = std::move(*value);
    item.created_at = static_cast<std::int64_t>(*created_at);
    if (*has_session != 0) {
      auto session = reader.ReadString();
      if (!session.has_value()) {
        return std::nullopt;
      }
      item.source_session_id = std::move(*session);
    }
    items.push_back(std::move(item));
  }
  if (!reader.exhausted()) {
    return std::nullopt;
  }
  return items;
}

}  // namespace

std::vector<std::byte> EncodeJournalRecord(const std::vector<MemoryItem>& items) {
  std::vector<std::byte> payload{};
  for (const char ch : kMagic) {
    payload.push_back(static_cast<std::byte>(ch));
  }
  core::AppendU32LE(payload, static_cast<std::uint32_t>(items.size()));
  for (const auto& item : items) {
    core::AppendU8(payload, static_cast<std::uint8_t>(item.tier));
    core::AppendString(payload, item.key);
    core::AppendString(payload, item.value);
    core::AppendU64LE(payload, static_cast<std::uint64_t>(item.created_at));
    core::AppendU8(payload, item.source_session_id.has_value() ? 1U : 0U);
    if (item.source_session_id.has_value()) {
      core::AppendString(payload, *item.source_session_id);
    }
  }

  std::vector<std::byte> frame{};
  frame.reserve(kFrameHeaderBytes + payload.size());
  core::AppendU32LE(frame, static_cast<std::uint32_t>(payload.size()));
  const auto checksum = Checksum(payload);
  frame.insert(frame.end(), checksum.begin(), checksum.end());
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

JournalScan ScanJournal(const std::filesystem::path& path) {
  JournalScan scan{};
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return scan;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StorageError("memory journal: cannot open " + path.string());
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw StorageError("memory journal: read failed for " + path.string());
  }
  std::vector<std::byte> bytes(raw.size());
  std::transform(raw.begin(), raw.end(), bytes.begin(), [](char ch) { return static_cast<std::byte>(ch); });
  scan.file_bytes = bytes.size();

  core::ByteReader reader(bytes);
  while (!reader.exhausted()) {
    const auto length = reader.ReadU32();
    const auto checksum = reader.ReadBytes(kChecksumBytes);
    if (!length.has_value() || !checksum.has_value()) {
      break;
    }
    const auto payload = reader.ReadBytes(*length);
    if (!payload.has_value()) {
      break;
    }
    const auto expected = Checksum(*payload);
    if (!std::equal(expected.begin(), expected.end(), checksum->begin())) {
      break;
    }
    auto items = DecodePayload(*payload);
    if (!items.has_value()) {
      break;
    }
    scan.records.push_back(std::move(*items));
    scan.valid_bytes = reader.position();
  }
  if (scan.valid_bytes != scan.file_bytes) {
    spdlog::warn("memory journal {}: ignoring {} trailing bytes after the last intact record",
                 path.string(),
                 scan.file_bytes - scan.valid_bytes);
  }
  return scan;
}

JournalWriter::JournalWriter(const std::filesystem::path& path, std::uint64_t valid_bytes)
    : path_(path), offset_(valid_bytes) {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw StorageError("memory journal: cannot create directory " + path_.parent_path().string() + ": " +
                         ec.message());
    }
  }
  if (std::filesystem::exists(path_, ec)) {
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
      throw StorageError("memory journal: cannot stat " + path_.string() + ": " + ec.message());
    }
    if (size != valid_bytes) {
      std::filesystem::resize_file(path_, valid_bytes, ec);
      if (ec) {
        throw StorageError("memory journal: cannot truncate torn tail of " + path_.string() + ": " + ec.message());
      }
    }
  }
  out_.open(path_, std::ios::binary | std::ios::app);
  if (!out_) {
    throw StorageError("memory journal: cannot open " + path_.string() + " for append");
  }
}

JournalWriter::~JournalWriter() {
  if (out_.is_open()) {
    out_.close();
  }
}

std::uint64_t JournalWriter::Append(const std::vector<std::byte>& frame) {
  out_.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
  out_.flush();
  if (!out_) {
    throw StorageError("memory journal: append failed for " + path_.string());
  }
  offset_ += frame.size();
  return offset_;
}

}  // namespace sailcpp::memory
