#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sailcpp::core {

void AppendU8(std::vector<std::byte>& out, std::uint8_t value);
void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value);
void AppendU64LE(std::vector<std::byte>& out, std::uint64_t value);
void AppendF32LE(std::vector<std::byte>& out, float value);
// u32 length prefix followed by the raw bytes.
void AppendString(std::vector<std::byte>& out, const std::string& value);

[[nodiscard]] std::vector<std::byte> EncodeFloatVector(const std::vector<float>& values);
[[nodiscard]] std::optional<std::vector<float>> DecodeFloatVector(std::span<const std::byte> bytes);

// Bounds-checked little-endian cursor. Every read returns std::nullopt once the
// input is exhausted instead of reading past it.
class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> bytes);

  std::optional<std::uint8_t> ReadU8();
  std::optional<std::uint32_t> ReadU32();
  std::optional<std::uint64_t> ReadU64();
  std::optional<float> ReadF32();
  std::optional<std::string> ReadString();
  std::optional<std::span<const std::byte>> ReadBytes(std::size_t length);

  [[nodiscard]] std::size_t position() const { return cursor_; }
  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - cursor_; }
  [[nodiscard]] bool exhausted() const { return cursor_ == bytes_.size(); }

 private:
  std::span<const std::byte> bytes_;
  std::size_t cursor_ = 0;
};

[[nodiscard]] std::string ToHex(std::span<const std::byte> bytes);

}  // namespace sailcpp::core
