#include "byte_codec.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

namespace sailcpp::core {

void AppendU8(std::vector<std::byte>& out, std::uint8_t value) {
  out.push_back(static_cast<std::byte>(value));
}

void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendU64LE(std::vector<std::byte>& out, std::uint64_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendF32LE(std::vector<std::byte>& out, float value) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32LE(out, bits);
}

void AppendString(std::vector<std::byte>& out, const std::string& value) {
  if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error("byte codec: string field exceeds uint32 length");
  }
  AppendU32LE(out, static_cast<std::uint32_t>(value.size()));
  for (const char ch : value) {
    out.push_back(static_cast<std::byte>(static_cast<unsigned char>(ch)));
  }
}

std::vector<std::byte> EncodeFloatVector(const std::vector<float>& values) {
  std::vector<std::byte> out{};
  out.reserve(values.size() * sizeof(float));
  for (const float value : values) {
    AppendF32LE(out, value);
  }
  return out;
}

std::optional<std::vector<float>> DecodeFloatVector(std::span<const std::byte> bytes) {
  if (bytes.size() % sizeof(float) != 0) {
    return std::nullopt;
  }
  ByteReader reader(bytes);
  std::vector<float> out{};
  out.reserve(bytes.size() / sizeof(float));
  while (!reader.exhausted()) {
    const auto value = reader.ReadF32();
    if (!value.has_value()) {
      return std::nullopt;
    }
    out.push_back(*value);
  }
  return out;
}

ByteReader::ByteReader(std::span<const std::byte> bytes) : bytes_(bytes) {}

std::optional<std::uint8_t> ByteReader::ReadU8() {
  if (cursor_ >= bytes_.size()) {
    return std::nullopt;
  }
  return std::to_integer<std::uint8_t>(bytes_[cursor_++]);
}

std::optional<std::uint32_t> ByteReader::ReadU32() {
  if (cursor_ + 4 > bytes_.size()) {
    return std::nullopt;
  }
  std::uint32_t out = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    out |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i])) << (8U * i);
  }
  cursor_ += 4;
  return out;
}

std::optional<std::uint64_t> ByteReader::ReadU64() {
  if (cursor_ + 8 > bytes_.size()) {
    return std::nullopt;
  }
  std::uint64_t out = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    out |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i])) << (8U * i);
  }
  cursor_ += 8;
  return out;
}

std::optional<float> ByteReader::ReadF32() {
  const auto bits = ReadU32();
  if (!bits.has_value()) {
    return std::nullopt;
  }
  float value = 0.0F;
  const std::uint32_t raw = *bits;
  std::memcpy(&value, &raw, sizeof(value));
  return value;
}

std::optional<std::string> ByteReader::ReadString() {
  const auto length = ReadU32();
  if (!length.has_value()) {
    return std::nullopt;
  }
  const auto raw = ReadBytes(*length);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  std::string out{};
  out.reserve(raw->size());
  for (const auto b : *raw) {
    out.push_back(static_cast<char>(std::to_integer<unsigned char>(b)));
  }
  return out;
}

std::optional<std::span<const std::byte>> ByteReader::ReadBytes(std::size_t length) {
  if (length > remaining()) {
    return std::nullopt;
  }
  const auto out = bytes_.subspan(cursor_, length);
  cursor_ += length;
  return out;
}

std::string ToHex(std::span<const std::byte> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out{};
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    const auto value = std::to_integer<unsigned char>(b);
    out.push_back(kDigits[value >> 4U]);
    out.push_back(kDigits[value & 0x0FU]);
  }
  return out;
}

}  // namespace sailcpp::core
