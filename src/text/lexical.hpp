#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sailcpp::text {

// Lowercased runs of ASCII alphanumerics. Bytes >= 0x80 stay inside tokens so
// UTF-8 sequences are never split.
[[nodiscard]] std::vector<std::string> Tokenize(std::string_view text);
[[nodiscard]] std::set<std::string> TokenSet(std::string_view text);

// |a ∩ b| / |a ∪ b|; 0 when either side is empty.
[[nodiscard]] double Jaccard(const std::set<std::string>& lhs, const std::set<std::string>& rhs);

[[nodiscard]] std::vector<std::string> SplitWhitespaceTokens(std::string_view text);
[[nodiscard]] std::string JoinPrefixTokens(const std::vector<std::string>& tokens, std::size_t count);

[[nodiscard]] std::string ToLowerAscii(std::string_view text);
[[nodiscard]] std::string Trim(std::string_view text);

}  // namespace sailcpp::text
