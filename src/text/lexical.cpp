#include "lexical.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sailcpp::text {

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (ch >= 0x80U || std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(ch >= 0x80U ? ch : std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
      current.reserve(32);
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::set<std::string> TokenSet(std::string_view text) {
  auto tokens = Tokenize(text);
  return std::set<std::string>(std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end()));
}

double Jaccard(const std::set<std::string>& lhs, const std::set<std::string>& rhs) {
  if (lhs.empty() || rhs.empty()) {
    return 0.0;
  }
  std::size_t intersection = 0;
  auto lhs_it = lhs.begin();
  auto rhs_it = rhs.begin();
  while (lhs_it != lhs.end() && rhs_it != rhs.end()) {
    if (*lhs_it < *rhs_it) {
      ++lhs_it;
    } else if (*rhs_it < *lhs_it) {
      ++rhs_it;
    } else {
      ++intersection;
      ++lhs_it;
      ++rhs_it;
    }
  }
  const std::size_t union_size = lhs.size() + rhs.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<std::string> SplitWhitespaceTokens(std::string_view text) {
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
      ++start;
    }
    if (start >= text.size()) {
      break;
    }
    std::size_t end = start;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    tokens.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return tokens;
}

std::string JoinPrefixTokens(const std::vector<std::string>& tokens, std::size_t count) {
  if (count == 0 || tokens.empty()) {
    return {};
  }
  std::string out = tokens[0];
  for (std::size_t i = 1; i < count && i < tokens.size(); ++i) {
    out.push_back(' ');
    out.append(tokens[i]);
  }
  return out;
}

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

}  // namespace sailcpp::text
