#include "memory_index.hpp"

#include "../text/lexical.hpp"

#include <algorithm>
#include <utility>

namespace sailcpp {

std::string MemoryIndex::CompositeKey(MemoryTier tier, const std::string& scope, const std::string& key) {
  std::string out(MemoryTierName(tier));
  out.push_back('\x1F');
  out.append(scope);
  out.push_back('\x1F');
  out.append(key);
  return out;
}

bool MemoryIndex::InScope(const MemoryItem& item, const std::optional<std::string>& session_scope) {
  if (item.tier != MemoryTier::kSession) {
    return true;
  }
  return session_scope.has_value() && item.source_session_id == session_scope;
}

void MemoryIndex::Apply(const MemoryItem& item) {
  const std::string scope = item.tier == MemoryTier::kSession ? item.source_session_id.value_or("") : std::string{};
  entries_.insert_or_assign(CompositeKey(item.tier, scope, item.key), Entry{item, next_sequence_++});
}

std::optional<MemoryItem> MemoryIndex::Get(MemoryTier tier,
                                           const std::string& key,
                                           const std::optional<std::string>& session_scope) const {
  if (tier == MemoryTier::kSession && !session_scope.has_value()) {
    return std::nullopt;
  }
  const std::string scope = tier == MemoryTier::kSession ? *session_scope : std::string{};
  const auto it = entries_.find(CompositeKey(tier, scope, key));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.item;
}

std::vector<MemoryHit> MemoryIndex::Search(MemoryTier tier,
                                           const std::string& query,
                                           int top_k,
                                           const std::optional<std::string>& session_scope) const {
  const auto needle = text::ToLowerAscii(text::Trim(query));
  if (top_k <= 0 || needle.empty()) {
    return {};
  }
  const auto query_tokens = text::TokenSet(needle);

  std::vector<MemoryHit> hits{};
  for (const auto& [composite, entry] : entries_) {
    const auto& item = entry.item;
    if (item.tier != tier || !InScope(item, session_scope)) {
      continue;
    }
    const std::string haystack = item.key + " " + item.value;
    double relevance = text::Jaccard(query_tokens, text::TokenSet(haystack));
    if (text::ToLowerAscii(haystack).find(needle) != std::string::npos) {
      relevance += 0.5;
    }
    if (relevance <= 0.0) {
      continue;
    }
    hits.push_back(MemoryHit{item, static_cast<float>(std::min(relevance, 1.0))});
  }

  std::sort(hits.begin(), hits.end(), [](const MemoryHit& lhs, const MemoryHit& rhs) {
    if (lhs.relevance != rhs.relevance) {
      return lhs.relevance > rhs.relevance;
    }
    if (lhs.item.created_at != rhs.item.created_at) {
      return lhs.item.created_at > rhs.item.created_at;
    }
    return lhs.item.key < rhs.item.key;
  });
  if (hits.size() > static_cast<std::size_t>(top_k)) {
    hits.resize(static_cast<std::size_t>(top_k));
  }
  return hits;
}

std::size_t MemoryIndex::size() const {
  return entries_.size();
}

}  // namespace sailcpp
