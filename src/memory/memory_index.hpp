#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sailcpp {

// In-memory view of every memory item ever written, keyed by
// (tier, session scope, key). Later applications replace earlier ones.
class MemoryIndex {
 public:
  MemoryIndex() = default;

  void Apply(const MemoryItem& item);

  [[nodiscard]] std::optional<MemoryItem> Get(MemoryTier tier,
                                              const std::string& key,
                                              const std::optional<std::string>& session_scope) const;
  // Relevance is token-set Jaccard between the query and "key value", raised
  // by 0.5 when the lowercased query occurs verbatim, capped at 1.
  [[nodiscard]] std::vector<MemoryHit> Search(MemoryTier tier,
                                              const std::string& query,
                                              int top_k,
                                              const std::optional<std::string>& session_scope) const;
  [[nodiscard]] std::size_t size() const;

 private:
  struct Entry {
    MemoryItem item;
    std::uint64_t sequence = 0;
  };

  static std::string CompositeKey(MemoryTier tier, const std::string& scope, const std::string& key);
  static bool InScope(const MemoryItem& item, const std::optional<std::string>& session_scope);

  std::uint64_t next_sequence_ = 0;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace sailcpp
