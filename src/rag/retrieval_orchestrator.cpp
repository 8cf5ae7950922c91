#include "sailcpp/retrieval_orchestrator.hpp"

#include "../text/lexical.hpp"
#include "../vector/similarity.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <set>
#include <utility>

namespace sailcpp {
namespace {

struct KeptChunk {
  const Chunk* chunk = nullptr;
  std::set<std::string> tokens;
};

bool IsNearDuplicate(const Chunk& candidate,
                     const std::set<std::string>& candidate_tokens,
                     const std::vector<KeptChunk>& kept,
                     const RetrievalConfig& config) {
  for (const auto& prior : kept) {
    const auto& other = *prior.chunk;
    if (candidate.embedding.has_value() && other.embedding.has_value() &&
        candidate.embedding->size() == other.embedding->size() &&
        vector::CosineSimilarity(*candidate.embedding, *other.embedding) >= config.vector_dedup_threshold) {
      return true;
    }
    if (text::Jaccard(candidate_tokens, prior.tokens) >= static_cast<double>(config.lexical_dedup_threshold)) {
      return true;
    }
  }
  return false;
}

std::vector<ChunkHit> DropNearDuplicates(std::vector<ChunkHit> hits,
                                         std::vector<KeptChunk>& kept,
                                         const RetrievalConfig& config) {
  std::vector<ChunkHit> out{};
  out.reserve(hits.size());
  for (auto& hit : hits) {
    auto tokens = text::TokenSet(hit.chunk.text);
    if (IsNearDuplicate(hit.chunk, tokens, kept, config)) {
      spdlog::debug("retrieval: dropping near-duplicate chunk {}", hit.chunk.id);
      continue;
    }
    out.push_back(std::move(hit));
    // Pointers into `out` stay valid: it never reallocates past the reserve.
    kept.push_back(KeptChunk{&out.back().chunk, std::move(tokens)});
  }
  return out;
}

struct ScoredMemory {
  MemoryHit hit;
  float score = 0.0F;
};

std::vector<ScoredMemory> RankMemory(std::vector<MemoryHit> hits) {
  if (hits.empty()) {
    return {};
  }
  std::int64_t oldest = std::numeric_limits<std::int64_t>::max();
  std::int64_t newest = std::numeric_limits<std::int64_t>::min();
  for (const auto& hit : hits) {
    oldest = std::min(oldest, hit.item.created_at);
    newest = std::max(newest, hit.item.created_at);
  }

  std::vector<ScoredMemory> ranked{};
  ranked.reserve(hits.size());
  for (auto& hit : hits) {
    double recency = 1.0;
    if (newest > oldest) {
      recency = 0.5 + 0.5 * static_cast<double>(hit.item.created_at - oldest) / static_cast<double>(newest - oldest);
    }
    const auto score = static_cast<float>(static_cast<double>(hit.relevance) * recency);
    ranked.push_back(ScoredMemory{std::move(hit), score});
  }
  std::sort(ranked.begin(), ranked.end(), [](const ScoredMemory& lhs, const ScoredMemory& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    if (lhs.hit.item.created_at != rhs.hit.item.created_at) {
      return lhs.hit.item.created_at > rhs.hit.item.created_at;
    }
    if (lhs.hit.item.tier != rhs.hit.item.tier) {
      return lhs.hit.item.tier < rhs.hit.item.tier;
    }
    return lhs.hit.item.key < rhs.hit.item.key;
  });
  return ranked;
}

// Appends items in order until the bucket budget is spent. The item crossing
// the budget is clipped to the remaining tokens. budget < 0 means unlimited.
void EmitBucket(std::vector<ContextItem> items, int budget, RankedContext& context) {
  int used = 0;
  for (auto& item : items) {
    auto tokens = text::SplitWhitespaceTokens(item.text);
    if (tokens.empty()) {
      continue;
    }
    std::size_t emit_tokens = tokens.size();
    if (budget >= 0) {
      const int remaining = budget - used;
      if (remaining <= 0) {
        break;
      }
      emit_tokens = std::min<std::size_t>(emit_tokens, static_cast<std::size_t>(remaining));
    }
    item.text = text::JoinPrefixTokens(tokens, emit_tokens);
    item.tokens = static_cast<int>(emit_tokens);
    used += item.tokens;
    context.total_tokens += item.tokens;
    context.items.push_back(std::move(item));
    if (budget >= 0 && used >= budget) {
      break;
    }
  }
}

std::vector<ContextItem> ChunkItems(const std::vector<ChunkHit>& hits) {
  std::vector<ContextItem> items{};
  items.reserve(hits.size());
  for (const auto& hit : hits) {
    ContextItem item{};
    item.kind = ContextItemKind::kChunk;
    item.content_type = hit.chunk.content_type;
    item.ref = hit.chunk.id;
    item.paper_id = hit.chunk.paper_id;
    item.page_from = hit.chunk.page_from;
    item.page_to = hit.chunk.page_to;
    item.score = std::isnan(hit.score) ? 0.0F : hit.score;
    item.provenance = hit.provenance;
    item.text = hit.chunk.text;
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<ContextItem> MemoryItems(const std::vector<ScoredMemory>& ranked) {
  std::vector<ContextItem> items{};
  items.reserve(ranked.size());
  for (const auto& entry : ranked) {
    ContextItem item{};
    item.kind = ContextItemKind::kMemory;
    item.tier = entry.hit.item.tier;
    item.ref = entry.hit.item.key;
    item.score = entry.score;
    item.provenance = Provenance::kKeyword;
    item.text = entry.hit.item.value;
    items.push_back(std::move(item));
  }
  return items;
}

int BucketBudget(int max_tokens, float ratio) {
  if (max_tokens <= 0) {
    return -1;
  }
  return static_cast<int>(std::floor(static_cast<double>(max_tokens) * static_cast<double>(ratio)));
}

}  // namespace

RetrievalOrchestrator::RetrievalOrchestrator(const ChunkStore& chunks,
                                             MemoryManager& memory,
                                             std::shared_ptr<EmbeddingProvider> embedder,
                                             const RetrievalConfig& config)
    : chunks_(chunks), memory_(memory), embedder_(std::move(embedder)), config_(config) {}

RankedContext RetrievalOrchestrator::ComposeContext(const std::string& query) const {
  RankedContext context{};
  context.query = query;

  ChunkQuery chunk_query{};
  chunk_query.text = query;
  if (embedder_) {
    try {
      auto embedding = embedder_->EmbedText(query);
      if (embedding.empty()) {
        context.warnings.push_back("embedding_unavailable:empty query embedding");
      } else {
        chunk_query.embedding = std::move(embedding);
      }
    } catch (const std::exception& error) {
      spdlog::warn("retrieval: query embedding failed, using keyword ranking: {}", error.what());
      context.warnings.push_back(std::string("embedding_unavailable:") + error.what());
    }
  }

  auto buckets = chunks_.QueryBuckets(chunk_query, config_.buckets);
  std::vector<KeptChunk> kept{};
  kept.reserve(buckets.text.size() + buckets.figure.size() + buckets.table.size());
  const auto text_hits = DropNearDuplicates(std::move(buckets.text), kept, config_);
  const auto figure_hits = DropNearDuplicates(std::move(buckets.figure), kept, config_);
  const auto table_hits = DropNearDuplicates(std::move(buckets.table), kept, config_);

  std::vector<MemoryHit> memory_hits{};
  for (const auto tier : {MemoryTier::kUser, MemoryTier::kSession, MemoryTier::kAgent}) {
    auto hits = memory_.Search(tier, query, config_.memory_k, &context.warnings);
    memory_hits.insert(memory_hits.end(), std::make_move_iterator(hits.begin()), std::make_move_iterator(hits.end()));
  }

  const int max_tokens = config_.max_context_tokens;
  EmitBucket(ChunkItems(text_hits), BucketBudget(max_tokens, config_.text_ratio), context);
  EmitBucket(ChunkItems(figure_hits), BucketBudget(max_tokens, config_.figure_ratio), context);
  EmitBucket(ChunkItems(table_hits), BucketBudget(max_tokens, config_.table_ratio), context);
  EmitBucket(MemoryItems(RankMemory(std::move(memory_hits))), BucketBudget(max_tokens, config_.memory_ratio), context);

  spdlog::debug("retrieval: query '{}' -> {} items, {} tokens", query, context.items.size(), context.total_tokens);
  return context;
}

}  // namespace sailcpp
