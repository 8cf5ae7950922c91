#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sailcpp {

enum class ContentType : std::uint8_t {
  kText = 0,
  kFigure = 1,
  kTable = 2,
};

enum class Provenance {
  kVector,
  kKeyword,
};

enum class MemoryTier : std::uint8_t {
  kUser = 0,
  kSession = 1,
  kAgent = 2,
};

enum class SessionStatus {
  kInit,
  kQuestioning,
  kRetrieving,
  kSynthesizing,
  kDeciding,
  kComplete,
  kFailed,
};

[[nodiscard]] std::string_view ContentTypeName(ContentType type);
[[nodiscard]] std::optional<ContentType> ParseContentType(std::string_view name);
[[nodiscard]] std::string_view ProvenanceName(Provenance provenance);
[[nodiscard]] std::string_view MemoryTierName(MemoryTier tier);
[[nodiscard]] std::optional<MemoryTier> ParseMemoryTier(std::string_view name);
[[nodiscard]] std::string_view SessionStatusName(SessionStatus status);
[[nodiscard]] std::optional<SessionStatus> ParseSessionStatus(std::string_view name);
[[nodiscard]] bool IsTerminal(SessionStatus status);

struct Chunk {
  std::string id;
  std::string paper_id;
  ContentType content_type = ContentType::kText;
  std::string text;
  std::optional<std::vector<float>> embedding;
  int page_from = 0;
  int page_to = 0;
  std::optional<std::string> image_path;
};

struct ChunkHit {
  Chunk chunk;
  float score = 0.0F;
  Provenance provenance = Provenance::kKeyword;
};

struct ChunkQuery {
  std::optional<std::vector<float>> embedding;
  std::string text;
  std::optional<ContentType> content_type;
  int top_k = 5;
};

struct BucketLimits {
  int text_k = 6;
  int figure_k = 3;
  int table_k = 3;
};

struct ChunkBuckets {
  std::vector<ChunkHit> text;
  std::vector<ChunkHit> figure;
  std::vector<ChunkHit> table;
};

struct MemoryItem {
  MemoryTier tier = MemoryTier::kUser;
  std::string key;
  std::string value;
  std::int64_t created_at = 0;
  std::optional<std::string> source_session_id;
};

struct MemoryHit {
  MemoryItem item;
  float relevance = 0.0F;
};

struct Citation {
  std::string paper_id;
  int page_from = 0;
  int page_to = 0;
  std::string chunk_id;
};

struct Finding {
  std::string question;
  std::string answer;
  std::vector<Citation> citations;
  int round = 0;
};

struct Idea {
  std::string title;
  std::string motivation;
  std::string method;
  std::string eval;
  std::string risks;
  std::vector<std::string> refs;
  int round = 0;
};

struct ReadingListEntry {
  std::string paper_id;
  std::string reason;
  int round = 0;
};

struct Question {
  std::string text;
  int round = 0;
  bool pending = true;
};

struct PaperRecord {
  std::string id;
  std::string title;
  std::string url;
};

// Committed view of a research session. Only the planner loop mutates it, and
// only when a round commits.
struct Session {
  std::string id;
  std::string topic;
  SessionStatus status = SessionStatus::kInit;
  int rounds_completed = 0;
  int max_rounds = 0;
  std::vector<std::string> warnings;
  std::vector<Question> questions;
  std::vector<Finding> findings;
  std::vector<Idea> ideas;
  std::vector<ReadingListEntry> reading_list;
  std::string failure_reason;
};

enum class ContextItemKind {
  kChunk,
  kMemory,
};

struct ContextItem {
  ContextItemKind kind = ContextItemKind::kChunk;
  ContentType content_type = ContentType::kText;
  std::optional<MemoryTier> tier;
  std::string ref;
  std::string paper_id;
  int page_from = 0;
  int page_to = 0;
  float score = 0.0F;
  Provenance provenance = Provenance::kKeyword;
  std::string text;
  int tokens = 0;
};

struct RankedContext {
  std::string query;
  std::vector<ContextItem> items;
  int total_tokens = 0;
  std::vector<std::string> warnings;
};

struct EmbeddingConfig {
  std::string model = "hashed-token";
  // 0 lets the first successful embedding fix the dimension.
  int dimensions = 0;
};

struct RetrievalConfig {
  BucketLimits buckets{};
  int memory_k = 3;
  int max_context_tokens = 1500;
  float text_ratio = 0.55F;
  float figure_ratio = 0.15F;
  float table_ratio = 0.15F;
  float memory_ratio = 0.15F;
  float vector_dedup_threshold = 0.97F;
  float lexical_dedup_threshold = 0.9F;
};

struct ExtractionConfig {
  int worker_count = 4;
  int embedding_batch_size = 32;
};

enum class MemoryBackendKind {
  kLocal,
  kExternal,
};

struct MemoryConfig {
  MemoryBackendKind backend = MemoryBackendKind::kLocal;
};

struct PlannerConfig {
  int max_rounds = 6;
  int synthesis_attempts = 2;
  int round_attempts = 2;
};

struct EngineConfig {
  EmbeddingConfig embedding{};
  RetrievalConfig retrieval{};
  ExtractionConfig extraction{};
  MemoryConfig memory{};
  PlannerConfig planner{};
};

// Throws ConfigError describing the first invalid field.
void ValidateConfig(const EngineConfig& config);

}  // namespace sailcpp
