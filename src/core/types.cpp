#include "sailcpp/types.hpp"

#include "sailcpp/errors.hpp"

#include <cmath>
#include <string>

namespace sailcpp {
namespace {

void RequirePositive(int value, const char* field) {
  if (value <= 0) {
    throw ConfigError(std::string("config: ") + field + " must be positive");
  }
}

void RequireNonNegative(int value, const char* field) {
  if (value < 0) {
    throw ConfigError(std::string("config: ") + field + " must not be negative");
  }
}

void RequireRatio(float value, const char* field) {
  if (std::isnan(value) || value < 0.0F || value > 1.0F) {
    throw ConfigError(std::string("config: ") + field + " must be within [0, 1]");
  }
}

}  // namespace

std::string_view ContentTypeName(ContentType type) {
  switch (type) {
    case ContentType::kText:
      return "text";
    case ContentType::kFigure:
      return "figure";
    case ContentType::kTable:
      return "table";
  }
  return "text";
}

std::optional<ContentType> ParseContentType(std::string_view name) {
  if (name == "text") {
    return ContentType::kText;
  }
  if (name == "figure") {
    return ContentType::kFigure;
  }
  if (name == "table") {
    return ContentType::kTable;
  }
  return std::nullopt;
}

std::string_view ProvenanceName(Provenance provenance) {
  return provenance == Provenance::kVector ? "vector" : "keyword";
}

std::string_view MemoryTierName(MemoryTier tier) {
  switch (tier) {
    case MemoryTier::kUser:
      return "user";
    case MemoryTier::kSession:
      return "session";
    case MemoryTier::kAgent:
      return "agent";
  }
  return "user";
}

std::optional<MemoryTier> ParseMemoryTier(std::string_view name) {
  if (name == "user") {
    return MemoryTier::kUser;
  }
  if (name == "session") {
    return MemoryTier::kSession;
  }
  if (name == "agent") {
    return MemoryTier::kAgent;
  }
  return std::nullopt;
}

std::string_view SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kInit:
      return "INIT";
    case SessionStatus::kQuestioning:
      return "QUESTIONING";
    case SessionStatus::kRetrieving:
      return "RETRIEVING";
    case SessionStatus::kSynthesizing:
      return "SYNTHESIZING";
    case SessionStatus::kDeciding:
      return "DECIDING";
    case SessionStatus::kComplete:
      return "COMPLETE";
    case SessionStatus::kFailed:
      return "FAILED";
  }
  return "INIT";
}

std::optional<SessionStatus> ParseSessionStatus(std::string_view name) {
  for (const auto status : {SessionStatus::kInit,
                            SessionStatus::kQuestioning,
                            SessionStatus::kRetrieving,
                            SessionStatus::kSynthesizing,
                            SessionStatus::kDeciding,
                            SessionStatus::kComplete,
                            SessionStatus::kFailed}) {
    if (SessionStatusName(status) == name) {
      return status;
    }
  }
  return std::nullopt;
}

bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kComplete || status == SessionStatus::kFailed;
}

void ValidateConfig(const EngineConfig& config) {
  RequireNonNegative(config.embedding.dimensions, "embedding.dimensions");

  const auto& retrieval = config.retrieval;
  RequireNonNegative(retrieval.buckets.text_k, "retrieval.buckets.text_k");
  RequireNonNegative(retrieval.buckets.figure_k, "retrieval.buckets.figure_k");
  RequireNonNegative(retrieval.buckets.table_k, "retrieval.buckets.table_k");
  RequireNonNegative(retrieval.memory_k, "retrieval.memory_k");
  RequireNonNegative(retrieval.max_context_tokens, "retrieval.max_context_tokens");
  RequireRatio(retrieval.text_ratio, "retrieval.text_ratio");
  RequireRatio(retrieval.figure_ratio, "retrieval.figure_ratio");
  RequireRatio(retrieval.table_ratio, "retrieval.table_ratio");
  RequireRatio(retrieval.memory_ratio, "retrieval.memory_ratio");
  const float ratio_sum =
      retrieval.text_ratio + retrieval.figure_ratio + retrieval.table_ratio + retrieval.memory_ratio;
  if (ratio_sum > 1.0F + 1e-4F) {
    throw ConfigError("config: retrieval modality ratios must not sum above 1");
  }
  RequireRatio(retrieval.vector_dedup_threshold, "retrieval.vector_dedup_threshold");
  RequireRatio(retrieval.lexical_dedup_threshold, "retrieval.lexical_dedup_threshold");

  RequirePositive(config.extraction.worker_count, "extraction.worker_count");
  RequirePositive(config.extraction.embedding_batch_size, "extraction.embedding_batch_size");

  RequirePositive(config.planner.max_rounds, "planner.max_rounds");
  RequirePositive(config.planner.synthesis_attempts, "planner.synthesis_attempts");
  RequirePositive(config.planner.round_attempts, "planner.round_attempts");
}

}  // namespace sailcpp
