#pragma once

#include "sailcpp/chunk_store.hpp"
#include "sailcpp/embeddings.hpp"
#include "sailcpp/providers.hpp"
#include "sailcpp/types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sailcpp {

class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ExtractionTask {
  std::string paper_id;
  ContentType content_type = ContentType::kText;
  std::string location;
  int page_from = 0;
  int page_to = 0;
  // Raw passage for text tasks, caption context for figure and table tasks.
  std::string text;
  std::vector<std::byte> image;
  std::optional<std::string> image_path;
};

enum class ExtractionStatus {
  kSucceeded,
  kFailed,
  kSkipped,
};

struct ExtractionOutcome {
  std::size_t task_index = 0;
  std::string chunk_id;
  ExtractionStatus status = ExtractionStatus::kSkipped;
  std::optional<Chunk> chunk;
  std::string reason;
};

struct ExtractionReport {
  std::vector<ExtractionOutcome> outcomes;
  std::size_t stored = 0;
  std::size_t embedded = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  bool cancelled = false;
  std::vector<std::string> warnings;
};

// Turns newly available document content into extraction tasks. Documents with
// no passages fall back to their abstract; documents with neither produce a
// warning and no tasks.
[[nodiscard]] std::vector<ExtractionTask> PlanExtractionTasks(const SourceDocument& document,
                                                              std::vector<std::string>& warnings);

// Runs describe calls on a fixed number of worker threads, batches embeddings
// for the described chunks, then writes them to the chunk store.
class ExtractionPool {
 public:
  ExtractionPool(const ExtractionConfig& config,
                 std::shared_ptr<VisionProvider> vision,
                 std::shared_ptr<EmbeddingProvider> embedder);

  ExtractionReport Run(const std::vector<ExtractionTask>& tasks,
                       ChunkStore& store,
                       const CancellationToken& token) const;

 private:
  [[nodiscard]] ExtractionOutcome Describe(std::size_t index, const ExtractionTask& task) const;
  void EmbedChunks(std::vector<ExtractionOutcome>& outcomes,
                   const std::vector<ExtractionTask>& tasks,
                   ExtractionReport& report) const;

  ExtractionConfig config_;
  std::shared_ptr<VisionProvider> vision_;
  std::shared_ptr<EmbeddingProvider> embedder_;
};

}  // namespace sailcpp
