#pragma once

#include "sailcpp/chunk_store.hpp"
#include "sailcpp/embeddings.hpp"
#include "sailcpp/memory.hpp"
#include "sailcpp/types.hpp"

#include <memory>
#include <string>

namespace sailcpp {

// Fuses bucketed chunk retrieval with tiered memory search for one session.
// ComposeContext never writes to either store.
class RetrievalOrchestrator {
 public:
  RetrievalOrchestrator(const ChunkStore& chunks,
                        MemoryManager& memory,
                        std::shared_ptr<EmbeddingProvider> embedder,
                        const RetrievalConfig& config);

  [[nodiscard]] RankedContext ComposeContext(const std::string& query) const;

 private:
  const ChunkStore& chunks_;
  MemoryManager& memory_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  RetrievalConfig config_;
};

}  // namespace sailcpp
