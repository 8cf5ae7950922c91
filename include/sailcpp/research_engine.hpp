#pragma once

#include "sailcpp/embeddings.hpp"
#include "sailcpp/extraction_pool.hpp"
#include "sailcpp/memory.hpp"
#include "sailcpp/planner_loop.hpp"
#include "sailcpp/providers.hpp"
#include "sailcpp/session_store.hpp"
#include "sailcpp/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sailcpp {

struct Providers {
  std::shared_ptr<EmbeddingProvider> embedder;
  std::shared_ptr<VisionProvider> vision;
  std::shared_ptr<SynthesisProvider> synthesis;
  std::shared_ptr<DocumentSource> documents;
  // Used only when config.memory.backend == MemoryBackendKind::kExternal.
  std::shared_ptr<MemoryBackend> external_memory;
};

// Owns a workspace directory:
//   <root>/sessions.sqlite3          session records and paper catalog
//   <root>/chunks/<session>.sqlite3  per-session chunk store
//   <root>/memory.journal            local memory backend
// Sessions may run concurrently from different threads.
class ResearchEngine {
 public:
  ResearchEngine(const std::filesystem::path& root, const EngineConfig& config, Providers providers);

  std::string StartSession(const std::string& topic, std::optional<int> max_rounds = std::nullopt);
  // Runs (or resumes) a session until it is terminal or the token is cancelled.
  Session RunSession(const std::string& session_id, const CancellationToken& token);
  bool RequestStop(const std::string& session_id);

  [[nodiscard]] std::vector<std::string> ListSessions() const;
  [[nodiscard]] std::optional<Session> GetSession(const std::string& session_id) const;
  [[nodiscard]] std::vector<PaperRecord> ListPapers() const;

 private:
  std::filesystem::path root_;
  EngineConfig config_;
  Providers providers_;
  std::shared_ptr<MemoryBackend> memory_backend_;
  std::unique_ptr<SessionStore> sessions_;
  std::unordered_map<std::string, PlannerLoop*> active_loops_;
  std::uint64_t session_counter_ = 0;
  mutable std::mutex mutex_{};
};

}  // namespace sailcpp
