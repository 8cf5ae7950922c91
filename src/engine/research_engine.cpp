#include "sailcpp/research_engine.hpp"

#include "sailcpp/chunk_store.hpp"
#include "sailcpp/errors.hpp"
#include "sailcpp/retrieval_orchestrator.hpp"

#include "../core/sha256.hpp"
#include "../text/lexical.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace sailcpp {
namespace {

constexpr int kDefaultHashedDimensions = 256;

// Keeps a running loop reachable from RequestStop for the duration of a run.
class ActiveLoopRegistration final {
 public:
  ActiveLoopRegistration(std::mutex& mutex,
                         std::unordered_map<std::string, PlannerLoop*>& loops,
                         const std::string& session_id,
                         PlannerLoop* loop)
      : mutex_(mutex), loops_(loops), session_id_(session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loops_.emplace(session_id_, loop).second) {
      throw std::runtime_error("research engine: session " + session_id_ + " is already running");
    }
  }

  ~ActiveLoopRegistration() {
    std::lock_guard<std::mutex> lock(mutex_);
    loops_.erase(session_id_);
  }

  ActiveLoopRegistration(const ActiveLoopRegistration&) = delete;
  ActiveLoopRegistration& operator=(const ActiveLoopRegistration&) = delete;

 private:
  std::mutex& mutex_;
  std::unordered_map<std::string, PlannerLoop*>& loops_;
  std::string session_id_;
};

}  // namespace

ResearchEngine::ResearchEngine(const std::filesystem::path& root, const EngineConfig& config, Providers providers)
    : root_(root), config_(config), providers_(std::move(providers)) {
  ValidateConfig(config_);
  if (!providers_.synthesis) {
    throw ConfigError("research engine: a synthesis provider is required");
  }

  std::error_code ec;
  std::filesystem::create_directories(root_ / "chunks", ec);
  if (ec) {
    throw StorageError("research engine: cannot create workspace " + root_.string() + ": " + ec.message());
  }

  if (!providers_.embedder && config_.embedding.model == "hashed-token") {
    const int dimensions = config_.embedding.dimensions > 0 ? config_.embedding.dimensions : kDefaultHashedDimensions;
    providers_.embedder = std::make_shared<HashedTokenEmbedder>(dimensions);
  }

  switch (config_.memory.backend) {
    case MemoryBackendKind::kLocal:
      memory_backend_ = std::make_shared<LocalMemoryBackend>(root_ / "memory.journal");
      break;
    case MemoryBackendKind::kExternal:
      if (!providers_.external_memory) {
        throw ConfigError("research engine: external memory backend selected but none was provided");
      }
      memory_backend_ = providers_.external_memory;
      break;
  }

  sessions_ = std::make_unique<SessionStore>(root_ / "sessions.sqlite3");
  spdlog::info("research engine: workspace {} ready ({} memory backend, embedder {})",
               root_.string(),
               config_.memory.backend == MemoryBackendKind::kLocal ? "local" : "external",
               providers_.embedder ? config_.embedding.model : std::string("none"));
}

std::string ResearchEngine::StartSession(const std::string& topic, std::optional<int> max_rounds) {
  const auto trimmed = text::Trim(topic);
  if (trimmed.empty()) {
    throw ConfigError("research engine: topic must not be empty");
  }
  const int rounds = max_rounds.value_or(config_.planner.max_rounds);
  if (rounds <= 0) {
    throw ConfigError("research engine: max_rounds must be positive");
  }

  std::uint64_t counter = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    counter = ++session_counter_;
  }
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  Session session{};
  session.id = core::Sha256Hex(trimmed + '\x1F' + std::to_string(now) + '\x1F' + std::to_string(counter), 6);
  session.topic = trimmed;
  session.status = SessionStatus::kInit;
  session.max_rounds = rounds;
  sessions_->CreateSession(session);
  spdlog::info("research engine: started session {} on '{}' (max {} rounds)", session.id, session.topic, rounds);
  return session.id;
}

Session ResearchEngine::RunSession(const std::string& session_id, const CancellationToken& token) {
  auto loaded = sessions_->LoadSession(session_id);
  if (!loaded.has_value()) {
    throw std::runtime_error("research engine: unknown session " + session_id);
  }
  if (IsTerminal(loaded->status)) {
    return *loaded;
  }
  if (loaded->rounds_completed > 0) {
    spdlog::info("research engine: resuming session {} after round {}", session_id, loaded->rounds_completed);
  }

  ChunkStore chunks(root_ / "chunks" / (session_id + ".sqlite3"), config_.embedding.dimensions);
  MemoryManager memory(memory_backend_, session_id);
  RetrievalOrchestrator retrieval(chunks, memory, providers_.embedder, config_.retrieval);
  ExtractionPool extraction(config_.extraction, providers_.vision, providers_.embedder);

  PlannerDependencies deps{};
  deps.sessions = sessions_.get();
  deps.chunks = &chunks;
  deps.memory = &memory;
  deps.retrieval = &retrieval;
  deps.extraction = &extraction;
  deps.synthesis = providers_.synthesis;
  deps.documents = providers_.documents;

  PlannerLoop loop(config_, std::move(*loaded), std::move(deps));
  ActiveLoopRegistration registration(mutex_, active_loops_, session_id, &loop);
  const auto status = loop.Run(token);
  spdlog::info("research engine: session {} stopped in {}", session_id, SessionStatusName(status));
  return loop.session();
}

bool ResearchEngine::RequestStop(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = active_loops_.find(session_id);
  if (it == active_loops_.end()) {
    return false;
  }
  it->second->RequestStop();
  return true;
}

std::vector<std::string> ResearchEngine::ListSessions() const {
  return sessions_->ListSessions();
}

std::optional<Session> ResearchEngine::GetSession(const std::string& session_id) const {
  return sessions_->LoadSession(session_id);
}

std::vector<PaperRecord> ResearchEngine::ListPapers() const {
  return sessions_->ListPapers();
}

}  // namespace sailcpp
