#pragma once

#include "sailcpp/chunk_store.hpp"
#include "sailcpp/extraction_pool.hpp"
#include "sailcpp/memory.hpp"
#include "sailcpp/providers.hpp"
#include "sailcpp/retrieval_orchestrator.hpp"
#include "sailcpp/session_store.hpp"
#include "sailcpp/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sailcpp {

struct PlannerDependencies {
  SessionStore* sessions = nullptr;
  ChunkStore* chunks = nullptr;
  MemoryManager* memory = nullptr;
  const RetrievalOrchestrator* retrieval = nullptr;
  const ExtractionPool* extraction = nullptr;
  std::shared_ptr<SynthesisProvider> synthesis;
  std::shared_ptr<DocumentSource> documents;
};

// Round-based state machine for one session:
//   INIT -> QUESTIONING -> RETRIEVING -> SYNTHESIZING -> DECIDING
//        -> {QUESTIONING | COMPLETE | FAILED}
// Rounds run strictly in sequence. All writes of a round are buffered and
// published together when DECIDING commits.
class PlannerLoop {
 public:
  using PhaseListener = std::function<void(SessionStatus)>;

  PlannerLoop(const EngineConfig& config, Session session, PlannerDependencies deps);

  // Runs one round (with one automatic retry on a round-fatal error) and
  // returns the committed status afterwards.
  SessionStatus RunRound(const CancellationToken& token);
  // Runs rounds until the session is terminal or the token is cancelled.
  SessionStatus Run(const CancellationToken& token);

  // External stop signal, honoured at the next DECIDING.
  void RequestStop();
  void SetPhaseListener(PhaseListener listener);

  [[nodiscard]] Session session() const;
  [[nodiscard]] SessionStatus phase() const;

 private:
  struct RoundBuffer;

  void ExecuteRound(const CancellationToken& token, RoundBuffer& buffer);
  void Questioning(RoundBuffer& buffer);
  void Retrieving(const CancellationToken& token, RoundBuffer& buffer);
  void Synthesizing(RoundBuffer& buffer);
  void Deciding(RoundBuffer& buffer);
  SynthesisReply AskWithRetry(const SynthesisRequest& request);
  void EnterPhase(SessionStatus phase);
  void CheckCancelled(const CancellationToken& token) const;
  void ApplyCommit(const RoundBuffer& buffer);
  void FailSession(const std::string& reason, const std::vector<std::string>& warnings);

  EngineConfig config_;
  Session session_;
  PlannerDependencies deps_;
  // Documents polled for the round in flight; kept across a retried attempt.
  std::vector<SourceDocument> staged_documents_;
  bool documents_polled_ = false;
  // Warnings of cancelled or failed attempts, carried into the next attempt.
  std::vector<std::string> discarded_warnings_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<SessionStatus> phase_{SessionStatus::kInit};
  PhaseListener phase_listener_;
  mutable std::mutex session_mutex_{};
};

}  // namespace sailcpp
