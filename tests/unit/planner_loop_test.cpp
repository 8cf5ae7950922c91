#include "sailcpp/chunk_store.hpp"
#include "sailcpp/embeddings.hpp"
#include "sailcpp/errors.hpp"
#include "sailcpp/extraction_pool.hpp"
#include "sailcpp/memory.hpp"
#include "sailcpp/planner_loop.hpp"
#include "sailcpp/retrieval_orchestrator.hpp"
#include "sailcpp/session_store.hpp"

#include "../test_logger.hpp"

#include <cstddef>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniqueDir(const std::string& label) {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("sailcpp_planner_test_" + label + "_" + std::to_string(static_cast<long long>(now)));
}

std::vector<std::byte> FakeImage() {
  return {std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47}};
}

class GnnDocuments final : public sailcpp::DocumentSource {
 public:
  std::vector<sailcpp::SourceDocument> Poll(const std::string&, const std::string&) override {
    ++polls;
    if (delivered_) {
      return {};
    }
    delivered_ = true;

    sailcpp::SourceDocument mpnn{};
    mpnn.paper = sailcpp::PaperRecord{"mpnn", "Neural Message Passing for Quantum Chemistry", "https://example.org/mpnn"};
    mpnn.passages = {
        sailcpp::TextPassage{1, 1, "intro", "Graph neural networks use message passing between neighbouring nodes."},
        sailcpp::TextPassage{2, 3, "method", "Deep graph neural networks suffer from oversmoothing of node features."},
        sailcpp::TextPassage{4, 4, "apps", "Graph neural networks predict molecular properties in quantum chemistry."}};
    sailcpp::VisualRegion figure{};
    figure.content_type = sailcpp::ContentType::kFigure;
    figure.page = 2;
    figure.region = "0,0,300,200";
    figure.image = FakeImage();
    figure.context = "graph neural networks accuracy versus depth";
    sailcpp::VisualRegion table{};
    table.content_type = sailcpp::ContentType::kTable;
    table.page = 5;
    table.region = "0,0,400,120";
    table.image = FakeImage();
    table.context = "graph neural networks benchmark results";
    mpnn.visuals = {figure, table};

    sailcpp::SourceDocument gcn{};
    gcn.paper = sailcpp::PaperRecord{"gcn", "Semi-Supervised Classification with GCNs", "https://example.org/gcn"};
    gcn.abstract = "Spectral graph convolutions for semi-supervised node classification with graph neural networks.";
    return {mpnn, gcn};
  }

  int polls = 0;

 private:
  bool delivered_ = false;
};

class CaptionVision final : public sailcpp::VisionProvider {
 public:
  std::optional<std::string> Describe(const std::vector<std::byte>&, const std::string& context) override {
    return "figure showing " + context;
  }
};

// Round 1 asks three questions; later rounds repeat them (differently cased)
// unless extra questions are queued.
class ScriptedSynthesis final : public sailcpp::SynthesisProvider {
 public:
  sailcpp::SynthesisReply Ask(const sailcpp::SynthesisRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sailcpp::SynthesisReply reply{};
    if (request.task == sailcpp::SynthesisTask::kQuestions) {
      ++question_calls;
      if (request.round == 1) {
        reply.questions = {"How do graph neural networks pass messages?",
                           "Why do deep graph neural networks oversmooth?",
                           "Which benchmarks evaluate graph neural networks?"};
      } else {
        reply.questions = {"  how do GRAPH neural networks pass messages?  "};
        reply.questions.insert(reply.questions.end(), extra_questions.begin(), extra_questions.end());
      }
      return reply;
    }

    ++synthesis_calls;
    if (synthesis_failures_remaining > 0) {
      --synthesis_failures_remaining;
      throw std::runtime_error("model overloaded");
    }
    last_contexts = request.contexts;
    for (const auto& question_context : request.contexts) {
      sailcpp::Finding finding{};
      finding.question = question_context.question;
      finding.answer = "Answer to: " + question_context.question;
      for (const auto& item : question_context.context.items) {
        if (item.kind == sailcpp::ContextItemKind::kChunk) {
          finding.citations.push_back(sailcpp::Citation{item.paper_id, item.page_from, item.page_to, item.ref});
          break;
        }
      }
      reply.findings.push_back(std::move(finding));
    }
    reply.ideas = {sailcpp::Idea{"Residual message passing round " + std::to_string(request.round),
                                 "oversmoothing limits depth",
                                 "add residual links",
                                 "node classification accuracy",
                                 "extra parameters",
                                 {"mpnn"},
                                 0}};
    reply.reading_list = {sailcpp::ReadingListEntry{"mpnn", "core message passing reference", 0}};
    return reply;
  }

  std::vector<std::string> extra_questions;
  int synthesis_failures_remaining = 0;
  int question_calls = 0;
  int synthesis_calls = 0;
  std::vector<sailcpp::QuestionContext> last_contexts;

 private:
  std::mutex mutex_;
};

// Writes go to the local journal; every search fails.
class SearchDownBackend final : public sailcpp::MemoryBackend {
 public:
  explicit SearchDownBackend(std::shared_ptr<sailcpp::MemoryBackend> inner) : inner_(std::move(inner)) {}

  void Put(const sailcpp::MemoryItem& item) override { inner_->Put(item); }
  void PutBatch(const std::vector<sailcpp::MemoryItem>& items) override { inner_->PutBatch(items); }
  std::optional<sailcpp::MemoryItem> Get(sailcpp::MemoryTier tier,
                                         const std::string& key,
                                         const std::optional<std::string>& scope) override {
    return inner_->Get(tier, key, scope);
  }
  std::vector<sailcpp::MemoryHit> Search(sailcpp::MemoryTier,
                                         const std::string&,
                                         int,
                                         const std::optional<std::string>&) override {
    throw sailcpp::BackendUnavailableError("search endpoint down");
  }

 private:
  std::shared_ptr<sailcpp::MemoryBackend> inner_;
};

std::shared_ptr<sailcpp::MemoryBackend> SelectBackend(std::shared_ptr<sailcpp::LocalMemoryBackend> local,
                                                      bool search_down) {
  if (search_down) {
    return std::make_shared<SearchDownBackend>(std::move(local));
  }
  return local;
}

struct ScopedDir {
  explicit ScopedDir(const std::string& label) : path(UniqueDir(label)) {}
  ~ScopedDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  std::filesystem::path path;
};

struct Fixture {
  explicit Fixture(const std::string& label, bool memory_search_down = false)
      : scoped_dir(label),
        dir(scoped_dir.path),
        sessions(dir / "sessions.sqlite3"),
        chunks(dir / "chunks" / "session.sqlite3"),
        backend(std::make_shared<sailcpp::LocalMemoryBackend>(dir / "memory.journal")),
        memory(SelectBackend(backend, memory_search_down), "session-1"),
        embedder(std::make_shared<sailcpp::HashedTokenEmbedder>(64)),
        retrieval(chunks, memory, embedder, sailcpp::RetrievalConfig{}),
        extraction(sailcpp::ExtractionConfig{}, std::make_shared<CaptionVision>(), embedder),
        synthesis(std::make_shared<ScriptedSynthesis>()),
        documents(std::make_shared<GnnDocuments>()) {}

  std::unique_ptr<sailcpp::PlannerLoop> MakeLoop(int max_rounds, const sailcpp::EngineConfig& config = {}) {
    sailcpp::Session session{};
    session.id = "session-1";
    session.topic = "graph neural networks";
    session.max_rounds = max_rounds;
    sessions.CreateSession(session);

    sailcpp::PlannerDependencies deps{};
    deps.sessions = &sessions;
    deps.chunks = &chunks;
    deps.memory = &memory;
    deps.retrieval = &retrieval;
    deps.extraction = &extraction;
    deps.synthesis = synthesis;
    deps.documents = documents;
    return std::make_unique<sailcpp::PlannerLoop>(config, session, deps);
  }

  ScopedDir scoped_dir;
  std::filesystem::path dir;
  sailcpp::SessionStore sessions;
  sailcpp::ChunkStore chunks;
  std::shared_ptr<sailcpp::LocalMemoryBackend> backend;
  sailcpp::MemoryManager memory;
  std::shared_ptr<sailcpp::HashedTokenEmbedder> embedder;
  sailcpp::RetrievalOrchestrator retrieval;
  sailcpp::ExtractionPool extraction;
  std::shared_ptr<ScriptedSynthesis> synthesis;
  std::shared_ptr<GnnDocuments> documents;
};

bool HasItem(const sailcpp::RankedContext& context, sailcpp::ContentType type) {
  for (const auto& item : context.items) {
    if (item.kind == sailcpp::ContextItemKind::kChunk && item.content_type == type) {
      return true;
    }
  }
  return false;
}

void ScenarioEndToEnd() {
  sailcpp::tests::Log("scenario: end to end");
  Fixture fixture("e2e");
  auto loop = fixture.MakeLoop(2);
  sailcpp::CancellationToken token;

  const auto after_first = loop->RunRound(token);
  Require(after_first == sailcpp::SessionStatus::kQuestioning, "round 1 should continue");
  const auto round_one = loop->session();
  Require(round_one.rounds_completed == 1, "round 1 must be committed");
  Require(round_one.questions.size() == 3, "round 1 must ask three questions");
  Require(round_one.findings.size() == 3, "round 1 must produce three findings");
  for (const auto& finding : round_one.findings) {
    Require(!finding.citations.empty(), "every finding must cite a chunk");
    Require(!finding.citations[0].chunk_id.empty(), "citations must carry chunk ids");
  }
  Require(!round_one.ideas.empty(), "round 1 must produce an idea");
  Require(fixture.synthesis->last_contexts.size() == 3, "one context per pending question");
  for (const auto& question_context : fixture.synthesis->last_contexts) {
    Require(HasItem(question_context.context, sailcpp::ContentType::kText), "text bucket must be populated");
    Require(HasItem(question_context.context, sailcpp::ContentType::kFigure), "figure bucket must be populated");
  }
  Require(fixture.chunks.Size() == 6, "three passages, one summary, one figure and one table expected");
  Require(fixture.sessions.ListPapers().size() == 2, "polled papers must be catalogued");

  const auto final_status = loop->Run(token);
  Require(final_status == sailcpp::SessionStatus::kComplete, "round 2 without new questions must complete");
  const auto session = loop->session();
  Require(session.rounds_completed == 2, "both rounds must be counted");
  Require(session.questions.size() == 3, "repeated questions must be dropped");
  for (const auto& question : session.questions) {
    Require(!question.pending, "no question may stay pending");
  }
  Require(!session.reading_list.empty(), "reading list must not be empty");
  Require(fixture.synthesis->synthesis_calls == 1, "round 2 has nothing to synthesize");

  const auto persisted = fixture.sessions.LoadSession("session-1");
  Require(persisted.has_value() && persisted->status == sailcpp::SessionStatus::kComplete, "persisted status mismatch");
  Require(persisted->findings.size() == 3 && persisted->rounds_completed == 2, "persisted round state mismatch");

  Require(fixture.memory.Get(sailcpp::MemoryTier::kSession, "round/1/summary").has_value(), "round summary stored");
  Require(fixture.memory.Get(sailcpp::MemoryTier::kSession, "finding/1/2").has_value(), "findings stored in memory");
  Require(fixture.memory.Get(sailcpp::MemoryTier::kAgent, "idea/Residual message passing round 1").has_value(),
          "ideas stored as agent knowledge");
  Require(fixture.memory.Get(sailcpp::MemoryTier::kUser, "interest/graph neural networks").has_value(),
          "topic stored as user interest");
}

void ScenarioCancelDuringSynthesis() {
  sailcpp::tests::Log("scenario: cancel during synthesis");
  Fixture fixture("cancel");
  auto loop = fixture.MakeLoop(2);
  auto token = std::make_shared<sailcpp::CancellationToken>();
  loop->SetPhaseListener([token](sailcpp::SessionStatus phase) {
    if (phase == sailcpp::SessionStatus::kSynthesizing) {
      token->Cancel();
    }
  });

  const auto status = loop->RunRound(*token);
  Require(status == sailcpp::SessionStatus::kInit, "cancelled round must revert to the committed status");
  const auto session = loop->session();
  Require(session.rounds_completed == 0 && session.findings.empty() && session.ideas.empty(),
          "cancelled round must not publish anything");
  Require(session.questions.empty(), "cancelled round must not publish questions");
  const auto persisted = fixture.sessions.LoadSession("session-1");
  Require(persisted->rounds_completed == 0 && persisted->findings.empty(), "store must hold the last committed round");
  Require(fixture.memory.PendingMutationCount() == 0, "buffered memory writes must be discarded");
  Require(!fixture.memory.Get(sailcpp::MemoryTier::kSession, "round/1/summary").has_value(),
          "no memory may be written for a cancelled round");

  loop->SetPhaseListener({});
  sailcpp::CancellationToken fresh;
  Require(loop->RunRound(fresh) == sailcpp::SessionStatus::kQuestioning, "next attempt must commit");
  Require(loop->session().findings.size() == 3, "documents polled before cancellation must be reused");
  Require(fixture.documents->polls == 1, "staged documents must not be polled twice");
}

bool HasWarning(const sailcpp::Session& session, const std::string& warning) {
  return std::find(session.warnings.begin(), session.warnings.end(), warning) != session.warnings.end();
}

void ScenarioWarningsSurviveCancelledRound() {
  sailcpp::tests::Log("scenario: warnings survive a cancelled round");
  Fixture fixture("cancel_warnings", true);
  auto loop = fixture.MakeLoop(1);
  auto token = std::make_shared<sailcpp::CancellationToken>();
  loop->SetPhaseListener([token](sailcpp::SessionStatus phase) {
    if (phase == sailcpp::SessionStatus::kSynthesizing) {
      token->Cancel();
    }
  });
  Require(loop->RunRound(*token) == sailcpp::SessionStatus::kInit, "cancelled round must not commit");
  Require(loop->session().warnings.empty(), "cancelled round publishes no warnings");

  loop->SetPhaseListener({});
  sailcpp::CancellationToken fresh;
  Require(loop->Run(fresh) == sailcpp::SessionStatus::kComplete, "single round session must complete");
  const auto session = loop->session();
  Require(session.rounds_completed == 1, "one committed round expected");
  Require(HasWarning(session, "memory_unavailable:search endpoint down"), "memory degradation must be recorded");
  Require(std::count(session.warnings.begin(), session.warnings.end(), "memory_unavailable:search endpoint down") == 1,
          "each cause is recorded once per session");
  const auto persisted = fixture.sessions.LoadSession("session-1");
  Require(HasWarning(*persisted, "memory_unavailable:search endpoint down"), "warning must be persisted");
}

void ScenarioRoundRetry() {
  sailcpp::tests::Log("scenario: round retry");
  Fixture fixture("retry");
  fixture.synthesis->synthesis_failures_remaining = 2;
  auto loop = fixture.MakeLoop(3);
  sailcpp::CancellationToken token;

  const auto status = loop->RunRound(token);
  Require(status == sailcpp::SessionStatus::kQuestioning, "round must succeed on its automatic retry");
  Require(fixture.synthesis->synthesis_calls == 3, "two failed calls then one success");
  Require(loop->session().rounds_completed == 1, "retried round must commit once");
  Require(loop->session().questions.size() == 3, "retried round must not duplicate questions");
}

void ScenarioSessionFailure() {
  sailcpp::tests::Log("scenario: session failure");
  Fixture fixture("failure");
  auto loop = fixture.MakeLoop(4);
  sailcpp::CancellationToken token;
  Require(loop->RunRound(token) == sailcpp::SessionStatus::kQuestioning, "round 1 should succeed");

  fixture.synthesis->extra_questions = {"What limits expressivity?"};
  fixture.synthesis->synthesis_failures_remaining = 100;
  const auto status = loop->RunRound(token);
  Require(status == sailcpp::SessionStatus::kFailed, "round failing twice must fail the session");
  const auto session = loop->session();
  Require(!session.failure_reason.empty(), "failure must carry a diagnostic");
  Require(session.rounds_completed == 1 && session.findings.size() == 3, "earlier rounds stay readable");

  const auto persisted = fixture.sessions.LoadSession("session-1");
  Require(persisted->status == sailcpp::SessionStatus::kFailed, "failure must be persisted");
  Require(persisted->findings.size() == 3 && persisted->questions.size() == 3, "failed round must not leak rows");
  Require(loop->RunRound(token) == sailcpp::SessionStatus::kFailed, "terminal sessions stay terminal");
}

void ScenarioStopRequest() {
  sailcpp::tests::Log("scenario: stop request");
  Fixture fixture("stop");
  auto loop = fixture.MakeLoop(5);
  loop->RequestStop();
  sailcpp::CancellationToken token;
  Require(loop->Run(token) == sailcpp::SessionStatus::kComplete, "stop request must complete at DECIDING");
  Require(loop->session().rounds_completed == 1, "the round in flight still commits");
}

}  // namespace

int main() {
  try {
    sailcpp::tests::Log("planner_loop_test: start");
    ScenarioEndToEnd();
    ScenarioCancelDuringSynthesis();
    ScenarioWarningsSurviveCancelledRound();
    ScenarioRoundRetry();
    ScenarioSessionFailure();
    ScenarioStopRequest();
    sailcpp::tests::Log("planner_loop_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sailcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
