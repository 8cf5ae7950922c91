#include "sailcpp/planner_loop.hpp"

#include "sailcpp/errors.hpp"

#include "../text/lexical.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <unordered_set>
#include <utility>

namespace sailcpp {
namespace {

std::string QuestionKey(const std::string& text) {
  return text::ToLowerAscii(text::Trim(text));
}

std::string RoundSummary(int round, std::size_t questions, const std::vector<Finding>& findings) {
  std::string summary = "round " + std::to_string(round) + ": " + std::to_string(questions) + " new questions, " +
                        std::to_string(findings.size()) + " findings";
  for (const auto& finding : findings) {
    summary.append("\n- ");
    summary.append(finding.question);
  }
  return summary;
}

}  // namespace

struct PlannerLoop::RoundBuffer {
  int round = 0;
  std::vector<Question> new_questions;
  std::vector<std::string> pending;
  std::vector<std::string> resolved;
  std::vector<QuestionContext> contexts;
  std::vector<Finding> findings;
  std::vector<Idea> ideas;
  std::vector<ReadingListEntry> reading_list;
  std::vector<std::string> warnings;
  std::unordered_set<std::string> warned;
  std::vector<PaperRecord> papers;
  SessionStatus next_status = SessionStatus::kQuestioning;

  void AddWarning(std::string warning) {
    if (warned.insert(warning).second) {
      warnings.push_back(std::move(warning));
    }
  }
};

PlannerLoop::PlannerLoop(const EngineConfig& config, Session session, PlannerDependencies deps)
    : config_(config), session_(std::move(session)), deps_(std::move(deps)) {
  ValidateConfig(config_);
  if (deps_.sessions == nullptr || deps_.chunks == nullptr || deps_.memory == nullptr ||
      deps_.retrieval == nullptr || deps_.extraction == nullptr || !deps_.synthesis) {
    throw ConfigError("planner loop: missing dependency");
  }
  if (session_.max_rounds <= 0) {
    session_.max_rounds = config_.planner.max_rounds;
  }
  phase_.store(session_.status);
}

SessionStatus PlannerLoop::RunRound(const CancellationToken& token) {
  if (IsTerminal(session_.status)) {
    return session_.status;
  }

  std::string last_error{};
  for (int attempt = 1; attempt <= config_.planner.round_attempts; ++attempt) {
    RoundBuffer buffer{};
    buffer.round = session_.rounds_completed + 1;
    for (const auto& warning : session_.warnings) {
      buffer.warned.insert(warning);
    }
    for (const auto& warning : discarded_warnings_) {
      buffer.AddWarning(warning);
    }
    try {
      ExecuteRound(token, buffer);
      staged_documents_.clear();
      documents_polled_ = false;
      discarded_warnings_.clear();
      EnterPhase(session_.status);
      return session_.status;
    } catch (const RoundCancelled&) {
      deps_.memory->RollbackStaged();
      discarded_warnings_ = std::move(buffer.warnings);
      spdlog::info("session {}: round {} cancelled, buffered writes discarded", session_.id, buffer.round);
      EnterPhase(session_.status);
      return session_.status;
    } catch (const std::exception& error) {
      deps_.memory->RollbackStaged();
      discarded_warnings_ = std::move(buffer.warnings);
      last_error = error.what();
      spdlog::error("session {}: round {} attempt {}/{} failed: {}",
                    session_.id,
                    buffer.round,
                    attempt,
                    config_.planner.round_attempts,
                    last_error);
    }
  }

  auto warnings = std::move(discarded_warnings_);
  discarded_warnings_.clear();
  FailSession(last_error, warnings);
  return session_.status;
}

SessionStatus PlannerLoop::Run(const CancellationToken& token) {
  while (!IsTerminal(session_.status) && !token.cancelled()) {
    RunRound(token);
  }
  return session_.status;
}

void PlannerLoop::RequestStop() {
  stop_requested_.store(true, std::memory_order_release);
}

void PlannerLoop::SetPhaseListener(PhaseListener listener) {
  phase_listener_ = std::move(listener);
}

Session PlannerLoop::session() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_;
}

SessionStatus PlannerLoop::phase() const {
  return phase_.load(std::memory_order_acquire);
}

void PlannerLoop::EnterPhase(SessionStatus phase) {
  phase_.store(phase, std::memory_order_release);
  if (phase_listener_) {
    phase_listener_(phase);
  }
}

void PlannerLoop::CheckCancelled(const CancellationToken& token) const {
  if (token.cancelled()) {
    throw RoundCancelled("session " + session_.id + ": round cancelled");
  }
}

void PlannerLoop::ExecuteRound(const CancellationToken& token, RoundBuffer& buffer) {
  CheckCancelled(token);
  EnterPhase(SessionStatus::kQuestioning);
  Questioning(buffer);

  if (!buffer.pending.empty()) {
    CheckCancelled(token);
    EnterPhase(SessionStatus::kRetrieving);
    Retrieving(token, buffer);

    CheckCancelled(token);
    EnterPhase(SessionStatus::kSynthesizing);
    Synthesizing(buffer);
  }

  CheckCancelled(token);
  EnterPhase(SessionStatus::kDeciding);
  Deciding(buffer);
}

SynthesisReply PlannerLoop::AskWithRetry(const SynthesisRequest& request) {
  std::string last_error{};
  for (int attempt = 1; attempt <= config_.planner.synthesis_attempts; ++attempt) {
    try {
      return deps_.synthesis->Ask(request);
    } catch (const std::exception& error) {
      last_error = error.what();
      spdlog::warn("session {}: synthesis attempt {}/{} failed: {}",
                   session_.id,
                   attempt,
                   config_.planner.synthesis_attempts,
                   last_error);
    }
  }
  throw SynthesisError("synthesis failed " + std::to_string(config_.planner.synthesis_attempts) +
                       " times in a row: " + last_error);
}

void PlannerLoop::Questioning(RoundBuffer& buffer) {
  SynthesisRequest request{};
  request.task = SynthesisTask::kQuestions;
  request.session_id = session_.id;
  request.topic = session_.topic;
  request.round = buffer.round;
  request.prior_findings = session_.findings;
  request.prior_ideas = session_.ideas;

  std::unordered_set<std::string> seen{};
  for (const auto& question : session_.questions) {
    request.asked_questions.push_back(question.text);
    seen.insert(QuestionKey(question.text));
    if (question.pending) {
      buffer.pending.push_back(question.text);
    }
  }

  const auto reply = AskWithRetry(request);
  for (const auto& raw : reply.questions) {
    auto text = text::Trim(raw);
    if (text.empty() || !seen.insert(QuestionKey(text)).second) {
      continue;
    }
    buffer.pending.push_back(text);
    buffer.new_questions.push_back(Question{std::move(text), buffer.round, true});
  }
  spdlog::info("session {}: round {} asked {} new questions, {} pending",
               session_.id,
               buffer.round,
               buffer.new_questions.size(),
               buffer.pending.size());
}

void PlannerLoop::Retrieving(const CancellationToken& token, RoundBuffer& buffer) {
  if (!documents_polled_ && deps_.documents) {
    try {
      staged_documents_ = deps_.documents->Poll(session_.id, session_.topic);
    } catch (const std::exception& error) {
      spdlog::warn("session {}: document source failed: {}", session_.id, error.what());
      buffer.AddWarning(std::string("document_source_unavailable:") + error.what());
      staged_documents_.clear();
    }
    documents_polled_ = true;
  }

  std::vector<ExtractionTask> tasks{};
  std::vector<std::string> plan_warnings{};
  for (const auto& document : staged_documents_) {
    auto document_tasks = PlanExtractionTasks(document, plan_warnings);
    tasks.insert(tasks.end(), std::make_move_iterator(document_tasks.begin()), std::make_move_iterator(document_tasks.end()));
    if (!document.paper.id.empty()) {
      buffer.papers.push_back(document.paper);
    }
  }
  for (auto& warning : plan_warnings) {
    buffer.AddWarning(std::move(warning));
  }

  auto report = deps_.extraction->Run(tasks, *deps_.chunks, token);
  for (auto& warning : report.warnings) {
    buffer.AddWarning(std::move(warning));
  }
  if (report.cancelled) {
    throw RoundCancelled("session " + session_.id + ": extraction cancelled");
  }

  for (const auto& question : buffer.pending) {
    auto context = deps_.retrieval->ComposeContext(question);
    for (const auto& warning : context.warnings) {
      buffer.AddWarning(warning);
    }
    buffer.contexts.push_back(QuestionContext{question, std::move(context)});
  }
}

void PlannerLoop::Synthesizing(RoundBuffer& buffer) {
  if (buffer.contexts.empty()) {
    return;
  }
  SynthesisRequest request{};
  request.task = SynthesisTask::kSynthesis;
  request.session_id = session_.id;
  request.topic = session_.topic;
  request.round = buffer.round;
  request.prior_findings = session_.findings;
  request.prior_ideas = session_.ideas;
  request.contexts = buffer.contexts;
  for (const auto& question : session_.questions) {
    request.asked_questions.push_back(question.text);
  }
  for (const auto& question : buffer.new_questions) {
    request.asked_questions.push_back(question.text);
  }

  auto reply = AskWithRetry(request);

  std::unordered_set<std::string> resolved{};
  for (auto& finding : reply.findings) {
    finding.round = buffer.round;
    const auto key = QuestionKey(finding.question);
    for (const auto& pending : buffer.pending) {
      if (QuestionKey(pending) == key && resolved.insert(key).second) {
        buffer.resolved.push_back(pending);
      }
    }
    buffer.findings.push_back(std::move(finding));
  }
  for (auto& idea : reply.ideas) {
    idea.round = buffer.round;
    buffer.ideas.push_back(std::move(idea));
  }
  for (auto& entry : reply.reading_list) {
    entry.round = buffer.round;
    buffer.reading_list.push_back(std::move(entry));
  }
}

void PlannerLoop::Deciding(RoundBuffer& buffer) {
  const bool cap_reached = buffer.round >= session_.max_rounds;
  const bool exhausted = buffer.new_questions.empty();
  const bool stop_requested = stop_requested_.load(std::memory_order_acquire);
  buffer.next_status = (cap_reached || exhausted || stop_requested) ? SessionStatus::kComplete
                                                                     : SessionStatus::kQuestioning;

  auto& memory = *deps_.memory;
  memory.StagePut(MemoryTier::kSession,
                  "round/" + std::to_string(buffer.round) + "/summary",
                  RoundSummary(buffer.round, buffer.new_questions.size(), buffer.findings));
  for (std::size_t i = 0; i < buffer.findings.size(); ++i) {
    const auto& finding = buffer.findings[i];
    memory.StagePut(MemoryTier::kSession,
                    "finding/" + std::to_string(buffer.round) + "/" + std::to_string(i),
                    finding.question + ": " + finding.answer);
  }
  if (buffer.round == 1) {
    memory.StagePut(MemoryTier::kUser, "interest/" + QuestionKey(session_.topic), session_.topic);
  }
  for (const auto& idea : buffer.ideas) {
    if (idea.title.empty()) {
      continue;
    }
    memory.StagePut(MemoryTier::kAgent, "idea/" + idea.title, idea.title + ": " + idea.motivation + " " + idea.method);
  }

  RoundCommit commit{};
  commit.session_id = session_.id;
  commit.status = buffer.next_status;
  commit.rounds_completed = buffer.round;
  commit.new_questions = buffer.new_questions;
  commit.resolved_questions = buffer.resolved;
  commit.findings = buffer.findings;
  commit.ideas = buffer.ideas;
  commit.reading_list = buffer.reading_list;
  commit.warnings = buffer.warnings;
  commit.papers = buffer.papers;
  deps_.sessions->CommitRound(commit, [&memory]() { memory.CommitStaged(); });

  ApplyCommit(buffer);
  spdlog::info("session {}: round {} committed ({} findings, {} ideas) -> {}",
               session_.id,
               buffer.round,
               buffer.findings.size(),
               buffer.ideas.size(),
               SessionStatusName(buffer.next_status));
}

void PlannerLoop::ApplyCommit(const RoundBuffer& buffer) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session_.status = buffer.next_status;
  session_.rounds_completed = buffer.round;
  for (const auto& question : buffer.new_questions) {
    session_.questions.push_back(question);
  }
  for (auto& question : session_.questions) {
    if (std::find(buffer.resolved.begin(), buffer.resolved.end(), question.text) != buffer.resolved.end()) {
      question.pending = false;
    }
  }
  session_.findings.insert(session_.findings.end(), buffer.findings.begin(), buffer.findings.end());
  session_.ideas.insert(session_.ideas.end(), buffer.ideas.begin(), buffer.ideas.end());
  session_.reading_list.insert(session_.reading_list.end(), buffer.reading_list.begin(), buffer.reading_list.end());
  session_.warnings.insert(session_.warnings.end(), buffer.warnings.begin(), buffer.warnings.end());
}

void PlannerLoop::FailSession(const std::string& reason, const std::vector<std::string>& warnings) {
  spdlog::error("session {}: failed after round {}: {}", session_.id, session_.rounds_completed, reason);
  try {
    deps_.sessions->MarkFailed(session_.id, reason, warnings);
  } catch (const StorageError& error) {
    spdlog::error("session {}: could not persist failure: {}", session_.id, error.what());
  }
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.status = SessionStatus::kFailed;
    session_.failure_reason = reason;
    for (const auto& warning : warnings) {
      if (std::find(session_.warnings.begin(), session_.warnings.end(), warning) == session_.warnings.end()) {
        session_.warnings.push_back(warning);
      }
    }
  }
  EnterPhase(SessionStatus::kFailed);
}

}  // namespace sailcpp
