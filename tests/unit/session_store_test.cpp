#include "sailcpp/errors.hpp"
#include "sailcpp/session_store.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniqueDir() {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("sailcpp_session_store_test_" + std::to_string(static_cast<long long>(now)));
}

sailcpp::Session NewSession(const std::string& id) {
  sailcpp::Session session{};
  session.id = id;
  session.topic = "graph neural networks";
  session.max_rounds = 3;
  return session;
}

sailcpp::RoundCommit FirstRound(const std::string& id) {
  sailcpp::RoundCommit commit{};
  commit.session_id = id;
  commit.status = sailcpp::SessionStatus::kQuestioning;
  commit.rounds_completed = 1;
  commit.new_questions = {sailcpp::Question{"What is message passing?", 1, true},
                          sailcpp::Question{"How deep can GNNs go?", 1, true}};
  commit.resolved_questions = {"What is message passing?"};
  commit.findings = {sailcpp::Finding{"What is message passing?",
                                      "Nodes aggregate neighbour states.",
                                      {sailcpp::Citation{"p1", 2, 3, "chunk-a"}, sailcpp::Citation{"p2", 5, 5, "chunk-b"}},
                                      1}};
  commit.ideas = {sailcpp::Idea{"Residual GNN", "depth", "skip links", "ogbn", "oversmoothing", {"p1", "p2"}, 1}};
  commit.reading_list = {sailcpp::ReadingListEntry{"p1", "foundational", 1}};
  commit.warnings = {"no_content:p9"};
  commit.papers = {sailcpp::PaperRecord{"p1", "MPNN", "https://example.org/p1"}};
  return commit;
}

void ScenarioCreateCommitAndReload() {
  sailcpp::tests::Log("scenario: create, commit and reload");
  const auto dir = UniqueDir();
  {
    sailcpp::SessionStore store(dir / "sessions.sqlite3");
    store.CreateSession(NewSession("s1"));
    store.CreateSession(NewSession("s2"));
    store.CommitRound(FirstRound("s1"));

    bool duplicate_rejected = false;
    try {
      store.CreateSession(NewSession("s1"));
    } catch (const sailcpp::StorageError&) {
      duplicate_rejected = true;
    }
    Require(duplicate_rejected, "duplicate session ids must be rejected");
  }
  {
    sailcpp::SessionStore store(dir / "sessions.sqlite3");
    Require(store.ListSessions() == std::vector<std::string>({"s1", "s2"}), "session listing mismatch");
    const auto session = store.LoadSession("s1");
    Require(session.has_value(), "committed session must load");
    Require(session->status == sailcpp::SessionStatus::kQuestioning && session->rounds_completed == 1,
            "status and round must be committed");
    Require(session->questions.size() == 2, "questions must be stored");
    Require(!session->questions[0].pending && session->questions[1].pending, "resolution must be recorded");
    Require(session->findings.size() == 1 && session->findings[0].citations.size() == 2, "citations must be stored");
    Require(session->findings[0].citations[1].chunk_id == "chunk-b", "citation chunk id mismatch");
    Require(session->ideas.size() == 1 && session->ideas[0].refs == std::vector<std::string>({"p1", "p2"}),
            "idea refs must round trip");
    Require(session->reading_list.size() == 1 && session->warnings.size() == 1, "reading list and warnings stored");
    Require(store.ListPapers().size() == 1 && store.ListPapers()[0].title == "MPNN", "papers must be catalogued");

    const auto untouched = store.LoadSession("s2");
    Require(untouched.has_value() && untouched->findings.empty(), "other sessions are untouched");
    Require(!store.LoadSession("missing").has_value(), "unknown sessions load as empty");
  }
  std::filesystem::remove_all(dir);
}

void ScenarioHookFailureRollsBack() {
  sailcpp::tests::Log("scenario: hook failure rolls back");
  const auto dir = UniqueDir();
  sailcpp::SessionStore store(dir / "sessions.sqlite3");
  store.CreateSession(NewSession("s1"));

  bool hook_ran = false;
  bool failed = false;
  try {
    store.CommitRound(FirstRound("s1"), [&hook_ran]() {
      hook_ran = true;
      throw sailcpp::StorageError("journal write failed");
    });
  } catch (const sailcpp::StorageError&) {
    failed = true;
  }
  Require(hook_ran && failed, "hook failure must surface");
  const auto session = store.LoadSession("s1");
  Require(session->rounds_completed == 0 && session->findings.empty() && session->questions.empty(),
          "a failed commit must leave no partial round");
  Require(session->status == sailcpp::SessionStatus::kInit, "status must stay at the last committed value");
  Require(store.ListPapers().empty(), "papers are part of the round transaction");

  store.CommitRound(FirstRound("s1"));
  Require(store.LoadSession("s1")->rounds_completed == 1, "a later commit must still succeed");
  std::filesystem::remove_all(dir);
}

void ScenarioMarkFailed() {
  sailcpp::tests::Log("scenario: mark failed");
  const auto dir = UniqueDir();
  sailcpp::SessionStore store(dir / "sessions.sqlite3");
  store.CreateSession(NewSession("s1"));
  store.CommitRound(FirstRound("s1"));
  store.MarkFailed("s1", "synthesis failed twice", {"synthesis_unavailable"});

  const auto session = store.LoadSession("s1");
  Require(session->status == sailcpp::SessionStatus::kFailed, "status must be FAILED");
  Require(session->failure_reason == "synthesis failed twice", "diagnostic must be stored");
  Require(session->rounds_completed == 1 && session->findings.size() == 1, "earlier rounds stay readable");
  Require(session->warnings.size() == 2, "failure warnings are appended");

  bool unknown_rejected = false;
  try {
    store.MarkFailed("missing", "x", {});
  } catch (const sailcpp::StorageError&) {
    unknown_rejected = true;
  }
  Require(unknown_rejected, "unknown sessions cannot be failed");
  std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
  try {
    sailcpp::tests::Log("session_store_test: start");
    ScenarioCreateCommitAndReload();
    ScenarioHookFailureRollsBack();
    ScenarioMarkFailed();
    sailcpp::tests::Log("session_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sailcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
