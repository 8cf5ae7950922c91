#pragma once

#include "sailcpp/types.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sailcpp {

// Everything one round publishes. Applied in a single transaction.
struct RoundCommit {
  std::string session_id;
  SessionStatus status = SessionStatus::kQuestioning;
  int rounds_completed = 0;
  std::vector<Question> new_questions;
  std::vector<std::string> resolved_questions;
  std::vector<Finding> findings;
  std::vector<Idea> ideas;
  std::vector<ReadingListEntry> reading_list;
  std::vector<std::string> warnings;
  std::vector<PaperRecord> papers;
};

class SessionStore {
 public:
  explicit SessionStore(const std::filesystem::path& path);
  ~SessionStore();
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  void CreateSession(const Session& session);
  [[nodiscard]] std::optional<Session> LoadSession(const std::string& session_id) const;
  [[nodiscard]] std::vector<std::string> ListSessions() const;

  // before_commit runs inside the transaction after all rows are written; if it
  // throws, the transaction is rolled back and the exception propagates.
  void CommitRound(const RoundCommit& commit, const std::function<void()>& before_commit = {});
  void MarkFailed(const std::string& session_id, const std::string& reason, const std::vector<std::string>& warnings);

  [[nodiscard]] std::vector<PaperRecord> ListPapers() const;

 private:
  struct SQLiteState;

  std::unique_ptr<SQLiteState> sqlite_;
  mutable std::mutex mutex_{};
};

}  // namespace sailcpp
