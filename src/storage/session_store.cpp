#include "sailcpp/session_store.hpp"

#include "sailcpp/errors.hpp"

#include "sqlite_util.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sailcpp {
namespace {

constexpr char kRefSeparator = '\x1F';

void CreateSchema(sqlite3* db) {
  storage::Exec(db, "PRAGMA journal_mode=WAL;");
  storage::Exec(db, "PRAGMA foreign_keys=ON;");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS sessions("
                "id TEXT PRIMARY KEY,"
                "topic TEXT NOT NULL,"
                "status TEXT NOT NULL,"
                "rounds_completed INTEGER NOT NULL,"
                "max_rounds INTEGER NOT NULL,"
                "failure_reason TEXT NOT NULL DEFAULT ''"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS questions("
                "session_id TEXT NOT NULL REFERENCES sessions(id),"
                "text TEXT NOT NULL,"
                "round INTEGER NOT NULL,"
                "pending INTEGER NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS findings("
                "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "session_id TEXT NOT NULL REFERENCES sessions(id),"
                "question TEXT NOT NULL,"
                "answer TEXT NOT NULL,"
                "round INTEGER NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS citations("
                "finding_id INTEGER NOT NULL REFERENCES findings(id),"
                "paper_id TEXT NOT NULL,"
                "page_from INTEGER NOT NULL,"
                "page_to INTEGER NOT NULL,"
                "chunk_id TEXT NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS ideas("
                "session_id TEXT NOT NULL REFERENCES sessions(id),"
                "title TEXT NOT NULL,"
                "motivation TEXT NOT NULL,"
                "method TEXT NOT NULL,"
                "eval TEXT NOT NULL,"
                "risks TEXT NOT NULL,"
                "refs TEXT NOT NULL,"
                "round INTEGER NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS reading_list("
                "session_id TEXT NOT NULL REFERENCES sessions(id),"
                "paper_id TEXT NOT NULL,"
                "reason TEXT NOT NULL,"
                "round INTEGER NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS warnings("
                "session_id TEXT NOT NULL REFERENCES sessions(id),"
                "message TEXT NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS papers("
                "id TEXT PRIMARY KEY,"
                "title TEXT NOT NULL,"
                "url TEXT NOT NULL"
                ");");
}

std::string JoinRefs(const std::vector<std::string>& refs) {
  std::string out{};
  for (std::size_t i = 0; i < refs.size(); ++i) {
    if (i > 0) {
      out.push_back(kRefSeparator);
    }
    out.append(refs[i]);
  }
  return out;
}

std::vector<std::string> SplitRefs(const std::string& joined) {
  std::vector<std::string> refs{};
  if (joined.empty()) {
    return refs;
  }
  std::size_t start = 0;
  while (true) {
    const auto end = joined.find(kRefSeparator, start);
    refs.push_back(joined.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return refs;
}

void InsertWarnings(sqlite3* db, const std::string& session_id, const std::vector<std::string>& warnings) {
  if (warnings.empty()) {
    return;
  }
  storage::Statement stmt(db, "INSERT INTO warnings(session_id, message) VALUES(?1, ?2);");
  for (const auto& warning : warnings) {
    stmt.Reset();
    stmt.BindText(1, session_id);
    stmt.BindText(2, warning);
    stmt.Run();
  }
}

void InsertPapers(sqlite3* db, const std::vector<PaperRecord>& papers) {
  if (papers.empty()) {
    return;
  }
  storage::Statement stmt(db,
                          "INSERT INTO papers(id, title, url) VALUES(?1, ?2, ?3) "
                          "ON CONFLICT(id) DO UPDATE SET title=excluded.title, url=excluded.url;");
  for (const auto& paper : papers) {
    if (paper.id.empty()) {
      continue;
    }
    stmt.Reset();
    stmt.BindText(1, paper.id);
    stmt.BindText(2, paper.title);
    stmt.BindText(3, paper.url);
    stmt.Run();
  }
}

SessionStatus ParseStoredStatus(const std::string& name, const std::string& session_id) {
  const auto status = ParseSessionStatus(name);
  if (!status.has_value()) {
    throw StorageError("session store: unknown status '" + name + "' for session " + session_id);
  }
  return *status;
}

}  // namespace

struct SessionStore::SQLiteState {
  explicit SQLiteState(const std::filesystem::path& path) : db(path) {}

  storage::Database db;
};

SessionStore::SessionStore(const std::filesystem::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw StorageError("session store: cannot create directory " + path.parent_path().string() + ": " +
                         ec.message());
    }
  }
  sqlite_ = std::make_unique<SQLiteState>(path);
  CreateSchema(sqlite_->db.get());
}

SessionStore::~SessionStore() = default;

void SessionStore::CreateSession(const Session& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db.get();
  storage::Statement stmt(db,
                          "INSERT INTO sessions(id, topic, status, rounds_completed, max_rounds, failure_reason) "
                          "VALUES(?1, ?2, ?3, ?4, ?5, ?6);");
  stmt.BindText(1, session.id);
  stmt.BindText(2, session.topic);
  stmt.BindText(3, std::string(SessionStatusName(session.status)));
  stmt.BindInt(4, session.rounds_completed);
  stmt.BindInt(5, session.max_rounds);
  stmt.BindText(6, session.failure_reason);
  stmt.Run();
}

std::optional<Session> SessionStore::LoadSession(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db.get();

  Session session{};
  {
    storage::Statement stmt(db,
                            "SELECT id, topic, status, rounds_completed, max_rounds, failure_reason "
                            "FROM sessions WHERE id = ?1;");
    stmt.BindText(1, session_id);
    if (!stmt.Step()) {
      return std::nullopt;
    }
    session.id = stmt.ColumnText(0);
    session.topic = stmt.ColumnText(1);
    session.status = ParseStoredStatus(stmt.ColumnText(2), session_id);
    session.rounds_completed = static_cast<int>(stmt.ColumnInt(3));
    session.max_rounds = static_cast<int>(stmt.ColumnInt(4));
    session.failure_reason = stmt.ColumnText(5);
  }
  {
    storage::Statement stmt(db, "SELECT text, round, pending FROM questions WHERE session_id = ?1 ORDER BY rowid;");
    stmt.BindText(1, session_id);
    while (stmt.Step()) {
      session.questions.push_back(
          Question{stmt.ColumnText(0), static_cast<int>(stmt.ColumnInt(1)), stmt.ColumnInt(2) != 0});
    }
  }
  {
    storage::Statement stmt(db,
                            "SELECT id, question, answer, round FROM findings WHERE session_id = ?1 ORDER BY id;");
    storage::Statement cite_stmt(db,
                                 "SELECT paper_id, page_from, page_to, chunk_id FROM citations "
                                 "WHERE finding_id = ?1 ORDER BY rowid;");
    stmt.BindText(1, session_id);
    while (stmt.Step()) {
      Finding finding{};
      finding.question = stmt.ColumnText(1);
      finding.answer = stmt.ColumnText(2);
      finding.round = static_cast<int>(stmt.ColumnInt(3));
      cite_stmt.Reset();
      cite_stmt.BindInt(1, stmt.ColumnInt(0));
      while (cite_stmt.Step()) {
        finding.citations.push_back(Citation{cite_stmt.ColumnText(0),
                                             static_cast<int>(cite_stmt.ColumnInt(1)),
                                             static_cast<int>(cite_stmt.ColumnInt(2)),
                                             cite_stmt.ColumnText(3)});
      }
      session.findings.push_back(std::move(finding));
    }
  }
  {
    storage::Statement stmt(db,
                            "SELECT title, motivation, method, eval, risks, refs, round FROM ideas "
                            "WHERE session_id = ?1 ORDER BY rowid;");
    stmt.BindText(1, session_id);
    while (stmt.Step()) {
      Idea idea{};
      idea.title = stmt.ColumnText(0);
      idea.motivation = stmt.ColumnText(1);
      idea.method = stmt.ColumnText(2);
      idea.eval = stmt.ColumnText(3);
      idea.risks = stmt.ColumnText(4);
      idea.refs = SplitRefs(stmt.ColumnText(5));
      idea.round = static_cast<int>(stmt.ColumnInt(6));
      session.ideas.push_back(std::move(idea));
    }
  }
  {
    storage::Statement stmt(db,
                            "SELECT paper_id, reason, round FROM reading_list WHERE session_id = ?1 ORDER BY rowid;");
    stmt.BindText(1, session_id);
    while (stmt.Step()) {
      session.reading_list.push_back(
          ReadingListEntry{stmt.ColumnText(0), stmt.ColumnText(1), static_cast<int>(stmt.ColumnInt(2))});
    }
  }
  {
    storage::Statement stmt(db, "SELECT message FROM warnings WHERE session_id = ?1 ORDER BY rowid;");
    stmt.BindText(1, session_id);
    while (stmt.Step()) {
      session.warnings.push_back(stmt.ColumnText(0));
    }
  }
  return session;
}

std::vector<std::string> SessionStore::ListSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  storage::Statement stmt(sqlite_->db.get(), "SELECT id FROM sessions ORDER BY rowid;");
  std::vector<std::string> ids{};
  while (stmt.Step()) {
    ids.push_back(stmt.ColumnText(0));
  }
  return ids;
}

void SessionStore::CommitRound(const RoundCommit& commit, const std::function<void()>& before_commit) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db.get();
  storage::Transaction txn(db);

  {
    storage::Statement stmt(db, "UPDATE sessions SET status = ?2, rounds_completed = ?3 WHERE id = ?1;");
    stmt.BindText(1, commit.session_id);
    stmt.BindText(2, std::string(SessionStatusName(commit.status)));
    stmt.BindInt(3, commit.rounds_completed);
    stmt.Run();
    if (sqlite3_changes(db) != 1) {
      throw StorageError("session store: unknown session " + commit.session_id);
    }
  }
  if (!commit.new_questions.empty()) {
    storage::Statement stmt(db, "INSERT INTO questions(session_id, text, round, pending) VALUES(?1, ?2, ?3, ?4);");
    for (const auto& question : commit.new_questions) {
      stmt.Reset();
      stmt.BindText(1, commit.session_id);
      stmt.BindText(2, question.text);
      stmt.BindInt(3, question.round);
      stmt.BindInt(4, question.pending ? 1 : 0);
      stmt.Run();
    }
  }
  if (!commit.resolved_questions.empty()) {
    storage::Statement stmt(db, "UPDATE questions SET pending = 0 WHERE session_id = ?1 AND text = ?2;");
    for (const auto& text : commit.resolved_questions) {
      stmt.Reset();
      stmt.BindText(1, commit.session_id);
      stmt.BindText(2, text);
      stmt.Run();
    }
  }
  if (!commit.findings.empty()) {
    storage::Statement stmt(db, "INSERT INTO findings(session_id, question, answer, round) VALUES(?1, ?2, ?3, ?4);");
    storage::Statement cite_stmt(db,
                                 "INSERT INTO citations(finding_id, paper_id, page_from, page_to, chunk_id) "
                                 "VALUES(?1, ?2, ?3, ?4, ?5);");
    for (const auto& finding : commit.findings) {
      stmt.Reset();
      stmt.BindText(1, commit.session_id);
      stmt.BindText(2, finding.question);
      stmt.BindText(3, finding.answer);
      stmt.BindInt(4, finding.round);
      stmt.Run();
      const auto finding_id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
      for (const auto& citation : finding.citations) {
        cite_stmt.Reset();
        cite_stmt.BindInt(1, finding_id);
        cite_stmt.BindText(2, citation.paper_id);
        cite_stmt.BindInt(3, citation.page_from);
        cite_stmt.BindInt(4, citation.page_to);
        cite_stmt.BindText(5, citation.chunk_id);
        cite_stmt.Run();
      }
    }
  }
  if (!commit.ideas.empty()) {
    storage::Statement stmt(db,
                            "INSERT INTO ideas(session_id, title, motivation, method, eval, risks, refs, round) "
                            "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
    for (const auto& idea : commit.ideas) {
      stmt.Reset();
      stmt.BindText(1, commit.session_id);
      stmt.BindText(2, idea.title);
      stmt.BindText(3, idea.motivation);
      stmt.BindText(4, idea.method);
      stmt.BindText(5, idea.eval);
      stmt.BindText(6, idea.risks);
      stmt.BindText(7, JoinRefs(idea.refs));
      stmt.BindInt(8, idea.round);
      stmt.Run();
    }
  }
  if (!commit.reading_list.empty()) {
    storage::Statement stmt(db,
                            "INSERT INTO reading_list(session_id, paper_id, reason, round) VALUES(?1, ?2, ?3, ?4);");
    for (const auto& entry : commit.reading_list) {
      stmt.Reset();
      stmt.BindText(1, commit.session_id);
      stmt.BindText(2, entry.paper_id);
      stmt.BindText(3, entry.reason);
      stmt.BindInt(4, entry.round);
      stmt.Run();
    }
  }
  InsertWarnings(db, commit.session_id, commit.warnings);
  InsertPapers(db, commit.papers);

  if (before_commit) {
    before_commit();
  }
  txn.Commit();
  spdlog::debug("session store: committed round {} of session {}", commit.rounds_completed, commit.session_id);
}

void SessionStore::MarkFailed(const std::string& session_id,
                              const std::string& reason,
                              const std::vector<std::string>& warnings) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db.get();
  storage::Transaction txn(db);
  {
    storage::Statement stmt(db, "UPDATE sessions SET status = ?2, failure_reason = ?3 WHERE id = ?1;");
    stmt.BindText(1, session_id);
    stmt.BindText(2, std::string(SessionStatusName(SessionStatus::kFailed)));
    stmt.BindText(3, reason);
    stmt.Run();
    if (sqlite3_changes(db) != 1) {
      throw StorageError("session store: unknown session " + session_id);
    }
  }
  InsertWarnings(db, session_id, warnings);
  txn.Commit();
}

std::vector<PaperRecord> SessionStore::ListPapers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  storage::Statement stmt(sqlite_->db.get(), "SELECT id, title, url FROM papers ORDER BY id;");
  std::vector<PaperRecord> papers{};
  while (stmt.Step()) {
    papers.push_back(PaperRecord{stmt.ColumnText(0), stmt.ColumnText(1), stmt.ColumnText(2)});
  }
  return papers;
}

}  // namespace sailcpp
