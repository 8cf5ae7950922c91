#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sailcpp {

// Storage behind the memory manager. Session scoping is passed explicitly:
// session-tier lookups only see items whose source_session_id equals the scope.
class MemoryBackend {
 public:
  virtual ~MemoryBackend() = default;

  virtual void Put(const MemoryItem& item) = 0;
  virtual void PutBatch(const std::vector<MemoryItem>& items) = 0;
  virtual std::optional<MemoryItem> Get(MemoryTier tier,
                                        const std::string& key,
                                        const std::optional<std::string>& session_scope) = 0;
  virtual std::vector<MemoryHit> Search(MemoryTier tier,
                                        const std::string& query,
                                        int top_k,
                                        const std::optional<std::string>& session_scope) = 0;
};

class MemoryIndex;

// Append-only journal on disk with an in-memory index rebuilt on open. Every
// write holds the journal handle only for the duration of that write.
class LocalMemoryBackend final : public MemoryBackend {
 public:
  explicit LocalMemoryBackend(const std::filesystem::path& journal_path);
  ~LocalMemoryBackend() override;
  LocalMemoryBackend(const LocalMemoryBackend&) = delete;
  LocalMemoryBackend& operator=(const LocalMemoryBackend&) = delete;

  void Put(const MemoryItem& item) override;
  void PutBatch(const std::vector<MemoryItem>& items) override;
  std::optional<MemoryItem> Get(MemoryTier tier,
                                const std::string& key,
                                const std::optional<std::string>& session_scope) override;
  std::vector<MemoryHit> Search(MemoryTier tier,
                                const std::string& query,
                                int top_k,
                                const std::optional<std::string>& session_scope) override;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::uint64_t valid_journal_bytes() const;

 private:
  std::filesystem::path journal_path_;
  std::unique_ptr<MemoryIndex> index_;
  std::uint64_t valid_bytes_ = 0;
  mutable std::mutex mutex_{};
};

// Session-bound facade over a backend. Writes to the session tier are scoped
// to the bound session. Read failures degrade to an empty result; when the
// caller passes a warnings list the cause is appended to it (once per call).
class MemoryManager {
 public:
  MemoryManager(std::shared_ptr<MemoryBackend> backend, std::string session_id);

  void Put(MemoryTier tier, const std::string& key, const std::string& value);
  std::optional<MemoryItem> Get(MemoryTier tier, const std::string& key, std::vector<std::string>* warnings = nullptr);
  std::vector<MemoryHit> Search(MemoryTier tier,
                                const std::string& query,
                                int top_k,
                                std::vector<std::string>* warnings = nullptr);

  // Buffered writes, published as one batch by CommitStaged.
  void StagePut(MemoryTier tier, const std::string& key, const std::string& value);
  void CommitStaged();
  void RollbackStaged();
  [[nodiscard]] std::size_t PendingMutationCount() const;

  [[nodiscard]] const std::string& session_id() const;

 private:
  MemoryItem BuildItem(MemoryTier tier, const std::string& key, const std::string& value) const;
  [[nodiscard]] std::optional<std::string> ScopeFor(MemoryTier tier) const;
  void ReportReadFailure(const std::exception& error, std::vector<std::string>* warnings) const;

  std::shared_ptr<MemoryBackend> backend_;
  std::string session_id_;
  std::vector<MemoryItem> pending_items_;
  mutable std::mutex mutex_{};
};

[[nodiscard]] std::int64_t MemoryClockNowMs();

}  // namespace sailcpp
