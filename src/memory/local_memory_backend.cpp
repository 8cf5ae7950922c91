#include "sailcpp/memory.hpp"

#include "journal.hpp"
#include "memory_index.hpp"

#include <spdlog/spdlog.h>

namespace sailcpp {

LocalMemoryBackend::LocalMemoryBackend(const std::filesystem::path& journal_path)
    : journal_path_(journal_path), index_(std::make_unique<MemoryIndex>()) {
  const auto scan = memory::ScanJournal(journal_path_);
  for (const auto& record : scan.records) {
    for (const auto& item : record) {
      index_->Apply(item);
    }
  }
  valid_bytes_ = scan.valid_bytes;
  spdlog::debug("memory journal {}: {} records, {} items indexed",
                journal_path_.string(),
                scan.records.size(),
                index_->size());
}

LocalMemoryBackend::~LocalMemoryBackend() = default;

void LocalMemoryBackend::Put(const MemoryItem& item) {
  PutBatch({item});
}

void LocalMemoryBackend::PutBatch(const std::vector<MemoryItem>& items) {
  if (items.empty()) {
    return;
  }
  const auto frame = memory::EncodeJournalRecord(items);
  std::lock_guard<std::mutex> lock(mutex_);
  {
    memory::JournalWriter writer(journal_path_, valid_bytes_);
    valid_bytes_ = writer.Append(frame);
  }
  for (const auto& item : items) {
    index_->Apply(item);
  }
}

std::optional<MemoryItem> LocalMemoryBackend::Get(MemoryTier tier,
                                                  const std::string& key,
                                                  const std::optional<std::string>& session_scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->Get(tier, key, session_scope);
}

std::vector<MemoryHit> LocalMemoryBackend::Search(MemoryTier tier,
                                                  const std::string& query,
                                                  int top_k,
                                                  const std::optional<std::string>& session_scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->Search(tier, query, top_k, session_scope);
}

std::size_t LocalMemoryBackend::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->size();
}

std::uint64_t LocalMemoryBackend::valid_journal_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return valid_bytes_;
}

}  // namespace sailcpp
