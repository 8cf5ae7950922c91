#include "sailcpp/memory.hpp"

#include "sailcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace sailcpp {

std::int64_t MemoryClockNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

MemoryManager::MemoryManager(std::shared_ptr<MemoryBackend> backend, std::string session_id)
    : backend_(std::move(backend)), session_id_(std::move(session_id)) {
  if (!backend_) {
    throw ConfigError("memory manager: backend must not be null");
  }
  if (session_id_.empty()) {
    throw ConfigError("memory manager: session id must not be empty");
  }
}

MemoryItem MemoryManager::BuildItem(MemoryTier tier, const std::string& key, const std::string& value) const {
  if (key.empty()) {
    throw std::runtime_error("memory manager: key must not be empty");
  }
  MemoryItem item{};
  item.tier = tier;
  item.key = key;
  item.value = value;
  item.created_at = MemoryClockNowMs();
  item.source_session_id = session_id_;
  return item;
}

std::optional<std::string> MemoryManager::ScopeFor(MemoryTier tier) const {
  if (tier == MemoryTier::kSession) {
    return session_id_;
  }
  return std::nullopt;
}

void MemoryManager::ReportReadFailure(const std::exception& error, std::vector<std::string>* warnings) const {
  auto message = std::string("memory_unavailable:") + error.what();
  spdlog::warn("session {}: {}", session_id_, message);
  if (warnings == nullptr) {
    return;
  }
  if (std::find(warnings->begin(), warnings->end(), message) == warnings->end()) {
    warnings->push_back(std::move(message));
  }
}

void MemoryManager::Put(MemoryTier tier, const std::string& key, const std::string& value) {
  backend_->Put(BuildItem(tier, key, value));
}

std::optional<MemoryItem> MemoryManager::Get(MemoryTier tier,
                                             const std::string& key,
                                             std::vector<std::string>* warnings) {
  try {
    return backend_->Get(tier, key, ScopeFor(tier));
  } catch (const std::exception& error) {
    ReportReadFailure(error, warnings);
    return std::nullopt;
  }
}

std::vector<MemoryHit> MemoryManager::Search(MemoryTier tier,
                                             const std::string& query,
                                             int top_k,
                                             std::vector<std::string>* warnings) {
  try {
    return backend_->Search(tier, query, top_k, ScopeFor(tier));
  } catch (const std::exception& error) {
    ReportReadFailure(error, warnings);
    return {};
  }
}

void MemoryManager::StagePut(MemoryTier tier, const std::string& key, const std::string& value) {
  auto item = BuildItem(tier, key, value);
  std::lock_guard<std::mutex> lock(mutex_);
  pending_items_.push_back(std::move(item));
}

void MemoryManager::CommitStaged() {
  std::vector<MemoryItem> batch{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_items_.empty()) {
      return;
    }
    batch = pending_items_;
  }
  backend_->PutBatch(batch);
  std::lock_guard<std::mutex> lock(mutex_);
  pending_items_.clear();
}

void MemoryManager::RollbackStaged() {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_items_.clear();
}

std::size_t MemoryManager::PendingMutationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_items_.size();
}

const std::string& MemoryManager::session_id() const {
  return session_id_;
}

}  // namespace sailcpp
