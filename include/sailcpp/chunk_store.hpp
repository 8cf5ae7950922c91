#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sailcpp {

// Content address of a chunk: hex SHA-256 prefix over paper id, content type
// and location within the paper.
[[nodiscard]] std::string MakeChunkId(const std::string& paper_id, ContentType content_type, const std::string& location);

// Per-session store of extracted chunks backed by an SQLite table. Writes are
// serialized; queries take a shared lock and may run concurrently.
class ChunkStore {
 public:
  explicit ChunkStore(const std::filesystem::path& path, int fixed_dimensions = 0);
  ~ChunkStore();
  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  Chunk Upsert(Chunk chunk);
  [[nodiscard]] std::vector<ChunkHit> Query(const ChunkQuery& query) const;
  [[nodiscard]] ChunkBuckets QueryBuckets(const ChunkQuery& query, const BucketLimits& limits) const;

  [[nodiscard]] std::optional<Chunk> Get(const std::string& id) const;
  [[nodiscard]] std::vector<Chunk> All() const;
  [[nodiscard]] std::size_t Size() const;
  [[nodiscard]] std::optional<int> Dimensions() const;
  // Degradation warnings raised since the previous drain.
  std::vector<std::string> DrainWarnings();

 private:
  struct SQLiteState;

  void LoadState();
  [[nodiscard]] std::vector<ChunkHit> QueryLocked(const ChunkQuery& query) const;
  [[nodiscard]] std::vector<ChunkHit> RankByVector(const ChunkQuery& query) const;
  [[nodiscard]] std::vector<ChunkHit> RankByKeyword(const ChunkQuery& query) const;

  std::filesystem::path path_;
  std::unique_ptr<SQLiteState> sqlite_;
  std::map<std::string, Chunk> chunks_;
  std::optional<int> dimensions_;
  std::vector<std::string> warnings_;
  mutable std::shared_mutex mutex_{};
};

}  // namespace sailcpp
