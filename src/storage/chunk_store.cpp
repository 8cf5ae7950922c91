#include "sailcpp/chunk_store.hpp"

#include "sailcpp/errors.hpp"

#include "../core/byte_codec.hpp"
#include "../core/sha256.hpp"
#include "../text/lexical.hpp"
#include "../vector/similarity.hpp"
#include "sqlite_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace sailcpp {
namespace {

constexpr const char* kDimensionKey = "embedding_dimensions";

void CreateSchema(sqlite3* db) {
  storage::Exec(db, "PRAGMA journal_mode=WAL;");
  storage::Exec(db, "PRAGMA synchronous=NORMAL;");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS chunks("
                "id TEXT PRIMARY KEY,"
                "paper_id TEXT NOT NULL,"
                "content_type TEXT NOT NULL,"
                "text TEXT NOT NULL,"
                "embedding BLOB,"
                "page_from INTEGER NOT NULL,"
                "page_to INTEGER NOT NULL,"
                "image_path TEXT"
                ");");
  storage::Exec(db,
                "CREATE TABLE IF NOT EXISTS store_meta("
                "key TEXT PRIMARY KEY,"
                "value TEXT NOT NULL"
                ");");
  storage::Exec(db,
                "CREATE VIRTUAL TABLE IF NOT EXISTS chunks_fts USING fts5("
                "text,"
                "content='chunks',"
                "content_rowid='rowid',"
                "tokenize='unicode61 remove_diacritics 0'"
                ");");
  storage::Exec(db,
                "CREATE TRIGGER IF NOT EXISTS chunks_ai AFTER INSERT ON chunks BEGIN "
                "INSERT INTO chunks_fts(rowid, text) VALUES(new.rowid, new.text); "
                "END;");
  storage::Exec(db,
                "CREATE TRIGGER IF NOT EXISTS chunks_ad AFTER DELETE ON chunks BEGIN "
                "INSERT INTO chunks_fts(chunks_fts, rowid, text) VALUES('delete', old.rowid, old.text); "
                "END;");
  storage::Exec(db,
                "CREATE TRIGGER IF NOT EXISTS chunks_au AFTER UPDATE ON chunks BEGIN "
                "INSERT INTO chunks_fts(chunks_fts, rowid, text) VALUES('delete', old.rowid, old.text); "
                "INSERT INTO chunks_fts(rowid, text) VALUES(new.rowid, new.text); "
                "END;");
}

std::string BuildFtsMatchQuery(const std::set<std::string>& tokens) {
  std::string query{};
  for (const auto& token : tokens) {
    if (!query.empty()) {
      query.append(" OR ");
    }
    query.push_back('"');
    query.append(token);
    query.push_back('"');
  }
  return query;
}

std::unordered_set<std::string> QueryCandidateIds(sqlite3* db, const std::set<std::string>& tokens) {
  const auto fts_query = BuildFtsMatchQuery(tokens);
  if (fts_query.empty()) {
    return {};
  }
  storage::Statement select_stmt(db,
                                 "SELECT c.id FROM chunks_fts "
                                 "JOIN chunks c ON c.rowid = chunks_fts.rowid "
                                 "WHERE chunks_fts MATCH ?1;");
  select_stmt.BindText(1, fts_query);
  std::unordered_set<std::string> ids{};
  while (select_stmt.Step()) {
    ids.insert(select_stmt.ColumnText(0));
  }
  return ids;
}

void SortAndClip(std::vector<ChunkHit>& hits, int top_k) {
  std::sort(hits.begin(), hits.end(), [](const ChunkHit& lhs, const ChunkHit& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.chunk.id < rhs.chunk.id;
  });
  if (hits.size() > static_cast<std::size_t>(top_k)) {
    hits.resize(static_cast<std::size_t>(top_k));
  }
}

bool MatchesType(const Chunk& chunk, const ChunkQuery& query) {
  return !query.content_type.has_value() || chunk.content_type == *query.content_type;
}

}  // namespace

std::string MakeChunkId(const std::string& paper_id, ContentType content_type, const std::string& location) {
  std::string material = paper_id;
  material.push_back('\x1F');
  material.append(ContentTypeName(content_type));
  material.push_back('\x1F');
  material.append(location);
  return core::Sha256Hex(material, 16);
}

struct ChunkStore::SQLiteState {
  explicit SQLiteState(const std::filesystem::path& path) : db(path) {}

  storage::Database db;
};

ChunkStore::ChunkStore(const std::filesystem::path& path, int fixed_dimensions) : path_(path) {
  if (fixed_dimensions < 0) {
    throw ConfigError("chunk store: fixed dimensions must not be negative");
  }
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw StorageError("chunk store: cannot create directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }
  sqlite_ = std::make_unique<SQLiteState>(path_);
  CreateSchema(sqlite_->db.get());
  if (fixed_dimensions > 0) {
    dimensions_ = fixed_dimensions;
  }
  LoadState();
}

ChunkStore::~ChunkStore() = default;

void ChunkStore::LoadState() {
  sqlite3* db = sqlite_->db.get();

  storage::Statement meta_stmt(db, "SELECT value FROM store_meta WHERE key = ?1;");
  meta_stmt.BindText(1, kDimensionKey);
  if (meta_stmt.Step()) {
    const int stored = std::stoi(meta_stmt.ColumnText(0));
    if (dimensions_.has_value() && *dimensions_ != stored) {
      spdlog::warn("chunk store {}: persisted dimension {} overrides configured {}", path_.string(), stored, *dimensions_);
    }
    dimensions_ = stored;
  }

  storage::Statement select_stmt(
      db, "SELECT id, paper_id, content_type, text, embedding, page_from, page_to, image_path FROM chunks;");
  while (select_stmt.Step()) {
    Chunk chunk{};
    chunk.id = select_stmt.ColumnText(0);
    chunk.paper_id = select_stmt.ColumnText(1);
    const auto type = ParseContentType(select_stmt.ColumnText(2));
    if (!type.has_value()) {
      throw StorageError("chunk store: unknown content type for chunk " + chunk.id);
    }
    chunk.content_type = *type;
    chunk.text = select_stmt.ColumnText(3);
    if (!select_stmt.ColumnIsNull(4)) {
      const auto blob = select_stmt.ColumnBlob(4);
      auto decoded = core::DecodeFloatVector(blob);
      if (decoded.has_value() && !decoded->empty() &&
          (!dimensions_.has_value() || static_cast<int>(decoded->size()) == *dimensions_)) {
        chunk.embedding = std::move(*decoded);
      }
    }
    chunk.page_from = static_cast<int>(select_stmt.ColumnInt(5));
    chunk.page_to = static_cast<int>(select_stmt.ColumnInt(6));
    chunk.image_path = select_stmt.ColumnOptionalText(7);
    auto id = chunk.id;
    chunks_.insert_or_assign(std::move(id), std::move(chunk));
  }
  spdlog::debug("chunk store {}: loaded {} chunks", path_.string(), chunks_.size());
}

Chunk ChunkStore::Upsert(Chunk chunk) {
  if (chunk.id.empty()) {
    throw StorageError("chunk store: refusing to write a chunk without id");
  }

  std::unique_lock lock(mutex_);
  std::optional<int> next_dimensions = dimensions_;
  bool persist_dimensions = false;
  if (chunk.embedding.has_value() && chunk.embedding->empty()) {
    chunk.embedding.reset();
  }
  if (chunk.embedding.has_value()) {
    const int size = static_cast<int>(chunk.embedding->size());
    if (!next_dimensions.has_value()) {
      next_dimensions = size;
    } else if (*next_dimensions != size) {
      // Pending until drained; re-raised on the next mismatch after a drain.
      auto warning = "embedding_dimension_mismatch:expected=" + std::to_string(*next_dimensions);
      if (std::find(warnings_.begin(), warnings_.end(), warning) == warnings_.end()) {
        warnings_.push_back(std::move(warning));
      }
      spdlog::warn("chunk store {}: embedding dimension {} does not match {}, storing chunk {} without embedding",
                   path_.string(),
                   size,
                   *next_dimensions,
                   chunk.id);
      chunk.embedding.reset();
    }
  }
  if (chunk.embedding.has_value()) {
    persist_dimensions = true;
  }

  sqlite3* db = sqlite_->db.get();
  storage::Transaction txn(db);
  storage::Statement upsert_stmt(
      db,
      "INSERT INTO chunks(id, paper_id, content_type, text, embedding, page_from, page_to, image_path) "
      "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
      "ON CONFLICT(id) DO UPDATE SET paper_id=excluded.paper_id, content_type=excluded.content_type, "
      "text=excluded.text, embedding=excluded.embedding, page_from=excluded.page_from, "
      "page_to=excluded.page_to, image_path=excluded.image_path;");
  upsert_stmt.BindText(1, chunk.id);
  upsert_stmt.BindText(2, chunk.paper_id);
  upsert_stmt.BindText(3, std::string(ContentTypeName(chunk.content_type)));
  upsert_stmt.BindText(4, chunk.text);
  if (chunk.embedding.has_value()) {
    upsert_stmt.BindBlob(5, core::EncodeFloatVector(*chunk.embedding));
  } else {
    upsert_stmt.BindNull(5);
  }
  upsert_stmt.BindInt(6, chunk.page_from);
  upsert_stmt.BindInt(7, chunk.page_to);
  upsert_stmt.BindOptionalText(8, chunk.image_path);
  upsert_stmt.Run();

  if (persist_dimensions && next_dimensions.has_value()) {
    storage::Statement meta_stmt(db,
                                 "INSERT INTO store_meta(key, value) VALUES(?1, ?2) "
                                 "ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    meta_stmt.BindText(1, kDimensionKey);
    meta_stmt.BindText(2, std::to_string(*next_dimensions));
    meta_stmt.Run();
  }
  txn.Commit();

  dimensions_ = next_dimensions;
  chunks_.insert_or_assign(chunk.id, chunk);
  return chunk;
}

std::vector<ChunkHit> ChunkStore::Query(const ChunkQuery& query) const {
  std::shared_lock lock(mutex_);
  return QueryLocked(query);
}

ChunkBuckets ChunkStore::QueryBuckets(const ChunkQuery& query, const BucketLimits& limits) const {
  std::shared_lock lock(mutex_);
  ChunkBuckets buckets{};
  auto bucket_query = query;

  bucket_query.content_type = ContentType::kText;
  bucket_query.top_k = limits.text_k;
  buckets.text = QueryLocked(bucket_query);

  bucket_query.content_type = ContentType::kFigure;
  bucket_query.top_k = limits.figure_k;
  buckets.figure = QueryLocked(bucket_query);

  bucket_query.content_type = ContentType::kTable;
  bucket_query.top_k = limits.table_k;
  buckets.table = QueryLocked(bucket_query);
  return buckets;
}

std::vector<ChunkHit> ChunkStore::QueryLocked(const ChunkQuery& query) const {
  if (query.top_k <= 0) {
    return {};
  }
  if (query.embedding.has_value() && !query.embedding->empty()) {
    auto vector_hits = RankByVector(query);
    if (!vector_hits.empty()) {
      return vector_hits;
    }
  }
  return RankByKeyword(query);
}

std::vector<ChunkHit> ChunkStore::RankByVector(const ChunkQuery& query) const {
  const auto& query_vector = *query.embedding;
  std::vector<ChunkHit> hits{};
  for (const auto& [id, chunk] : chunks_) {
    if (!MatchesType(chunk, query) || !chunk.embedding.has_value() ||
        chunk.embedding->size() != query_vector.size()) {
      continue;
    }
    ChunkHit hit{};
    hit.chunk = chunk;
    hit.score = vector::CosineSimilarity(query_vector, *chunk.embedding);
    hit.provenance = Provenance::kVector;
    hits.push_back(std::move(hit));
  }
  SortAndClip(hits, query.top_k);
  return hits;
}

std::vector<ChunkHit> ChunkStore::RankByKeyword(const ChunkQuery& query) const {
  const auto query_tokens = text::TokenSet(query.text);
  if (query_tokens.empty()) {
    return {};
  }

  std::optional<std::unordered_set<std::string>> candidates;
  try {
    candidates = QueryCandidateIds(sqlite_->db.get(), query_tokens);
  } catch (const StorageError& error) {
    spdlog::warn("chunk store {}: full-text lookup failed, scanning all chunks: {}", path_.string(), error.what());
  }

  std::vector<ChunkHit> hits{};
  for (const auto& [id, chunk] : chunks_) {
    if (!MatchesType(chunk, query)) {
      continue;
    }
    if (candidates.has_value() && candidates->find(id) == candidates->end()) {
      continue;
    }
    const double overlap = text::Jaccard(query_tokens, text::TokenSet(chunk.text));
    if (overlap <= 0.0) {
      continue;
    }
    ChunkHit hit{};
    hit.chunk = chunk;
    hit.score = static_cast<float>(overlap);
    hit.provenance = Provenance::kKeyword;
    hits.push_back(std::move(hit));
  }
  SortAndClip(hits, query.top_k);
  return hits;
}

std::optional<Chunk> ChunkStore::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto it = chunks_.find(id);
  if (it == chunks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Chunk> ChunkStore::All() const {
  std::shared_lock lock(mutex_);
  std::vector<Chunk> out{};
  out.reserve(chunks_.size());
  for (const auto& [id, chunk] : chunks_) {
    out.push_back(chunk);
  }
  return out;
}

std::size_t ChunkStore::Size() const {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

std::optional<int> ChunkStore::Dimensions() const {
  std::shared_lock lock(mutex_);
  return dimensions_;
}

std::vector<std::string> ChunkStore::DrainWarnings() {
  std::unique_lock lock(mutex_);
  std::vector<std::string> out{};
  out.swap(warnings_);
  return out;
}

}  // namespace sailcpp
