#include "majcpp/sqlite_graph_store.hpp"
#include "majcpp/errors.hpp"
#include "majcpp/log.hpp"
#include "majcpp/cosine_index.hpp"

#include "node_validation.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace majcpp {
namespace {

constexpr const char* kNodeColumns =
    "n.id, n.kind, n.description, n.name, n.is_successful, n.reasoning, n.embedding";

class Statement final {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw GraphError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  void BindText(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
      throw GraphError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  void BindOptionalText(int index, const std::optional<std::string>& value) {
    if (!value.has_value()) {
      BindNull(index);
      return;
    }
    BindText(index, *value);
  }

  void BindInt64(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
      throw GraphError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  void BindBlob(int index, const std::vector<std::byte>& value) {
    if (sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
      throw GraphError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  void BindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
      throw GraphError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  // true while rows remain.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw GraphError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw GraphError(message);
}

// Rolls back on scope exit unless committed.
class Transaction final {
 public:
  explicit Transaction(sqlite3* db) : db_(db) { Exec(db_, "BEGIN IMMEDIATE TRANSACTION;"); }

  ~Transaction() {
    if (!committed_) {
      sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit() {
    Exec(db_, "COMMIT;");
    committed_ = true;
  }

 private:
  sqlite3* db_ = nullptr;
  bool committed_ = false;
};

std::vector<std::byte> EncodeEmbedding(const Embedding& embedding) {
  std::vector<std::byte> out{};
  out.reserve(embedding.size() * sizeof(float));
  for (const float value : embedding) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (std::size_t i = 0; i < sizeof(bits); ++i) {
      out.push_back(static_cast<std::byte>((bits >> (8U * i)) & 0xFFU));
    }
  }
  return out;
}

Embedding DecodeEmbedding(const void* data, int length) {
  if (length < 0 || static_cast<std::size_t>(length) % sizeof(float) != 0) {
    throw GraphError("SqliteGraphStore stored embedding has invalid length");
  }
  const auto* bytes = static_cast<const unsigned char*>(data);
  Embedding out(static_cast<std::size_t>(length) / sizeof(float), 0.0F);
  for (std::size_t i = 0; i < out.size(); ++i) {
    std::uint32_t bits = 0;
    for (std::size_t b = 0; b < sizeof(bits); ++b) {
      bits |= static_cast<std::uint32_t>(bytes[i * sizeof(bits) + b]) << (8U * b);
    }
    std::memcpy(&out[i], &bits, sizeof(bits));
  }
  return out;
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
  const auto* text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

std::optional<std::string> ColumnOptionalText(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColumnText(stmt, column);
}

// Reads kNodeColumns starting at `first`.
Node ReadNode(sqlite3_stmt* stmt, int first) {
  Node node{};
  node.id = ColumnText(stmt, first);
  const auto kind_text = ColumnText(stmt, first + 1);
  const auto kind = ParseNodeKind(kind_text);
  if (!kind.has_value()) {
    throw GraphError("SqliteGraphStore unknown node kind in database: " + kind_text);
  }
  node.kind = *kind;
  node.description = ColumnText(stmt, first + 2);
  node.name = ColumnOptionalText(stmt, first + 3);
  if (sqlite3_column_type(stmt, first + 4) != SQLITE_NULL) {
    node.is_successful = sqlite3_column_int(stmt, first + 4) != 0;
  }
  node.reasoning = ColumnOptionalText(stmt, first + 5);
  if (sqlite3_column_type(stmt, first + 6) != SQLITE_NULL) {
    node.embedding = DecodeEmbedding(sqlite3_column_blob(stmt, first + 6), sqlite3_column_bytes(stmt, first + 6));
  }
  return node;
}

std::optional<NodeKind> LookupKind(sqlite3* db, const std::string& id) {
  Statement stmt(db, "SELECT kind FROM nodes WHERE id = ?1;");
  stmt.BindText(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ParseNodeKind(ColumnText(stmt.get(), 0));
}

std::size_t CountRows(sqlite3* db, const std::string& sql, const std::optional<std::string>& kind) {
  Statement stmt(db, sql);
  if (kind.has_value()) {
    stmt.BindText(1, *kind);
  }
  if (!stmt.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

void EnsureSchema(sqlite3* db, int dimensions) {
  Exec(db, "PRAGMA foreign_keys=ON;");
  Exec(db, "PRAGMA busy_timeout=5000;");
  // Concurrent first opens of one file serialise on the write lock.
  Transaction tx(db);
  Exec(db,
       "CREATE TABLE IF NOT EXISTS meta("
       "key TEXT PRIMARY KEY,"
       "value TEXT NOT NULL"
       ");");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS nodes("
       "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
       "id TEXT NOT NULL UNIQUE,"
       "kind TEXT NOT NULL,"
       "description TEXT NOT NULL,"
       "name TEXT,"
       "is_successful INTEGER,"
       "reasoning TEXT,"
       "embedding BLOB"
       ");");
  Exec(db, "CREATE INDEX IF NOT EXISTS nodes_by_kind ON nodes(kind, seq);");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS edges("
       "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
       "kind TEXT NOT NULL,"
       "from_id TEXT NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,"
       "to_id TEXT NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,"
       "UNIQUE(kind, from_id, to_id)"
       ");");
  Exec(db, "CREATE INDEX IF NOT EXISTS edges_by_target ON edges(kind, to_id, seq);");

  {
    Statement insert_dims(db, "INSERT OR IGNORE INTO meta(key, value) VALUES('dimensions', ?1);");
    insert_dims.BindText(1, std::to_string(dimensions));
    (void)insert_dims.Step();
  }
  std::string stored{};
  {
    Statement select_dims(db, "SELECT value FROM meta WHERE key = 'dimensions';");
    if (!select_dims.Step()) {
      throw GraphError("SqliteGraphStore meta table has no dimensions row");
    }
    stored = ColumnText(select_dims.get(), 0);
  }
  tx.Commit();
  if (stored != std::to_string(dimensions)) {
    throw GraphError("SqliteGraphStore dimension mismatch: database uses " + stored + ", requested " +
                     std::to_string(dimensions));
  }
}

}  // namespace

struct SqliteGraphStore::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

SqliteGraphStore::SqliteGraphStore(const std::string& path, int dimensions)
    : path_(path), dimensions_(dimensions), sqlite_(std::make_unique<SQLiteState>()) {
  if (dimensions_ <= 0) {
    throw std::runtime_error("SqliteGraphStore dimensions must be positive");
  }
  if (sqlite3_open_v2(path_.c_str(),
                      &sqlite_->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                      nullptr) != SQLITE_OK) {
    const std::string message = sqlite_->db != nullptr ? sqlite3_errmsg(sqlite_->db) : "out of memory";
    throw GraphError("SqliteGraphStore open failed for " + path_ + ": " + message);
  }
  EnsureSchema(sqlite_->db, dimensions_);
  log::Debug("SqliteGraphStore opened " + path_);
}

SqliteGraphStore::~SqliteGraphStore() = default;

int SqliteGraphStore::dimensions() const {
  return dimensions_;
}

void SqliteGraphStore::InsertLocked(const Node& node) {
  store::ValidateNodeForInsert(node, dimensions_, "SqliteGraphStore::CreateNode");
  Statement insert(sqlite_->db,
                   "INSERT INTO nodes(id, kind, description, name, is_successful, reasoning, embedding) "
                   "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7);");
  insert.BindText(1, node.id);
  insert.BindText(2, std::string(ToString(node.kind)));
  insert.BindText(3, node.description);
  insert.BindOptionalText(4, node.name);
  if (node.is_successful.has_value()) {
    insert.BindInt64(5, *node.is_successful ? 1 : 0);
  } else {
    insert.BindNull(5);
  }
  insert.BindOptionalText(6, node.reasoning);
  if (node.embedding.has_value()) {
    insert.BindBlob(7, EncodeEmbedding(*node.embedding));
  } else {
    insert.BindNull(7);
  }

  const int rc = sqlite3_step(insert.get());
  if (rc == SQLITE_DONE) {
    return;
  }
  if (sqlite3_extended_errcode(sqlite_->db) == SQLITE_CONSTRAINT_UNIQUE) {
    throw DuplicateEntityError("SqliteGraphStore::CreateNode duplicate id: " + node.id, node.id);
  }
  throw GraphError(std::string("SqliteGraphStore::CreateNode insert failed: ") + sqlite3_errmsg(sqlite_->db));
}

void SqliteGraphStore::CreateNode(const Node& node) {
  std::lock_guard<std::mutex> lock(mutex_);
  InsertLocked(node);
}

UpsertResult SqliteGraphStore::CreateNodeUnlessSimilar(const Node& candidate, float threshold) {
  if (!candidate.embedding.has_value()) {
    throw GraphError("SqliteGraphStore::CreateNodeUnlessSimilar candidate requires an embedding");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction transaction(sqlite_->db);
  const auto nearest = QueryNearestLocked(candidate.kind, *candidate.embedding, 1);
  if (!nearest.empty() && nearest.front().score >= threshold) {
    transaction.Commit();
    return UpsertResult{nearest.front().node.id, false};
  }
  InsertLocked(candidate);
  transaction.Commit();
  return UpsertResult{candidate.id, true};
}

std::optional<Node> SqliteGraphStore::GetNode(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement select(sqlite_->db, std::string("SELECT ") + kNodeColumns + " FROM nodes n WHERE n.id = ?1;");
  select.BindText(1, id);
  if (!select.Step()) {
    return std::nullopt;
  }
  return ReadNode(select.get(), 0);
}

void SqliteGraphStore::CreateRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction transaction(sqlite_->db);
  const auto from_kind = LookupKind(sqlite_->db, from_id);
  if (!from_kind.has_value()) {
    throw NotFoundError("SqliteGraphStore::CreateRelationship endpoint not found: " + from_id, from_id);
  }
  const auto to_kind = LookupKind(sqlite_->db, to_id);
  if (!to_kind.has_value()) {
    throw NotFoundError("SqliteGraphStore::CreateRelationship endpoint not found: " + to_id, to_id);
  }
  store::ValidateEndpointKinds(kind, *from_kind, *to_kind, "SqliteGraphStore::CreateRelationship");

  Statement insert(sqlite_->db, "INSERT OR IGNORE INTO edges(kind, from_id, to_id) VALUES(?1, ?2, ?3);");
  insert.BindText(1, std::string(ToString(kind)));
  insert.BindText(2, from_id);
  insert.BindText(3, to_id);
  (void)insert.Step();
  transaction.Commit();
}

bool SqliteGraphStore::HasRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement select(sqlite_->db, "SELECT 1 FROM edges WHERE kind = ?1 AND from_id = ?2 AND to_id = ?3;");
  select.BindText(1, std::string(ToString(kind)));
  select.BindText(2, from_id);
  select.BindText(3, to_id);
  return select.Step();
}

std::vector<SimilarityHit> SqliteGraphStore::QueryNearestLocked(NodeKind kind,
                                                                const Embedding& vector,
                                                                int top_k) const {
  store::ValidateQueryVector(vector, dimensions_, "SqliteGraphStore::QueryNearest");
  if (top_k <= 0) {
    return {};
  }
  Statement select(sqlite_->db,
                   std::string("SELECT ") + kNodeColumns +
                       " FROM nodes n WHERE n.kind = ?1 AND n.embedding IS NOT NULL ORDER BY n.seq;");
  select.BindText(1, std::string(ToString(kind)));

  std::vector<SimilarityHit> hits{};
  while (select.Step()) {
    auto node = ReadNode(select.get(), 0);
    if (node.embedding->size() != vector.size()) {
      throw GraphError("SqliteGraphStore::QueryNearest stored embedding dimension mismatch for " + node.id);
    }
    const float score = CosineSimilarity(vector, *node.embedding);
    hits.push_back(SimilarityHit{std::move(node), score});
  }

  // Stable so equal scores keep insertion order.
  std::stable_sort(hits.begin(), hits.end(), [](const SimilarityHit& lhs, const SimilarityHit& rhs) {
    return lhs.score > rhs.score;
  });
  if (hits.size() > static_cast<std::size_t>(top_k)) {
    hits.resize(static_cast<std::size_t>(top_k));
  }
  return hits;
}

std::vector<SimilarityHit> SqliteGraphStore::QueryNearest(NodeKind kind, const Embedding& vector, int top_k) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return QueryNearestLocked(kind, vector, top_k);
}

std::vector<Neighbor> SqliteGraphStore::Outgoing(const std::vector<std::string>& from_ids, RelationKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Neighbor> out{};
  if (from_ids.empty()) {
    return out;
  }
  Statement select(sqlite_->db,
                   std::string("SELECT ") + kNodeColumns +
                       " FROM edges e JOIN nodes n ON n.id = e.to_id"
                       " WHERE e.kind = ?1 AND e.from_id = ?2 ORDER BY e.seq;");
  const std::string kind_text(ToString(kind));
  for (const auto& from_id : from_ids) {
    select.Reset();
    select.BindText(1, kind_text);
    select.BindText(2, from_id);
    while (select.Step()) {
      out.push_back(Neighbor{from_id, ReadNode(select.get(), 0)});
    }
  }
  return out;
}

std::vector<Neighbor> SqliteGraphStore::Incoming(const std::string& to_id, RelationKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement select(sqlite_->db,
                   std::string("SELECT ") + kNodeColumns +
                       " FROM edges e JOIN nodes n ON n.id = e.from_id"
                       " WHERE e.kind = ?1 AND e.to_id = ?2 ORDER BY e.seq;");
  select.BindText(1, std::string(ToString(kind)));
  select.BindText(2, to_id);
  std::vector<Neighbor> out{};
  while (select.Step()) {
    auto node = ReadNode(select.get(), 0);
    auto from_id = node.id;
    out.push_back(Neighbor{std::move(from_id), std::move(node)});
  }
  return out;
}

std::vector<Node> SqliteGraphStore::NodesOfKind(NodeKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement select(sqlite_->db,
                   std::string("SELECT ") + kNodeColumns + " FROM nodes n WHERE n.kind = ?1 ORDER BY n.seq;");
  select.BindText(1, std::string(ToString(kind)));
  std::vector<Node> out{};
  while (select.Step()) {
    out.push_back(ReadNode(select.get(), 0));
  }
  return out;
}

std::size_t SqliteGraphStore::NodeCount(std::optional<NodeKind> kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!kind.has_value()) {
    return CountRows(sqlite_->db, "SELECT COUNT(*) FROM nodes;", std::nullopt);
  }
  return CountRows(sqlite_->db, "SELECT COUNT(*) FROM nodes WHERE kind = ?1;", std::string(ToString(*kind)));
}

std::size_t SqliteGraphStore::RelationshipCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CountRows(sqlite_->db, "SELECT COUNT(*) FROM edges;", std::nullopt);
}

void SqliteGraphStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction transaction(sqlite_->db);
  Exec(sqlite_->db, "DELETE FROM edges;");
  Exec(sqlite_->db, "DELETE FROM nodes;");
  transaction.Commit();
}

}  // namespace majcpp
