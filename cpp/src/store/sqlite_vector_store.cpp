#include "caserag/vector_store.hpp"

#include "caserag/errors.hpp"
#include "caserag/logging.hpp"
#include "caserag/similarity.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace caserag {
namespace {

constexpr const char* kMemoryPath = ":memory:";
constexpr const char* kEmbeddingModelKey = "embedding_model";

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
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
    if (sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
      throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  void BindInt64(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
      throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  void BindBlob(int index, const void* data, int size) {
    if (sqlite3_bind_blob(stmt_, index, data, size, SQLITE_TRANSIENT) != SQLITE_OK) {
      throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  // True while a row is available.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

  std::string ColumnText(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
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
  throw StoreError("sqlite exec failed: " + message);
}

void Rollback(sqlite3* db) {
  if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    logging::Get()->error("sqlite rollback failed: {}", sqlite3_errmsg(db));
  }
}

template <typename Fn>
auto InTransaction(sqlite3* db, Fn&& fn) {
  Exec(db, "BEGIN IMMEDIATE TRANSACTION;");
  try {
    auto result = fn();
    Exec(db, "COMMIT;");
    return result;
  } catch (...) {
    Rollback(db);
    throw;
  }
}

std::vector<float> DecodeEmbedding(const void* blob, int bytes) {
  std::vector<float> embedding(static_cast<std::size_t>(bytes) / sizeof(float));
  if (!embedding.empty()) {
    std::memcpy(embedding.data(), blob, embedding.size() * sizeof(float));
  }
  return embedding;
}

Metadata EffectiveMetadata(const Fragment& fragment) {
  Metadata metadata = fragment.metadata;
  if (metadata.find(kCaseIdKey) == metadata.end() && !fragment.case_id.empty()) {
    metadata[kCaseIdKey] = fragment.case_id;
  }
  if (metadata.find(kFileNameKey) == metadata.end() && !fragment.source_id.empty()) {
    metadata[kFileNameKey] = fragment.source_id;
  }
  return metadata;
}

std::optional<std::string> ReadMeta(sqlite3* db, const char* key) {
  Statement select_stmt(db, "SELECT value FROM store_meta WHERE key = ?1;");
  select_stmt.BindText(1, key);
  if (!select_stmt.Step()) {
    return std::nullopt;
  }
  return select_stmt.ColumnText(0);
}

void WriteMeta(sqlite3* db, const char* key, const std::string& value) {
  Statement insert_stmt(db, "INSERT INTO store_meta(key, value) VALUES(?1, ?2);");
  insert_stmt.BindText(1, key);
  insert_stmt.BindText(2, value);
  (void)insert_stmt.Step();
}

int ReadStoredDimensions(sqlite3* db) {
  const auto stored = ReadMeta(db, "dimensions");
  if (!stored.has_value()) {
    return 0;
  }
  const auto& text = *stored;
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value <= 0) {
    throw StoreError("vector store has a malformed dimensions record: '" + text + "'");
  }
  return static_cast<int>(value);
}

}  // namespace

struct SqliteVectorStore::SQLiteState {
  sqlite3* db = nullptr;
  std::mutex mutex;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

SqliteVectorStore::SqliteVectorStore(std::filesystem::path path, int dimensions, std::unique_ptr<SQLiteState> state)
    : path_(std::move(path)), dimensions_(dimensions), sqlite_(std::move(state)) {}

SqliteVectorStore::~SqliteVectorStore() = default;

SqliteVectorStore::SqliteVectorStore(SqliteVectorStore&&) noexcept = default;

SqliteVectorStore& SqliteVectorStore::operator=(SqliteVectorStore&&) noexcept = default;

SqliteVectorStore SqliteVectorStore::Open(const std::filesystem::path& path,
                                          int dimensions,
                                          const std::string& embedding_model) {
  if (dimensions <= 0) {
    throw StoreError("vector store dimensions must be positive");
  }
  if (path.string() != kMemoryPath && path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw StoreError("cannot create store directory '" + path.parent_path().string() + "': " + ec.message());
    }
  }

  auto state = std::make_unique<SQLiteState>();
  if (sqlite3_open_v2(path.string().c_str(),
                      &state->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    const std::string message = state->db != nullptr ? sqlite3_errmsg(state->db) : "out of memory";
    throw StoreError("cannot open vector store '" + path.string() + "': " + message);
  }

  Exec(state->db, "PRAGMA foreign_keys=ON;");
  Exec(state->db, "CREATE TABLE IF NOT EXISTS store_meta("
                  "key TEXT PRIMARY KEY,"
                  "value TEXT NOT NULL"
                  ");");
  Exec(state->db, "CREATE TABLE IF NOT EXISTS fragments("
                  "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  "case_id TEXT NOT NULL,"
                  "source_id TEXT NOT NULL,"
                  "body TEXT NOT NULL,"
                  "embedding BLOB NOT NULL"
                  ");");
  Exec(state->db, "CREATE TABLE IF NOT EXISTS fragment_metadata("
                  "fragment_id INTEGER NOT NULL REFERENCES fragments(id) ON DELETE CASCADE,"
                  "key TEXT NOT NULL,"
                  "value TEXT NOT NULL,"
                  "PRIMARY KEY(fragment_id, key)"
                  ");");
  Exec(state->db, "CREATE INDEX IF NOT EXISTS fragment_metadata_kv ON fragment_metadata(key, value);");

  const int stored = ReadStoredDimensions(state->db);
  if (stored == 0) {
    WriteMeta(state->db, "dimensions", std::to_string(dimensions));
  } else if (stored != dimensions) {
    throw StoreError("vector store '" + path.string() + "' holds " + std::to_string(stored) +
                     "-dimensional embeddings, expected " + std::to_string(dimensions));
  }

  // An unnamed embedder neither stamps nor checks the store.
  if (!embedding_model.empty()) {
    const auto stored_model = ReadMeta(state->db, kEmbeddingModelKey);
    if (!stored_model.has_value()) {
      WriteMeta(state->db, kEmbeddingModelKey, embedding_model);
    } else if (*stored_model != embedding_model) {
      throw StoreError("vector store '" + path.string() + "' was built with embedding model '" + *stored_model +
                       "', not '" + embedding_model + "'");
    }
  }

  logging::Get()->debug("opened vector store '{}' ({} dims)", path.string(), dimensions);
  return SqliteVectorStore(path, dimensions, std::move(state));
}

std::uint64_t SqliteVectorStore::Insert(const Fragment& fragment) {
  const auto ids = InsertBatch({fragment});
  return ids.front();
}

std::vector<std::uint64_t> SqliteVectorStore::InsertBatch(const std::vector<Fragment>& fragments) {
  if (fragments.empty()) {
    return {};
  }
  for (const auto& fragment : fragments) {
    if (fragment.embedding.size() != static_cast<std::size_t>(dimensions_)) {
      throw StoreError("fragment embedding has " + std::to_string(fragment.embedding.size()) +
                       " dimensions, store expects " + std::to_string(dimensions_));
    }
  }

  std::lock_guard<std::mutex> lock(sqlite_->mutex);
  sqlite3* db = sqlite_->db;
  return InTransaction(db, [&]() {
    Statement insert_stmt(db, "INSERT INTO fragments(case_id, source_id, body, embedding) VALUES(?1, ?2, ?3, ?4);");
    Statement meta_stmt(db, "INSERT OR REPLACE INTO fragment_metadata(fragment_id, key, value) VALUES(?1, ?2, ?3);");

    std::vector<std::uint64_t> ids{};
    ids.reserve(fragments.size());
    for (const auto& fragment : fragments) {
      insert_stmt.Reset();
      insert_stmt.BindText(1, fragment.case_id);
      insert_stmt.BindText(2, fragment.source_id);
      insert_stmt.BindText(3, fragment.text);
      insert_stmt.BindBlob(4, fragment.embedding.data(), static_cast<int>(fragment.embedding.size() * sizeof(float)));
      (void)insert_stmt.Step();
      const auto id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));

      for (const auto& [key, value] : EffectiveMetadata(fragment)) {
        meta_stmt.Reset();
        meta_stmt.BindInt64(1, static_cast<std::int64_t>(id));
        meta_stmt.BindText(2, key);
        meta_stmt.BindText(3, value);
        (void)meta_stmt.Step();
      }
      ids.push_back(id);
    }
    return ids;
  });
}

std::vector<FragmentHit> SqliteVectorStore::Query(const std::vector<float>& embedding,
                                                  int k,
                                                  const std::optional<MetadataFilter>& filter) const {
  if (embedding.size() != static_cast<std::size_t>(dimensions_)) {
    throw StoreError("query embedding has " + std::to_string(embedding.size()) + " dimensions, store expects " +
                     std::to_string(dimensions_));
  }
  if (k <= 0) {
    return {};
  }

  struct Row {
    StoredFragment fragment;
    std::vector<float> embedding;
  };
  std::vector<Row> rows{};
  {
    std::lock_guard<std::mutex> lock(sqlite_->mutex);
    sqlite3* db = sqlite_->db;
    const char* sql = filter.has_value()
                          ? "SELECT f.id, f.case_id, f.source_id, f.body, f.embedding FROM fragments f "
                            "JOIN fragment_metadata m ON m.fragment_id = f.id "
                            "WHERE m.key = ?1 AND m.value = ?2 ORDER BY f.id;"
                          : "SELECT id, case_id, source_id, body, embedding FROM fragments ORDER BY id;";
    Statement select_stmt(db, sql);
    if (filter.has_value()) {
      select_stmt.BindText(1, filter->key);
      select_stmt.BindText(2, filter->value);
    }
    while (select_stmt.Step()) {
      Row row{};
      row.fragment.id = static_cast<std::uint64_t>(sqlite3_column_int64(select_stmt.get(), 0));
      row.fragment.case_id = select_stmt.ColumnText(1);
      row.fragment.source_id = select_stmt.ColumnText(2);
      row.fragment.text = select_stmt.ColumnText(3);
      row.embedding = DecodeEmbedding(sqlite3_column_blob(select_stmt.get(), 4), sqlite3_column_bytes(select_stmt.get(), 4));
      rows.push_back(std::move(row));
    }
  }

  std::vector<FragmentHit> hits{};
  hits.reserve(rows.size());
  for (auto& row : rows) {
    if (row.embedding.size() != embedding.size()) {
      throw StoreError("stored fragment " + std::to_string(row.fragment.id) + " has a malformed embedding");
    }
    FragmentHit hit{};
    hit.distance = SquaredL2Distance(std::span<const float>(embedding), std::span<const float>(row.embedding));
    hit.fragment = std::move(row.fragment);
    hits.push_back(std::move(hit));
  }

  std::stable_sort(hits.begin(), hits.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.distance != rhs.distance) {
      return lhs.distance < rhs.distance;
    }
    return lhs.fragment.id < rhs.fragment.id;
  });
  if (hits.size() > static_cast<std::size_t>(k)) {
    hits.resize(static_cast<std::size_t>(k));
  }

  std::lock_guard<std::mutex> lock(sqlite_->mutex);
  Statement meta_stmt(sqlite_->db, "SELECT key, value FROM fragment_metadata WHERE fragment_id = ?1;");
  for (auto& hit : hits) {
    meta_stmt.Reset();
    meta_stmt.BindInt64(1, static_cast<std::int64_t>(hit.fragment.id));
    while (meta_stmt.Step()) {
      hit.fragment.metadata[meta_stmt.ColumnText(0)] = meta_stmt.ColumnText(1);
    }
  }
  return hits;
}

std::uint64_t SqliteVectorStore::Count() const {
  std::lock_guard<std::mutex> lock(sqlite_->mutex);
  Statement count_stmt(sqlite_->db, "SELECT COUNT(*) FROM fragments;");
  if (!count_stmt.Step()) {
    return 0;
  }
  return static_cast<std::uint64_t>(sqlite3_column_int64(count_stmt.get(), 0));
}

void SqliteVectorStore::DeleteAll() {
  std::lock_guard<std::mutex> lock(sqlite_->mutex);
  sqlite3* db = sqlite_->db;
  (void)InTransaction(db, [&]() {
    Exec(db, "DELETE FROM fragment_metadata;");
    Exec(db, "DELETE FROM fragments;");
    return true;
  });
}

std::uint64_t SqliteVectorStore::DeleteWhere(const MetadataFilter& filter) {
  std::lock_guard<std::mutex> lock(sqlite_->mutex);
  sqlite3* db = sqlite_->db;
  return InTransaction(db, [&]() {
    Statement delete_stmt(db,
                          "DELETE FROM fragments WHERE id IN ("
                          "SELECT fragment_id FROM fragment_metadata WHERE key = ?1 AND value = ?2);");
    delete_stmt.BindText(1, filter.key);
    delete_stmt.BindText(2, filter.value);
    (void)delete_stmt.Step();
    const auto removed = static_cast<std::uint64_t>(sqlite3_changes(db));
    Exec(db, "DELETE FROM fragment_metadata WHERE fragment_id NOT IN (SELECT id FROM fragments);");
    return removed;
  });
}

}  // namespace caserag
