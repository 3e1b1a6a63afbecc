#pragma once

#include "caserag/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace caserag {

class VectorStore {
 public:
  virtual ~VectorStore() = default;

  // Never deduplicates; returns the new store-unique id.
  virtual std::uint64_t Insert(const Fragment& fragment) = 0;
  // All-or-nothing; ids are returned in input order.
  virtual std::vector<std::uint64_t> InsertBatch(const std::vector<Fragment>& fragments) = 0;

  // Up to k hits ordered by ascending distance, ties by insertion order.
  virtual std::vector<FragmentHit> Query(const std::vector<float>& embedding,
                                         int k,
                                         const std::optional<MetadataFilter>& filter = std::nullopt) const = 0;

  virtual std::uint64_t Count() const = 0;
  virtual void DeleteAll() = 0;
  // Returns the number of fragments removed.
  virtual std::uint64_t DeleteWhere(const MetadataFilter& filter) = 0;
};

// SQLite-backed fragment store with brute-force squared-L2 search. The path ":memory:"
// opens a private in-memory database.
class SqliteVectorStore final : public VectorStore {
 public:
  ~SqliteVectorStore() override;
  SqliteVectorStore(SqliteVectorStore&&) noexcept;
  SqliteVectorStore& operator=(SqliteVectorStore&&) noexcept;
  SqliteVectorStore(const SqliteVectorStore&) = delete;
  SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

  // Creates the database (and parent directories) when missing. Throws StoreError when the
  // backend cannot be opened or was created with a different dimension or embedding model.
  // The first non-empty `embedding_model` is recorded with the store.
  static SqliteVectorStore Open(const std::filesystem::path& path,
                                int dimensions,
                                const std::string& embedding_model = {});

  [[nodiscard]] int dimensions() const { return dimensions_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  std::uint64_t Insert(const Fragment& fragment) override;
  std::vector<std::uint64_t> InsertBatch(const std::vector<Fragment>& fragments) override;
  std::vector<FragmentHit> Query(const std::vector<float>& embedding,
                                 int k,
                                 const std::optional<MetadataFilter>& filter = std::nullopt) const override;
  std::uint64_t Count() const override;
  void DeleteAll() override;
  std::uint64_t DeleteWhere(const MetadataFilter& filter) override;

 private:
  struct SQLiteState;

  SqliteVectorStore(std::filesystem::path path, int dimensions, std::unique_ptr<SQLiteState> state);

  std::filesystem::path path_;
  int dimensions_ = 0;
  std::unique_ptr<SQLiteState> sqlite_;
};

}  // namespace caserag
