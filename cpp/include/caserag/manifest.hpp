#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace caserag {

struct ManifestEntry {
  std::string case_id;
  std::string file_name;
  std::string ingested_at;
};

enum class ManifestLoadStatus {
  kLoaded,
  kMissing,
  kCorrupt,
};

// Idempotency ledger of (case, source file) pairs already turned into fragments.
// Not synchronized; callers serialize access.
class IngestionManifest {
 public:
  static constexpr char kKeySeparator = '_';

  explicit IngestionManifest(std::filesystem::path path);

  static std::string MakeKey(const std::string& case_id, const std::string& file_name);

  // Replaces the in-memory ledger with the file contents. A missing file yields an empty
  // ledger; a malformed one is logged and also yields an empty ledger.
  ManifestLoadStatus Load();

  [[nodiscard]] bool Has(const std::string& key) const;
  [[nodiscard]] std::optional<ManifestEntry> Get(const std::string& key) const;
  void Record(const std::string& key, const ManifestEntry& entry);
  // Removes every entry belonging to `case_id`; returns how many were removed.
  std::size_t RemoveByCase(const std::string& case_id);
  void Clear();

  // Writes to a sibling temp file and renames it over the ledger. Throws ManifestError.
  void Save() const;
  // Deletes the backing file and clears the in-memory ledger. Returns false on I/O failure.
  bool RemoveFile();

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] const std::map<std::string, ManifestEntry>& entries() const { return entries_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::map<std::string, ManifestEntry> entries_;
};

// UTC timestamp in ISO-8601 form, used as the ingestion marker.
std::string CurrentIngestionMarker();

}  // namespace caserag
