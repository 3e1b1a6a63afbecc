#include "caserag/manifest.hpp"

#include "caserag/errors.hpp"
#include "caserag/logging.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace caserag {
namespace {

using json = nlohmann::json;

std::string StringField(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

IngestionManifest::IngestionManifest(std::filesystem::path path) : path_(std::move(path)) {}

std::string IngestionManifest::MakeKey(const std::string& case_id, const std::string& file_name) {
  return case_id + kKeySeparator + file_name;
}

ManifestLoadStatus IngestionManifest::Load() {
  entries_.clear();
  auto log = logging::Get();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return ManifestLoadStatus::kMissing;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    log->warn("ingestion manifest '{}' is unreadable, starting empty", path_.string());
    return ManifestLoadStatus::kCorrupt;
  }

  json document;
  try {
    document = json::parse(in);
  } catch (const json::parse_error& ex) {
    log->warn("ingestion manifest '{}' is corrupt ({}), starting empty", path_.string(), ex.what());
    return ManifestLoadStatus::kCorrupt;
  }
  if (!document.is_object()) {
    log->warn("ingestion manifest '{}' is not a JSON object, starting empty", path_.string());
    return ManifestLoadStatus::kCorrupt;
  }

  for (const auto& [key, value] : document.items()) {
    if (!value.is_object()) {
      log->warn("ignoring malformed manifest entry '{}'", key);
      continue;
    }
    entries_[key] = ManifestEntry{
        .case_id = StringField(value, "case_id"),
        .file_name = StringField(value, "file_name"),
        .ingested_at = StringField(value, "ingested_at"),
    };
  }
  return ManifestLoadStatus::kLoaded;
}

bool IngestionManifest::Has(const std::string& key) const {
  return entries_.find(key) != entries_.end();
}

std::optional<ManifestEntry> IngestionManifest::Get(const std::string& key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void IngestionManifest::Record(const std::string& key, const ManifestEntry& entry) {
  entries_[key] = entry;
}

std::size_t IngestionManifest::RemoveByCase(const std::string& case_id) {
  const std::string prefix = case_id + kKeySeparator;
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    const bool belongs = it->second.case_id.empty() ? it->first.rfind(prefix, 0) == 0
                                                    : it->second.case_id == case_id;
    if (belongs) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void IngestionManifest::Clear() {
  entries_.clear();
}

void IngestionManifest::Save() const {
  json document = json::object();
  for (const auto& [key, entry] : entries_) {
    document[key] = {
        {"case_id", entry.case_id},
        {"file_name", entry.file_name},
        {"ingested_at", entry.ingested_at},
    };
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw ManifestError("cannot create manifest directory '" + path_.parent_path().string() + "': " + ec.message());
    }
  }

  auto tmp_path = path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ManifestError("cannot write manifest '" + tmp_path.string() + "'");
    }
    out << document.dump(2);
    out.flush();
    if (!out) {
      throw ManifestError("short write to manifest '" + tmp_path.string() + "'");
    }
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw ManifestError("cannot replace manifest '" + path_.string() + "': " + ec.message());
  }
}

bool IngestionManifest::RemoveFile() {
  entries_.clear();
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    logging::Get()->error("cannot remove manifest '{}': {}", path_.string(), ec.message());
    return false;
  }
  return true;
}

std::string CurrentIngestionMarker() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

}  // namespace caserag
