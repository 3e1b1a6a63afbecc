#pragma once

#include "caserag/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace caserag {

struct CaseDocument {
  std::string filename;
  std::string type;
  std::string date;
  std::string description;
};

struct CaseMetadata {
  std::string case_id;
  std::string title;
  std::string date;
  std::optional<std::string> summary;
  std::vector<std::string> key_findings;
  std::vector<CaseDocument> documents;
};

struct CaseMetadataLookup {
  enum class Status {
    kFound,
    kFallback,
  };

  Status status = Status::kFallback;
  std::optional<CaseMetadata> metadata;
  std::string reason;

  [[nodiscard]] bool found() const { return status == Status::kFound; }

  static CaseMetadataLookup Found(CaseMetadata metadata);
  static CaseMetadataLookup Fallback(std::string reason);
};

class CaseMetadataSource {
 public:
  virtual ~CaseMetadataSource() = default;

  // Never throws; missing or unreadable metadata comes back as a fallback with a reason.
  virtual CaseMetadataLookup Lookup(const std::string& case_id) const = 0;
  // Approximate count of content files in the case's storage location, 0 on failure.
  virtual int CountDocuments(const std::string& case_id) const = 0;
};

// Reads <data_dir>/<case_id>/<metadata_file_name>.
class FileCaseMetadataSource final : public CaseMetadataSource {
 public:
  FileCaseMetadataSource(std::filesystem::path data_dir, std::string metadata_file_name = "metadata.json");

  CaseMetadataLookup Lookup(const std::string& case_id) const override;
  int CountDocuments(const std::string& case_id) const override;

 private:
  std::filesystem::path data_dir_;
  std::string metadata_file_name_;
};

// Parses a metadata descriptor; missing optional fields take the defaults used for display.
// Throws std::runtime_error (nlohmann parse/type errors included) on malformed input.
CaseMetadata ParseCaseMetadata(const std::string& json_text, const std::string& fallback_case_id);

// Counts visible regular files with an extension, excluding the metadata descriptor.
int CountCaseFiles(const std::filesystem::path& case_dir, const std::string& metadata_file_name);

// One entry per case directory under data_dir, sorted by case id.
std::vector<CaseInfo> ListCases(const std::filesystem::path& data_dir, const std::string& metadata_file_name);

struct CaseValidationReport {
  bool valid = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

CaseValidationReport ValidateCaseDirectory(const std::filesystem::path& case_dir,
                                           const std::string& case_id,
                                           const std::string& metadata_file_name,
                                           const std::vector<std::string>& content_extensions);

}  // namespace caserag
