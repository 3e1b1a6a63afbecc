#include "caserag/case_catalog.hpp"

#include "caserag/document_loader.hpp"
#include "caserag/logging.hpp"
#include "caserag/similarity.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace caserag {
namespace {

using json = nlohmann::json;

constexpr const char* kUnknownDate = "Unknown";

constexpr std::array<const char*, 7> kRequiredStringFields = {
    "case_id", "title", "defendant", "date", "court", "evaluator", "question",
};
constexpr std::array<const char*, 4> kRequiredDocumentFields = {"filename", "type", "date", "description"};
constexpr std::array<const char*, 5> kStandardDocumentTypes = {
    "evaluation_report", "testimony", "correspondence", "risk_assessment", "civil_commitment",
};

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open '" + path.string() + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string StringOr(const json& object, const char* key, const std::string& fallback) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  return it->get<std::string>();
}

}  // namespace

CaseMetadataLookup CaseMetadataLookup::Found(CaseMetadata metadata) {
  CaseMetadataLookup lookup{};
  lookup.status = Status::kFound;
  lookup.metadata = std::move(metadata);
  return lookup;
}

CaseMetadataLookup CaseMetadataLookup::Fallback(std::string reason) {
  CaseMetadataLookup lookup{};
  lookup.status = Status::kFallback;
  lookup.reason = std::move(reason);
  return lookup;
}

CaseMetadata ParseCaseMetadata(const std::string& json_text, const std::string& fallback_case_id) {
  try {
    const auto document = json::parse(json_text);
    if (!document.is_object()) {
      throw std::runtime_error("case metadata is not a JSON object");
    }

    CaseMetadata metadata{};
    metadata.case_id = StringOr(document, "case_id", fallback_case_id);
    metadata.title = StringOr(document, "title", metadata.case_id);
    metadata.date = StringOr(document, "date", kUnknownDate);
    if (const auto it = document.find("summary"); it != document.end() && !it->is_null()) {
      metadata.summary = it->get<std::string>();
    }
    if (const auto it = document.find("key_findings"); it != document.end() && !it->is_null()) {
      metadata.key_findings = it->get<std::vector<std::string>>();
    }
    if (const auto it = document.find("documents"); it != document.end() && !it->is_null()) {
      for (const auto& entry : *it) {
        metadata.documents.push_back(CaseDocument{
            .filename = StringOr(entry, "filename", ""),
            .type = StringOr(entry, "type", ""),
            .date = StringOr(entry, "date", ""),
            .description = StringOr(entry, "description", ""),
        });
      }
    }
    return metadata;
  } catch (const json::exception& ex) {
    throw std::runtime_error(std::string("invalid case metadata: ") + ex.what());
  }
}

int CountCaseFiles(const std::filesystem::path& case_dir, const std::string& metadata_file_name) {
  std::error_code ec;
  if (!std::filesystem::is_directory(case_dir, ec)) {
    return 0;
  }
  int count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(case_dir, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const auto name = entry.path().filename().string();
    if (name.empty() || name.front() == '.' || name.find('.') == std::string::npos) {
      continue;
    }
    if (name == metadata_file_name) {
      continue;
    }
    ++count;
  }
  return ec ? 0 : count;
}

FileCaseMetadataSource::FileCaseMetadataSource(std::filesystem::path data_dir, std::string metadata_file_name)
    : data_dir_(std::move(data_dir)), metadata_file_name_(std::move(metadata_file_name)) {}

CaseMetadataLookup FileCaseMetadataSource::Lookup(const std::string& case_id) const {
  const auto metadata_path = data_dir_ / case_id / metadata_file_name_;
  std::error_code ec;
  if (!std::filesystem::exists(metadata_path, ec)) {
    return CaseMetadataLookup::Fallback("metadata file not found: " + metadata_path.string());
  }
  try {
    return CaseMetadataLookup::Found(ParseCaseMetadata(ReadFile(metadata_path), case_id));
  } catch (const std::exception& ex) {
    return CaseMetadataLookup::Fallback(ex.what());
  }
}

int FileCaseMetadataSource::CountDocuments(const std::string& case_id) const {
  return CountCaseFiles(data_dir_ / case_id, metadata_file_name_);
}

std::vector<CaseInfo> ListCases(const std::filesystem::path& data_dir, const std::string& metadata_file_name) {
  std::vector<CaseInfo> cases{};
  std::error_code ec;
  if (!std::filesystem::is_directory(data_dir, ec)) {
    return cases;
  }

  auto log = logging::Get();
  for (const auto& entry : std::filesystem::directory_iterator(data_dir, ec)) {
    if (!entry.is_directory(ec)) {
      continue;
    }
    const auto dir_name = entry.path().filename().string();
    const auto metadata_path = entry.path() / metadata_file_name;

    CaseInfo info{
        .case_id = dir_name,
        .title = dir_name,
        .date = kUnknownDate,
        .document_count = CountCaseFiles(entry.path(), metadata_file_name),
    };
    if (std::filesystem::exists(metadata_path, ec)) {
      try {
        const auto metadata = ParseCaseMetadata(ReadFile(metadata_path), dir_name);
        info.case_id = metadata.case_id;
        info.title = metadata.title;
        info.date = metadata.date;
        info.document_count = static_cast<int>(metadata.documents.size());
      } catch (const std::exception& ex) {
        log->warn("case '{}' has unreadable metadata ({}), using directory listing", dir_name, ex.what());
      }
    }
    cases.push_back(std::move(info));
  }

  std::sort(cases.begin(), cases.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.case_id < rhs.case_id;
  });
  return cases;
}

CaseValidationReport ValidateCaseDirectory(const std::filesystem::path& case_dir,
                                           const std::string& case_id,
                                           const std::string& metadata_file_name,
                                           const std::vector<std::string>& content_extensions) {
  CaseValidationReport report{};
  std::error_code ec;
  if (!std::filesystem::exists(case_dir, ec)) {
    report.errors.push_back("case directory does not exist: " + case_dir.string());
    return report;
  }
  if (!std::filesystem::is_directory(case_dir, ec)) {
    report.errors.push_back("case path is not a directory: " + case_dir.string());
    return report;
  }
  const auto metadata_path = case_dir / metadata_file_name;
  if (!std::filesystem::exists(metadata_path, ec)) {
    report.errors.push_back(metadata_file_name + " not found in case directory");
    return report;
  }

  json document;
  try {
    document = json::parse(ReadFile(metadata_path));
  } catch (const json::parse_error& ex) {
    report.errors.push_back(std::string("invalid JSON: ") + ex.what());
    return report;
  } catch (const std::runtime_error& ex) {
    report.errors.push_back(ex.what());
    return report;
  }
  if (!document.is_object()) {
    report.errors.push_back("metadata must be a JSON object");
    return report;
  }

  for (const auto* field : kRequiredStringFields) {
    const auto it = document.find(field);
    if (it == document.end()) {
      report.errors.push_back(std::string(field) + ": field required");
    } else if (!it->is_string()) {
      report.errors.push_back(std::string(field) + ": must be a string");
    }
  }

  std::unordered_set<std::string> listed{};
  const auto docs_it = document.find("documents");
  if (docs_it == document.end()) {
    report.errors.push_back("documents: field required");
  } else if (!docs_it->is_array()) {
    report.errors.push_back("documents: must be a list");
  } else {
    for (std::size_t i = 0; i < docs_it->size(); ++i) {
      const auto& entry = (*docs_it)[i];
      const std::string where = "documents." + std::to_string(i);
      if (!entry.is_object()) {
        report.errors.push_back(where + ": must be an object");
        continue;
      }
      for (const auto* field : kRequiredDocumentFields) {
        const auto it = entry.find(field);
        if (it == entry.end() || !it->is_string()) {
          report.errors.push_back(where + "." + field + ": string field required");
        }
      }
      if (const auto type_it = entry.find("type"); type_it != entry.end() && type_it->is_string()) {
        const auto type = type_it->get<std::string>();
        if (std::find(kStandardDocumentTypes.begin(), kStandardDocumentTypes.end(), type) ==
            kStandardDocumentTypes.end()) {
          report.warnings.push_back("document type '" + type + "' is not a standard type");
        }
      }
      if (const auto name_it = entry.find("filename"); name_it != entry.end() && name_it->is_string()) {
        const auto filename = name_it->get<std::string>();
        listed.insert(filename);
        if (!std::filesystem::exists(case_dir / filename, ec)) {
          report.warnings.push_back("document '" + filename + "' listed in metadata but not found");
        }
      }
    }
  }

  if (const auto it = document.find("key_findings");
      it != document.end() && !it->is_null() && (!it->is_array() ||
                                                  !std::all_of(it->begin(), it->end(),
                                                               [](const json& v) { return v.is_string(); }))) {
    report.errors.push_back("key_findings: must be a list of strings");
  }
  if (const auto it = document.find("summary"); it != document.end() && !it->is_null() && !it->is_string()) {
    report.errors.push_back("summary: must be a string");
  }

  if (const auto it = document.find("case_id"); it != document.end() && it->is_string()) {
    const auto declared = it->get<std::string>();
    if (declared.rfind("case_", 0) != 0) {
      report.errors.push_back("case_id must start with 'case_'");
    }
    if (declared != case_id) {
      report.errors.push_back("case_id in metadata ('" + declared + "') does not match directory name ('" +
                              case_id + "')");
    }
  }

  const auto summary_it = document.find("summary");
  if (summary_it == document.end() || !summary_it->is_string() || IsBlank(summary_it->get<std::string>())) {
    report.warnings.push_back("no summary provided; case search works better with a short summary");
  }
  const auto findings_it = document.find("key_findings");
  if (findings_it == document.end() || !findings_it->is_array() || findings_it->empty()) {
    report.warnings.push_back("no key_findings provided; case discovery works better with 3-5 findings");
  }

  for (const auto& path : ListContentFiles(case_dir, content_extensions, metadata_file_name)) {
    const auto name = path.filename().string();
    if (listed.find(name) == listed.end()) {
      report.warnings.push_back("document '" + name + "' is not listed in metadata");
    }
  }

  report.valid = report.errors.empty();
  return report;
}

}  // namespace caserag
