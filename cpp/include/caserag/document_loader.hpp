#pragma once

#include "caserag/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace caserag {

struct LoadedDocument {
  std::string file_name;
  std::vector<std::string> fragments;
};

class DocumentLoader {
 public:
  virtual ~DocumentLoader() = default;

  // Non-recursive. Only files whose lower-cased extension is in `extensions` are loaded;
  // `excluded_file_name` (the case metadata descriptor) never is. Sorted by file name.
  virtual std::vector<LoadedDocument> LoadDirectory(const std::filesystem::path& directory,
                                                    const std::vector<std::string>& extensions,
                                                    const std::string& excluded_file_name) = 0;
};

std::vector<std::string> ChunkText(const std::string& content, const ChunkingStrategy& strategy);

// Lists content files in `directory` matching `extensions`, excluding `excluded_file_name`.
std::vector<std::filesystem::path> ListContentFiles(const std::filesystem::path& directory,
                                                    const std::vector<std::string>& extensions,
                                                    const std::string& excluded_file_name);

// Reads .txt/.md directly and .pdf through the pdftotext tool; other formats are skipped.
class TextDocumentLoader final : public DocumentLoader {
 public:
  explicit TextDocumentLoader(ChunkingStrategy chunking = {});

  std::vector<LoadedDocument> LoadDirectory(const std::filesystem::path& directory,
                                            const std::vector<std::string>& extensions,
                                            const std::string& excluded_file_name) override;

 private:
  ChunkingStrategy chunking_;
};

}  // namespace caserag
