#include "caserag/document_loader.hpp"

#include "caserag/logging.hpp"
#include "caserag/similarity.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace caserag {
namespace {

std::string LowerExtension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return ext;
}

std::vector<std::string> TokenizeWhitespace(const std::string& content) {
  std::vector<std::string> tokens{};
  std::istringstream stream(content);
  std::string token{};
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string JoinTokenRange(const std::vector<std::string>& tokens, std::size_t begin, std::size_t end) {
  if (begin >= end || begin >= tokens.size()) {
    return {};
  }
  end = std::min(end, tokens.size());
  std::string out = tokens[begin];
  for (std::size_t i = begin + 1; i < end; ++i) {
    out.push_back(' ');
    out.append(tokens[i]);
  }
  return out;
}

std::optional<std::string> ReadPlainText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Runs pdftotext directly with the path as its own argv element; no shell is involved.
std::optional<std::string> ExtractPdfText(const std::filesystem::path& path) {
  const std::string file = path.string();
  char* const argv[] = {
      const_cast<char*>("pdftotext"),
      const_cast<char*>(file.c_str()),
      const_cast<char*>("-"),
      nullptr,
  };

  int fds[2];
  if (pipe(fds) != 0) {
    return std::nullopt;
  }
  const pid_t pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    return std::nullopt;
  }
  if (pid == 0) {
    dup2(fds[1], STDOUT_FILENO);
    close(fds[0]);
    close(fds[1]);
    const int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    execvp("pdftotext", argv);
    _exit(127);
  }

  close(fds[1]);
  std::string content{};
  char buffer[4096];
  for (;;) {
    const ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      content.append(buffer, static_cast<std::size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      break;
    }
  }
  close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return std::nullopt;
    }
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return std::nullopt;
  }
  return content;
}

}  // namespace

std::vector<std::string> ChunkText(const std::string& content, const ChunkingStrategy& strategy) {
  const auto tokens = TokenizeWhitespace(content);
  if (tokens.empty()) {
    return {};
  }
  if (strategy.chunk_tokens <= 0 || tokens.size() <= static_cast<std::size_t>(strategy.chunk_tokens)) {
    return {JoinTokenRange(tokens, 0, tokens.size())};
  }

  const int step = std::max(1, strategy.chunk_tokens - std::max(0, strategy.overlap_tokens));
  std::vector<std::string> chunks{};
  for (std::size_t start = 0; start < tokens.size(); start += static_cast<std::size_t>(step)) {
    const auto end = std::min(tokens.size(), start + static_cast<std::size_t>(strategy.chunk_tokens));
    chunks.push_back(JoinTokenRange(tokens, start, end));
    if (end == tokens.size()) {
      break;
    }
  }
  return chunks;
}

std::vector<std::filesystem::path> ListContentFiles(const std::filesystem::path& directory,
                                                    const std::vector<std::string>& extensions,
                                                    const std::string& excluded_file_name) {
  std::vector<std::filesystem::path> files{};
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return files;
  }
  for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const auto name = entry.path().filename().string();
    if (name == excluded_file_name) {
      continue;
    }
    const auto ext = LowerExtension(entry.path());
    if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
      continue;
    }
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.filename().string() < rhs.filename().string();
  });
  return files;
}

TextDocumentLoader::TextDocumentLoader(ChunkingStrategy chunking) : chunking_(chunking) {}

std::vector<LoadedDocument> TextDocumentLoader::LoadDirectory(const std::filesystem::path& directory,
                                                              const std::vector<std::string>& extensions,
                                                              const std::string& excluded_file_name) {
  auto log = logging::Get();
  std::vector<LoadedDocument> documents{};
  for (const auto& path : ListContentFiles(directory, extensions, excluded_file_name)) {
    const auto ext = LowerExtension(path);
    std::optional<std::string> content{};
    if (ext == ".txt" || ext == ".md") {
      content = ReadPlainText(path);
    } else if (ext == ".pdf") {
      content = ExtractPdfText(path);
    } else {
      log->warn("no text extractor for '{}', skipping", path.string());
      continue;
    }

    if (!content.has_value()) {
      log->warn("could not read '{}', skipping", path.string());
      continue;
    }
    if (IsBlank(*content)) {
      log->debug("'{}' has no text, skipping", path.string());
      continue;
    }

    documents.push_back(LoadedDocument{
        .file_name = path.filename().string(),
        .fragments = ChunkText(*content, chunking_),
    });
  }
  return documents;
}

}  // namespace caserag
