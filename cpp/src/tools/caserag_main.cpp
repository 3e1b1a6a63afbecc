#include "caserag/case_catalog.hpp"
#include "caserag/config.hpp"
#include "caserag/engine.hpp"
#include "caserag/errors.hpp"
#include "caserag/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

using json = nlohmann::json;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kUsage =
    "usage: caserag [--data-dir DIR] [--store PATH] [--log-level LEVEL] <command> [options]\n"
    "\n"
    "commands:\n"
    "  ingest [--case ID] [--force] [--clear] [--validate-only]\n"
    "  query TEXT [--case ID]\n"
    "  search-cases TEXT [--top N]\n"
    "  cases\n"
    "  count\n"
    "  clear [--case ID]\n";

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::set<std::string> switches;
};

const std::set<std::string> kValueOptions = {"--data-dir", "--store", "--log-level", "--case", "--top"};
const std::set<std::string> kSwitches = {"--force", "--clear", "--validate-only", "--help"};

const std::map<std::string, std::set<std::string>> kCommandFlags = {
    {"ingest", {"--case", "--force", "--clear", "--validate-only"}},
    {"query", {"--case"}},
    {"search-cases", {"--top"}},
    {"cases", {}},
    {"count", {}},
    {"clear", {"--case"}},
};

const std::set<std::string> kGlobalFlags = {"--data-dir", "--store", "--log-level", "--help"};

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine cli{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (kSwitches.count(arg) != 0) {
        cli.switches.insert(arg);
        continue;
      }
      if (kValueOptions.count(arg) == 0) {
        throw UsageError("unknown option '" + arg + "'");
      }
      if (i + 1 >= argc) {
        throw UsageError("option '" + arg + "' needs a value");
      }
      cli.options[arg] = argv[++i];
      continue;
    }
    if (cli.command.empty()) {
      cli.command = arg;
    } else {
      cli.positional.push_back(arg);
    }
  }
  if (cli.switches.count("--help") != 0) {
    return cli;
  }
  if (cli.command.empty()) {
    throw UsageError("missing command");
  }

  const auto allowed = kCommandFlags.find(cli.command);
  if (allowed == kCommandFlags.end()) {
    throw UsageError("unknown command '" + cli.command + "'");
  }
  auto check_flag = [&](const std::string& flag) {
    if (kGlobalFlags.count(flag) == 0 && allowed->second.count(flag) == 0) {
      throw UsageError("option '" + flag + "' is not valid for '" + cli.command + "'");
    }
  };
  for (const auto& [flag, value] : cli.options) {
    check_flag(flag);
  }
  for (const auto& flag : cli.switches) {
    check_flag(flag);
  }
  return cli;
}

std::optional<std::string> Option(const CommandLine& cli, const std::string& name) {
  const auto it = cli.options.find(name);
  if (it == cli.options.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Switch(const CommandLine& cli, const std::string& name) {
  return cli.switches.count(name) != 0;
}

std::string SinglePositional(const CommandLine& cli, const char* what) {
  if (cli.positional.size() != 1) {
    throw UsageError(std::string("'") + cli.command + "' expects exactly one " + what + " argument");
  }
  return cli.positional.front();
}

void RequireNoPositional(const CommandLine& cli) {
  if (!cli.positional.empty()) {
    throw UsageError("'" + cli.command + "' takes no arguments");
  }
}

int ParseTopN(const std::string& value) {
  char* end = nullptr;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || parsed <= 0 || parsed > 1000) {
    throw UsageError("--top must be a positive integer, got '" + value + "'");
  }
  return static_cast<int>(parsed);
}

void Print(const json& document) {
  std::cout << document.dump(2) << "\n";
}

json ToJson(const caserag::QueryResult& result) {
  json sources = json::array();
  for (const auto& source : result.sources) {
    sources.push_back({
        {"doc_id", source.doc_id},
        {"fragment_id", source.fragment_id},
        {"snippet", source.snippet},
        {"relevance_score", source.relevance_score},
    });
  }
  return {
      {"answer", result.answer},
      {"sources", sources},
      {"metadata",
       {
           {"total_chunks_retrieved", result.metadata.total_chunks_retrieved},
           {"processing_time_ms", result.metadata.processing_time_ms},
       }},
  };
}

json ToJson(const caserag::CaseAggregateResult& result) {
  return {
      {"case_id", result.case_id},
      {"title", result.title},
      {"relevance_score", result.relevance_score},
      {"summary", result.summary},
      {"key_findings", result.key_findings},
      {"document_count", result.document_count},
  };
}

json ToJson(const caserag::CaseInfo& info) {
  return {
      {"case_id", info.case_id},
      {"title", info.title},
      {"date", info.date},
      {"document_count", info.document_count},
  };
}

std::vector<std::filesystem::path> CaseDirectories(const std::filesystem::path& data_dir,
                                                   const std::optional<std::string>& case_filter) {
  std::error_code ec;
  if (case_filter.has_value()) {
    const auto case_dir = data_dir / *case_filter;
    if (!std::filesystem::is_directory(case_dir, ec)) {
      throw UsageError("case directory not found: " + case_dir.string());
    }
    return {case_dir};
  }
  std::vector<std::filesystem::path> dirs{};
  for (const auto& entry : std::filesystem::directory_iterator(data_dir, ec)) {
    if (entry.is_directory(ec)) {
      dirs.push_back(entry.path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

int RunIngest(caserag::Engine& engine, const CommandLine& cli) {
  RequireNoPositional(cli);
  const auto& config = engine.config();
  auto log = caserag::logging::Get();

  std::error_code ec;
  if (!std::filesystem::is_directory(config.data_dir, ec)) {
    throw caserag::ConfigError("data directory not found: " + config.data_dir);
  }
  const auto case_dirs = CaseDirectories(config.data_dir, Option(cli, "--case"));

  json validation = json::array();
  std::vector<std::filesystem::path> valid{};
  for (const auto& case_dir : case_dirs) {
    const auto case_id = case_dir.filename().string();
    const auto report =
        caserag::ValidateCaseDirectory(case_dir, case_id, config.metadata_file_name, config.content_extensions);
    for (const auto& warning : report.warnings) {
      log->warn("case '{}': {}", case_id, warning);
    }
    for (const auto& error : report.errors) {
      log->error("case '{}': {}", case_id, error);
    }
    validation.push_back({
        {"case_id", case_id},
        {"valid", report.valid},
        {"errors", report.errors},
        {"warnings", report.warnings},
    });
    if (report.valid) {
      valid.push_back(case_dir);
    }
  }

  if (Switch(cli, "--validate-only")) {
    Print({{"validation", validation}, {"valid_cases", valid.size()}, {"total_cases", case_dirs.size()}});
    return valid.size() == case_dirs.size() ? kExitOk : kExitUsage;
  }
  if (valid.empty()) {
    Print({{"validation", validation}, {"error", "no valid cases found"}});
    return kExitUsage;
  }

  if (Switch(cli, "--clear") && !engine.ClearAll()) {
    Print({{"error", "failed to clear the vector store"}});
    return kExitFailure;
  }

  int ingested = 0;
  int skipped = 0;
  int failed = 0;
  json cases = json::array();
  for (const auto& case_dir : valid) {
    const auto case_id = case_dir.filename().string();
    try {
      const auto result = engine.Ingest(case_dir, case_id, {}, Switch(cli, "--force"));
      ingested += result.ingested;
      skipped += result.skipped;
      cases.push_back({{"case_id", case_id}, {"ingested", result.ingested}, {"skipped", result.skipped}});
    } catch (const caserag::EngineError& ex) {
      log->error("case '{}': {}", case_id, ex.what());
      ++failed;
      cases.push_back({{"case_id", case_id}, {"error", ex.what()}, {"kind", caserag::ErrorKindName(ex.kind())}});
    }
  }

  Print({
      {"validation", validation},
      {"cases", cases},
      {"successful", static_cast<int>(valid.size()) - failed},
      {"failed", failed},
      {"ingested", ingested},
      {"skipped", skipped},
      {"total_fragments", engine.DocumentCount()},
  });
  return failed == 0 ? kExitOk : kExitFailure;
}

int Run(const CommandLine& cli) {
  auto config = caserag::LoadConfigFromEnv();
  if (const auto data_dir = Option(cli, "--data-dir")) {
    config.data_dir = *data_dir;
  }
  if (const auto store = Option(cli, "--store")) {
    config.store_path = *store;
  }

  caserag::Engine engine(config);
  engine.Initialize();

  int exit_code = kExitOk;
  if (cli.command == "ingest") {
    exit_code = RunIngest(engine, cli);
  } else if (cli.command == "query") {
    const auto text = SinglePositional(cli, "query text");
    Print(ToJson(engine.Query(text, Option(cli, "--case"))));
  } else if (cli.command == "search-cases") {
    const auto text = SinglePositional(cli, "description");
    const auto top = Option(cli, "--top");
    json results = json::array();
    for (const auto& result : engine.RankCases(text, top.has_value() ? ParseTopN(*top) : 5)) {
      results.push_back(ToJson(result));
    }
    Print({{"results", results}});
  } else if (cli.command == "cases") {
    RequireNoPositional(cli);
    json cases = json::array();
    for (const auto& info : engine.ListCases()) {
      cases.push_back(ToJson(info));
    }
    Print({{"cases", cases}});
  } else if (cli.command == "count") {
    RequireNoPositional(cli);
    Print({{"documents", engine.DocumentCount()}});
  } else if (cli.command == "clear") {
    RequireNoPositional(cli);
    if (const auto case_id = Option(cli, "--case")) {
      Print({{"case_id", *case_id}, {"removed", engine.ClearCase(*case_id)}});
    } else {
      const bool cleared = engine.ClearAll();
      Print({{"cleared", cleared}});
      exit_code = cleared ? kExitOk : kExitFailure;
    }
  }

  engine.Shutdown();
  return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
  CommandLine cli{};
  try {
    cli = ParseCommandLine(argc, argv);
    if (Switch(cli, "--help")) {
      std::cout << kUsage;
      return kExitOk;
    }
    auto level = caserag::logging::LevelFromEnv(spdlog::level::info);
    if (const auto text = Option(cli, "--log-level")) {
      const auto parsed = caserag::logging::ParseLevel(*text);
      if (!parsed.has_value()) {
        throw UsageError("unknown log level '" + *text + "'");
      }
      level = *parsed;
    }
    caserag::logging::Configure(level);
  } catch (const UsageError& ex) {
    std::cerr << "caserag: " << ex.what() << "\n\n" << kUsage;
    return kExitUsage;
  }

  try {
    return Run(cli);
  } catch (const UsageError& ex) {
    std::cerr << "caserag: " << ex.what() << "\n\n" << kUsage;
    return kExitUsage;
  } catch (const caserag::EngineError& ex) {
    Print({{"error", ex.what()}, {"kind", caserag::ErrorKindName(ex.kind())}});
    return caserag::IsCallerError(ex.kind()) ? kExitUsage : kExitFailure;
  } catch (const std::exception& ex) {
    Print({{"error", ex.what()}, {"kind", "internal"}});
    return kExitFailure;
  }
}
