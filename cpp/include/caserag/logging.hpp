#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace caserag::logging {

inline constexpr const char* kLoggerName = "caserag";

// Shared "caserag" logger; created with a stderr console sink on first use.
std::shared_ptr<spdlog::logger> Get();

// Replaces the sinks of the shared logger. Safe to call more than once.
void Configure(spdlog::level::level_enum level, const std::optional<std::string>& file_path = std::nullopt);

// Accepts trace|debug|info|warn|warning|error|critical|off (case-insensitive).
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& text);

// Reads CASERAG_LOG_LEVEL, falling back to `fallback` when unset or unparsable.
spdlog::level::level_enum LevelFromEnv(spdlog::level::level_enum fallback);

}  // namespace caserag::logging
