#pragma once

#include "caserag/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace caserag {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Process environment lookup (std::getenv).
std::optional<std::string> ProcessEnv(const std::string& name);

// Applies CASERAG_* overrides on top of `base`. Throws ConfigError on unparsable numbers.
EngineConfig LoadConfigFromEnv(EngineConfig base = {}, const EnvLookup& lookup = ProcessEnv);

// Throws ConfigError describing the first invalid field.
void ValidateConfig(const EngineConfig& config);

std::filesystem::path ResolveManifestPath(const EngineConfig& config);

}  // namespace caserag
