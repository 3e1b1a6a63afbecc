#include "caserag/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace caserag::logging {
namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [caserag] %v";

std::mutex& LoggerMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger> BuildLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern(kPattern);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

std::shared_ptr<spdlog::logger>& Slot() {
  static std::shared_ptr<spdlog::logger> logger;
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Get() {
  std::lock_guard<std::mutex> lock(LoggerMutex());
  auto& logger = Slot();
  if (logger == nullptr) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    logger = BuildLogger({console_sink}, LevelFromEnv(spdlog::level::info));
  }
  return logger;
}

void Configure(spdlog::level::level_enum level, const std::optional<std::string>& file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(level);
  sinks.push_back(console_sink);
  if (file_path.has_value() && !file_path->empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*file_path, false);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);
  }

  std::lock_guard<std::mutex> lock(LoggerMutex());
  Slot() = BuildLogger(std::move(sinks), level);
}

std::optional<spdlog::level::level_enum> ParseLevel(const std::string& text) {
  std::string value = text;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "info") {
    return spdlog::level::info;
  }
  if (value == "warn" || value == "warning") {
    return spdlog::level::warn;
  }
  if (value == "error") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

spdlog::level::level_enum LevelFromEnv(spdlog::level::level_enum fallback) {
  const char* env = std::getenv("CASERAG_LOG_LEVEL");
  if (env == nullptr) {
    return fallback;
  }
  return ParseLevel(env).value_or(fallback);
}

}  // namespace caserag::logging
