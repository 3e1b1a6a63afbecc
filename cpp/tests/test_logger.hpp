#pragma once

#include "caserag/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace caserag::tests {

inline bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

inline bool LoggingEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    constexpr bool kDefault = false;
#else
    constexpr bool kDefault = true;
#endif
    const char* env = std::getenv("CASERAG_TEST_LOG");
    if (env == nullptr) {
      return kDefault;
    }
    return IsTruthy(env);
  }();
  return enabled;
}

// Routes the library logger to the console only when test logging is on.
inline void ConfigureLibraryLogging() {
  caserag::logging::Configure(LoggingEnabled() ? spdlog::level::debug : spdlog::level::off);
}

inline void Log(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[caserag-test] " << message << "\n";
}

inline void LogError(std::string_view message) {
  std::cerr << "[caserag-test] ERROR: " << message << "\n";
}

inline void LogKV(std::string_view key, std::string_view value) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[caserag-test] " << key << "=" << value << "\n";
}

inline void LogKV(std::string_view key, std::uint64_t value) {
  LogKV(key, std::to_string(value));
}

inline void LogKV(std::string_view key, int value) {
  LogKV(key, std::to_string(value));
}

}  // namespace caserag::tests
