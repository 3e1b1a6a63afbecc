#pragma once

#include <stdexcept>
#include <string>

namespace caserag {

enum class ErrorKind {
  kNotInitialized,
  kValidation,
  kProvider,
  kStore,
  kManifest,
  kConfig,
};

const char* ErrorKindName(ErrorKind kind);

// Only validation failures are fixable by the caller; everything else means
// the system could not complete the request.
bool IsCallerError(ErrorKind kind);

class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, const std::string& message);

  [[nodiscard]] ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

class NotInitializedError final : public EngineError {
 public:
  explicit NotInitializedError(const std::string& operation);
};

class ValidationError final : public EngineError {
 public:
  explicit ValidationError(const std::string& message) : EngineError(ErrorKind::kValidation, message) {}
};

class ProviderError final : public EngineError {
 public:
  explicit ProviderError(const std::string& message) : EngineError(ErrorKind::kProvider, message) {}
};

class StoreError final : public EngineError {
 public:
  explicit StoreError(const std::string& message) : EngineError(ErrorKind::kStore, message) {}
};

class ManifestError final : public EngineError {
 public:
  explicit ManifestError(const std::string& message) : EngineError(ErrorKind::kManifest, message) {}
};

class ConfigError final : public EngineError {
 public:
  explicit ConfigError(const std::string& message) : EngineError(ErrorKind::kConfig, message) {}
};

}  // namespace caserag
