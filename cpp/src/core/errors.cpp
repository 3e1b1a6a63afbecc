#include "caserag/errors.hpp"

#include <string>

namespace caserag {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotInitialized:
      return "not_initialized";
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kProvider:
      return "provider";
    case ErrorKind::kStore:
      return "store";
    case ErrorKind::kManifest:
      return "manifest";
    case ErrorKind::kConfig:
      return "config";
  }
  return "unknown";
}

bool IsCallerError(ErrorKind kind) {
  return kind == ErrorKind::kValidation;
}

EngineError::EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

NotInitializedError::NotInitializedError(const std::string& operation)
    : EngineError(ErrorKind::kNotInitialized, "engine not initialized: " + operation + " called before Initialize()") {}

}  // namespace caserag
