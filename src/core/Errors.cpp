#include "core/Errors.hpp"

namespace uds {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:          return "ValidationError";
    case ErrorKind::SessionNotFound:     return "SessionNotFound";
    case ErrorKind::NotFound:            return "NotFound";
    case ErrorKind::NoArtifactPublished: return "NoArtifactPublished";
    case ErrorKind::IncompleteUpload:    return "IncompleteUpload";
    case ErrorKind::CorruptSession:      return "CorruptSession";
    case ErrorKind::StorageFailure:      return "StorageFailure";
  }
  return "Error";
}

} // namespace uds
