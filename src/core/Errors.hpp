#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace uds {

enum class ErrorKind {
  Validation,
  SessionNotFound,
  NotFound,
  NoArtifactPublished,
  IncompleteUpload,
  CorruptSession,
  StorageFailure
};

const char* to_string(ErrorKind kind);

// Base for every failure an operation can report. Request-scoped: the HTTP
// layer maps kind() to a status code.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ValidationError : public Error {
public:
  explicit ValidationError(const std::string& msg)
    : Error(ErrorKind::Validation, msg) {}
};

class SessionNotFound : public Error {
public:
  explicit SessionNotFound(const std::string& sessionId)
    : Error(ErrorKind::SessionNotFound, "Upload session not found: " + sessionId),
      sessionId_(sessionId) {}
  const std::string& sessionId() const { return sessionId_; }

private:
  std::string sessionId_;
};

class NotFound : public Error {
public:
  explicit NotFound(const std::string& msg)
    : Error(ErrorKind::NotFound, msg) {}
};

class NoArtifactPublished : public Error {
public:
  NoArtifactPublished()
    : Error(ErrorKind::NoArtifactPublished, "No version available") {}
};

class IncompleteUpload : public Error {
public:
  IncompleteUpload(int64_t received, int64_t total)
    : Error(ErrorKind::IncompleteUpload,
            "Not all chunks uploaded (" + std::to_string(received) + "/" +
              std::to_string(total) + ")"),
      received_(received), total_(total) {}
  int64_t received() const { return received_; }
  int64_t total() const { return total_; }

private:
  int64_t received_;
  int64_t total_;
};

// A chunk is marked received but its bytes are gone.
class CorruptSession : public Error {
public:
  explicit CorruptSession(const std::string& msg)
    : Error(ErrorKind::CorruptSession, msg) {}
};

class StorageFailure : public Error {
public:
  explicit StorageFailure(const std::string& msg)
    : Error(ErrorKind::StorageFailure, msg) {}
};

} // namespace uds
