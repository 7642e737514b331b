#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uds {

// Metadata supplied when a chunked upload starts.
struct UploadRequest {
  std::string fileName;
  int64_t     fileSize = 0;
  int64_t     totalChunks = 0;
  std::string currentVersion;
  std::string minVersion;
};

struct UploadSession {
  std::string sessionId;
  std::string fileName;
  int64_t     declaredFileSize = 0;
  int64_t     totalChunks = 0;
  std::string currentVersion;
  std::string minVersion;
  std::vector<int64_t> receivedChunkIndices; // ascending
  int64_t     createdAt = 0;                 // epoch millis
  int64_t     updatedAt = 0;                 // last chunk or creation
};

struct ChunkProgress {
  int64_t received = 0;
  int64_t total = 0;

  // 100 * received / total, rounded to two decimals.
  double progressPercent() const;
};

constexpr size_t kMaxFileNameLength = 200;

// Throws ValidationError describing the first problem found.
void validate_upload_request(const UploadRequest& req,
                             const std::vector<std::string>& allowedExtensions);

// Random RFC 4122 version 4 identifier.
std::string generate_session_id();

// Keyed bookkeeping for in-progress uploads. Chunk bytes are not stored here.
class SessionStore {
public:
  virtual ~SessionStore() = default;

  virtual std::string create(const UploadRequest& req) = 0;
  virtual ChunkProgress recordChunk(const std::string& sessionId, int64_t chunkIndex) = 0;
  virtual ChunkProgress status(const std::string& sessionId) = 0;
  virtual std::optional<UploadSession> find(const std::string& sessionId) = 0;
  // Snapshot for finalize; IncompleteUpload unless every chunk arrived.
  // Does not delete the session.
  virtual UploadSession complete(const std::string& sessionId) = 0;
  // No-op for unknown sessions.
  virtual void remove(const std::string& sessionId) = 0;
  // Sessions whose last activity is older than cutoffMillis.
  virtual std::vector<std::string> listExpired(int64_t cutoffMillis) = 0;
};

} // namespace uds
