#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/metadata/ArtifactCatalog.hpp"
#include "core/upload/ChunkReassembler.hpp"
#include "core/upload/SessionStore.hpp"

namespace uds {

class LocalFSBackend;

// Reader/writer lock per session id. Chunk uploads share it so different
// indices proceed in parallel; finalize and expiry take it exclusively.
class SessionLocks {
public:
  std::shared_ptr<std::shared_mutex> get(const std::string& sessionId);
  void release(const std::string& sessionId);
  size_t size() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;
};

struct ChunkReceipt {
  int64_t chunkIndex = 0;
  ChunkProgress progress;
};

class UploadService {
public:
  UploadService(SessionStore& sessions,
                ArtifactCatalog& catalog,
                LocalFSBackend& fs,
                int64_t maxChunkBytes);

  std::string init(const UploadRequest& req);

  ChunkReceipt uploadChunk(const std::string& sessionId, int64_t chunkIndex, std::string_view bytes);

  ChunkProgress status(const std::string& sessionId);

  // Merges the chunks and publishes the result as the current artifact.
  // Any failure before the catalog insert leaves the catalog untouched and
  // the session in place for another attempt.
  ArtifactRecord finalize(const std::string& sessionId);

  // Drops sessions idle for longer than ttl, chunk files included.
  size_t sweepExpired(std::chrono::milliseconds ttl, int64_t nowMillis);

  // Number of sessions with a lock entry.
  size_t lockedSessionCount() const { return locks_.size(); }

private:
  std::string makeStoredFilename(const std::string& fileName) const;

  SessionStore& sessions_;
  ArtifactCatalog& catalog_;
  LocalFSBackend& fs_;
  ChunkReassembler reassembler_;
  int64_t maxChunkBytes_;
  SessionLocks locks_;
  std::mutex publishMu_;
};

} // namespace uds
