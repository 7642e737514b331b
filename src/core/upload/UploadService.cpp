#include "core/upload/UploadService.hpp"

#include <cstdio>
#include <random>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/Time.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace uds {

// -------- SessionLocks --------

std::shared_ptr<std::shared_mutex> SessionLocks::get(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& slot = locks_[sessionId];
  if (!slot) slot = std::make_shared<std::shared_mutex>();
  return slot;
}

void SessionLocks::release(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  locks_.erase(sessionId);
}

size_t SessionLocks::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return locks_.size();
}

// -------- helpers --------

// Ids are generated by us; anything else never reaches the filesystem.
static bool looks_like_session_id(const std::string& id) {
  if (id.empty() || id.size() > 64) return false;
  for (char c : id) {
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-';
    if (!ok) return false;
  }
  return true;
}

// -------- UploadService --------

UploadService::UploadService(SessionStore& sessions,
                             ArtifactCatalog& catalog,
                             LocalFSBackend& fs,
                             int64_t maxChunkBytes)
  : sessions_(sessions), catalog_(catalog), fs_(fs), reassembler_(fs),
    maxChunkBytes_(maxChunkBytes) {}

std::string UploadService::init(const UploadRequest& req) {
  std::string id = sessions_.create(req);
  spdlog::info("upload session {} initialized: {} v{} (min {}), {} bytes in {} chunks",
               id, req.fileName, req.currentVersion, req.minVersion,
               req.fileSize, req.totalChunks);
  return id;
}

ChunkReceipt UploadService::uploadChunk(const std::string& sessionId,
                                        int64_t chunkIndex,
                                        std::string_view bytes) {
  if (bytes.empty()) throw ValidationError("No chunk uploaded");
  if (static_cast<int64_t>(bytes.size()) > maxChunkBytes_) {
    throw ValidationError("Chunk exceeds " + std::to_string(maxChunkBytes_) + " bytes");
  }
  if (!looks_like_session_id(sessionId)) throw SessionNotFound(sessionId);

  auto mu = locks_.get(sessionId);
  std::shared_lock<std::shared_mutex> lock(*mu);

  auto session = sessions_.find(sessionId);
  if (!session) {
    locks_.release(sessionId);
    throw SessionNotFound(sessionId);
  }
  if (chunkIndex < 0 || chunkIndex >= session->totalChunks) {
    throw ValidationError("chunkIndex " + std::to_string(chunkIndex) +
                          " out of range [0, " + std::to_string(session->totalChunks) + ")");
  }

  fs_.putChunk(sessionId, chunkIndex, bytes);
  ChunkReceipt r;
  r.chunkIndex = chunkIndex;
  try {
    r.progress = sessions_.recordChunk(sessionId, chunkIndex);
  } catch (const SessionNotFound&) {
    fs_.removeChunk(sessionId, chunkIndex);
    throw;
  }
  spdlog::debug("session {}: chunk {} stored ({}/{})", sessionId, chunkIndex,
                r.progress.received, r.progress.total);
  return r;
}

ChunkProgress UploadService::status(const std::string& sessionId) {
  return sessions_.status(sessionId);
}

std::string UploadService::makeStoredFilename(const std::string& fileName) const {
  static thread_local std::mt19937 rng{std::random_device{}()};
  char token[16];
  std::snprintf(token, sizeof(token), "%08x", static_cast<unsigned>(rng()));
  return std::to_string(now_millis()) + "-" + token + "-" + fileName;
}

ArtifactRecord UploadService::finalize(const std::string& sessionId) {
  if (!looks_like_session_id(sessionId)) throw SessionNotFound(sessionId);

  auto mu = locks_.get(sessionId);
  std::unique_lock<std::shared_mutex> lock(*mu);

  if (!sessions_.find(sessionId)) {
    locks_.release(sessionId);
    throw SessionNotFound(sessionId);
  }
  const UploadSession session = sessions_.complete(sessionId);
  const std::string storedName = makeStoredFilename(session.fileName);

  const int64_t size = reassembler_.assemble(sessionId, session.receivedChunkIndices, storedName);
  if (size != session.declaredFileSize) {
    spdlog::warn("session {}: merged size {} differs from declared {}",
                 sessionId, size, session.declaredFileSize);
  }

  ArtifactRecord rec;
  rec.currentVersion = session.currentVersion;
  rec.minVersion     = session.minVersion;
  rec.storedFilename = storedName;
  rec.originalName   = session.fileName;
  rec.fileSize       = size;

  std::optional<ArtifactRecord> previous;
  {
    // One publish at a time so "previous" is the record we actually replace.
    std::lock_guard<std::mutex> publishLock(publishMu_);
    previous = catalog_.current();
    rec.uploadDate = now_millis();
    try {
      rec = catalog_.publish(rec);
    } catch (const std::exception& e) {
      spdlog::error("session {}: publish failed: {}", sessionId, e.what());
      fs_.removeArtifact(storedName);
      throw StorageFailure(std::string("failed to record artifact: ") + e.what());
    }
  }

  reassembler_.discardChunks(sessionId, session.receivedChunkIndices);

  if (previous && previous->storedFilename != rec.storedFilename) {
    if (!fs_.removeArtifact(previous->storedFilename)) {
      spdlog::warn("superseded artifact {} left on disk", previous->storedFilename);
    }
  }

  sessions_.remove(sessionId);
  locks_.release(sessionId);

  spdlog::info("published {} v{} (min {}) as {}, {} bytes",
               rec.originalName, rec.currentVersion, rec.minVersion,
               rec.storedFilename, rec.fileSize);
  return rec;
}

size_t UploadService::sweepExpired(std::chrono::milliseconds ttl, int64_t nowMillis) {
  const int64_t cutoff = nowMillis - static_cast<int64_t>(ttl.count());
  size_t removed = 0;
  for (const auto& id : sessions_.listExpired(cutoff)) {
    auto mu = locks_.get(id);
    std::unique_lock<std::shared_mutex> lock(*mu);

    // A chunk may have landed while we waited for the lock.
    auto s = sessions_.find(id);
    if (!s) {
      locks_.release(id);
      continue;
    }
    if (s->updatedAt >= cutoff) continue;

    fs_.removeSessionChunks(id);
    sessions_.remove(id);
    locks_.release(id);
    ++removed;
    spdlog::info("expired upload session {} ({}, {}/{} chunks)", id, s->fileName,
                 s->receivedChunkIndices.size(), s->totalChunks);
  }
  return removed;
}

} // namespace uds
