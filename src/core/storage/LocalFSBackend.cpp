#include "LocalFSBackend.hpp"
#include <atomic>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace uds {

namespace fs = std::filesystem;

static std::atomic<uint64_t> g_tmpCounter{0};

static bool remove_quietly(const fs::path& p, const char* what) {
  std::error_code ec;
  fs::remove(p, ec);
  if (ec) {
    spdlog::warn("failed to remove {} {}: {}", what, p.string(), ec.message());
    return false;
  }
  return true;
}

LocalFSBackend::LocalFSBackend(std::string uploadRoot, std::string tempRoot)
  : uploadRoot_(std::move(uploadRoot)), tempRoot_(std::move(tempRoot)) {
  std::error_code ec;
  fs::create_directories(uploadRoot_, ec);
  if (ec) throw StorageFailure("cannot create upload root " + uploadRoot_ + ": " + ec.message());
  fs::create_directories(tempRoot_, ec);
  if (ec) throw StorageFailure("cannot create temp root " + tempRoot_ + ": " + ec.message());
}

fs::path LocalFSBackend::sessionDir(const std::string& sessionId) const {
  return fs::path(tempRoot_) / sessionId;
}

fs::path LocalFSBackend::chunkPath(const std::string& sessionId, int64_t index) const {
  return sessionDir(sessionId) / ("chunk-" + std::to_string(index));
}

void LocalFSBackend::putChunk(const std::string& sessionId,
                              int64_t index,
                              std::string_view bytes) {
  fs::path dir = sessionDir(sessionId);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw StorageFailure("cannot create " + dir.string() + ": " + ec.message());

  fs::path target = chunkPath(sessionId, index);
  fs::path tmp = target;
  tmp += ".tmp-" + std::to_string(g_tmpCounter.fetch_add(1));
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      remove_quietly(tmp, "chunk temp file");
      throw StorageFailure("failed writing chunk " + target.string());
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    remove_quietly(tmp, "chunk temp file");
    throw StorageFailure("failed to move chunk into place " + target.string() + ": " + ec.message());
  }
}

bool LocalFSBackend::hasChunk(const std::string& sessionId, int64_t index) const {
  std::error_code ec;
  return fs::is_regular_file(chunkPath(sessionId, index), ec);
}

bool LocalFSBackend::removeChunk(const std::string& sessionId, int64_t index) {
  return remove_quietly(chunkPath(sessionId, index), "chunk");
}

bool LocalFSBackend::removeSessionChunks(const std::string& sessionId) {
  std::error_code ec;
  fs::remove_all(sessionDir(sessionId), ec);
  if (ec) {
    spdlog::warn("failed to remove chunk dir for session {}: {}", sessionId, ec.message());
    return false;
  }
  return true;
}

fs::path LocalFSBackend::artifactPath(const std::string& storedFilename) const {
  return fs::path(uploadRoot_) / storedFilename; // original name lives in the catalog
}

bool LocalFSBackend::hasArtifact(const std::string& storedFilename) const {
  std::error_code ec;
  return fs::is_regular_file(artifactPath(storedFilename), ec);
}

int64_t LocalFSBackend::artifactSize(const std::string& storedFilename) const {
  std::error_code ec;
  auto size = fs::file_size(artifactPath(storedFilename), ec);
  if (ec) throw StorageFailure("cannot stat artifact " + storedFilename + ": " + ec.message());
  return static_cast<int64_t>(size);
}

bool LocalFSBackend::removeArtifact(const std::string& storedFilename) {
  return remove_quietly(artifactPath(storedFilename), "artifact");
}

} // namespace uds
