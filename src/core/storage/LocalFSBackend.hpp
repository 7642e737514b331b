#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace uds {

// Filesystem store for chunk files (temp root, one directory per session)
// and published artifacts (upload root). I/O errors raise StorageFailure.
class LocalFSBackend {
public:
  LocalFSBackend(std::string uploadRoot, std::string tempRoot);

  // Writes bytes as chunk `index` of the session. A second write of the same
  // index replaces the first one atomically.
  void putChunk(const std::string& sessionId, int64_t index, std::string_view bytes);

  std::filesystem::path chunkPath(const std::string& sessionId, int64_t index) const;
  bool hasChunk(const std::string& sessionId, int64_t index) const;
  // false if the file could not be removed; a missing file counts as removed.
  bool removeChunk(const std::string& sessionId, int64_t index);
  bool removeSessionChunks(const std::string& sessionId);

  std::filesystem::path artifactPath(const std::string& storedFilename) const;
  bool hasArtifact(const std::string& storedFilename) const;
  int64_t artifactSize(const std::string& storedFilename) const;
  bool removeArtifact(const std::string& storedFilename);

private:
  std::filesystem::path sessionDir(const std::string& sessionId) const;

  std::string uploadRoot_;
  std::string tempRoot_;
};

} // namespace uds
