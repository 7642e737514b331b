#include "core/upload/ChunkReassembler.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace uds {

namespace fs = std::filesystem;

namespace {

// Removes the partial output unless released.
class PartialFileGuard {
public:
  explicit PartialFileGuard(fs::path p) : path_(std::move(p)) {}
  ~PartialFileGuard() {
    if (released_) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) spdlog::warn("failed to remove partial artifact {}: {}", path_.string(), ec.message());
  }
  void release() { released_ = true; }

private:
  fs::path path_;
  bool released_ = false;
};

} // namespace

int64_t ChunkReassembler::assemble(const std::string& sessionId,
                                   std::vector<int64_t> indices,
                                   const std::string& destinationName) {
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

  const fs::path dest = fs_.artifactPath(destinationName);
  fs::path part = dest;
  part += ".part";

  PartialFileGuard guard(part);
  int64_t written = 0;
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) throw StorageFailure("cannot open " + part.string() + " for writing");

    std::vector<char> buf(64 * 1024);
    for (int64_t idx : indices) {
      const fs::path chunk = fs_.chunkPath(sessionId, idx);
      std::ifstream in(chunk, std::ios::binary);
      if (!in) {
        throw CorruptSession("chunk " + std::to_string(idx) + " of session " + sessionId +
                             " is marked received but missing");
      }
      while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        out.write(buf.data(), n);
        written += n;
      }
      if (in.bad()) throw StorageFailure("failed reading " + chunk.string());
      if (!out) throw StorageFailure("failed writing " + part.string());
    }
    out.flush();
    if (!out) throw StorageFailure("failed writing " + part.string());
  }

  std::error_code ec;
  fs::rename(part, dest, ec);
  if (ec) throw StorageFailure("cannot move " + part.string() + " into place: " + ec.message());
  guard.release();

  spdlog::info("assembled {} chunks of session {} into {} ({} bytes)",
               indices.size(), sessionId, destinationName, written);
  return written;
}

void ChunkReassembler::discardChunks(const std::string& sessionId,
                                     const std::vector<int64_t>& indices) {
  size_t failed = 0;
  for (int64_t idx : indices) {
    if (!fs_.removeChunk(sessionId, idx)) ++failed;
  }
  if (failed > 0) {
    // Leftovers are never read again; only disk usage suffers.
    spdlog::warn("session {}: {} chunk file(s) could not be deleted", sessionId, failed);
    return;
  }
  fs_.removeSessionChunks(sessionId);
}

int64_t ChunkReassembler::merge(const std::string& sessionId,
                                const std::vector<int64_t>& indices,
                                const std::string& destinationName) {
  int64_t size = assemble(sessionId, indices, destinationName);
  discardChunks(sessionId, indices);
  return size;
}

} // namespace uds
