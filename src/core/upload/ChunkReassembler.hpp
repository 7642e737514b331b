#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace uds {

class LocalFSBackend;

// Concatenates a session's chunk files, in ascending index order, into one
// artifact under the upload root.
class ChunkReassembler {
public:
  explicit ChunkReassembler(LocalFSBackend& fs) : fs_(fs) {}

  // Writes the artifact and returns its size. Chunk files are left alone.
  // A missing chunk raises CorruptSession; no destination file is left
  // behind on any failure.
  int64_t assemble(const std::string& sessionId,
                   std::vector<int64_t> indices,
                   const std::string& destinationName);

  // Deletes the chunk files. Failures are logged, never raised.
  void discardChunks(const std::string& sessionId, const std::vector<int64_t>& indices);

  // assemble() followed by discardChunks().
  int64_t merge(const std::string& sessionId,
                const std::vector<int64_t>& indices,
                const std::string& destinationName);

private:
  LocalFSBackend& fs_;
};

} // namespace uds
