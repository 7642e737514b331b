#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "core/metadata/Sqlite.hpp"
#include "core/upload/SessionStore.hpp"

namespace uds {

class SqliteSessionStore : public SessionStore {
public:
  SqliteSessionStore(const std::string& dbPath, std::vector<std::string> allowedExtensions);

  std::string create(const UploadRequest& req) override;
  ChunkProgress recordChunk(const std::string& sessionId, int64_t chunkIndex) override;
  ChunkProgress status(const std::string& sessionId) override;
  std::optional<UploadSession> find(const std::string& sessionId) override;
  UploadSession complete(const std::string& sessionId) override;
  void remove(const std::string& sessionId) override;
  std::vector<std::string> listExpired(int64_t cutoffMillis) override;

private:
  std::optional<UploadSession> loadLocked(const std::string& sessionId);
  int64_t countChunksLocked(const std::string& sessionId);

  std::vector<std::string> allowedExtensions_;
  std::mutex mu_; // one connection; multi-statement operations must not interleave
  sqlite::DbPtr db_;
};

} // namespace uds
