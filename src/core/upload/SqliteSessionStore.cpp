#include "core/upload/SqliteSessionStore.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/Time.hpp"

namespace uds {

SqliteSessionStore::SqliteSessionStore(const std::string& dbPath,
                                       std::vector<std::string> allowedExtensions)
  : allowedExtensions_(std::move(allowedExtensions)),
    db_(sqlite::open(dbPath, /*create*/ false)) {}

std::string SqliteSessionStore::create(const UploadRequest& req) {
  validate_upload_request(req, allowedExtensions_);

  std::lock_guard<std::mutex> lock(mu_);
  const std::string id = generate_session_id();
  const int64_t now = now_millis();
  const char* sql = R"SQL(
    INSERT INTO upload_sessions
      (id, file_name, file_size, total_chunks, current_version, min_version, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL";
  sqlite::Statement st(db_.get(), sql);
  int i = 1;
  st.bind(i++, id)
    .bind(i++, req.fileName)
    .bind(i++, req.fileSize)
    .bind(i++, req.totalChunks)
    .bind(i++, req.currentVersion)
    .bind(i++, req.minVersion)
    .bind(i++, now)
    .bind(i++, now);
  st.run();
  spdlog::debug("session {} created for {} ({} chunks)", id, req.fileName, req.totalChunks);
  return id;
}

std::optional<UploadSession> SqliteSessionStore::loadLocked(const std::string& sessionId) {
  sqlite::Statement st(db_.get(), R"SQL(
    SELECT id, file_name, file_size, total_chunks, current_version, min_version,
           created_at, updated_at
    FROM upload_sessions WHERE id = ?
  )SQL");
  st.bind(1, sessionId);
  if (!st.step()) return std::nullopt;

  UploadSession s;
  s.sessionId        = st.text(0);
  s.fileName         = st.text(1);
  s.declaredFileSize = st.int64(2);
  s.totalChunks      = st.int64(3);
  s.currentVersion   = st.text(4);
  s.minVersion       = st.text(5);
  s.createdAt        = st.int64(6);
  s.updatedAt        = st.int64(7);

  sqlite::Statement chunks(db_.get(),
    "SELECT chunk_index FROM upload_chunks WHERE session_id = ? ORDER BY chunk_index ASC");
  chunks.bind(1, sessionId);
  while (chunks.step()) s.receivedChunkIndices.push_back(chunks.int64(0));
  return s;
}

int64_t SqliteSessionStore::countChunksLocked(const std::string& sessionId) {
  sqlite::Statement st(db_.get(), "SELECT COUNT(*) FROM upload_chunks WHERE session_id = ?");
  st.bind(1, sessionId);
  st.step();
  return st.int64(0);
}

ChunkProgress SqliteSessionStore::recordChunk(const std::string& sessionId, int64_t chunkIndex) {
  std::lock_guard<std::mutex> lock(mu_);
  sqlite::Transaction tx(db_.get());

  int64_t total = 0;
  {
    sqlite::Statement sel(db_.get(), "SELECT total_chunks FROM upload_sessions WHERE id = ?");
    sel.bind(1, sessionId);
    if (!sel.step()) throw SessionNotFound(sessionId);
    total = sel.int64(0);
  }
  if (chunkIndex < 0 || chunkIndex >= total) {
    throw ValidationError("chunkIndex " + std::to_string(chunkIndex) +
                          " out of range [0, " + std::to_string(total) + ")");
  }

  const int64_t now = now_millis();
  // Re-sending an index keeps the original row: the set never grows twice.
  sqlite::Statement ins(db_.get(),
    "INSERT OR IGNORE INTO upload_chunks (session_id, chunk_index, received_at) VALUES (?,?,?)");
  ins.bind(1, sessionId).bind(2, chunkIndex).bind(3, now);
  ins.run();

  sqlite::Statement touch(db_.get(), "UPDATE upload_sessions SET updated_at = ? WHERE id = ?");
  touch.bind(1, now).bind(2, sessionId);
  touch.run();

  ChunkProgress p{countChunksLocked(sessionId), total};
  tx.commit();
  return p;
}

ChunkProgress SqliteSessionStore::status(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  sqlite::Statement sel(db_.get(), "SELECT total_chunks FROM upload_sessions WHERE id = ?");
  sel.bind(1, sessionId);
  if (!sel.step()) throw SessionNotFound(sessionId);
  return ChunkProgress{countChunksLocked(sessionId), sel.int64(0)};
}

std::optional<UploadSession> SqliteSessionStore::find(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  return loadLocked(sessionId);
}

UploadSession SqliteSessionStore::complete(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  auto s = loadLocked(sessionId);
  if (!s) throw SessionNotFound(sessionId);
  const auto received = static_cast<int64_t>(s->receivedChunkIndices.size());
  if (received != s->totalChunks) throw IncompleteUpload(received, s->totalChunks);
  return *s;
}

void SqliteSessionStore::remove(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(mu_);
  // upload_chunks rows go with it (ON DELETE CASCADE)
  sqlite::Statement st(db_.get(), "DELETE FROM upload_sessions WHERE id = ?");
  st.bind(1, sessionId);
  st.run();
}

std::vector<std::string> SqliteSessionStore::listExpired(int64_t cutoffMillis) {
  std::lock_guard<std::mutex> lock(mu_);
  sqlite::Statement st(db_.get(), "SELECT id FROM upload_sessions WHERE updated_at < ?");
  st.bind(1, cutoffMillis);
  std::vector<std::string> ids;
  while (st.step()) ids.push_back(st.text(0));
  return ids;
}

} // namespace uds
