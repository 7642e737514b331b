#include "ArtifactCatalog.hpp"

#include <sqlite3.h>

#include "core/Errors.hpp"

namespace uds {

static constexpr const char* kSelectColumns =
  "SELECT id, current_version, min_version, stored_filename, original_name,"
  " file_size, upload_date FROM artifacts";

static ArtifactRecord read_record(const sqlite::Statement& st) {
  ArtifactRecord r;
  r.id             = st.int64(0);
  r.currentVersion = st.text(1);
  r.minVersion     = st.text(2);
  r.storedFilename = st.text(3);
  r.originalName   = st.text(4);
  r.fileSize       = st.int64(5);
  r.uploadDate     = st.int64(6);
  return r;
}

SqliteArtifactCatalog::SqliteArtifactCatalog(const std::string& dbPath)
  : db_(sqlite::open(dbPath, /*create*/ false)) {}

ArtifactRecord SqliteArtifactCatalog::publish(const ArtifactRecord& rec) {
  std::lock_guard<std::mutex> lock(mu_);
  const char* sql = R"SQL(
    INSERT INTO artifacts
      (current_version, min_version, stored_filename, original_name, file_size, upload_date)
    VALUES (?,?,?,?,?,?)
  )SQL";
  sqlite::Statement st(db_.get(), sql);
  int i = 1;
  st.bind(i++, rec.currentVersion)
    .bind(i++, rec.minVersion)
    .bind(i++, rec.storedFilename)
    .bind(i++, rec.originalName)
    .bind(i++, rec.fileSize)
    .bind(i++, rec.uploadDate);
  st.run();

  ArtifactRecord out = rec;
  out.id = sqlite3_last_insert_rowid(db_.get());
  return out;
}

std::optional<ArtifactRecord> SqliteArtifactCatalog::currentLocked() {
  std::string sql = std::string(kSelectColumns) + " ORDER BY id DESC LIMIT 1";
  sqlite::Statement st(db_.get(), sql.c_str());
  if (!st.step()) return std::nullopt;
  return read_record(st);
}

std::optional<ArtifactRecord> SqliteArtifactCatalog::current() {
  std::lock_guard<std::mutex> lock(mu_);
  return currentLocked();
}

std::optional<ArtifactRecord>
SqliteArtifactCatalog::findByStoredFilename(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto cur = currentLocked();
  if (!cur || cur->storedFilename != name) return std::nullopt;
  return cur;
}

std::vector<ArtifactRecord> SqliteArtifactCatalog::history(int64_t limit) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string sql = std::string(kSelectColumns) + " ORDER BY id DESC LIMIT ?";
  sqlite::Statement st(db_.get(), sql.c_str());
  st.bind(1, limit);
  std::vector<ArtifactRecord> out;
  while (st.step()) out.push_back(read_record(st));
  return out;
}

} // namespace uds
