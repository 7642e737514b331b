#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/metadata/Sqlite.hpp"

namespace uds {

struct ArtifactRecord {
  int64_t     id = 0;           // append sequence, assigned by publish()
  std::string currentVersion;
  std::string minVersion;
  std::string storedFilename;   // unique name under the upload root
  std::string originalName;     // client-supplied display name
  int64_t     fileSize = 0;
  int64_t     uploadDate = 0;   // epoch millis
};

// Append-only history of published artifacts. The newest entry is current;
// records are never updated in place.
class ArtifactCatalog {
public:
  virtual ~ArtifactCatalog() = default;

  // Appends rec and makes it current. Returns the stored record (id set).
  virtual ArtifactRecord publish(const ArtifactRecord& rec) = 0;

  virtual std::optional<ArtifactRecord> current() = 0;

  // Matches only the current record; superseded names yield nullopt.
  virtual std::optional<ArtifactRecord> findByStoredFilename(const std::string& name) = 0;

  // Newest first.
  virtual std::vector<ArtifactRecord> history(int64_t limit) = 0;
};

class SqliteArtifactCatalog : public ArtifactCatalog {
public:
  explicit SqliteArtifactCatalog(const std::string& dbPath);

  ArtifactRecord publish(const ArtifactRecord& rec) override;
  std::optional<ArtifactRecord> current() override;
  std::optional<ArtifactRecord> findByStoredFilename(const std::string& name) override;
  std::vector<ArtifactRecord> history(int64_t limit) override;

private:
  std::optional<ArtifactRecord> currentLocked();

  std::mutex mu_;
  sqlite::DbPtr db_;
};

} // namespace uds
