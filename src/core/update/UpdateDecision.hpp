#pragma once
#include <optional>
#include <string>

#include "core/metadata/ArtifactCatalog.hpp"

namespace uds {

struct UpdateDecision {
  bool needsUpdate = false;  // client is below the minimum supported version
  bool hasUpdate = false;    // a newer version than the client's exists
  std::string currentVersion;
  std::string minVersion;
  std::optional<std::string> downloadUrl; // set only when hasUpdate
};

// The stored filename is percent-encoded as one path segment.
std::string download_url_for(const ArtifactRecord& rec, const std::string& downloadPrefix);

// Throws ValidationError for a malformed clientVersion and
// NoArtifactPublished when nothing has been published yet.
UpdateDecision decide_update(const std::string& clientVersion,
                             const std::optional<ArtifactRecord>& current,
                             const std::string& downloadPrefix);

} // namespace uds
