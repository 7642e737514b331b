#include "core/update/UpdateDecision.hpp"

#include "core/Errors.hpp"
#include "core/version/VersionComparator.hpp"

namespace uds {

// Unreserved characters (RFC 3986) pass through, everything else is %XX.
static std::string encode_path_segment(const std::string& s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xf]);
    }
  }
  return out;
}

std::string download_url_for(const ArtifactRecord& rec, const std::string& downloadPrefix) {
  return downloadPrefix + encode_path_segment(rec.storedFilename);
}

UpdateDecision decide_update(const std::string& clientVersion,
                             const std::optional<ArtifactRecord>& current,
                             const std::string& downloadPrefix) {
  if (clientVersion.empty()) throw ValidationError("clientVersion is required");
  if (!is_dotted_numeric(clientVersion)) {
    throw ValidationError("clientVersion must be dotted numeric (e.g., 1.3.2)");
  }
  if (!current) throw NoArtifactPublished();

  UpdateDecision d;
  d.needsUpdate = compare_versions(clientVersion, current->minVersion) < 0;
  d.hasUpdate = compare_versions(clientVersion, current->currentVersion) < 0;
  d.currentVersion = current->currentVersion;
  d.minVersion = current->minVersion;
  if (d.hasUpdate) d.downloadUrl = download_url_for(*current, downloadPrefix);
  return d;
}

} // namespace uds
