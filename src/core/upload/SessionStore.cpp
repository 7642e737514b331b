#include "core/upload/SessionStore.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

#include "core/Errors.hpp"
#include "core/version/VersionComparator.hpp"

namespace uds {

double ChunkProgress::progressPercent() const {
  if (total <= 0) return 0.0;
  double pct = 100.0 * static_cast<double>(received) / static_cast<double>(total);
  return std::round(pct * 100.0) / 100.0;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void validate_upload_request(const UploadRequest& req,
                             const std::vector<std::string>& allowedExtensions) {
  if (req.fileName.empty() || req.fileSize <= 0 || req.totalChunks <= 0 ||
      req.currentVersion.empty() || req.minVersion.empty()) {
    throw ValidationError("Missing required fields");
  }
  if (!is_strict_version(req.currentVersion) || !is_strict_version(req.minVersion)) {
    throw ValidationError("Version format must be X.Y.Z (e.g., 1.3.2)");
  }
  // The name ends up inside the stored filename, behind a timestamp and token
  // and ahead of ".part"; all of it must stay below NAME_MAX.
  if (req.fileName.size() > kMaxFileNameLength) {
    throw ValidationError("File name too long");
  }
  for (unsigned char c : req.fileName) {
    if (c < 0x20 || c == 0x7f) throw ValidationError("Invalid file name");
  }
  if (req.fileName.find('/') != std::string::npos ||
      req.fileName.find('\\') != std::string::npos ||
      req.fileName.find("..") != std::string::npos) {
    throw ValidationError("Invalid file name");
  }
  const std::string name = lower(req.fileName);
  bool allowed = allowedExtensions.empty();
  for (const auto& ext : allowedExtensions) {
    if (ends_with(name, lower(ext))) { allowed = true; break; }
  }
  if (!allowed) {
    std::string list;
    for (const auto& ext : allowedExtensions) list += (list.empty() ? "" : ", ") + ext;
    throw ValidationError("Only " + list + " files are allowed");
  }
}

std::string generate_session_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

} // namespace uds
