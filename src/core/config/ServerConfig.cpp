#include "core/config/ServerConfig.hpp"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace uds {

// -------- helpers --------

static std::optional<std::string> get_env(const char* key) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return std::nullopt;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return std::nullopt;
#endif
}

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

static int64_t int_or(const EnvLookup& lookup, const char* key, int64_t def,
                      int64_t minValue, int64_t maxValue) {
  auto v = lookup(key);
  if (!v || trim(*v).empty()) return def;
  try {
    size_t pos = 0;
    long long n = std::stoll(trim(*v), &pos);
    if (pos != trim(*v).size() || n < minValue || n > maxValue) {
      throw std::out_of_range(key);
    }
    return n;
  } catch (const std::exception&) {
    spdlog::warn("ignoring invalid {}='{}', using {}", key, *v, def);
    return def;
  }
}

static void string_or(const EnvLookup& lookup, const char* key, std::string& out) {
  if (auto v = lookup(key); v && !trim(*v).empty()) out = trim(*v);
}

// -------- public --------

std::vector<std::string> split_extension_list(const std::string& csv) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(',', start);
    if (comma == std::string::npos) comma = csv.size();
    std::string ext = trim(csv.substr(start, comma - start));
    if (!ext.empty()) {
      if (ext[0] != '.') ext.insert(ext.begin(), '.');
      out.push_back(ext);
    }
    start = comma + 1;
  }
  return out;
}

ServerConfig load_config(const EnvLookup& lookup) {
  ServerConfig c;
  string_or(lookup, "UDS_DB_PATH", c.dbPath);
  string_or(lookup, "UDS_UPLOAD_ROOT", c.uploadRoot);
  string_or(lookup, "UDS_TEMP_ROOT", c.tempRoot);
  string_or(lookup, "UDS_HOST", c.host);
  string_or(lookup, "UDS_LOG_LEVEL", c.logLevel);

  c.port = static_cast<int>(int_or(lookup, "UDS_PORT", c.port, 1, 65535));
  c.maxChunkBytes = int_or(lookup, "UDS_MAX_CHUNK_BYTES", c.maxChunkBytes, 1, INT64_MAX);
  c.sessionTtlSeconds = int_or(lookup, "UDS_SESSION_TTL_SECONDS", c.sessionTtlSeconds, 0, INT64_MAX / 1000);
  c.sweepIntervalSeconds = int_or(lookup, "UDS_SWEEP_INTERVAL_SECONDS", c.sweepIntervalSeconds, 1, INT64_MAX / 1000);

  if (auto v = lookup("UDS_ALLOWED_EXTENSIONS")) {
    auto exts = split_extension_list(*v);
    if (exts.empty()) spdlog::warn("UDS_ALLOWED_EXTENSIONS is empty, keeping defaults");
    else c.allowedExtensions = std::move(exts);
  }
  return c;
}

ServerConfig load_config_from_env() {
  return load_config(get_env);
}

} // namespace uds
