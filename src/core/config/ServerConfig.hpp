#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace uds {

struct ServerConfig {
  std::string dbPath        = "data/update-server.db";
  std::string uploadRoot    = "data/uploads";
  std::string tempRoot      = "data/temp";
  std::string host          = "0.0.0.0";
  int         port          = 5100;
  std::vector<std::string> allowedExtensions{".exe"};
  int64_t     maxChunkBytes = 5 * 1024 * 1024;
  int64_t     sessionTtlSeconds    = 24 * 60 * 60; // 0 disables expiry
  int64_t     sweepIntervalSeconds = 10 * 60;
  std::string logLevel      = "info";
  std::string downloadPrefix = "/api/download/";
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Builds the config from UDS_* variables. Unparseable numbers keep the
// default and log a warning.
ServerConfig load_config(const EnvLookup& lookup);
ServerConfig load_config_from_env();

std::vector<std::string> split_extension_list(const std::string& csv);

} // namespace uds
