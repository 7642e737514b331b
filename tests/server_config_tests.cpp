#include "gtest/gtest.h"

#include <map>

#include "core/config/ServerConfig.hpp"

using namespace uds;

namespace {

EnvLookup lookup_from(std::map<std::string, std::string> env) {
  return [env](const char* key) -> std::optional<std::string> {
    auto it = env.find(key);
    if (it == env.end()) return std::nullopt;
    return it->second;
  };
}

} // namespace

TEST(ServerConfigTest, Defaults) {
  auto c = load_config(lookup_from({}));
  EXPECT_EQ(c.port, 5100);
  EXPECT_EQ(c.allowedExtensions, (std::vector<std::string>{".exe"}));
  EXPECT_EQ(c.maxChunkBytes, 5 * 1024 * 1024);
  EXPECT_EQ(c.sessionTtlSeconds, 86400);
  EXPECT_EQ(c.downloadPrefix, "/api/download/");
}

TEST(ServerConfigTest, ReadsOverrides) {
  auto c = load_config(lookup_from({
    {"UDS_DB_PATH", "/var/lib/uds/db.sqlite"},
    {"UDS_PORT", "8081"},
    {"UDS_ALLOWED_EXTENSIONS", "exe, .MSI ,"},
    {"UDS_MAX_CHUNK_BYTES", "1024"},
    {"UDS_SESSION_TTL_SECONDS", "0"},
    {"UDS_LOG_LEVEL", "debug"},
  }));
  EXPECT_EQ(c.dbPath, "/var/lib/uds/db.sqlite");
  EXPECT_EQ(c.port, 8081);
  EXPECT_EQ(c.allowedExtensions, (std::vector<std::string>{".exe", ".MSI"}));
  EXPECT_EQ(c.maxChunkBytes, 1024);
  EXPECT_EQ(c.sessionTtlSeconds, 0);
  EXPECT_EQ(c.logLevel, "debug");
}

TEST(ServerConfigTest, InvalidNumbersKeepDefaults) {
  auto c = load_config(lookup_from({
    {"UDS_PORT", "eighty"},
    {"UDS_MAX_CHUNK_BYTES", "-5"},
    {"UDS_SWEEP_INTERVAL_SECONDS", "10s"},
  }));
  EXPECT_EQ(c.port, 5100);
  EXPECT_EQ(c.maxChunkBytes, 5 * 1024 * 1024);
  EXPECT_EQ(c.sweepIntervalSeconds, 600);
}

TEST(ServerConfigTest, EmptyExtensionListKeepsDefault) {
  auto c = load_config(lookup_from({{"UDS_ALLOWED_EXTENSIONS", " , "}}));
  EXPECT_EQ(c.allowedExtensions, (std::vector<std::string>{".exe"}));
}
