// src/main.cpp
#include <chrono>
#include <memory>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/Time.hpp"
#include "core/config/ServerConfig.hpp"
#include "core/metadata/ArtifactCatalog.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/upload/SessionSweeper.hpp"
#include "core/upload/SqliteSessionStore.hpp"
#include "core/upload/UploadService.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (UDS_PORT or 5100)\n"
            << "  " << argv0 << " --history     # print published artifacts as JSON\n";
}

static void apply_log_level(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("unknown UDS_LOG_LEVEL '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string cmd = argc > 1 ? argv[1] : "";
    if (cmd != "--init" && cmd != "--serve" && cmd != "--history") {
      print_usage(argv[0]);
      return 1;
    }

    const uds::ServerConfig cfg = uds::load_config_from_env();
    apply_log_level(cfg.logLevel);

    // Self-heal DB on every command (idempotent)
    uds::initDatabase(cfg.dbPath, findSchemaPath());

    if (cmd == "--init") {
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    uds::SqliteArtifactCatalog catalog(cfg.dbPath);

    if (cmd == "--history") {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& r : catalog.history(100)) {
        out.push_back({{"id", r.id},
                       {"currentVersion", r.currentVersion},
                       {"minVersion", r.minVersion},
                       {"storedFilename", r.storedFilename},
                       {"originalName", r.originalName},
                       {"fileSize", r.fileSize},
                       {"uploadDate", uds::to_iso8601(r.uploadDate)}});
      }
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    // Construct services
    uds::SqliteSessionStore sessions(cfg.dbPath, cfg.allowedExtensions);
    uds::LocalFSBackend fs(cfg.uploadRoot, cfg.tempRoot);
    uds::UploadService uploads(sessions, catalog, fs, cfg.maxChunkBytes);

    std::unique_ptr<uds::SessionSweeper> sweeper;
    if (cfg.sessionTtlSeconds > 0) {
      sweeper = std::make_unique<uds::SessionSweeper>(
        uploads,
        std::chrono::seconds(cfg.sessionTtlSeconds),
        std::chrono::seconds(cfg.sweepIntervalSeconds));
      sweeper->start();
    }

    uds::run_http_server(uploads, catalog, fs, cfg);
    return 0;
  } catch (const uds::Error& e) {
    std::cerr << "Fatal (" << uds::to_string(e.kind()) << "): " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
