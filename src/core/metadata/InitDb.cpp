// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/Errors.hpp"
#include "core/metadata/Sqlite.hpp"

namespace uds {

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    auto db = sqlite::open(dbPath, /*create*/ true);

    // Load schema file and apply (safe: CREATE TABLE IF NOT EXISTS ...)
    std::ifstream in(schemaPath);
    if (!in) throw StorageFailure("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    sqlite::exec(db.get(), buf.str());

    sqlite::exec(db.get(), "PRAGMA user_version=1;");
    return true;
}

} // namespace uds
