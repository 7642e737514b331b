#pragma once
#include <string>

namespace uds {

// Creates the database file if needed and applies schema.sql (idempotent).
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace uds
