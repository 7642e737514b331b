#pragma once
#include <cstdint>
#include <string>

namespace uds {

int64_t now_millis();

// 2026-01-31T12:00:00.000Z
std::string to_iso8601(int64_t epochMillis);

} // namespace uds
