#include "core/Time.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace uds {

int64_t now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string to_iso8601(int64_t epochMillis) {
  std::time_t secs = static_cast<std::time_t>(epochMillis / 1000);
  int ms = static_cast<int>(epochMillis % 1000);
  if (ms < 0) { ms += 1000; --secs; }
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

} // namespace uds
