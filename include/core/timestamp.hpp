#pragma once

#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>

namespace triage::core {

// UTC, second precision, e.g. 2024-03-01T12:00:00Z.
inline std::string format_rfc3339(const std::time_t seconds) {
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

inline std::string rfc3339_now() {
  return format_rfc3339(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

}  // namespace triage::core
