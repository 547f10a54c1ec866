#include "liftkit/core/clock.h"

#include <array>
#include <ctime>

namespace liftkit::core {

std::string format_lift_timestamp(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::array<char, 32> buffer{};
  const std::size_t written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer.data(), written);
}

std::string SystemClock::timestamp() {
  return format_lift_timestamp(std::chrono::system_clock::now());
}

}  // namespace liftkit::core
