#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace warehouse::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIsoString(TimePoint tp) {
  const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

  const std::time_t t = Clock::to_time_t(secs);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return out.str();
}

} // namespace warehouse::util
