#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mirrorguard::util {

TimePoint SystemClock::Now() const {
  return SystemClockType::now();
}

std::string FormatMysqlDateTime(TimePoint tp, std::int32_t offset_minutes) {
  const auto shifted = tp + std::chrono::minutes(offset_minutes);
  const auto seconds = SystemClockType::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(shifted));

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

} // namespace mirrorguard::util
