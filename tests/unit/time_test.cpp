#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using mirrorguard::util::FixedClock;
using mirrorguard::util::FormatMysqlDateTime;
using mirrorguard::util::TimePoint;

void TestFormatsUtcAndShiftedStamps() {
  const TimePoint tp{std::chrono::seconds(1709642096)};
  assert(FormatMysqlDateTime(tp) == "2024-03-05 12:34:56");
  assert(FormatMysqlDateTime(tp, 60) == "2024-03-05 13:34:56");
  assert(FormatMysqlDateTime(tp, -330) == "2024-03-05 07:04:56");
}

void TestNegativeOffsetCrossesDayBoundary() {
  // 2024-01-01 00:10:00 UTC
  const TimePoint tp{std::chrono::seconds(1704067800)};
  assert(FormatMysqlDateTime(tp, -60) == "2023-12-31 23:10:00");
}

void TestFixedClockIsSettable() {
  FixedClock clock(TimePoint{std::chrono::seconds(0)});
  assert(FormatMysqlDateTime(clock.Now()) == "1970-01-01 00:00:00");
  clock.Set(TimePoint{std::chrono::seconds(86400)});
  assert(FormatMysqlDateTime(clock.Now()) == "1970-01-02 00:00:00");
}

} // namespace

int main() {
  TestFormatsUtcAndShiftedStamps();
  TestNegativeOffsetCrossesDayBoundary();
  TestFixedClockIsSettable();

  std::cout << "mirrorguard_unit_time: pass\n";
  return 0;
}
