#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mirrorguard::util {

/*
  Time utilities.

  Anything that stamps wall-clock time takes a Clock so tests
  can pin it.
*/

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

class FixedClock final : public Clock {
 public:
  explicit FixedClock(TimePoint now) : now_(now) {
  }

  TimePoint Now() const override {
    return now_;
  }

  void Set(TimePoint now) {
    now_ = now;
  }

 private:
  TimePoint now_;
};

// "YYYY-MM-DD HH:MM:SS" of tp shifted by offset_minutes from UTC.
std::string FormatMysqlDateTime(TimePoint tp, std::int32_t offset_minutes = 0);

} // namespace mirrorguard::util
