#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shopfloor::util {

/*
  Time utilities. Clock reads go through here.

  Plant dates are calendar days (sys_days); times of day are seconds since
  local midnight.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::sys_days;

constexpr std::int32_t kSecondsPerDay = 24 * 60 * 60;

TimePoint Now();

std::uint64_t ToUnixMillis(TimePoint tp);

std::int32_t SecondOfDay(TimePoint tp);

// ISO weekday: 1 = Monday .. 7 = Sunday.
unsigned IsoWeekday(Date date);
Date     StartOfIsoWeek(Date date);

// "YYYY-MM-DD"; throws ValidationError on malformed input.
Date        ParseDate(std::string_view text);
std::string FormatDate(Date date);

// "HH:MM" or "HH:MM:SS"; 24:00 is accepted as end of day.
std::int32_t ParseTimeOfDay(std::string_view text);
std::string  FormatTimeOfDay(std::int32_t seconds);

inline std::int32_t DaysBetween(Date from, Date to) {
  return static_cast<std::int32_t>((to - from).count());
}

/*
  Caller deadline for long computations.

  A default-constructed deadline never expires.
*/
class Deadline {
 public:
  Deadline() = default;
  explicit Deadline(std::chrono::steady_clock::time_point at) : at_(at) {
  }

  static Deadline After(std::chrono::milliseconds budget) {
    return Deadline(std::chrono::steady_clock::now() + budget);
  }

  bool Expired() const {
    return at_ && std::chrono::steady_clock::now() >= *at_;
  }

  // Throws DeadlineExceeded naming the stage that ran out of time.
  void Check(std::string_view stage) const;

 private:
  std::optional<std::chrono::steady_clock::time_point> at_;
};

} // namespace shopfloor::util
