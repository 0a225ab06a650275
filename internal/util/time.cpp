#include "time.hpp"

#include <charconv>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace shopfloor::util {

namespace {

bool ParseNumber(std::string_view text, int& out) {
  if (text.empty()) return false;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int32_t SecondOfDay(TimePoint tp) {
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  return static_cast<int32_t>(std::chrono::duration_cast<std::chrono::seconds>(tp - day).count());
}

unsigned IsoWeekday(Date date) {
  return std::chrono::weekday{date}.iso_encoding();
}

Date StartOfIsoWeek(Date date) {
  return date - std::chrono::days{IsoWeekday(date) - 1};
}

Date ParseDate(std::string_view text) {
  int year = 0, month = 0, day = 0;
  if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !ParseNumber(text.substr(0, 4), year) ||
      !ParseNumber(text.substr(5, 2), month) || !ParseNumber(text.substr(8, 2), day)) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "malformed date '" + std::string(text) + "', expected YYYY-MM-DD");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "invalid calendar date '" + std::string(text) + "'");
  }
  return std::chrono::sys_days{ymd};
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

int32_t ParseTimeOfDay(std::string_view text) {
  int hours = 0, minutes = 0, seconds = 0;
  bool ok = (text.size() == 5 || text.size() == 8) && text[2] == ':' && ParseNumber(text.substr(0, 2), hours) &&
            ParseNumber(text.substr(3, 2), minutes);
  if (ok && text.size() == 8) {
    ok = text[5] == ':' && ParseNumber(text.substr(6, 2), seconds);
  }
  ok = ok && hours >= 0 && minutes >= 0 && minutes < 60 && seconds >= 0 && seconds < 60;

  const int32_t total = hours * 3600 + minutes * 60 + seconds;
  if (!ok || total > kSecondsPerDay) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "malformed time of day '" + std::string(text) + "', expected HH:MM[:SS]");
  }
  return total;
}

std::string FormatTimeOfDay(int32_t seconds) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", seconds / 3600, (seconds / 60) % 60, seconds % 60);
  return buf;
}

void Deadline::Check(std::string_view stage) const {
  if (Expired()) {
    throw DeadlineExceeded("deadline exceeded during " + std::string(stage));
  }
}

} // namespace shopfloor::util
