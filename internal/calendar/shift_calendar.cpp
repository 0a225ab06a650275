#include "shift_calendar.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include "internal/util/errors.hpp"

namespace shopfloor::calendar {

using util::ValidationError;
using util::ValidationErrorKind;

namespace {

// Two years of consecutive non-working days means the calendar is unusable.
constexpr int kMaxSearchDays = 731;

constexpr std::int32_t kMaxUtcOffsetMinutes = 14 * 60;

} // namespace

double ShiftCalendar::WorkingHoursBetween(util::Date first, util::Date last) const {
  std::int64_t seconds = 0;
  for (auto day = first; day <= last; day += std::chrono::days{1}) {
    seconds += ShiftSeconds(day);
  }
  return static_cast<double>(seconds) / 3600.0;
}

SlotTime ShiftCalendar::LocalTime(util::TimePoint instant) const {
  const auto local = instant + std::chrono::minutes(UtcOffsetMinutes());
  return {std::chrono::floor<std::chrono::days>(local), util::SecondOfDay(local)};
}

StandardShiftCalendar::StandardShiftCalendar(ShiftPattern pattern) : pattern_(std::move(pattern)) {
  if (pattern_.utc_offset_minutes < -kMaxUtcOffsetMinutes || pattern_.utc_offset_minutes > kMaxUtcOffsetMinutes) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument,
                          "utc_offset_minutes " + std::to_string(pattern_.utc_offset_minutes) + " outside +/-14 hours");
  }
  if (pattern_.day_start < 0 || pattern_.day_end > util::kSecondsPerDay || pattern_.day_start >= pattern_.day_end) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "shift day_start must precede day_end within one day");
  }
  if (pattern_.overtime_end == 0) {
    pattern_.overtime_end = pattern_.day_end;
  }
  if (pattern_.overtime_end < pattern_.day_end || pattern_.overtime_end > util::kSecondsPerDay) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "overtime_end must lie between day_end and midnight");
  }

  auto breaks = pattern_.breaks;
  std::sort(breaks.begin(), breaks.end(), [](const BreakWindow& a, const BreakWindow& b) { return a.start < b.start; });

  std::int32_t cursor = pattern_.day_start;
  for (const auto& window : breaks) {
    if (window.start >= window.end || window.start < cursor || window.end > pattern_.day_end) {
      throw ValidationError(ValidationErrorKind::kInvalidArgument,
                            "break " + util::FormatTimeOfDay(window.start) + "-" + util::FormatTimeOfDay(window.end) +
                                " must be non-empty, non-overlapping and inside the shift");
    }
    if (window.start > cursor) segments_.push_back({cursor, window.start});
    cursor = window.end;
  }
  if (cursor < pattern_.day_end) segments_.push_back({cursor, pattern_.day_end});
  pattern_.breaks = std::move(breaks);

  for (const auto& segment : segments_) shift_seconds_ += segment.end - segment.start;
  if (shift_seconds_ <= 0) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "shift has no working time");
  }

  for (auto weekday : pattern_.working_weekdays) {
    if (weekday < 1 || weekday > 7) {
      throw ValidationError(ValidationErrorKind::kInvalidArgument, "working weekday " + std::to_string(weekday) + " outside 1..7");
    }
    weekdays_.insert(weekday);
  }
  if (weekdays_.empty()) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "at least one working weekday is required");
  }
  holidays_.insert(pattern_.holidays.begin(), pattern_.holidays.end());
}

bool StandardShiftCalendar::IsWorkingDay(util::Date date) const {
  return weekdays_.contains(util::IsoWeekday(date)) && !holidays_.contains(date);
}

std::int32_t StandardShiftCalendar::ShiftSeconds(util::Date date) const {
  return IsWorkingDay(date) ? shift_seconds_ : 0;
}

std::int32_t StandardShiftCalendar::DayStart(util::Date) const {
  return pattern_.day_start;
}

std::int32_t StandardShiftCalendar::DayEnd(util::Date) const {
  return pattern_.day_end;
}

std::int32_t StandardShiftCalendar::OvertimeSeconds(util::Date date) const {
  return IsWorkingDay(date) ? pattern_.overtime_end - pattern_.day_end : 0;
}

SlotTime StandardShiftCalendar::NextOpenSlot(SlotTime from) const {
  auto         date   = from.date;
  std::int32_t second = from.second;

  for (int i = 0; i < kMaxSearchDays; ++i) {
    if (IsWorkingDay(date)) {
      for (const auto& segment : segments_) {
        if (second < segment.end) {
          return {date, std::max(second, segment.start)};
        }
      }
    }
    date += std::chrono::days{1};
    second = 0;
  }

  throw ValidationError(ValidationErrorKind::kInvalidArgument, "no working day within two years of " + util::FormatDate(from.date));
}

std::int32_t StandardShiftCalendar::WorkingSecondsBetween(util::Date date, std::int32_t from, std::int32_t to) const {
  if (!IsWorkingDay(date) || from >= to) {
    return 0;
  }

  std::int32_t total = 0;
  for (const auto& segment : segments_) {
    const auto lo = std::max(from, segment.start);
    const auto hi = std::min(to, segment.end);
    if (hi > lo) total += hi - lo;
  }
  return total;
}

std::int32_t StandardShiftCalendar::Advance(util::Date date, std::int32_t from, std::int64_t seconds) const {
  std::int32_t position = std::max(from, pattern_.day_start);
  if (!IsWorkingDay(date) || seconds <= 0) {
    return std::min(position, pattern_.day_end);
  }

  std::int64_t remaining = seconds;
  for (const auto& segment : segments_) {
    if (position >= segment.end) continue;

    const auto lo        = std::max(position, segment.start);
    const auto available = static_cast<std::int64_t>(segment.end - lo);
    if (remaining <= available) {
      return lo + static_cast<std::int32_t>(remaining);
    }
    remaining -= available;
    position = segment.end;
  }
  return pattern_.day_end;
}

std::int32_t StandardShiftCalendar::UtcOffsetMinutes() const {
  return pattern_.utc_offset_minutes;
}

} // namespace shopfloor::calendar
