#pragma once

#include <cstdint>
#include <set>
#include <vector>

#include "internal/util/time.hpp"

namespace shopfloor::calendar {

struct BreakWindow {
  std::int32_t start = 0;
  std::int32_t end   = 0;
};

/*
  Plant shift definition. Times are seconds since local midnight.

  Defaults: 07:00-15:30 with an unpaid 11:00-11:30 break (8 working
  hours), Monday to Friday, overtime allowed until 18:00. The plant clock
  is UTC shifted by utc_offset_minutes; no daylight saving rules.
*/
struct ShiftPattern {
  std::int32_t             day_start = 7 * 3600;
  std::int32_t             day_end   = 15 * 3600 + 30 * 60;
  std::vector<BreakWindow> breaks{{11 * 3600, 11 * 3600 + 30 * 60}};
  std::vector<unsigned>    working_weekdays{1, 2, 3, 4, 5};
  std::vector<util::Date>  holidays;
  std::int32_t             overtime_end = 18 * 3600;
  std::int32_t             utc_offset_minutes = 0;
};

// A point on the plant calendar.
struct SlotTime {
  util::Date   date{};
  std::int32_t second = 0;

  bool operator==(const SlotTime& other) const {
    return date == other.date && second == other.second;
  }
  bool operator<(const SlotTime& other) const {
    return date < other.date || (date == other.date && second < other.second);
  }
};

class ShiftCalendar {
 public:
  virtual ~ShiftCalendar() = default;

  virtual bool IsWorkingDay(util::Date date) const = 0;

  // Working seconds of the day excluding breaks; 0 on non-working days.
  virtual std::int32_t ShiftSeconds(util::Date date) const = 0;

  virtual std::int32_t DayStart(util::Date date) const = 0;
  virtual std::int32_t DayEnd(util::Date date) const    = 0;

  // Length of the evening overtime window after DayEnd.
  virtual std::int32_t OvertimeSeconds(util::Date date) const = 0;

  // Earliest working instant at or after `from`. Never inside a break and
  // never at or past the day end.
  virtual SlotTime NextOpenSlot(SlotTime from) const = 0;

  // Working seconds within [from, to) on `date`, breaks excluded.
  virtual std::int32_t WorkingSecondsBetween(util::Date date, std::int32_t from, std::int32_t to) const = 0;

  // Second of day reached after `seconds` working seconds from `from`,
  // skipping breaks; capped at DayEnd.
  virtual std::int32_t Advance(util::Date date, std::int32_t from, std::int64_t seconds) const = 0;

  double ShiftHours(util::Date date) const {
    return static_cast<double>(ShiftSeconds(date)) / 3600.0;
  }

  // Working hours over the inclusive date range.
  double WorkingHoursBetween(util::Date first, util::Date last) const;

  // Plant local minus UTC.
  virtual std::int32_t UtcOffsetMinutes() const = 0;

  // Plant date and second of day at an instant.
  SlotTime LocalTime(util::TimePoint instant) const;
};

class StandardShiftCalendar final : public ShiftCalendar {
 public:
  // Throws ValidationError when the pattern is inconsistent.
  explicit StandardShiftCalendar(ShiftPattern pattern = {});

  bool         IsWorkingDay(util::Date date) const override;
  std::int32_t ShiftSeconds(util::Date date) const override;
  std::int32_t DayStart(util::Date date) const override;
  std::int32_t DayEnd(util::Date date) const override;
  std::int32_t OvertimeSeconds(util::Date date) const override;
  SlotTime     NextOpenSlot(SlotTime from) const override;
  std::int32_t WorkingSecondsBetween(util::Date date, std::int32_t from, std::int32_t to) const override;
  std::int32_t Advance(util::Date date, std::int32_t from, std::int64_t seconds) const override;
  std::int32_t UtcOffsetMinutes() const override;

  const ShiftPattern& pattern() const {
    return pattern_;
  }

 private:
  // Working segments of a shift day: the shift minus its breaks.
  std::vector<BreakWindow> segments_;
  ShiftPattern             pattern_;
  std::set<unsigned>       weekdays_;
  std::set<util::Date>     holidays_;
  std::int32_t             shift_seconds_ = 0;
};

} // namespace shopfloor::calendar
