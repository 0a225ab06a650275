#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::model {

struct Assignment {
  std::uint64_t worker_id      = 0;
  std::int64_t  planned_output = 0;
};

/*
  One scheduled occurrence of a step on a single working day.

  start/end are seconds since local midnight on `date`; the window may
  contain an unpaid break. Actuals stay empty until logged.
*/
struct ScheduleEntry {
  std::uint64_t id          = 0;
  std::uint64_t schedule_id = 0;
  std::uint64_t order_id    = 0;
  std::uint64_t step_id     = 0;

  util::Date   date{};
  std::int32_t start_second = 0;
  std::int32_t end_second   = 0;

  std::int64_t            planned_output = 0;
  std::vector<Assignment> assignments;

  EntryStatus                 status = EntryStatus::kNotStarted;
  std::optional<std::int32_t> actual_start_second;
  std::optional<std::int32_t> actual_end_second;
  std::optional<std::int64_t> actual_output;
  std::uint64_t               completed_at_ms = 0;

  bool HasWorker(std::uint64_t worker_id) const {
    for (const auto& assignment : assignments) {
      if (assignment.worker_id == worker_id) return true;
    }
    return false;
  }
};

struct Schedule {
  std::uint64_t id       = 0;
  std::uint64_t order_id = 0;
  util::Date    start_date{};
  std::uint64_t generated_at_ms = 0;

  std::vector<ScheduleEntry> entries;
};

enum class WarningKind : std::uint8_t {
  kResourceUnavailable  = 1,
  kWorkersBusy          = 2,
  kEquipmentUnavailable = 3,
  kDueDateMissed        = 4,
};

// Non-fatal finding returned alongside a generated schedule.
struct ScheduleWarning {
  WarningKind               kind     = WarningKind::kResourceUnavailable;
  std::uint64_t             order_id = 0;
  std::uint64_t             step_id  = 0;
  std::optional<util::Date> date;
  std::string               message;
};

} // namespace shopfloor::model
