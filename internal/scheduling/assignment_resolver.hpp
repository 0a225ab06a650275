#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "internal/catalog/resource_catalog.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/step.hpp"
#include "internal/scheduling/scheduling_options.hpp"

namespace shopfloor::scheduling {

struct SlotWindow {
  util::Date   date{};
  std::int32_t start_second = 0;
  std::int32_t end_second   = 0;
};

// Worker time committed so far in one planning run, seeded with other orders' entries.
class BookingLedger {
 public:
  BookingLedger() = default;
  explicit BookingLedger(const std::vector<catalog::Booking>& existing);

  void Add(const catalog::Booking& booking);

  bool Overlaps(std::uint64_t worker_id, util::Date date, std::int32_t start, std::int32_t end) const;

  std::int64_t BookedSeconds(std::uint64_t worker_id, util::Date date) const;

  // Earliest stretch in [from, until) on `date` during which at least one of
  // `workers` has no booking, extended as far as that worker stays free.
  // The whole range when `workers` is empty; nullopt when all of them are
  // busy until `until`.
  std::optional<SlotWindow> FreeStretch(const std::vector<std::uint64_t>& workers, util::Date date, std::int32_t from, std::int32_t until) const;

 private:
  bool BusyAt(std::uint64_t worker_id, util::Date date, std::int32_t second) const;

  std::map<std::uint64_t, std::vector<catalog::Booking>> by_worker_;
};

struct ResolvedSlot {
  std::vector<model::Assignment>      assignments;
  double                              crew_factor = 1.0;
  std::vector<model::ScheduleWarning> warnings;

  bool unassigned() const {
    return assignments.empty();
  }
};

/*
  Picks the crew for a slot and splits its planned output.

  Eligible: active, skill compatible, certified for the step's equipment on
  the slot date, not excluded. Workers booked anywhere in the window are
  never picked. The rest rank by higher proficiency, fewer booked seconds
  that day, lower id.
*/
class AssignmentResolver {
 public:
  AssignmentResolver(const catalog::ResourceSnapshot& snapshot, SchedulingOptions options, std::set<std::uint64_t> excluded_workers = {});

  std::vector<std::uint64_t> EligibleWorkers(const model::Step& step, util::Date date) const;

  // Crew assumed before the slot window is known: best proficiency, then id.
  std::vector<std::uint64_t> EstimateCrew(const model::Step& step, util::Date date) const;

  // 1 / sum(1 / multiplier) over the crew; 1.0 for an empty crew.
  double CrewFactor(const model::Step& step, const std::vector<std::uint64_t>& crew) const;

  // Shares proportional to level / time per piece; sums to `output` exactly.
  std::vector<model::Assignment> Apportion(const model::Step& step, const std::vector<std::uint64_t>& crew, std::int64_t output) const;

  // Selects the crew among workers free for the whole window, apportions the
  // output and books the crew into `ledger`. When every eligible worker is
  // busy the slot stays unassigned with a WorkersBusy warning.
  ResolvedSlot Resolve(std::uint64_t order_id, const model::Step& step, const SlotWindow& window, std::int64_t output,
                       BookingLedger& ledger) const;

  // Set when the step's equipment is missing or not operational.
  std::optional<model::ScheduleWarning> EquipmentWarning(std::uint64_t order_id, const model::Step& step) const;

 private:
  const catalog::ResourceSnapshot& snapshot_;
  SchedulingOptions                options_;
  std::set<std::uint64_t>          excluded_;
};

} // namespace shopfloor::scheduling
