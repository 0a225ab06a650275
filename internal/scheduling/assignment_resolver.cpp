#include "assignment_resolver.hpp"

#include <algorithm>
#include <tuple>

namespace shopfloor::scheduling {

// ------------------------------------------------------------------
// BookingLedger
// ------------------------------------------------------------------

BookingLedger::BookingLedger(const std::vector<catalog::Booking>& existing) {
  for (const auto& booking : existing) Add(booking);
}

void BookingLedger::Add(const catalog::Booking& booking) {
  by_worker_[booking.worker_id].push_back(booking);
}

bool BookingLedger::Overlaps(std::uint64_t worker_id, util::Date date, std::int32_t start, std::int32_t end) const {
  auto it = by_worker_.find(worker_id);
  if (it == by_worker_.end()) return false;

  return std::any_of(it->second.begin(), it->second.end(), [&](const catalog::Booking& b) {
    return b.date == date && b.start_second < end && start < b.end_second;
  });
}

std::int64_t BookingLedger::BookedSeconds(std::uint64_t worker_id, util::Date date) const {
  auto it = by_worker_.find(worker_id);
  if (it == by_worker_.end()) return 0;

  std::int64_t total = 0;
  for (const auto& b : it->second) {
    if (b.date == date) total += b.end_second - b.start_second;
  }
  return total;
}

bool BookingLedger::BusyAt(std::uint64_t worker_id, util::Date date, std::int32_t second) const {
  auto it = by_worker_.find(worker_id);
  if (it == by_worker_.end()) return false;

  return std::any_of(it->second.begin(), it->second.end(),
                     [&](const catalog::Booking& b) { return b.date == date && b.start_second <= second && second < b.end_second; });
}

std::optional<SlotWindow> BookingLedger::FreeStretch(const std::vector<std::uint64_t>& workers, util::Date date, std::int32_t from,
                                                     std::int32_t until) const {
  if (from >= until) return std::nullopt;
  if (workers.empty()) return SlotWindow{date, from, until};

  // A free stretch can only begin at `from` or where some booking ends.
  std::vector<std::int32_t> candidates{from};
  for (auto worker_id : workers) {
    auto it = by_worker_.find(worker_id);
    if (it == by_worker_.end()) continue;
    for (const auto& b : it->second) {
      if (b.date == date && b.end_second > from && b.end_second < until) candidates.push_back(b.end_second);
    }
  }
  std::sort(candidates.begin(), candidates.end());

  for (auto start : candidates) {
    std::optional<std::int32_t> end;
    for (auto worker_id : workers) {
      if (BusyAt(worker_id, date, start)) continue;

      std::int32_t free_until = until;
      if (auto it = by_worker_.find(worker_id); it != by_worker_.end()) {
        for (const auto& b : it->second) {
          if (b.date == date && b.start_second > start) free_until = std::min(free_until, b.start_second);
        }
      }
      end = std::max(end.value_or(free_until), free_until);
    }
    if (end) return SlotWindow{date, start, *end};
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// AssignmentResolver
// ------------------------------------------------------------------

AssignmentResolver::AssignmentResolver(const catalog::ResourceSnapshot& snapshot, SchedulingOptions options,
                                       std::set<std::uint64_t> excluded_workers)
    : snapshot_(snapshot), options_(options), excluded_(std::move(excluded_workers)) {
  if (options_.max_crew_size == 0) options_.max_crew_size = 1;
}

std::vector<std::uint64_t> AssignmentResolver::EligibleWorkers(const model::Step& step, util::Date date) const {
  std::vector<std::uint64_t> out;
  for (const auto& worker : snapshot_.workers) {
    if (worker.status != model::WorkerStatus::kActive) continue;
    if (excluded_.contains(worker.id)) continue;
    if (!model::SkillCovers(worker.skill, step.required_skill, options_.sewing_workers_cover_other)) continue;
    if (step.equipment_id && !snapshot_.HasValidCertification(worker.id, *step.equipment_id, date)) continue;
    out.push_back(worker.id);
  }
  return out;
}

std::vector<std::uint64_t> AssignmentResolver::EstimateCrew(const model::Step& step, util::Date date) const {
  auto eligible = EligibleWorkers(step, date);
  std::sort(eligible.begin(), eligible.end(), [&](std::uint64_t a, std::uint64_t b) {
    return std::make_tuple(-snapshot_.ProficiencyOf(a, step.id), a) < std::make_tuple(-snapshot_.ProficiencyOf(b, step.id), b);
  });
  if (eligible.size() > options_.max_crew_size) eligible.resize(options_.max_crew_size);
  return eligible;
}

double AssignmentResolver::CrewFactor(const model::Step& step, const std::vector<std::uint64_t>& crew) const {
  if (crew.empty()) return 1.0;

  double rate = 0.0;
  for (auto worker_id : crew) {
    rate += 1.0 / model::TimeMultiplier(snapshot_.ProficiencyOf(worker_id, step.id));
  }
  return 1.0 / rate;
}

std::vector<model::Assignment> AssignmentResolver::Apportion(const model::Step& step, const std::vector<std::uint64_t>& crew,
                                                             std::int64_t output) const {
  std::vector<model::Assignment> out;
  if (crew.empty()) return out;

  // Time per piece is shared by the crew, so level / tpp reduces to level.
  std::vector<std::int64_t> weights;
  std::int64_t              total_weight = 0;
  for (auto worker_id : crew) {
    const std::int64_t weight = step.time_per_piece_seconds > 0 ? snapshot_.ProficiencyOf(worker_id, step.id) : 1;
    weights.push_back(weight);
    total_weight += weight;
  }

  std::int64_t assigned = 0;
  std::size_t  leader   = 0;
  for (std::size_t i = 0; i < crew.size(); ++i) {
    const auto share = output * weights[i] / total_weight;
    out.push_back({crew[i], share});
    assigned += share;

    if (weights[i] > weights[leader] || (weights[i] == weights[leader] && crew[i] < crew[leader])) leader = i;
  }
  out[leader].planned_output += output - assigned;
  return out;
}

ResolvedSlot AssignmentResolver::Resolve(std::uint64_t order_id, const model::Step& step, const SlotWindow& window, std::int64_t output,
                                         BookingLedger& ledger) const {
  const auto eligible = EligibleWorkers(step, window.date);

  std::vector<std::uint64_t> crew;
  for (auto worker_id : eligible) {
    if (!ledger.Overlaps(worker_id, window.date, window.start_second, window.end_second)) crew.push_back(worker_id);
  }

  auto rank = [&](std::uint64_t id) { return std::make_tuple(-snapshot_.ProficiencyOf(id, step.id), ledger.BookedSeconds(id, window.date), id); };
  std::sort(crew.begin(), crew.end(), [&](std::uint64_t a, std::uint64_t b) { return rank(a) < rank(b); });
  if (crew.size() > options_.max_crew_size) crew.resize(options_.max_crew_size);

  ResolvedSlot slot;
  slot.crew_factor = CrewFactor(step, crew);
  slot.assignments = Apportion(step, crew, output);

  if (crew.empty() && !eligible.empty()) {
    slot.warnings.push_back({model::WarningKind::kWorkersBusy, order_id, step.id, window.date,
                             "all " + std::to_string(eligible.size()) + " eligible workers are booked " + util::FormatTimeOfDay(window.start_second) +
                                 "-" + util::FormatTimeOfDay(window.end_second)});
  }
  for (auto worker_id : crew) {
    ledger.Add({worker_id, order_id, window.date, window.start_second, window.end_second});
  }
  return slot;
}

std::optional<model::ScheduleWarning> AssignmentResolver::EquipmentWarning(std::uint64_t order_id, const model::Step& step) const {
  if (!step.equipment_id) return std::nullopt;

  const auto* equipment = snapshot_.FindEquipment(*step.equipment_id);
  if (equipment && model::IsOperational(equipment->status)) return std::nullopt;

  return model::ScheduleWarning{model::WarningKind::kEquipmentUnavailable, order_id, step.id, std::nullopt,
                                "equipment " + std::to_string(*step.equipment_id) + (equipment ? " is not operational" : " is unknown")};
}

} // namespace shopfloor::scheduling
