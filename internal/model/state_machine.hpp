#pragma once

#include <cstdint>

namespace shopfloor::model {

// Order lifecycle: pending -> scheduled -> in_progress -> completed.
// A scheduled order may complete directly when every entry is logged at once.
enum class OrderStatus : std::uint8_t {
  kPending    = 1,
  kScheduled  = 2,
  kInProgress = 3,
  kCompleted  = 4,
};

// Entry lifecycle: not_started -> in_progress -> completed. Completion may
// be recorded without a prior start.
enum class EntryStatus : std::uint8_t {
  kNotStarted = 1,
  kInProgress = 2,
  kCompleted  = 3,
};

constexpr bool IsTerminal(OrderStatus status) {
  return status == OrderStatus::kCompleted;
}

constexpr bool IsTerminal(EntryStatus status) {
  return status == EntryStatus::kCompleted;
}

constexpr bool CanTransition(OrderStatus from, OrderStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == OrderStatus::kPending) {
    return false;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr bool CanTransition(EntryStatus from, EntryStatus to) {
  return !IsTerminal(from) && static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

// Orders the deadline analysis considers in flight.
constexpr bool IsOpen(OrderStatus status) {
  return !IsTerminal(status);
}

// Status an order moves to once shop-floor progress has been logged against
// its schedule.
constexpr OrderStatus StatusAfterProgress(bool all_entries_completed) {
  return all_entries_completed ? OrderStatus::kCompleted : OrderStatus::kInProgress;
}

} // namespace shopfloor::model
