#pragma once

#include <cstdint>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::model {

// Largest quantity accepted for planning. Keeps cumulative output arithmetic
// and the number of generated entries bounded.
constexpr std::int64_t kMaxOrderQuantity = 1'000'000;

struct Order {
  std::uint64_t id         = 0;
  std::uint64_t product_id = 0;
  std::int64_t  quantity   = 0;
  util::Date    due_date{};
  OrderStatus   status = OrderStatus::kPending;
};

} // namespace shopfloor::model
