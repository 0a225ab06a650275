#pragma once

#include <cstdint>

namespace shopfloor::scheduling {

struct SchedulingOptions {
  std::uint32_t max_crew_size               = 1;
  bool          sewing_workers_cover_other  = false;
  bool          reject_forward_dependencies = false;
  // 0 disables the default generation deadline.
  std::uint32_t generation_timeout_ms  = 30'000;
  std::uint32_t write_retry_limit      = 3;
  std::uint32_t start_rounding_minutes = 15;
};

} // namespace shopfloor::scheduling
