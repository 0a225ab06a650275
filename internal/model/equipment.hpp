#pragma once

#include <cstdint>
#include <string>

namespace shopfloor::model {

enum class EquipmentStatus : std::uint8_t {
  kAvailable   = 1,
  kInUse       = 2,
  kMaintenance = 3,
  kRetired     = 4,
};

struct Equipment {
  std::uint64_t   id = 0;
  std::string     name;
  EquipmentStatus status = EquipmentStatus::kAvailable;
};

constexpr bool IsOperational(EquipmentStatus status) {
  return status == EquipmentStatus::kAvailable || status == EquipmentStatus::kInUse;
}

} // namespace shopfloor::model
