#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/step.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::model {

enum class WorkerStatus : std::uint8_t {
  kActive   = 1,
  kInactive = 2,
  kOnLeave  = 3,
};

struct Worker {
  std::uint64_t id = 0;
  std::string   name;
  WorkerStatus  status = WorkerStatus::kActive;
  SkillCategory skill  = SkillCategory::kOther;
};

// Equipment certification; no expiry means valid indefinitely.
struct Certification {
  std::uint64_t             worker_id    = 0;
  std::uint64_t             equipment_id = 0;
  std::optional<util::Date> expires_on;

  bool ValidOn(util::Date date) const {
    return !expires_on || *expires_on >= date;
  }
};

constexpr std::int32_t kMinProficiency     = 1;
constexpr std::int32_t kMaxProficiency     = 5;
constexpr std::int32_t kDefaultProficiency = 3;

// Multiplier applied to the standard time per piece at a proficiency level.
constexpr double TimeMultiplier(std::int32_t level) {
  switch (level) {
    case 1:
      return 1.5;
    case 2:
      return 1.25;
    case 4:
      return 0.85;
    case 5:
      return 0.7;
    default:
      return 1.0;
  }
}

struct Proficiency {
  std::uint64_t worker_id     = 0;
  std::uint64_t step_id       = 0;
  std::int32_t  level         = kDefaultProficiency;
  std::uint64_t updated_at_ms = 0;
};

enum class ProficiencyReason : std::uint8_t {
  kManual       = 1,
  kAutoIncrease = 2,
  kAutoDecrease = 3,
};

/*
  Append-only record of a proficiency mutation.

  average_efficiency / sample_size describe the trailing window that
  triggered an automatic change; manual edits leave them empty.
*/
struct ProficiencyHistory {
  std::uint64_t     id        = 0;
  std::uint64_t     worker_id = 0;
  std::uint64_t     step_id   = 0;
  std::int32_t      old_level = kDefaultProficiency;
  std::int32_t      new_level = kDefaultProficiency;
  ProficiencyReason reason    = ProficiencyReason::kManual;

  std::optional<double> average_efficiency;
  std::int32_t          sample_size = 0;

  std::uint64_t recorded_at_ms = 0;
};

// Worker skill compatibility with a step's required skill.
constexpr bool SkillCovers(SkillCategory worker_skill, SkillCategory required, bool sewing_covers_other) {
  if (worker_skill == required) {
    return true;
  }
  return sewing_covers_other && worker_skill == SkillCategory::kSewing && required == SkillCategory::kOther;
}

} // namespace shopfloor::model
