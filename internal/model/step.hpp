#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shopfloor::model {

enum class StepCategory : std::uint8_t {
  kCutting    = 1,
  kSilkscreen = 2,
  kPrep       = 3,
  kSewing     = 4,
  kInspection = 5,
};

enum class SkillCategory : std::uint8_t {
  kSewing = 1,
  kOther  = 2,
};

std::string_view ToString(StepCategory category);
std::string_view ToString(SkillCategory skill);

// Upper bound on a step's standard time per piece (one day).
constexpr std::int64_t kMaxTimePerPieceSeconds = 86'400;

/*
  One unit of work in a product's recipe.

  time_per_piece_seconds is the standard time at proficiency 3; zero makes
  the step a zero-length marker. Dependencies name steps of the same product.
*/
struct Step {
  std::uint64_t id         = 0;
  std::uint64_t product_id = 0;
  std::string   name;
  std::int32_t  sequence = 0;

  StepCategory  category       = StepCategory::kCutting;
  SkillCategory required_skill = SkillCategory::kOther;

  std::int64_t time_per_piece_seconds = 0;

  std::optional<std::uint64_t> equipment_id;
  std::vector<std::uint64_t>   dependencies;
};

} // namespace shopfloor::model
