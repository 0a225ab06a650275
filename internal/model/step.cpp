#include "internal/model/step.hpp"

namespace shopfloor::model {

std::string_view ToString(StepCategory category) {
  switch (category) {
    case StepCategory::kCutting:
      return "CUTTING";
    case StepCategory::kSilkscreen:
      return "SILKSCREEN";
    case StepCategory::kPrep:
      return "PREP";
    case StepCategory::kSewing:
      return "SEWING";
    case StepCategory::kInspection:
      return "INSPECTION";
  }
  return "UNKNOWN";
}

std::string_view ToString(SkillCategory skill) {
  switch (skill) {
    case SkillCategory::kSewing:
      return "SEWING";
    case SkillCategory::kOther:
      return "OTHER";
  }
  return "UNKNOWN";
}

} // namespace shopfloor::model
