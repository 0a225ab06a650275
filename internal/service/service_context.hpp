#pragma once

#include <memory>

namespace shopfloor::scheduling { class ScheduleGenerator; }
namespace shopfloor::analysis { class CapacityAnalyzer; }
namespace shopfloor::feedback { class EfficiencyFeedback; }

namespace shopfloor::service {

/*
  Engine components behind the scheduling service. All three share one
  repository and shift calendar, wired up in factory::Build.
*/
struct ServiceContext {
  std::shared_ptr<scheduling::ScheduleGenerator> generator;
  std::shared_ptr<analysis::CapacityAnalyzer>    analyzer;
  std::shared_ptr<feedback::EfficiencyFeedback>  feedback;
};

} // namespace shopfloor::service
