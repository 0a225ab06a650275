#pragma once

#include "config/config.pb.h"

#include "internal/calendar/shift_calendar.hpp"
#include "internal/feedback/efficiency_feedback.hpp"
#include "internal/scheduling/scheduling_options.hpp"

namespace shopfloor::config {

/*
  Engine settings derived from RuntimeConfig.

  Unset (zero / empty) fields keep the built-in defaults. Malformed times
  and dates throw ValidationError.
*/

calendar::ShiftPattern ShiftPatternFromConfig(const shopfloor::runtime::config::ShiftCalendarConfig& config);

scheduling::SchedulingOptions SchedulingOptionsFromConfig(const shopfloor::runtime::config::SchedulingConfig& config);

feedback::FeedbackOptions FeedbackOptionsFromConfig(const shopfloor::runtime::config::FeedbackConfig& config);

} // namespace shopfloor::config
