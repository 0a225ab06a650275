#include "engine_options.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::config {

using shopfloor::runtime::config::FeedbackConfig;
using shopfloor::runtime::config::SchedulingConfig;
using shopfloor::runtime::config::ShiftCalendarConfig;

calendar::ShiftPattern ShiftPatternFromConfig(const ShiftCalendarConfig& config) {
  calendar::ShiftPattern pattern;

  if (!config.day_start().empty()) pattern.day_start = util::ParseTimeOfDay(config.day_start());
  if (!config.day_end().empty()) pattern.day_end = util::ParseTimeOfDay(config.day_end());

  if (config.breaks_size() > 0) {
    pattern.breaks.clear();
    for (const auto& window : config.breaks()) {
      pattern.breaks.push_back({util::ParseTimeOfDay(window.start()), util::ParseTimeOfDay(window.end())});
    }
  }

  if (config.working_weekdays_size() > 0) {
    pattern.working_weekdays.assign(config.working_weekdays().begin(), config.working_weekdays().end());
  }

  for (const auto& holiday : config.holidays()) {
    pattern.holidays.push_back(util::ParseDate(holiday));
  }

  // The default overtime end never falls before a configured day end.
  if (!config.overtime_end().empty()) {
    pattern.overtime_end = util::ParseTimeOfDay(config.overtime_end());
  } else if (!config.day_end().empty()) {
    pattern.overtime_end = std::max(pattern.overtime_end, pattern.day_end);
  }

  pattern.utc_offset_minutes = config.utc_offset_minutes();
  return pattern;
}

scheduling::SchedulingOptions SchedulingOptionsFromConfig(const SchedulingConfig& config) {
  scheduling::SchedulingOptions options;

  if (config.max_crew_size() > 0) options.max_crew_size = config.max_crew_size();
  options.sewing_workers_cover_other  = config.sewing_workers_cover_other();
  options.reject_forward_dependencies = config.reject_forward_dependencies();
  if (config.generation_timeout_ms() > 0) options.generation_timeout_ms = config.generation_timeout_ms();
  if (config.write_retry_limit() > 0) options.write_retry_limit = config.write_retry_limit();
  if (config.start_rounding_minutes() > 0) options.start_rounding_minutes = config.start_rounding_minutes();

  return options;
}

feedback::FeedbackOptions FeedbackOptionsFromConfig(const FeedbackConfig& config) {
  feedback::FeedbackOptions options;

  if (config.window_size() > 0) options.window_size = config.window_size();
  if (config.min_samples() > 0) options.min_samples = config.min_samples();
  if (config.increase_threshold_percent() > 0) options.increase_threshold_percent = config.increase_threshold_percent();
  if (config.decrease_threshold_percent() > 0) options.decrease_threshold_percent = config.decrease_threshold_percent();
  if (config.lookback_days() > 0) options.lookback_days = config.lookback_days();

  if (options.min_samples > options.window_size) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument,
                                "feedback.min_samples (" + std::to_string(options.min_samples) + ") exceeds feedback.window_size (" +
                                    std::to_string(options.window_size) + ")");
  }
  if (options.decrease_threshold_percent >= options.increase_threshold_percent) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "feedback.decrease_threshold_percent must be below increase_threshold_percent");
  }

  return options;
}

} // namespace shopfloor::config
