// File: src/memory/consolidation_schedule.cpp
#include "memory/consolidation_schedule.hpp"
#include <stdexcept>

namespace engram {

ConsolidationSchedule::ConsolidationSchedule(Timestamp now)
    : ConsolidationSchedule(Config{}, now) {
}

ConsolidationSchedule::ConsolidationSchedule(const Config& config, Timestamp now)
    : config_(config),
      next_consolidation_(now + config.initial_delay),
      last_deep_consolidation_(now) {
    if (config_.initial_delay.count() < 0) {
        throw std::invalid_argument("initial_delay must be >= 0");
    }
    if (config_.consolidation_interval.count() <= 0) {
        throw std::invalid_argument("consolidation_interval must be > 0");
    }
    if (config_.deep_consolidation_interval.count() <= 0) {
        throw std::invalid_argument("deep_consolidation_interval must be > 0");
    }
}

bool ConsolidationSchedule::IsDue(Timestamp now) const {
    return !maintenance_mode_ && now >= next_consolidation_;
}

bool ConsolidationSchedule::IsDeepDue(Timestamp now) const {
    return IsDue(now) && now >= last_deep_consolidation_ + config_.deep_consolidation_interval;
}

void ConsolidationSchedule::MarkCompleted(Timestamp now, bool deep) {
    next_consolidation_ = now + config_.consolidation_interval;
    if (deep) {
        last_deep_consolidation_ = now;
    }
}

} // namespace engram
