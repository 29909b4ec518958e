// File: src/memory/consolidation_schedule.hpp
#pragma once

#include "core/types.hpp"
#include <chrono>

namespace engram {

/// ConsolidationSchedule: when the next consolidation pass is due
///
/// Regular passes run every consolidation_interval; every
/// deep_consolidation_interval a pass is flagged as deep. While
/// maintenance_mode is set nothing is ever due.
class ConsolidationSchedule {
public:
    struct Config {
        std::chrono::hours initial_delay{1};
        std::chrono::hours consolidation_interval{6};
        std::chrono::hours deep_consolidation_interval{24};
    };

    /// First pass due at now + initial_delay
    /// @throws std::invalid_argument if an interval is not positive
    explicit ConsolidationSchedule(Timestamp now = Timestamp::Now());
    ConsolidationSchedule(const Config& config, Timestamp now);

    /// True if a pass should run at now
    bool IsDue(Timestamp now) const;

    /// True if the pass due at now should be a deep one
    bool IsDeepDue(Timestamp now) const;

    /// Record a finished pass and move next_consolidation forward
    void MarkCompleted(Timestamp now, bool deep = false);

    Timestamp NextConsolidation() const { return next_consolidation_; }
    Timestamp LastDeepConsolidation() const { return last_deep_consolidation_; }

    std::chrono::hours ConsolidationInterval() const { return config_.consolidation_interval; }
    std::chrono::hours DeepConsolidationInterval() const { return config_.deep_consolidation_interval; }

    bool InMaintenanceMode() const { return maintenance_mode_; }
    void SetMaintenanceMode(bool enabled) { maintenance_mode_ = enabled; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    Timestamp next_consolidation_;
    Timestamp last_deep_consolidation_;
    bool maintenance_mode_{false};
};

} // namespace engram
