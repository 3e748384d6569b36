/**
 * @file plateau_detector.hpp
 * @brief Stalled estimated-1RM progression detection
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */
#ifndef GYMCOACH_PLATEAU_DETECTOR_HPP
#define GYMCOACH_PLATEAU_DETECTOR_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include "gc_logger.hpp"
#include "trend_analyzer.hpp"
#include <vector>
#include <algorithm>

namespace gymcoach {

/**
 * @class PlateauDetector
 * @brief Flags exercises whose total and weekly gains both stay under the limits
 *
 * Exercises with fewer than min_sessions data points are never reported.
 */
class PlateauDetector {
public:
    explicit PlateauDetector(PlateauConfig config = PlateauConfig{}) : config_(std::move(config)) {}

    [[nodiscard]] std::vector<PlateauRecord> detect(const StrengthTrend& strength) const {
        std::vector<PlateauRecord> plateaus;
        for (const auto& p : strength.progressions) {
            if (p.direction == TrendDirection::INSUFFICIENT_DATA) continue;
            if (p.data_points < static_cast<std::size_t>(config_.min_sessions)) continue;
            if (p.total_improvement_pct >= config_.max_total_pct) continue;
            if (p.weekly_improvement_pct >= config_.max_weekly_pct) continue;

            PlateauRecord rec;
            rec.exercise_name = p.exercise_name;
            rec.total_improvement_pct = p.total_improvement_pct;
            rec.weekly_improvement_pct = p.weekly_improvement_pct;
            rec.sessions = p.data_points;
            rec.duration_weeks = std::max(config_.min_duration_weeks,
                                          static_cast<double>(p.data_points) / 3.0);
            GC_LOG_DEBUG("PlateauDetector", "Plateau in " + p.exercise_name);
            plateaus.push_back(std::move(rec));
        }
        return plateaus;
    }

    /// Convenience overload running the strength classifier with default thresholds.
    [[nodiscard]] std::vector<PlateauRecord> detect(const std::vector<WorkoutSession>& sessions) const {
        return detect(TrendAnalyzer().analyzeStrength(sessions));
    }

    [[nodiscard]] static bool plateausDetected(const std::vector<PlateauRecord>& plateaus) noexcept {
        return !plateaus.empty();
    }

    [[nodiscard]] const PlateauConfig& config() const noexcept { return config_; }

private:
    PlateauConfig config_;
};

} // namespace gymcoach

#endif // GYMCOACH_PLATEAU_DETECTOR_HPP
