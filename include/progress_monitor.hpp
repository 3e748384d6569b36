/**
 * @file progress_monitor.hpp
 * @brief Ongoing progress alerts and forecast confidence
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */
#ifndef GYMCOACH_PROGRESS_MONITOR_HPP
#define GYMCOACH_PROGRESS_MONITOR_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include "gc_time_utils.hpp"
#include "metric_primitives.hpp"
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <cmath>

namespace gymcoach {

/// Days-since-last-workout reported when nothing has been logged.
constexpr int64_t NO_WORKOUT_DAYS = 999;

class ProgressMonitor {
public:
    explicit ProgressMonitor(MonitorConfig config = MonitorConfig{}) : config_(std::move(config)) {}

    /**
     * @brief Whole days from the latest parseable session date to @p now
     * @return NO_WORKOUT_DAYS if no session has a usable date
     */
    [[nodiscard]] static int64_t daysSinceLastWorkout(const std::vector<WorkoutSession>& sessions,
                                                      time_utils::TimePoint now) {
        std::optional<time_utils::TimePoint> latest;
        for (const auto& s : sessions) {
            auto tp = time_utils::parseISO8601(s.date);
            if (tp && (!latest || *tp > *latest)) latest = tp;
        }
        if (!latest) return NO_WORKOUT_DAYS;
        return time_utils::wholeDaysBetween(*latest, now);
    }

    /**
     * @brief Alert level from the consistency score, escalated after missed workouts
     */
    [[nodiscard]] ProgressAlert consistencyAlert(const ConsistencyTrend& consistency, int64_t daysSinceLast) const {
        ProgressAlert alert;
        alert.category = "consistency";
        alert.score = consistency.score;

        if (consistency.score < config_.consistency_high_alert) alert.level = AlertLevel::HIGH;
        else if (consistency.score < config_.consistency_medium_alert) alert.level = AlertLevel::MEDIUM;
        else alert.level = AlertLevel::LOW;

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "Consistency score " << consistency.score;
        if (daysSinceLast >= NO_WORKOUT_DAYS) {
            alert.level = AlertLevel::HIGH;
            oss << "; no workout data available";
        } else if (daysSinceLast > config_.missed_workout_days) {
            alert.level = AlertLevel::HIGH;
            oss << "; " << daysSinceLast << " days since last workout";
        }
        alert.message = oss.str();
        return alert;
    }

    /**
     * @brief Fraction of logged days within the calorie tolerance of the target
     */
    [[nodiscard]] NutritionAdherence nutritionAdherence(const std::vector<NutritionDay>& days,
                                                        double calorieTarget) const {
        NutritionAdherence result;
        result.days_evaluated = days.size();
        if (days.empty() || !(calorieTarget > 0.0)) {
            result.level = AlertLevel::MEDIUM;
            return result;
        }

        std::size_t within = 0;
        std::vector<double> calories;
        for (const auto& d : days) {
            calories.push_back(d.calories);
            if (std::abs(d.calories - calorieTarget) / calorieTarget <= config_.nutrition_deviation) ++within;
        }
        result.average_calories = metrics::mean(calories);
        const double adherence = static_cast<double>(within) / static_cast<double>(days.size());
        result.adherence = adherence;

        if (adherence < config_.nutrition_high_alert) result.level = AlertLevel::HIGH;
        else if (adherence < config_.nutrition_medium_alert) result.level = AlertLevel::MEDIUM;
        else result.level = AlertLevel::LOW;
        return result;
    }

    [[nodiscard]] static ProgressAlert nutritionAlert(const NutritionAdherence& adherence) {
        ProgressAlert alert;
        alert.category = "nutrition";
        alert.level = adherence.level;
        alert.score = adherence.adherence.value_or(0.0);
        if (!adherence.adherence) {
            alert.message = "Insufficient nutrition data";
        } else {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(0) << (*adherence.adherence * 100.0)
                << "% of " << adherence.days_evaluated << " days on calorie target";
            alert.message = oss.str();
        }
        return alert;
    }

    /**
     * @brief Confidence in forward-looking statements, from data availability
     */
    [[nodiscard]] static double predictionConfidence(const TrendReport& trends) {
        double confidence = 0.5;
        if (trends.strength.hasProgressions()) confidence += 0.2;
        if (trends.volume.trend.hasData()) confidence += 0.1;
        if (trends.consistency.trend.hasData() && trends.consistency.score > 0.7) confidence += 0.1;
        return std::min(1.0, confidence);
    }

    [[nodiscard]] static std::vector<std::string> identifyRiskFactors(const TrendReport& trends,
                                                                      const std::vector<PlateauRecord>& plateaus) {
        std::vector<std::string> factors;
        if (trends.fatigue.high_fatigue) factors.push_back("High fatigue levels detected");
        if (trends.strength.overall.direction == TrendDirection::DECLINING) {
            factors.push_back("Declining strength progression");
        }
        if (trends.consistency.trend.hasData() && trends.consistency.score < 0.4) {
            factors.push_back("Low workout consistency");
        }
        if (!plateaus.empty()) factors.push_back("Training plateaus detected");
        return factors;
    }

    [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

private:
    MonitorConfig config_;
};

} // namespace gymcoach

#endif // GYMCOACH_PROGRESS_MONITOR_HPP
