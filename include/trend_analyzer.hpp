/**
 * @file trend_analyzer.hpp
 * @brief Strength, volume, intensity, consistency and body-composition trends
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * The TrendAnalyzer classifies how each tracked metric moved over the
 * supplied history. Every classifier returns INSUFFICIENT_DATA rather than
 * failing when the history is too short.
 */
#ifndef GYMCOACH_TREND_ANALYZER_HPP
#define GYMCOACH_TREND_ANALYZER_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include <vector>

namespace gymcoach {

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(TrendConfig config = TrendConfig{}) : config_(std::move(config)) {}

    /**
     * @brief Run every trend classifier over one history
     * @param history Records for a single user
     * @param goal Which way body weight should move
     */
    [[nodiscard]] TrendReport analyze(const TrainingHistory& history, GoalDirection goal) const;

    /**
     * @brief Flat per-metric results: strength, volume, intensity, consistency, body composition
     */
    [[nodiscard]] std::vector<TrendResult> analyzeTrends(const TrainingHistory& history,
                                                         GoalDirection goal) const;

    /**
     * @brief Per-exercise estimated-1RM progression and the aggregate over exercises
     *
     * Exercises are keyed by lowercased name. Exercises with too few dated
     * records are reported as INSUFFICIENT_DATA and left out of the aggregate.
     */
    [[nodiscard]] StrengthTrend analyzeStrength(const std::vector<WorkoutSession>& sessions) const;

    [[nodiscard]] AggregateTrend analyzeVolume(const std::vector<WorkoutSession>& sessions) const;
    [[nodiscard]] IntensityTrend analyzeIntensity(const std::vector<WorkoutSession>& sessions) const;
    [[nodiscard]] ConsistencyTrend analyzeConsistency(const std::vector<WorkoutSession>& sessions) const;
    [[nodiscard]] BodyCompositionTrend analyzeBodyComposition(const std::vector<BodyMeasurement>& measurements,
                                                              GoalDirection goal) const;

    /// Recent-versus-earliest session volume drop.
    [[nodiscard]] FatigueIndicator detectFatigue(const std::vector<WorkoutSession>& sessions) const;

    [[nodiscard]] const TrendConfig& config() const noexcept { return config_; }

private:
    TrendDirection classify(double value, double improving, double declining) const;

    TrendConfig config_;
};

} // namespace gymcoach

#endif // GYMCOACH_TREND_ANALYZER_HPP
