/**
 * @file trend_analyzer.cpp
 * @brief Trend classifier implementation
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "trend_analyzer.hpp"
#include "metric_primitives.hpp"
#include "gc_logger.hpp"
#include "gc_time_utils.hpp"
#include <map>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace gymcoach {

namespace {

struct StrengthPoint {
    time_utils::TimePoint when;
    double one_rep_max;
};

std::string formatPct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v << "%";
    return oss.str();
}

} // namespace

TrendDirection TrendAnalyzer::classify(double value, double improving, double declining) const {
    if (value > improving) return TrendDirection::IMPROVING;
    if (value < declining) return TrendDirection::DECLINING;
    return TrendDirection::STABLE;
}

TrendReport TrendAnalyzer::analyze(const TrainingHistory& history, GoalDirection goal) const {
    TrendReport report;
    report.strength = analyzeStrength(history.workouts);
    report.volume = analyzeVolume(history.workouts);
    report.intensity = analyzeIntensity(history.workouts);
    report.consistency = analyzeConsistency(history.workouts);
    report.body_composition = analyzeBodyComposition(history.measurements, goal);
    report.fatigue = detectFatigue(history.workouts);

    GC_LOG_DEBUG("TrendAnalyzer", "strength=" + toString(report.strength.overall.direction) +
                 " volume=" + toString(report.volume.trend.direction) +
                 " intensity=" + toString(report.intensity.window.trend.direction) +
                 " consistency=" + toString(report.consistency.trend.direction));
    return report;
}

std::vector<TrendResult> TrendAnalyzer::analyzeTrends(const TrainingHistory& history,
                                                      GoalDirection goal) const {
    return analyze(history, goal).toTrendResults();
}

//=============================================================================
// Strength
//=============================================================================

StrengthTrend TrendAnalyzer::analyzeStrength(const std::vector<WorkoutSession>& sessions) const {
    std::map<std::string, std::vector<StrengthPoint>> byExercise;

    for (const auto& session : sessions) {
        for (const auto& record : session.exercises) {
            auto orm = metrics::estimatedOneRepMax(record.weight, record.reps);
            if (!orm) continue;
            auto when = time_utils::parseISO8601(session.dateOf(record));
            if (!when) {
                GC_LOG_WARNING("TrendAnalyzer", "Skipping record with unparsable date: " + session.dateOf(record));
                continue;
            }
            byExercise[metrics::lowercase(record.exercise_name)].push_back({*when, *orm});
        }
    }

    StrengthTrend result;
    result.overall.metric_name = "strength";
    std::vector<double> totals;
    const auto minPoints = static_cast<std::size_t>(config_.min_strength_points);

    for (auto& [name, points] : byExercise) {
        ExerciseProgression prog;
        prog.exercise_name = name;
        prog.data_points = points.size();

        if (points.size() < minPoints) {
            result.progressions.push_back(prog);
            continue;
        }

        std::stable_sort(points.begin(), points.end(),
                         [](const StrengthPoint& a, const StrengthPoint& b) { return a.when < b.when; });
        prog.first_1rm = points.front().one_rep_max;
        prog.last_1rm = points.back().one_rep_max;
        prog.total_improvement_pct = metrics::percentChange(prog.first_1rm, prog.last_1rm,
                                                            config_.max_percent_magnitude);
        prog.days_span = time_utils::wholeDaysBetween(points.front().when, points.back().when);
        if (prog.days_span > 0) {
            const double weeks = std::max(static_cast<double>(prog.days_span) / 7.0, 1.0);
            prog.weekly_improvement_pct = metrics::clampPercent(prog.total_improvement_pct / weeks,
                                                                config_.max_percent_magnitude);
        }
        prog.direction = classify(prog.total_improvement_pct,
                                  config_.strength_improving_pct, config_.strength_declining_pct);
        totals.push_back(prog.total_improvement_pct);
        result.progressions.push_back(prog);
    }

    result.overall.sample_count = totals.size();
    if (totals.empty()) return result;

    const double avg = metrics::mean(totals);
    result.overall.magnitude = avg;
    result.overall.direction = classify(avg, config_.overall_improving_pct, config_.overall_declining_pct);
    return result;
}

//=============================================================================
// Volume and Intensity
//=============================================================================

AggregateTrend TrendAnalyzer::analyzeVolume(const std::vector<WorkoutSession>& sessions) const {
    AggregateTrend result;
    result.trend.metric_name = "volume";

    std::vector<double> volumes;
    for (const auto& s : metrics::sortedByDate(sessions)) volumes.push_back(metrics::sessionVolume(s));
    result.trend.sample_count = volumes.size();
    if (volumes.size() < static_cast<std::size_t>(config_.min_aggregate_sessions)) return result;

    const auto window = static_cast<std::size_t>(config_.window_sessions);
    result.recent_average = metrics::tailMean(volumes, window);
    result.earlier_average = metrics::headMean(volumes, window);

    const double change = metrics::percentChange(result.earlier_average, result.recent_average,
                                                 config_.max_percent_magnitude);
    result.trend.magnitude = change;
    result.trend.direction = classify(change, config_.volume_change_pct, -config_.volume_change_pct);
    return result;
}

IntensityTrend TrendAnalyzer::analyzeIntensity(const std::vector<WorkoutSession>& sessions) const {
    IntensityTrend result;
    result.window.trend.metric_name = "intensity";

    std::vector<double> intensities;
    for (const auto& s : metrics::sortedByDate(sessions)) {
        auto value = metrics::sessionIntensity(s);
        if (!value) continue;
        intensities.push_back(*value);
        if (*value < config_.intensity_low_cutoff) {
            ++result.distribution.low_sessions;
        } else if (*value < config_.intensity_high_cutoff) {
            ++result.distribution.moderate_sessions;
        } else {
            ++result.distribution.high_sessions;
        }
    }
    result.average_intensity = metrics::mean(intensities);
    result.window.trend.sample_count = intensities.size();
    if (intensities.size() < static_cast<std::size_t>(config_.min_aggregate_sessions)) return result;

    const auto window = static_cast<std::size_t>(config_.window_sessions);
    result.window.recent_average = metrics::tailMean(intensities, window);
    result.window.earlier_average = metrics::headMean(intensities, window);

    // Percentage points, not a relative change
    const double diff = result.window.recent_average - result.window.earlier_average;
    result.window.trend.magnitude = diff;
    result.window.trend.direction = classify(diff, config_.intensity_change_points,
                                             -config_.intensity_change_points);
    return result;
}

//=============================================================================
// Consistency
//=============================================================================

ConsistencyTrend TrendAnalyzer::analyzeConsistency(const std::vector<WorkoutSession>& sessions) const {
    ConsistencyTrend result;
    result.trend.metric_name = "consistency";

    const auto sorted = metrics::sortedByDate(sessions);
    const auto gaps = metrics::workoutGaps(sorted);
    result.gap_count = gaps.size();
    result.average_gap_days = metrics::mean(gaps);
    result.gap_stddev = metrics::sampleStdDev(gaps);
    result.score = metrics::consistencyScore(gaps);
    result.trend.sample_count = sorted.size();

    result.frequency.total_workouts = sorted.size();
    for (const auto& s : sorted) {
        if (auto tp = time_utils::parseISO8601(s.date)) {
            ++result.frequency.day_distribution[time_utils::weekdayName(time_utils::weekdayIndex(*tp))];
        }
    }
    if (!sorted.empty()) {
        const auto first = time_utils::parseISO8601(sorted.front().date);
        const auto last = time_utils::parseISO8601(sorted.back().date);
        const double spanDays = static_cast<double>(time_utils::wholeDaysBetween(*first, *last));
        result.frequency.avg_workouts_per_week =
            static_cast<double>(sorted.size()) / std::max(1.0, spanDays / 7.0);
    }

    if (sorted.size() < static_cast<std::size_t>(config_.min_consistency_sessions) || gaps.empty()) {
        return result;
    }

    result.trend.magnitude = result.score * 100.0;
    if (result.score >= config_.consistency_good) {
        result.trend.direction = TrendDirection::IMPROVING;
    } else if (result.score < config_.consistency_poor) {
        result.trend.direction = TrendDirection::DECLINING;
    } else {
        result.trend.direction = TrendDirection::STABLE;
    }
    return result;
}

//=============================================================================
// Body Composition
//=============================================================================

BodyCompositionTrend TrendAnalyzer::analyzeBodyComposition(const std::vector<BodyMeasurement>& measurements,
                                                           GoalDirection goal) const {
    BodyCompositionTrend result;
    result.trend.metric_name = "body_composition";
    result.goal = goal;

    std::vector<std::pair<time_utils::TimePoint, double>> weights;
    for (const auto& m : measurements) {
        if (!(m.weight > 0.0)) continue;
        auto when = time_utils::parseISO8601(m.date);
        if (!when) {
            GC_LOG_WARNING("TrendAnalyzer", "Skipping measurement with unparsable date: " + m.date);
            continue;
        }
        weights.emplace_back(*when, m.weight);
    }
    result.trend.sample_count = weights.size();
    if (weights.size() < static_cast<std::size_t>(config_.min_measurements)) return result;

    std::stable_sort(weights.begin(), weights.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    result.start_weight = weights.front().second;
    result.end_weight = weights.back().second;

    const double change = metrics::percentChange(result.start_weight, result.end_weight,
                                                 config_.max_percent_magnitude);
    const double band = config_.body_change_pct;
    result.trend.magnitude = change;

    switch (goal) {
        case GoalDirection::LOSE_WEIGHT:
            result.trend.direction = change < -band ? TrendDirection::IMPROVING
                                   : change > band ? TrendDirection::DECLINING
                                   : TrendDirection::STABLE;
            break;
        case GoalDirection::GAIN_MASS:
            result.trend.direction = change > band ? TrendDirection::IMPROVING
                                   : change < -band ? TrendDirection::DECLINING
                                   : TrendDirection::STABLE;
            break;
        case GoalDirection::MAINTAIN:
            result.trend.direction = std::abs(change) <= band ? TrendDirection::STABLE
                                                              : TrendDirection::DECLINING;
            break;
    }
    return result;
}

//=============================================================================
// Fatigue
//=============================================================================

FatigueIndicator TrendAnalyzer::detectFatigue(const std::vector<WorkoutSession>& sessions) const {
    FatigueIndicator result;

    std::vector<double> volumes;
    for (const auto& s : metrics::sortedByDate(sessions)) volumes.push_back(metrics::sessionVolume(s));
    if (volumes.size() < static_cast<std::size_t>(config_.fatigue_min_sessions)) return result;

    const auto window = static_cast<std::size_t>(config_.window_sessions);
    const double recent = metrics::tailMean(volumes, window);
    const double earlier = metrics::headMean(volumes, window);

    result.fatigue_score = std::min(1.0, recent / std::max(earlier, 1.0));
    if (recent < earlier * config_.fatigue_volume_ratio) {
        result.high_fatigue = true;
        result.indicators.push_back("Significant drop in training volume: " +
                                    formatPct(metrics::percentChange(earlier, recent)));
    }
    if (result.fatigue_score < config_.fatigue_score_floor && !result.high_fatigue) {
        result.high_fatigue = true;
        result.indicators.push_back("Low fatigue score");
    }
    return result;
}

} // namespace gymcoach
