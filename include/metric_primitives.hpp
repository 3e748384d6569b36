/**
 * @file metric_primitives.hpp
 * @brief Pure numeric helpers shared by every analyzer
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */
#ifndef GYMCOACH_METRIC_PRIMITIVES_HPP
#define GYMCOACH_METRIC_PRIMITIVES_HPP

#include "gc_types.hpp"
#include "gc_time_utils.hpp"
#include <vector>
#include <string>
#include <optional>
#include <algorithm>
#include <numeric>
#include <cmath>
#include <cctype>

namespace gymcoach {
namespace metrics {

/// Upper bound on |percent| outputs unless configured otherwise.
constexpr double DEFAULT_MAX_PERCENT = 1000.0;

//=============================================================================
// Statistics
//=============================================================================

[[nodiscard]] inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

/**
 * @brief Sample standard deviation (n-1 denominator)
 * @return 0 when fewer than two values are supplied
 */
[[nodiscard]] inline double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - m) * (v - m);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

[[nodiscard]] inline double coefficientOfVariation(const std::vector<double>& values) {
    const double m = mean(values);
    if (m <= 0.0) return 0.0;
    return sampleStdDev(values) / m;
}

[[nodiscard]] inline double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

[[nodiscard]] inline double clampPercent(double v, double limit = DEFAULT_MAX_PERCENT) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, -limit, limit);
}

/**
 * @brief Percent change from @p from to @p to
 *
 * A non-positive baseline has no meaningful ratio and yields 0.
 */
[[nodiscard]] inline double percentChange(double from, double to, double limit = DEFAULT_MAX_PERCENT) {
    if (from <= 0.0) return 0.0;
    return clampPercent((to - from) / from * 100.0, limit);
}

//=============================================================================
// Per-Record Metrics
//=============================================================================

/**
 * @brief Epley-style estimated one-rep max: weight * (1 + reps / 30)
 * @return nullopt for non-positive weight or reps
 */
[[nodiscard]] inline std::optional<double> estimatedOneRepMax(double weight, int reps) {
    if (!(weight > 0.0) || reps <= 0 || !std::isfinite(weight)) return std::nullopt;
    return weight * (1.0 + static_cast<double>(reps) / 30.0);
}

/// Working weight as a percentage of the estimated 1RM.
[[nodiscard]] inline std::optional<double> intensityPercent(double weight, int reps) {
    auto orm = estimatedOneRepMax(weight, reps);
    if (!orm) return std::nullopt;
    return weight / *orm * 100.0;
}

[[nodiscard]] inline double volume(double weight, int reps, int sets = 1) {
    if (!(weight > 0.0) || reps <= 0 || !std::isfinite(weight)) return 0.0;
    return weight * reps * std::max(sets, 1);
}

[[nodiscard]] inline double sessionVolume(const WorkoutSession& session) {
    double total = 0.0;
    for (const auto& ex : session.exercises) total += volume(ex.weight, ex.reps, ex.sets);
    return total;
}

/**
 * @brief Mean intensity over the session's valid records
 */
[[nodiscard]] inline std::optional<double> sessionIntensity(const WorkoutSession& session) {
    std::vector<double> values;
    for (const auto& ex : session.exercises) {
        if (auto i = intensityPercent(ex.weight, ex.reps)) values.push_back(*i);
    }
    if (values.empty()) return std::nullopt;
    return mean(values);
}

//=============================================================================
// Calendar Metrics
//=============================================================================

/// Whole days from @p from to @p to; nullopt if either date is unparsable.
[[nodiscard]] inline std::optional<int64_t> daysBetween(const std::string& from, const std::string& to) {
    return time_utils::daysBetween(from, to);
}

/**
 * @brief Sessions ordered by parsed date; unparsable dates are dropped
 */
[[nodiscard]] inline std::vector<WorkoutSession> sortedByDate(const std::vector<WorkoutSession>& sessions) {
    std::vector<std::pair<time_utils::TimePoint, const WorkoutSession*>> dated;
    dated.reserve(sessions.size());
    for (const auto& s : sessions) {
        if (auto tp = time_utils::parseISO8601(s.date)) dated.emplace_back(*tp, &s);
    }
    std::stable_sort(dated.begin(), dated.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<WorkoutSession> out;
    out.reserve(dated.size());
    for (const auto& [tp, s] : dated) out.push_back(*s);
    return out;
}

/**
 * @brief Whole-day gaps between consecutive dated sessions
 */
[[nodiscard]] inline std::vector<double> workoutGaps(const std::vector<WorkoutSession>& sessions) {
    std::vector<time_utils::TimePoint> dates;
    for (const auto& s : sessions) {
        if (auto tp = time_utils::parseISO8601(s.date)) dates.push_back(*tp);
    }
    std::sort(dates.begin(), dates.end());
    std::vector<double> gaps;
    for (std::size_t i = 1; i < dates.size(); ++i) {
        gaps.push_back(static_cast<double>(time_utils::wholeDaysBetween(dates[i - 1], dates[i])));
    }
    return gaps;
}

/**
 * @brief Regularity of training: max(0, 1 - stddev(gaps) / max(mean(gaps), 1))
 * @return 0 for an empty gap list
 */
[[nodiscard]] inline double consistencyScore(const std::vector<double>& gapsDays) {
    if (gapsDays.empty()) return 0.0;
    const double m = mean(gapsDays);
    return clamp01(1.0 - sampleStdDev(gapsDays) / std::max(m, 1.0));
}

/// Lowercased copy; exercise names are compared case-insensitively.
[[nodiscard]] inline std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// Mean of the last @p n values (or all of them when fewer).
[[nodiscard]] inline double tailMean(const std::vector<double>& values, std::size_t n) {
    if (values.empty()) return 0.0;
    n = std::min(n, values.size());
    return mean(std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(n), values.end()));
}

[[nodiscard]] inline double headMean(const std::vector<double>& values, std::size_t n) {
    if (values.empty()) return 0.0;
    n = std::min(n, values.size());
    return mean(std::vector<double>(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(n)));
}

} // namespace metrics
} // namespace gymcoach

#endif // GYMCOACH_METRIC_PRIMITIVES_HPP
