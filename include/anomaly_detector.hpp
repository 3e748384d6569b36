/**
 * @file anomaly_detector.hpp
 * @brief Statistical outlier detection over training channels
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * Channels:
 * - volume: per-session volume, two-sided sigma bands
 * - intensity: per-session mean intensity, two-sided sigma bands
 * - consistency: gaps between sessions, long gaps only
 * - progression: weekly estimated-1RM change against fixed bands
 */
#ifndef GYMCOACH_ANOMALY_DETECTOR_HPP
#define GYMCOACH_ANOMALY_DETECTOR_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include "metric_primitives.hpp"
#include "trend_analyzer.hpp"
#include <vector>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace gymcoach {

class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalyConfig config = AnomalyConfig{}) : config_(std::move(config)) {}

    /**
     * @brief Detect anomalies across all channels
     * @param sessions Workout history, any order
     * @param strength Per-exercise progressions for the progression channel
     */
    [[nodiscard]] std::vector<AnomalyRecord> detect(const std::vector<WorkoutSession>& sessions,
                                                    const StrengthTrend& strength) const {
        const auto sorted = metrics::sortedByDate(sessions);
        std::vector<AnomalyRecord> out;

        std::vector<double> volumes;
        std::vector<double> intensities;
        for (const auto& s : sorted) {
            volumes.push_back(metrics::sessionVolume(s));
            if (auto i = metrics::sessionIntensity(s)) intensities.push_back(*i);
        }

        scanChannel(AnomalyType::VOLUME, volumes, false, out);
        scanChannel(AnomalyType::INTENSITY, intensities, false, out);
        scanChannel(AnomalyType::CONSISTENCY, metrics::workoutGaps(sorted), true, out);

        if (sorted.size() >= static_cast<std::size_t>(config_.min_data_points)) {
            scanProgression(strength, out);
        }
        return out;
    }

    /// Convenience overload computing the strength trend with default thresholds.
    [[nodiscard]] std::vector<AnomalyRecord> detect(const std::vector<WorkoutSession>& sessions) const {
        return detect(sessions, TrendAnalyzer().analyzeStrength(sessions));
    }

    /**
     * @brief Fold a detection list into a single severity in [0, 1]
     */
    [[nodiscard]] static AnomalySummary summarize(const std::vector<AnomalyRecord>& anomalies) {
        AnomalySummary s;
        for (const auto& a : anomalies) {
            if (a.severity == Severity::HIGH) ++s.high_count;
            else ++s.medium_count;
        }
        s.total = static_cast<int>(anomalies.size());
        if (s.total == 0) return s;
        s.overall_severity = s.high_count > 0 ? 0.8 + 0.1 * s.high_count
                                              : 0.3 + 0.1 * s.medium_count;
        s.overall_severity = metrics::clamp01(s.overall_severity);
        return s;
    }

    [[nodiscard]] const AnomalyConfig& config() const noexcept { return config_; }

private:
    void scanChannel(AnomalyType type, const std::vector<double>& values, bool upperOnly,
                     std::vector<AnomalyRecord>& out) const {
        if (values.size() < static_cast<std::size_t>(config_.min_data_points)) return;
        const double mu = metrics::mean(values);
        const double sigma = metrics::sampleStdDev(values);
        if (sigma <= 0.0) return;

        double low = mu - config_.medium_sigma * sigma;
        const double high = mu + config_.medium_sigma * sigma;
        if (upperOnly || type == AnomalyType::VOLUME) low = std::max(low, 0.0);

        for (std::size_t i = 0; i < values.size(); ++i) {
            const double dev = upperOnly ? values[i] - mu : std::abs(values[i] - mu);
            Severity severity;
            if (dev > config_.high_sigma * sigma) severity = Severity::HIGH;
            else if (dev > config_.medium_sigma * sigma) severity = Severity::MEDIUM;
            else continue;

            AnomalyRecord rec;
            rec.type = type;
            rec.severity = severity;
            rec.observed_value = values[i];
            rec.expected_low = low;
            rec.expected_high = high;
            rec.index = i;
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1);
            if (type == AnomalyType::CONSISTENCY) {
                oss << "Unusually long gap of " << values[i] << " days (typical " << mu << ")";
            } else {
                oss << "Session " << i << " " << toString(type) << " " << values[i]
                    << (values[i] > mu ? " above" : " below") << " typical " << mu;
            }
            rec.description = oss.str();
            out.push_back(std::move(rec));
        }
    }

    void scanProgression(const StrengthTrend& strength, std::vector<AnomalyRecord>& out) const {
        for (const auto& p : strength.progressions) {
            if (p.direction == TrendDirection::INSUFFICIENT_DATA) continue;

            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1);
            AnomalyRecord rec;
            rec.type = AnomalyType::PROGRESSION;
            rec.observed_value = p.weekly_improvement_pct;
            rec.expected_low = 0.0;
            rec.expected_high = 5.0;
            rec.reference = p.exercise_name;

            if (p.weekly_improvement_pct > config_.progression_fast_pct) {
                rec.severity = Severity::MEDIUM;
                oss << "Unusually fast progression in " << p.exercise_name << ": "
                    << p.weekly_improvement_pct << "% per week";
            } else if (p.weekly_improvement_pct < config_.progression_decline_pct) {
                rec.severity = Severity::HIGH;
                oss << "Strength decline in " << p.exercise_name << ": "
                    << p.weekly_improvement_pct << "% per week";
            } else {
                continue;
            }
            rec.description = oss.str();
            out.push_back(std::move(rec));
        }
    }

    AnomalyConfig config_;
};

} // namespace gymcoach

#endif // GYMCOACH_ANOMALY_DETECTOR_HPP
