/**
 * @file risk_assessor.cpp
 * @brief Injury-risk factor tables and composite scoring
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "risk_assessor.hpp"
#include "metric_primitives.hpp"
#include "gc_logger.hpp"
#include "gc_time_utils.hpp"
#include <map>
#include <set>
#include <vector>
#include <optional>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace gymcoach {

namespace {

using Keywords = std::vector<const char*>;

bool containsAny(const std::string& text, const Keywords& words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

enum class Movement { NONE, KNEE, HIP, PUSH, PULL };

Movement classifyMovement(const std::string& name) {
    if (containsAny(name, {"squat", "lunge", "leg press"})) return Movement::KNEE;
    if (containsAny(name, {"deadlift", "hip thrust", "romanian"})) return Movement::HIP;
    if (containsAny(name, {"press", "push", "bench"})) return Movement::PUSH;
    if (containsAny(name, {"pull", "row", "lat"})) return Movement::PULL;
    return Movement::NONE;
}

// Order matters: the first matching group wins
const std::vector<std::pair<std::string, Keywords>> MUSCLE_GROUPS = {
    {"chest", {"chest", "bench", "press"}},
    {"back", {"back", "row", "pull", "lat"}},
    {"shoulders", {"shoulder", "deltoid", "overhead"}},
    {"biceps", {"bicep", "curl"}},
    {"triceps", {"tricep", "extension"}},
    {"quads", {"quad", "squat", "leg press"}},
    {"hamstrings", {"hamstring", "deadlift", "romanian"}},
    {"glutes", {"glute", "hip", "thrust"}},
};

double sessionsPerWeek(const std::vector<WorkoutSession>& sorted) {
    if (sorted.empty()) return 0.0;
    auto first = time_utils::parseISO8601(sorted.front().date);
    auto last = time_utils::parseISO8601(sorted.back().date);
    if (!first || !last) return 0.0;
    const double span = static_cast<double>(time_utils::wholeDaysBetween(*first, *last));
    return static_cast<double>(sorted.size()) / std::max(span / 7.0, 1.0);
}

} // namespace

RiskFactorScore RiskAssessor::makeScore(RiskFactor factor, double score, std::vector<std::string> reasons) const {
    RiskFactorScore s;
    s.factor = factor;
    s.score = metrics::clamp01(score);
    s.weight = config_.weight(factor);
    s.reasons = std::move(reasons);
    return s;
}

RiskLevel RiskAssessor::levelFor(double score) const noexcept {
    if (score >= config_.high_cutoff) return RiskLevel::HIGH;
    if (score >= config_.medium_cutoff) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

RiskLevel RiskAssessor::monitoringLevelFor(double score) const noexcept {
    if (score >= config_.monitor_high_cutoff) return RiskLevel::HIGH;
    if (score >= config_.monitor_medium_cutoff) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

//=============================================================================
// Composite
//=============================================================================

RiskAssessment RiskAssessor::assess(const UserProfile& profile, const TrainingHistory& history,
                                    const WorkoutPlan& plan) const {
    const auto sorted = metrics::sortedByDate(history.workouts);

    RiskAssessment result;
    result.factors = {
        trainingLoadRisk(sorted, plan),
        movementPatternRisk(sorted),
        fatigueRisk(sorted),
        imbalanceRisk(sorted),
        progressionRisk(sorted, plan),
        equipmentRisk(profile, plan),
        injuryHistoryRisk(profile),
        ageFitnessRisk(profile, history.measurements),
    };

    double composite = 0.0;
    double weightSum = 0.0;
    for (const auto& f : result.factors) {
        composite += f.weight * f.score;
        weightSum += f.weight;
        result.reasons.insert(result.reasons.end(), f.reasons.begin(), f.reasons.end());
    }
    if (config_.normalize_weights && weightSum > 0.0) composite /= weightSum;

    result.overall_score = metrics::clamp01(composite);
    result.level = levelFor(result.overall_score);
    GC_LOG_DEBUG("RiskAssessor", "Injury risk " + fmt(result.overall_score) + " (" + toString(result.level) + ")");
    return result;
}

//=============================================================================
// Factors
//=============================================================================

RiskFactorScore RiskAssessor::trainingLoadRisk(const std::vector<WorkoutSession>& sorted,
                                               const WorkoutPlan& plan) const {
    if (sorted.empty()) {
        return makeScore(RiskFactor::TRAINING_LOAD, config_.load_no_history_score,
                         {"Insufficient training history"});
    }

    const auto window = std::min(sorted.size(), static_cast<std::size_t>(config_.load_window_sessions));
    std::vector<double> volumes;
    std::vector<double> intensities;
    for (auto it = sorted.end() - static_cast<std::ptrdiff_t>(window); it != sorted.end(); ++it) {
        volumes.push_back(metrics::sessionVolume(*it));
        if (auto i = metrics::sessionIntensity(*it)) intensities.push_back(*i);
    }

    double planned = 0.0;
    for (const auto& ex : plan.exercises) planned += metrics::volume(ex.weight, ex.reps, ex.sets);

    const double avgVolume = metrics::mean(volumes);
    const double increase = avgVolume > 0.0 ? (planned - avgVolume) / std::max(avgVolume, 1.0) * 100.0 : 0.0;

    double score = 0.0;
    std::vector<std::string> reasons;
    if (increase > config_.load_increase_high_pct) {
        reasons.push_back("High load increase: " + fmt(increase) + "%");
        score += 0.4;
    } else if (increase > config_.load_increase_medium_pct) {
        reasons.push_back("Moderate load increase: " + fmt(increase) + "%");
        score += 0.2;
    }

    if (!intensities.empty()) {
        const double avgIntensity = metrics::mean(intensities);
        if (avgIntensity > config_.load_intensity_high) {
            reasons.push_back("High training intensity: " + fmt(avgIntensity) + "%");
            score += 0.3;
        } else if (avgIntensity > config_.load_intensity_medium) {
            reasons.push_back("Moderate-high intensity: " + fmt(avgIntensity) + "%");
            score += 0.1;
        }
    }

    const double cv = metrics::sampleStdDev(volumes) / std::max(avgVolume, 1.0);
    if (cv > config_.load_volume_cv) {
        reasons.push_back("Inconsistent training volume");
        score += 0.2;
    }
    return makeScore(RiskFactor::TRAINING_LOAD, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::movementPatternRisk(const std::vector<WorkoutSession>& sorted) const {
    std::set<std::string> distinct;
    int knee = 0, hip = 0, push = 0, pull = 0;
    for (const auto& s : sorted) {
        for (const auto& ex : s.exercises) {
            const auto name = metrics::lowercase(ex.exercise_name);
            distinct.insert(name);
            switch (classifyMovement(name)) {
                case Movement::KNEE: ++knee; break;
                case Movement::HIP: ++hip; break;
                case Movement::PUSH: ++push; break;
                case Movement::PULL: ++pull; break;
                case Movement::NONE: break;
            }
        }
    }

    double score = 0.0;
    std::vector<std::string> reasons;
    const int classified = knee + hip + push + pull;
    if (push + pull > 0) {
        const double ratio = static_cast<double>(push) / std::max(pull, 1);
        if (ratio > config_.push_pull_high_ratio) {
            reasons.push_back("Push/pull imbalance (too much pushing)");
            score += 0.3;
        } else if (ratio < config_.push_pull_low_ratio) {
            reasons.push_back("Push/pull imbalance (too much pulling)");
            score += 0.3;
        }
    }
    if (classified > 0 && static_cast<double>(knee) / std::max(hip, 1) > config_.knee_hip_ratio) {
        reasons.push_back("Knee/hip dominant imbalance");
        score += 0.2;
    }
    if (distinct.size() < static_cast<std::size_t>(config_.variety_min_exercises) &&
        classified > config_.variety_min_patterns) {
        reasons.push_back("Limited exercise variety");
        score += 0.2;
    }
    for (const auto& name : distinct) {
        if (containsAny(name, {"overhead", "snatch", "clean", "jerk", "plyometric"})) {
            reasons.push_back("High-risk exercise: " + name);
            score += 0.1;
        }
    }
    return makeScore(RiskFactor::MOVEMENT_PATTERN, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::fatigueRisk(const std::vector<WorkoutSession>& sorted) const {
    if (sorted.size() < static_cast<std::size_t>(config_.fatigue_min_sessions)) {
        return makeScore(RiskFactor::FATIGUE, config_.fatigue_insufficient_score, {"Insufficient data"});
    }

    const std::size_t mid = sorted.size() / 2;
    std::vector<double> earlier, recent;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        (i < mid ? earlier : recent).push_back(metrics::sessionVolume(sorted[i]));
    }

    double score = 0.0;
    std::vector<std::string> reasons;
    const double earlierAvg = metrics::mean(earlier);
    const double drop = (earlierAvg - metrics::mean(recent)) / std::max(earlierAvg, 1.0) * 100.0;
    if (drop > config_.fatigue_drop_high_pct) {
        reasons.push_back("Significant performance decline: " + fmt(drop) + "%");
        score += 0.5;
    } else if (drop > config_.fatigue_drop_medium_pct) {
        reasons.push_back("Moderate performance decline: " + fmt(drop) + "%");
        score += 0.3;
    }

    const double frequency = sessionsPerWeek(sorted);
    if (frequency > config_.frequency_high_per_week) {
        reasons.push_back("Very high training frequency: " + fmt(frequency) + " workouts/week");
        score += 0.4;
    } else if (frequency > config_.frequency_medium_per_week) {
        reasons.push_back("High training frequency: " + fmt(frequency) + " workouts/week");
        score += 0.2;
    }
    return makeScore(RiskFactor::FATIGUE, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::imbalanceRisk(const std::vector<WorkoutSession>& sorted) const {
    std::map<std::string, int> groups;
    for (const auto& [group, words] : MUSCLE_GROUPS) groups[group] = 0;

    for (const auto& s : sorted) {
        for (const auto& ex : s.exercises) {
            const auto name = metrics::lowercase(ex.exercise_name);
            for (const auto& [group, words] : MUSCLE_GROUPS) {
                if (containsAny(name, words)) {
                    ++groups[group];
                    break;
                }
            }
        }
    }

    double score = 0.0;
    std::vector<std::string> reasons;
    if (groups["chest"] > groups["back"] * 1.5) {
        reasons.push_back("Chest/back imbalance (rounded shoulders risk)");
        score += 0.3;
    }
    if (groups["quads"] > groups["hamstrings"] * 2) {
        reasons.push_back("Quad/hamstring imbalance (knee injury risk)");
        score += 0.3;
    }
    if (groups["biceps"] > groups["triceps"] * 1.5) {
        reasons.push_back("Bicep/tricep imbalance");
        score += 0.2;
    }

    int total = 0;
    for (const auto& [group, count] : groups) total += count;
    if (total > 10) {
        for (const auto& [group, count] : groups) {
            if (count == 0) {
                reasons.push_back("Neglected muscle group: " + group);
                score += 0.1;
            }
        }
    }
    return makeScore(RiskFactor::IMBALANCE, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::progressionRisk(const std::vector<WorkoutSession>& sorted,
                                              const WorkoutPlan& plan) const {
    struct Point {
        time_utils::TimePoint when;
        double one_rep_max;
        double weight;
    };
    std::map<std::string, std::vector<Point>> byExercise;
    for (const auto& s : sorted) {
        for (const auto& ex : s.exercises) {
            auto orm = metrics::estimatedOneRepMax(ex.weight, ex.reps);
            auto when = time_utils::parseISO8601(s.dateOf(ex));
            if (!orm || !when) continue;
            byExercise[metrics::lowercase(ex.exercise_name)].push_back({*when, *orm, ex.weight});
        }
    }

    double score = 0.0;
    std::vector<std::string> reasons;
    for (auto& [name, points] : byExercise) {
        std::stable_sort(points.begin(), points.end(),
                         [](const Point& a, const Point& b) { return a.when < b.when; });
        if (points.size() < 3) continue;
        const int64_t span = time_utils::wholeDaysBetween(points.front().when, points.back().when);
        if (span <= 0) continue;
        const double weekly = (points.back().one_rep_max - points.front().one_rep_max) /
                              points.front().one_rep_max * 100.0 / (static_cast<double>(span) / 7.0);
        if (weekly > config_.progression_fast_pct) {
            reasons.push_back("Rapid progression in " + name + ": " + fmt(weekly) + "% per week");
            score += 0.4;
        } else if (weekly > config_.progression_moderate_pct) {
            reasons.push_back("Fast progression in " + name + ": " + fmt(weekly) + "% per week");
            score += 0.2;
        }
    }

    for (const auto& ex : plan.exercises) {
        const auto name = metrics::lowercase(ex.name);
        auto it = byExercise.find(name);
        if (it == byExercise.end() || it->second.empty()) continue;

        const auto& points = it->second;
        const std::size_t n = std::min<std::size_t>(3, points.size());
        double sum = 0.0;
        for (std::size_t i = points.size() - n; i < points.size(); ++i) sum += points[i].weight;
        const double recentAvg = sum / static_cast<double>(n);
        const double jump = (ex.weight - recentAvg) / std::max(recentAvg, 1.0) * 100.0;
        if (jump > config_.planned_jump_high_pct) {
            reasons.push_back("Large weight jump in " + name + ": " + fmt(jump) + "%");
            score += 0.3;
        } else if (jump > config_.planned_jump_medium_pct) {
            reasons.push_back("Moderate weight jump in " + name + ": " + fmt(jump) + "%");
            score += 0.1;
        }
    }
    return makeScore(RiskFactor::PROGRESSION, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::equipmentRisk(const UserProfile& profile, const WorkoutPlan& plan) const {
    std::set<std::string> available;
    for (const auto& e : profile.equipment) available.insert(metrics::lowercase(e));

    double score = 0.0;
    std::vector<std::string> reasons;
    for (const auto& ex : plan.exercises) {
        const auto required = ex.equipment.empty() ? std::string("bodyweight") : metrics::lowercase(ex.equipment);
        if (required != "bodyweight" && available.count(required) == 0) {
            reasons.push_back("Missing equipment for " + ex.name + ": " + required);
            score += 0.2;
        }
    }

    for (const auto& ex : plan.exercises) {
        const auto name = metrics::lowercase(ex.name);
        if (!containsAny(name, {"barbell", "dumbbell", "kettlebell"}) || !(ex.weight > 0.0)) continue;
        if (profile.experience_level == ExperienceLevel::BEGINNER &&
            ex.weight > config_.beginner_max_free_weight) {
            reasons.push_back("High weight for beginner: " + fmt(ex.weight) + "kg in " + ex.name);
            score += 0.3;
        } else if (profile.experience_level == ExperienceLevel::INTERMEDIATE &&
                   ex.weight > config_.intermediate_max_free_weight) {
            reasons.push_back("Very high weight for intermediate: " + fmt(ex.weight) + "kg in " + ex.name);
            score += 0.2;
        }
    }
    return makeScore(RiskFactor::EQUIPMENT, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::injuryHistoryRisk(const UserProfile& profile) const {
    double score = 0.0;
    std::vector<std::string> reasons;
    if (!profile.injury_history.empty()) {
        std::string joined;
        for (const auto& injury : profile.injury_history) {
            if (!joined.empty()) joined += ", ";
            joined += injury;
        }
        reasons.push_back("Previous injuries/limitations: " + joined);
        score += 0.4;

        for (const auto& injury : profile.injury_history) {
            if (containsAny(metrics::lowercase(injury), {"back", "spine", "knee", "shoulder", "neck"})) {
                reasons.push_back("High-risk injury history: " + injury);
                score += 0.2;
            }
        }
    }
    return makeScore(RiskFactor::INJURY_HISTORY, score, std::move(reasons));
}

RiskFactorScore RiskAssessor::ageFitnessRisk(const UserProfile& profile,
                                             const std::vector<BodyMeasurement>& measurements) const {
    double score = 0.0;
    std::vector<std::string> reasons;

    if (profile.age) {
        if (*profile.age > config_.senior_age) {
            reasons.push_back("Age-related risk: " + std::to_string(*profile.age) + " years old");
            score += 0.2;
        } else if (*profile.age > config_.middle_age) {
            reasons.push_back("Moderate age-related risk: " + std::to_string(*profile.age) + " years old");
            score += 0.1;
        }
    }

    if (profile.experience_level == ExperienceLevel::BEGINNER) {
        reasons.push_back("Beginner level - higher injury risk");
        score += 0.3;
    } else if (profile.experience_level == ExperienceLevel::INTERMEDIATE) {
        reasons.push_back("Intermediate level - moderate risk");
        score += 0.1;
    }

    // Latest weight, with the most recent height recorded up to that point
    std::vector<std::pair<time_utils::TimePoint, const BodyMeasurement*>> dated;
    for (const auto& m : measurements) {
        if (auto when = time_utils::parseISO8601(m.date)) dated.emplace_back(*when, &m);
    }
    std::stable_sort(dated.begin(), dated.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    if (!dated.empty()) {
        const double weight = dated.back().second->weight;
        std::optional<double> height;
        for (auto it = dated.rbegin(); it != dated.rend() && !height; ++it) {
            if (it->second->height_cm && *it->second->height_cm > 0.0) height = it->second->height_cm;
        }
        if (weight > 0.0 && height) {
            const double meters = *height / 100.0;
            const double bmi = weight / (meters * meters);
            if (bmi > config_.obese_bmi) {
                reasons.push_back("High BMI risk: " + fmt(bmi));
                score += 0.2;
            } else if (bmi > config_.overweight_bmi) {
                reasons.push_back("Moderate BMI risk: " + fmt(bmi));
                score += 0.1;
            }
        }
    }
    return makeScore(RiskFactor::AGE_FITNESS, score, std::move(reasons));
}

//=============================================================================
// Monitoring Variant
//=============================================================================

RiskAssessment RiskAssessor::assessMonitoringRisk(const UserProfile& profile,
                                                  const TrainingHistory& history) const {
    const auto sorted = metrics::sortedByDate(history.workouts);
    RiskAssessment result;
    double score = 0.0;

    if (!sorted.empty()) {
        std::vector<double> intensities;
        for (const auto& s : sorted) {
            if (auto i = metrics::sessionIntensity(s)) intensities.push_back(*i);
        }
        const double perWeek = sessionsPerWeek(sorted);
        const double avgIntensity = metrics::mean(intensities);
        if (perWeek > config_.monitor_frequency_per_week && avgIntensity > config_.monitor_intensity) {
            result.reasons.push_back("High training volume and intensity");
            score += 0.3;
        }

        if (sorted.size() >= static_cast<std::size_t>(config_.monitor_min_sessions)) {
            // Keyed by ISO week so consecutive entries are consecutive calendar weeks with training
            std::map<time_utils::IsoWeek, double> weekly;
            for (const auto& s : sorted) {
                auto when = time_utils::parseISO8601(s.date);
                weekly[time_utils::isoWeek(*when)] += metrics::sessionVolume(s);
            }
            double previous = -1.0;
            for (const auto& [week, vol] : weekly) {
                if (previous >= 0.0 && vol > previous * config_.monitor_weekly_jump_ratio) {
                    result.reasons.push_back("Sudden increase in training volume");
                    score += 0.2;
                    break;
                }
                previous = vol;
            }
        }
    }

    if (!profile.injury_history.empty()) {
        std::string joined;
        for (const auto& injury : profile.injury_history) {
            if (!joined.empty()) joined += ", ";
            joined += injury;
        }
        result.reasons.push_back("Previous injuries: " + joined);
        score += 0.2;
    }
    if (profile.age && *profile.age > config_.senior_age) {
        result.reasons.push_back("Age-related injury risk");
        score += 0.1;
    }

    result.overall_score = metrics::clamp01(score);
    result.level = monitoringLevelFor(result.overall_score);
    return result;
}

} // namespace gymcoach
