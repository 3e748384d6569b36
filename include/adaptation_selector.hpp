/**
 * @file adaptation_selector.hpp
 * @brief Ordered decision table mapping analysis results to a training directive
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * Rules are evaluated in order and the first match wins:
 *   1. plateau detected            -> break_plateau
 *   2. strength declining          -> reduce_load
 *   3. strength improving and
 *      consistency at or above gate -> progressive_overload
 *   4. high fatigue                -> recovery_focus
 *   5. consistency below gate      -> simplify
 *   6. otherwise                   -> maintain
 */
#ifndef GYMCOACH_ADAPTATION_SELECTOR_HPP
#define GYMCOACH_ADAPTATION_SELECTOR_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include "gc_logger.hpp"
#include <vector>
#include <string>
#include <functional>
#include <cmath>
#include <algorithm>

namespace gymcoach {

/// Consistency used when the history is too short to score it.
constexpr double NEUTRAL_CONSISTENCY = 0.5;

/**
 * @struct AdaptationInputs
 * @brief Everything a rule may look at
 */
struct AdaptationInputs {
    const TrendReport& trends;
    const std::vector<PlateauRecord>& plateaus;
    const RiskAssessment& risk;
    const UserProfile& profile;

    [[nodiscard]] double consistency() const noexcept {
        return trends.consistency.trend.hasData() ? trends.consistency.score : NEUTRAL_CONSISTENCY;
    }
};

class AdaptationSelector {
public:
    struct Rule {
        std::string name;
        std::function<bool(const AdaptationInputs&)> matches;
        std::function<AdaptationStrategy(const AdaptationInputs&)> build;
    };

    explicit AdaptationSelector(AdaptationConfig config = AdaptationConfig{})
        : config_(std::move(config)), rules_(defaultRules()) {}

    /**
     * @brief Pick exactly one strategy
     */
    [[nodiscard]] AdaptationStrategy select(const TrendReport& trends,
                                            const std::vector<PlateauRecord>& plateaus,
                                            const RiskAssessment& risk,
                                            const UserProfile& profile) const {
        const AdaptationInputs in{trends, plateaus, risk, profile};
        for (const auto& rule : rules_) {
            if (rule.matches(in)) {
                GC_LOG_DEBUG("AdaptationSelector", "Rule matched: " + rule.name);
                return rule.build(in);
            }
        }
        return makeStrategy(AdaptationAction::MAINTAIN, 0.0, 0.0, {},
                            "No adaptation signal; keep the current plan");
    }

    /**
     * @brief Fine-grained difficulty nudges from intensity, consistency and fatigue
     */
    [[nodiscard]] DifficultyAdjustment adjustDifficulty(const TrendReport& trends) const {
        DifficultyAdjustment adj;
        const double intensity = trends.intensity.average_intensity;
        const double consistency = trends.consistency.trend.hasData() ? trends.consistency.score
                                                                      : NEUTRAL_CONSISTENCY;
        const double fatigue = trends.fatigue.fatigue_score;

        if (trends.intensity.window.trend.sample_count > 0) {
            if (intensity > config_.difficulty_intensity_high) {
                adj.intensity_change = -0.1;
                adj.reasons.push_back("High intensity detected - reducing intensity");
            } else if (intensity < config_.difficulty_intensity_low) {
                adj.intensity_change = 0.1;
                adj.reasons.push_back("Low intensity detected - increasing intensity");
            }
        }

        if (consistency < config_.consistency_simplify) {
            adj.volume_change = -0.2;
            adj.complexity_change = -0.3;
            adj.reasons.push_back("Low consistency - simplifying workout");
        } else if (consistency > config_.difficulty_consistency_high) {
            adj.volume_change = 0.1;
            adj.reasons.push_back("High consistency - increasing volume");
        }

        if (fatigue > config_.difficulty_fatigue_score) {
            adj.intensity_change = -0.15;
            adj.volume_change = -0.2;
            adj.reasons.push_back("High fatigue detected - reducing load");
        }
        return adj;
    }

    /**
     * @brief Preview of the plan with the strategy's multipliers applied
     *
     * Weights scale by (1 + intensity_delta) and stay at least 1 kg when loaded;
     * sets scale by (1 + volume_delta), rounded, at least 1. The input is not modified.
     */
    [[nodiscard]] static WorkoutPlan applyToPlan(const WorkoutPlan& plan, const AdaptationStrategy& strategy) {
        WorkoutPlan adapted = plan;
        const double intensity = 1.0 + strategy.intensity_delta;
        const double vol = 1.0 + strategy.volume_delta;
        for (auto& ex : adapted.exercises) {
            if (ex.weight > 0.0) ex.weight = std::max(1.0, ex.weight * intensity);
            ex.sets = std::max(1, static_cast<int>(std::lround(std::max(ex.sets, 1) * vol)));
        }
        return adapted;
    }

    [[nodiscard]] static PeriodizationPhase phaseFor(AdaptationAction action) noexcept {
        switch (action) {
            case AdaptationAction::PROGRESSIVE_OVERLOAD: return PeriodizationPhase::ACCUMULATION;
            case AdaptationAction::BREAK_PLATEAU: return PeriodizationPhase::INTENSIFICATION;
            case AdaptationAction::RECOVERY_FOCUS: return PeriodizationPhase::DELOAD;
            default: return PeriodizationPhase::MAINTENANCE;
        }
    }

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }
    [[nodiscard]] const AdaptationConfig& config() const noexcept { return config_; }

private:
    static AdaptationStrategy makeStrategy(AdaptationAction action, double intensity, double volume,
                                           std::vector<std::string> secondary, std::string rationale) {
        AdaptationStrategy s;
        s.primary_action = action;
        s.intensity_delta = intensity;
        s.volume_delta = volume;
        s.secondary_actions = std::move(secondary);
        s.phase = phaseFor(action);
        s.rationale = std::move(rationale);
        return s;
    }

    std::vector<Rule> defaultRules() const {
        const AdaptationConfig c = config_;
        return {
            {"plateau",
             [](const AdaptationInputs& in) { return !in.plateaus.empty(); },
             [c](const AdaptationInputs& in) {
                 return makeStrategy(AdaptationAction::BREAK_PLATEAU, c.plateau_intensity, 0.0,
                                     {"change_exercises", "adjust_intensity"},
                                     std::to_string(in.plateaus.size()) + " exercise(s) have stalled");
             }},
            {"declining_strength",
             [](const AdaptationInputs& in) {
                 return in.trends.strength.overall.direction == TrendDirection::DECLINING;
             },
             [c](const AdaptationInputs&) {
                 return makeStrategy(AdaptationAction::REDUCE_LOAD, c.reduce_intensity, c.reduce_volume,
                                     {"deload_week"}, "Strength is declining; reduce load to recover");
             }},
            {"improving_and_consistent",
             [c](const AdaptationInputs& in) {
                 return in.trends.strength.overall.direction == TrendDirection::IMPROVING &&
                        in.consistency() >= c.consistency_overload;
             },
             [c](const AdaptationInputs&) {
                 return makeStrategy(AdaptationAction::PROGRESSIVE_OVERLOAD, c.overload_intensity,
                                     c.overload_volume, {"increase_intensity"},
                                     "Strength is improving with consistent training");
             }},
            {"high_fatigue",
             [](const AdaptationInputs& in) { return in.trends.fatigue.high_fatigue; },
             [c](const AdaptationInputs&) {
                 return makeStrategy(AdaptationAction::RECOVERY_FOCUS, 0.0, c.recovery_volume,
                                     {"reduce_volume", "increase_rest"},
                                     "Fatigue indicators are high; prioritise recovery");
             }},
            {"low_consistency",
             [c](const AdaptationInputs& in) { return in.consistency() < c.consistency_simplify; },
             [c](const AdaptationInputs&) {
                 return makeStrategy(AdaptationAction::SIMPLIFY, 0.0, c.simplify_volume,
                                     {"reduce_complexity", "focus_fundamentals"},
                                     "Training is irregular; simplify to rebuild the habit");
             }},
        };
    }

    AdaptationConfig config_;
    std::vector<Rule> rules_;
};

} // namespace gymcoach

#endif // GYMCOACH_ADAPTATION_SELECTOR_HPP
