/**
 * @file risk_assessor.hpp
 * @brief Composite injury-risk scoring
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * Two variants are provided:
 * - assess(): eight weighted factors over history, profile and upcoming plan
 * - assessMonitoringRisk(): the lighter check used for ongoing monitoring
 *
 * Each factor is an additive rule table clamped to [0, 1].
 */
#ifndef GYMCOACH_RISK_ASSESSOR_HPP
#define GYMCOACH_RISK_ASSESSOR_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include <vector>

namespace gymcoach {

class RiskAssessor {
public:
    explicit RiskAssessor(RiskConfig config = RiskConfig{}) : config_(std::move(config)) {}

    /**
     * @brief Injury-risk composite
     * @param profile User profile (experience, equipment, injuries, age)
     * @param history Windowed training history
     * @param plan Upcoming plan; may be empty
     */
    [[nodiscard]] RiskAssessment assess(const UserProfile& profile, const TrainingHistory& history,
                                        const WorkoutPlan& plan = WorkoutPlan{}) const;

    /**
     * @brief Monitoring-variant risk: frequency with intensity, weekly volume jumps,
     *        injury history and age
     */
    [[nodiscard]] RiskAssessment assessMonitoringRisk(const UserProfile& profile,
                                                      const TrainingHistory& history) const;

    // Individual factors, exposed for inspection and testing
    [[nodiscard]] RiskFactorScore trainingLoadRisk(const std::vector<WorkoutSession>& sorted,
                                                   const WorkoutPlan& plan) const;
    [[nodiscard]] RiskFactorScore movementPatternRisk(const std::vector<WorkoutSession>& sorted) const;
    [[nodiscard]] RiskFactorScore fatigueRisk(const std::vector<WorkoutSession>& sorted) const;
    [[nodiscard]] RiskFactorScore imbalanceRisk(const std::vector<WorkoutSession>& sorted) const;
    [[nodiscard]] RiskFactorScore progressionRisk(const std::vector<WorkoutSession>& sorted,
                                                  const WorkoutPlan& plan) const;
    [[nodiscard]] RiskFactorScore equipmentRisk(const UserProfile& profile, const WorkoutPlan& plan) const;
    [[nodiscard]] RiskFactorScore injuryHistoryRisk(const UserProfile& profile) const;
    [[nodiscard]] RiskFactorScore ageFitnessRisk(const UserProfile& profile,
                                                 const std::vector<BodyMeasurement>& measurements) const;

    [[nodiscard]] RiskLevel levelFor(double score) const noexcept;
    [[nodiscard]] RiskLevel monitoringLevelFor(double score) const noexcept;

    [[nodiscard]] const RiskConfig& config() const noexcept { return config_; }

private:
    RiskFactorScore makeScore(RiskFactor factor, double score, std::vector<std::string> reasons) const;

    RiskConfig config_;
};

} // namespace gymcoach

#endif // GYMCOACH_RISK_ASSESSOR_HPP
