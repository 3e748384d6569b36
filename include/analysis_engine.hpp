/**
 * @file analysis_engine.hpp
 * @brief Per-user analysis orchestration
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * The AnalysisEngine owns one instance of each analyzer, all configured from
 * a single AnalyticsConfig, and a ThreadPool. For one user it runs:
 * - Trend analysis
 * - Anomaly detection
 * - Plateau detection
 * - Injury and monitoring risk
 * concurrently over a private copy of the history, then feeds the results to
 * the adaptation selector and the progress monitor.
 */
#ifndef GYMCOACH_ANALYSIS_ENGINE_HPP
#define GYMCOACH_ANALYSIS_ENGINE_HPP

#include "gc_types.hpp"
#include "gc_config.hpp"
#include "gc_json.hpp"
#include "gc_time_utils.hpp"
#include "result.hpp"
#include "thread_pool.hpp"
#include "trend_analyzer.hpp"
#include "anomaly_detector.hpp"
#include "plateau_detector.hpp"
#include "risk_assessor.hpp"
#include "adaptation_selector.hpp"
#include "progress_monitor.hpp"
#include "history_repository.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gymcoach {

class AnalysisEngine {
public:
    explicit AnalysisEngine(AnalyticsConfig config = AnalyticsConfig{});
    ~AnalysisEngine();

    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    /**
     * @brief Validate @p config and build an engine from it
     * @return CONFIG_INVALID listing every offending field
     */
    [[nodiscard]] static Result<std::unique_ptr<AnalysisEngine>> create(AnalyticsConfig config);

    //=========================================================================
    // Single-step operations
    //=========================================================================

    [[nodiscard]] std::vector<TrendResult> analyzeTrends(const TrainingHistory& history,
                                                         GoalDirection goal = GoalDirection::LOSE_WEIGHT) const;
    [[nodiscard]] std::vector<AnomalyRecord> detectAnomalies(const TrainingHistory& history) const;
    [[nodiscard]] std::vector<PlateauRecord> detectPlateaus(const TrainingHistory& history) const;
    [[nodiscard]] RiskAssessment assessRisk(const UserProfile& profile, const TrainingHistory& history,
                                            const WorkoutPlan& plan = WorkoutPlan{}) const;
    [[nodiscard]] AdaptationStrategy selectAdaptation(const TrendReport& trends,
                                                      const std::vector<PlateauRecord>& plateaus,
                                                      const RiskAssessment& risk,
                                                      const UserProfile& profile) const;

    //=========================================================================
    // Full analysis
    //=========================================================================

    /**
     * @brief Run every analyzer for one user and pick the adaptation
     * @param now Reference time for days-since-last-workout and the report stamp
     * @return INVALID_ARGUMENT for an empty user id, INSUFFICIENT_DATA when
     *         the history holds no records at all, INTERNAL_ERROR if a worker fails
     */
    [[nodiscard]] Result<AnalysisReport> analyzeUser(const UserProfile& profile,
                                                     const TrainingHistory& history,
                                                     const WorkoutPlan& plan,
                                                     time_utils::TimePoint now) const;

    /**
     * @brief Analyse several users in parallel, one pool task per user
     *
     * Each user's analyzers run sequentially inside its task, so a batch never
     * waits on jobs queued behind itself. Failures are reported per user.
     */
    [[nodiscard]] std::map<std::string, Result<AnalysisReport>> analyzeUsers(
        const HistoryRepository& repo, const std::vector<std::string>& userIds,
        int windowDays, time_utils::TimePoint now) const;

    [[nodiscard]] static json::JsonValue reportToJson(const AnalysisReport& report);

    [[nodiscard]] const AnalyticsConfig& config() const noexcept { return config_; }
    [[nodiscard]] size_t workerCount() const { return pool_->threadCount(); }

private:
    struct AnalyzerOutputs {
        TrendReport trends;
        std::vector<AnomalyRecord> anomalies;
        std::vector<PlateauRecord> plateaus;
        RiskAssessment injury_risk;
        RiskAssessment monitoring_risk;
    };

    [[nodiscard]] Result<AnalysisReport> runAnalysis(const UserProfile& profile,
                                                     const TrainingHistory& history,
                                                     const WorkoutPlan& plan,
                                                     time_utils::TimePoint now,
                                                     bool parallel) const;
    [[nodiscard]] AnalyzerOutputs runSequential(const UserProfile& profile, const TrainingHistory& history,
                                                const WorkoutPlan& plan) const;
    [[nodiscard]] Result<AnalyzerOutputs> runParallel(const UserProfile& profile, const TrainingHistory& history,
                                                      const WorkoutPlan& plan) const;
    [[nodiscard]] Result<AnalysisReport> analyzeFromRepository(const HistoryRepository& repo,
                                                               const std::string& userId,
                                                               int windowDays,
                                                               time_utils::TimePoint now) const;

    AnalyticsConfig config_;
    TrendAnalyzer trends_;
    AnomalyDetector anomalies_;
    PlateauDetector plateaus_;
    RiskAssessor risk_;
    AdaptationSelector selector_;
    ProgressMonitor monitor_;
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace gymcoach

#endif // GYMCOACH_ANALYSIS_ENGINE_HPP
