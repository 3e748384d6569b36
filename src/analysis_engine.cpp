/**
 * @file analysis_engine.cpp
 * @brief Analysis engine implementation
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "analysis_engine.hpp"
#include "gc_serialization.hpp"
#include "gc_logger.hpp"
#include <algorithm>
#include <future>

namespace gymcoach {

namespace {

bool historyIsEmpty(const TrainingHistory& h) {
    return h.workouts.empty() && h.measurements.empty() && h.nutrition.empty();
}

template<typename T>
Result<T> joinJob(std::future<T>& job, const char* name) {
    try {
        return job.get();
    } catch (const std::exception& e) {
        GC_LOG_ERROR("AnalysisEngine", std::string(name) + " job failed: " + e.what());
        return Err<T>(ErrorCode::INTERNAL_ERROR, std::string(name) + " job failed: " + e.what());
    }
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

AnalysisEngine::AnalysisEngine(AnalyticsConfig config)
    : config_(std::move(config)),
      trends_(config_.trend),
      anomalies_(config_.anomaly),
      plateaus_(config_.plateau),
      risk_(config_.risk),
      selector_(config_.adaptation),
      monitor_(config_.monitor),
      pool_(std::make_unique<ThreadPool>(static_cast<size_t>(std::max(0, config_.engine.worker_threads)))) {
    GC_LOG_DEBUG("AnalysisEngine", "Started with " + std::to_string(pool_->threadCount()) + " worker(s)");
}

AnalysisEngine::~AnalysisEngine() {
    pool_->shutdown();
}

Result<std::unique_ptr<AnalysisEngine>> AnalysisEngine::create(AnalyticsConfig config) {
    auto valid = AnalyticsConfigValidator::validate(config);
    if (valid.isError()) return valid.error();
    return std::make_unique<AnalysisEngine>(std::move(config));
}

//=============================================================================
// Single-step operations
//=============================================================================

std::vector<TrendResult> AnalysisEngine::analyzeTrends(const TrainingHistory& history, GoalDirection goal) const {
    return trends_.analyzeTrends(history, goal);
}

std::vector<AnomalyRecord> AnalysisEngine::detectAnomalies(const TrainingHistory& history) const {
    return anomalies_.detect(history.workouts, trends_.analyzeStrength(history.workouts));
}

std::vector<PlateauRecord> AnalysisEngine::detectPlateaus(const TrainingHistory& history) const {
    return plateaus_.detect(trends_.analyzeStrength(history.workouts));
}

RiskAssessment AnalysisEngine::assessRisk(const UserProfile& profile, const TrainingHistory& history,
                                          const WorkoutPlan& plan) const {
    return risk_.assess(profile, history, plan);
}

AdaptationStrategy AnalysisEngine::selectAdaptation(const TrendReport& trends,
                                                    const std::vector<PlateauRecord>& plateaus,
                                                    const RiskAssessment& risk,
                                                    const UserProfile& profile) const {
    return selector_.select(trends, plateaus, risk, profile);
}

//=============================================================================
// Analyzer fan-out
//=============================================================================

AnalysisEngine::AnalyzerOutputs AnalysisEngine::runSequential(const UserProfile& profile,
                                                              const TrainingHistory& history,
                                                              const WorkoutPlan& plan) const {
    AnalyzerOutputs out;
    out.trends = trends_.analyze(history, profile.goal);
    out.anomalies = anomalies_.detect(history.workouts, out.trends.strength);
    out.plateaus = plateaus_.detect(out.trends.strength);
    out.injury_risk = risk_.assess(profile, history, plan);
    out.monitoring_risk = risk_.assessMonitoringRisk(profile, history);
    return out;
}

Result<AnalysisEngine::AnalyzerOutputs> AnalysisEngine::runParallel(const UserProfile& profile,
                                                                    const TrainingHistory& history,
                                                                    const WorkoutPlan& plan) const {
    // Every job shares one private snapshot of the inputs.
    auto h = std::make_shared<const TrainingHistory>(history);
    auto p = std::make_shared<const UserProfile>(profile);
    auto w = std::make_shared<const WorkoutPlan>(plan);

    auto trendJob = pool_->submit([this, h, p] { return trends_.analyze(*h, p->goal); });
    auto anomalyJob = pool_->submit([this, h] {
        return anomalies_.detect(h->workouts, trends_.analyzeStrength(h->workouts));
    });
    auto plateauJob = pool_->submit([this, h] {
        return plateaus_.detect(trends_.analyzeStrength(h->workouts));
    });
    auto riskJob = pool_->submit([this, h, p, w] {
        return std::make_pair(risk_.assess(*p, *h, *w), risk_.assessMonitoringRisk(*p, *h));
    });

    auto trends = joinJob(trendJob, "trend");
    auto anomalies = joinJob(anomalyJob, "anomaly");
    auto plateaus = joinJob(plateauJob, "plateau");
    auto risk = joinJob(riskJob, "risk");
    if (trends.isError()) return trends.error();
    if (anomalies.isError()) return anomalies.error();
    if (plateaus.isError()) return plateaus.error();
    if (risk.isError()) return risk.error();

    AnalyzerOutputs out;
    out.trends = std::move(trends).value();
    out.anomalies = std::move(anomalies).value();
    out.plateaus = std::move(plateaus).value();
    auto riskPair = std::move(risk).value();
    out.injury_risk = std::move(riskPair.first);
    out.monitoring_risk = std::move(riskPair.second);
    return out;
}

//=============================================================================
// Full analysis
//=============================================================================

Result<AnalysisReport> AnalysisEngine::analyzeUser(const UserProfile& profile, const TrainingHistory& history,
                                                   const WorkoutPlan& plan, time_utils::TimePoint now) const {
    return runAnalysis(profile, history, plan, now, config_.engine.parallel_analyzers);
}

Result<AnalysisReport> AnalysisEngine::runAnalysis(const UserProfile& profile, const TrainingHistory& history,
                                                   const WorkoutPlan& plan, time_utils::TimePoint now,
                                                   bool parallel) const {
    if (profile.user_id.empty()) {
        return Err<AnalysisReport>(ErrorCode::INVALID_ARGUMENT, "analysis requested without a user id");
    }
    if (historyIsEmpty(history)) {
        return Err<AnalysisReport>(ErrorCode::INSUFFICIENT_DATA, "no usable records for " + profile.user_id);
    }

    time_utils::Timer timer;
    AnalyzerOutputs outputs;
    if (parallel) {
        auto joined = runParallel(profile, history, plan);
        if (joined.isError()) return Err<AnalysisReport>(joined.error());
        outputs = std::move(joined).value();
    } else {
        outputs = runSequential(profile, history, plan);
    }

    AnalysisReport report;
    report.user_id = profile.user_id;
    report.analyzed_at = time_utils::toISO8601(now);
    report.trends = std::move(outputs.trends);
    report.anomalies = std::move(outputs.anomalies);
    report.anomaly_summary = AnomalyDetector::summarize(report.anomalies);
    report.plateaus = std::move(outputs.plateaus);
    report.injury_risk = std::move(outputs.injury_risk);
    report.monitoring_risk = std::move(outputs.monitoring_risk);

    report.strategy = selector_.select(report.trends, report.plateaus, report.injury_risk, profile);
    report.difficulty = selector_.adjustDifficulty(report.trends);

    const int64_t idle = ProgressMonitor::daysSinceLastWorkout(history.workouts, now);
    report.alerts.push_back(monitor_.consistencyAlert(report.trends.consistency, idle));
    if (profile.daily_calorie_target > 0.0 || !history.nutrition.empty()) {
        report.nutrition = monitor_.nutritionAdherence(history.nutrition, profile.daily_calorie_target);
        report.alerts.push_back(ProgressMonitor::nutritionAlert(*report.nutrition));
    }
    report.prediction_confidence = ProgressMonitor::predictionConfidence(report.trends);
    report.risk_factors = ProgressMonitor::identifyRiskFactors(report.trends, report.plateaus);

    if (!plan.empty()) report.adapted_plan = AdaptationSelector::applyToPlan(plan, report.strategy);

    report.elapsed_ms = timer.elapsedMs();
    GC_LOG_INFO("AnalysisEngine", profile.user_id + ": " + toString(report.strategy.primary_action) +
                ", injury risk " + toString(report.injury_risk.level));
    return report;
}

Result<AnalysisReport> AnalysisEngine::analyzeFromRepository(const HistoryRepository& repo,
                                                             const std::string& userId, int windowDays,
                                                             time_utils::TimePoint now) const {
    auto profile = repo.getUserProfile(userId);
    if (profile.isError()) return Err<AnalysisReport>(profile.error());
    auto history = repo.getHistory(userId, windowDays, now);
    if (history.isError()) return Err<AnalysisReport>(history.error());
    auto plan = repo.getPlan(userId);
    if (plan.isError()) return Err<AnalysisReport>(plan.error());
    return runAnalysis(profile.value(), history.value(), plan.value(), now, false);
}

std::map<std::string, Result<AnalysisReport>> AnalysisEngine::analyzeUsers(
    const HistoryRepository& repo, const std::vector<std::string>& userIds,
    int windowDays, time_utils::TimePoint now) const {
    std::vector<std::pair<std::string, std::future<Result<AnalysisReport>>>> jobs;
    jobs.reserve(userIds.size());
    for (const auto& id : userIds) {
        jobs.emplace_back(id, pool_->submit([this, &repo, id, windowDays, now] {
            return analyzeFromRepository(repo, id, windowDays, now);
        }));
    }

    std::map<std::string, Result<AnalysisReport>> results;
    for (auto& [id, job] : jobs) {
        Result<AnalysisReport> report = Err<AnalysisReport>(ErrorCode::INTERNAL_ERROR, "not run");
        try {
            report = job.get();
        } catch (const std::exception& e) {
            GC_LOG_ERROR("AnalysisEngine", id + ": user job failed: " + e.what());
            report = Err<AnalysisReport>(ErrorCode::INTERNAL_ERROR, std::string("user job failed: ") + e.what());
        }
        if (report.isError()) {
            GC_LOG_WARNING("AnalysisEngine", id + ": " + report.error().message);
        }
        results.insert_or_assign(id, std::move(report));
    }
    GC_LOG_INFO("AnalysisEngine", "Batch of " + std::to_string(userIds.size()) + " user(s) complete");
    return results;
}

json::JsonValue AnalysisEngine::reportToJson(const AnalysisReport& report) {
    return serialization::toJson(report);
}

} // namespace gymcoach
