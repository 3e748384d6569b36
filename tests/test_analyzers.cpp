/**
 * @file test_analyzers.cpp
 * @brief Tests for trend analysis, anomaly detection and plateau detection
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "test_framework.hpp"
#include "test_data.hpp"
#include "trend_analyzer.hpp"
#include "anomaly_detector.hpp"
#include "plateau_detector.hpp"

#include <algorithm>

using namespace gymcoach;
using namespace gymcoach::testing;
using namespace gymcoach::testdata;

namespace {

/// Eight weekly bench sessions at 8 reps x 3 sets.
std::vector<WorkoutSession> benchSeries(double finalWeight) {
    return series("Bench Press", {100, 102, 101, 103, 102, 103, 102, finalWeight}, 8, 3);
}

const ExerciseProgression* findProgression(const StrengthTrend& t, const std::string& name) {
    for (const auto& p : t.progressions) {
        if (p.exercise_name == name) return &p;
    }
    return nullptr;
}

} // namespace

//=============================================================================
// Strength
//=============================================================================

TEST_CASE_SUITE(Strength_SmallGainIsStable, Trend) {
    TrendAnalyzer analyzer;
    auto trend = analyzer.analyzeStrength(benchSeries(103));
    const auto* bench = findProgression(trend, "bench press");
    REQUIRE_NOT_NULL(bench);
    REQUIRE_EQ(bench->data_points, 8u);
    REQUIRE_NEAR(bench->total_improvement_pct, 3.0, 1e-6);
    REQUIRE_EQ(bench->days_span, 49);
    REQUIRE_NEAR(bench->weekly_improvement_pct, 3.0 / 7.0, 1e-6);
    REQUIRE(bench->direction == TrendDirection::STABLE);
    REQUIRE_EQ(trend.overall.metric_name, "strength");
    REQUIRE_EQ(trend.overall.sample_count, 1u);
}

TEST_CASE_SUITE(Strength_LargeFinalLiftIsImproving, Trend) {
    TrendAnalyzer analyzer;
    auto trend = analyzer.analyzeStrength(benchSeries(130));
    const auto* bench = findProgression(trend, "bench press");
    REQUIRE_NOT_NULL(bench);
    REQUIRE_NEAR(bench->total_improvement_pct, 30.0, 1e-6);
    REQUIRE(bench->direction == TrendDirection::IMPROVING);
    REQUIRE(trend.overall.direction == TrendDirection::IMPROVING);
}

TEST_CASE_SUITE(Strength_DecliningAndCaseInsensitive, Trend) {
    TrendAnalyzer analyzer;
    auto sessions = series("Squat", {140, 130, 120}, 5);
    sessions[1].exercises[0].exercise_name = "SQUAT";
    auto trend = analyzer.analyzeStrength(sessions);
    REQUIRE_SIZE(trend.progressions, 1u);
    REQUIRE_EQ(trend.progressions[0].exercise_name, "squat");
    REQUIRE(trend.progressions[0].direction == TrendDirection::DECLINING);
    REQUIRE(trend.overall.direction == TrendDirection::DECLINING);
}

TEST_CASE_SUITE(Strength_TooFewPointsIsInsufficient, Trend) {
    TrendAnalyzer analyzer;
    auto trend = analyzer.analyzeStrength(series("Deadlift", {150, 160}, 5));
    REQUIRE_SIZE(trend.progressions, 1u);
    REQUIRE(trend.progressions[0].direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE(trend.overall.direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE_FALSE(trend.hasProgressions());

    auto empty = analyzer.analyzeStrength({});
    REQUIRE_EMPTY(empty.progressions);
    REQUIRE(empty.overall.direction == TrendDirection::INSUFFICIENT_DATA);
}

TEST_CASE_SUITE(Strength_UnparsableDatesSkipped, Trend) {
    TrendAnalyzer analyzer;
    auto sessions = series("Row", {60, 62, 64}, 8);
    WorkoutSession bad = session(30, {lift("Row", 500, 8)});
    bad.date = "not-a-date";
    sessions.push_back(bad);
    auto trend = analyzer.analyzeStrength(sessions);
    REQUIRE_EQ(trend.progressions[0].data_points, 3u);
    REQUIRE_LT(trend.progressions[0].total_improvement_pct, 10.0);
}

//=============================================================================
// Volume and intensity
//=============================================================================

TEST_CASE_SUITE(Volume_ConstantLoadIsStable, Trend) {
    TrendAnalyzer analyzer;
    auto v = analyzer.analyzeVolume(series("Bench Press", {100, 100, 100, 100, 100, 100}, 8, 3, 2));
    REQUIRE(v.trend.direction == TrendDirection::STABLE);
    REQUIRE_NEAR(v.trend.magnitude, 0.0, 1e-9);
    REQUIRE_EQ(v.trend.sample_count, 6u);
    REQUIRE_NEAR(v.recent_average, 2400.0, 1e-9);
}

TEST_CASE_SUITE(Volume_RecentWindowHigherIsImproving, Trend) {
    TrendAnalyzer analyzer;
    auto v = analyzer.analyzeVolume(series("Squat", {100, 100, 100, 120, 120, 120}, 10, 1, 2));
    REQUIRE(v.trend.direction == TrendDirection::IMPROVING);
    REQUIRE_NEAR(v.trend.magnitude, 20.0, 1e-9);

    auto down = analyzer.analyzeVolume(series("Squat", {120, 120, 120, 100, 100, 100}, 10, 1, 2));
    REQUIRE(down.trend.direction == TrendDirection::DECLINING);
}

TEST_CASE_SUITE(Volume_ShortHistoryIsInsufficient, Trend) {
    TrendAnalyzer analyzer;
    auto v = analyzer.analyzeVolume(series("Squat", {100, 110, 120, 130}, 5));
    REQUIRE(v.trend.direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE_EQ(v.trend.sample_count, 4u);
}

TEST_CASE_SUITE(Intensity_PointDifferenceAndDistribution, Trend) {
    TrendAnalyzer analyzer;
    std::vector<WorkoutSession> sessions;
    for (int i = 0; i < 3; ++i) sessions.push_back(session(i * 2, {lift("Bench Press", 80, 10)}));
    for (int i = 3; i < 6; ++i) sessions.push_back(session(i * 2, {lift("Bench Press", 90, 3)}));

    auto t = analyzer.analyzeIntensity(sessions);
    REQUIRE(t.window.trend.direction == TrendDirection::IMPROVING);
    REQUIRE_NEAR(t.window.trend.magnitude, 100.0 / 1.1 - 75.0, 1e-6);
    REQUIRE_EQ(t.distribution.low_sessions, 0);
    REQUIRE_EQ(t.distribution.moderate_sessions, 3);
    REQUIRE_EQ(t.distribution.high_sessions, 3);
    REQUIRE_NEAR(t.average_intensity, (75.0 + 100.0 / 1.1) / 2.0, 1e-6);
}

//=============================================================================
// Consistency, body composition and fatigue
//=============================================================================

TEST_CASE_SUITE(Consistency_RegularScheduleImproving, Trend) {
    TrendAnalyzer analyzer;
    std::vector<WorkoutSession> sessions;
    for (int i = 0; i < 10; ++i) sessions.push_back(session(i * 3, {lift("Squat", 100, 5)}));
    auto c = analyzer.analyzeConsistency(sessions);
    REQUIRE_NEAR(c.score, 1.0, 1e-9);
    REQUIRE(c.trend.direction == TrendDirection::IMPROVING);
    REQUIRE_NEAR(c.trend.magnitude, 100.0, 1e-9);
    REQUIRE_NEAR(c.average_gap_days, 3.0, 1e-9);
    REQUIRE_EQ(c.gap_count, 9u);
    REQUIRE_EQ(c.frequency.total_workouts, 10u);
    REQUIRE_NEAR(c.frequency.avg_workouts_per_week, 10.0 / (27.0 / 7.0), 1e-9);
    REQUIRE_EQ(c.frequency.day_distribution.at("Monday"), 2);
}

TEST_CASE_SUITE(Consistency_IrregularScheduleDeclining, Trend) {
    TrendAnalyzer analyzer;
    std::vector<WorkoutSession> sessions;
    for (int d : {0, 1, 2, 3, 33}) sessions.push_back(session(d, {lift("Squat", 100, 5)}));
    auto c = analyzer.analyzeConsistency(sessions);
    REQUIRE_LT(c.score, 0.4);
    REQUIRE(c.trend.direction == TrendDirection::DECLINING);
}

TEST_CASE_SUITE(Consistency_FewSessionsStillReportsFrequency, Trend) {
    TrendAnalyzer analyzer;
    auto c = analyzer.analyzeConsistency(series("Squat", {100, 100, 100}, 5));
    REQUIRE(c.trend.direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE_EQ(c.frequency.total_workouts, 3u);
    REQUIRE_GT(c.frequency.avg_workouts_per_week, 0.0);
}

TEST_CASE_SUITE(BodyComposition_GoalDirection, Trend) {
    TrendAnalyzer analyzer;
    const std::vector<BodyMeasurement> losing{measurement(0, 90.0), measurement(30, 85.0)};
    REQUIRE(analyzer.analyzeBodyComposition(losing, GoalDirection::LOSE_WEIGHT).trend.direction ==
            TrendDirection::IMPROVING);
    REQUIRE(analyzer.analyzeBodyComposition(losing, GoalDirection::GAIN_MASS).trend.direction ==
            TrendDirection::DECLINING);
    REQUIRE(analyzer.analyzeBodyComposition(losing, GoalDirection::MAINTAIN).trend.direction ==
            TrendDirection::DECLINING);

    const std::vector<BodyMeasurement> steady{measurement(30, 90.9), measurement(0, 90.0)};
    auto maintained = analyzer.analyzeBodyComposition(steady, GoalDirection::MAINTAIN);
    REQUIRE(maintained.trend.direction == TrendDirection::STABLE);
    REQUIRE_NEAR(maintained.start_weight, 90.0, 1e-9);
    REQUIRE_NEAR(maintained.trend.magnitude, 1.0, 1e-6);

    auto single = analyzer.analyzeBodyComposition({measurement(0, 80.0)}, GoalDirection::LOSE_WEIGHT);
    REQUIRE(single.trend.direction == TrendDirection::INSUFFICIENT_DATA);
}

TEST_CASE_SUITE(Fatigue_VolumeDrop, Trend) {
    TrendAnalyzer analyzer;
    auto f = analyzer.detectFatigue(series("Squat", {100, 100, 100, 60, 60, 60}, 10, 1, 2));
    REQUIRE(f.high_fatigue);
    REQUIRE_NEAR(f.fatigue_score, 0.6, 1e-9);
    REQUIRE_NOT_EMPTY(f.indicators);

    auto steady = analyzer.detectFatigue(series("Squat", {100, 100, 100, 100, 100}, 10, 1, 2));
    REQUIRE_FALSE(steady.high_fatigue);
    REQUIRE_NEAR(steady.fatigue_score, 1.0, 1e-9);

    auto shortHistory = analyzer.detectFatigue(series("Squat", {100, 60}, 10));
    REQUIRE_FALSE(shortHistory.high_fatigue);
    REQUIRE_NEAR(shortHistory.fatigue_score, 0.5, 1e-9);
}

TEST_CASE_SUITE(Report_FlatResultsInOrder, Trend) {
    TrendAnalyzer analyzer;
    TrainingHistory h;
    h.workouts = benchSeries(103);
    auto results = analyzer.analyzeTrends(h, GoalDirection::LOSE_WEIGHT);
    REQUIRE_SIZE(results, 5u);
    REQUIRE_EQ(results[0].metric_name, "strength");
    REQUIRE_EQ(results[1].metric_name, "volume");
    REQUIRE_EQ(results[2].metric_name, "intensity");
    REQUIRE_EQ(results[3].metric_name, "consistency");
    REQUIRE_EQ(results[4].metric_name, "body_composition");
    REQUIRE(results[4].direction == TrendDirection::INSUFFICIENT_DATA);
}

//=============================================================================
// Anomalies
//=============================================================================

TEST_CASE_SUITE(Anomaly_AllEqualInputsFlagNothing, Anomaly) {
    AnomalyDetector detector;
    auto anomalies = detector.detect(series("Bench Press", std::vector<double>(9, 100.0), 10, 3, 2));
    REQUIRE_EMPTY(anomalies);
    REQUIRE_NEAR(AnomalyDetector::summarize(anomalies).overall_severity, 0.0, 1e-12);
}

TEST_CASE_SUITE(Anomaly_SingleVolumeOutlierFlagged, Anomaly) {
    AnomalyDetector detector;
    auto sessions = series("Bench Press", std::vector<double>(9, 100.0), 10, 1, 2);
    sessions.back().exercises[0].sets = 5;

    auto anomalies = detector.detect(sessions);
    REQUIRE_SIZE(anomalies, 1u);
    const auto& a = anomalies[0];
    REQUIRE(a.type == AnomalyType::VOLUME);
    REQUIRE(a.severity == Severity::MEDIUM);
    REQUIRE(a.index.has_value());
    REQUIRE_EQ(*a.index, 8u);
    REQUIRE_NEAR(a.observed_value, 5000.0, 1e-9);
    REQUIRE_GE(a.expected_low, 0.0);
    REQUIRE_LT(a.expected_high, 5000.0);
}

TEST_CASE_SUITE(Anomaly_LongGapIsConsistencyAnomaly, Anomaly) {
    AnomalyDetector detector;
    std::vector<WorkoutSession> sessions;
    for (int d : {0, 2, 4, 6, 8, 10, 12, 14, 44}) sessions.push_back(session(d, {lift("Squat", 100, 5)}));

    auto anomalies = detector.detect(sessions);
    REQUIRE_SIZE(anomalies, 1u);
    REQUIRE(anomalies[0].type == AnomalyType::CONSISTENCY);
    REQUIRE_NEAR(anomalies[0].observed_value, 30.0, 1e-9);
    REQUIRE_EQ(*anomalies[0].index, 7u);
    REQUIRE_CONTAINS(anomalies[0].description, "long gap");
}

TEST_CASE_SUITE(Anomaly_StrengthDeclineIsHighProgression, Anomaly) {
    AnomalyDetector detector;
    auto anomalies = detector.detect(series("Bench Press", {100, 92, 85, 78, 70}, 8));
    auto it = std::find_if(anomalies.begin(), anomalies.end(),
                           [](const AnomalyRecord& a) { return a.type == AnomalyType::PROGRESSION; });
    REQUIRE(it != anomalies.end());
    REQUIRE(it->severity == Severity::HIGH);
    REQUIRE_EQ(it->reference, "bench press");
    REQUIRE_NEAR(it->observed_value, -7.5, 1e-6);
    REQUIRE_FALSE(it->index.has_value());
}

TEST_CASE_SUITE(Anomaly_TooFewPointsFlagNothing, Anomaly) {
    AnomalyDetector detector;
    auto sessions = series("Bench Press", {100, 100, 100, 400}, 10, 1, 2);
    REQUIRE_EMPTY(detector.detect(sessions));
}

TEST_CASE_SUITE(Anomaly_SummarySeverity, Anomaly) {
    AnomalyRecord medium;
    medium.severity = Severity::MEDIUM;
    AnomalyRecord high;
    high.severity = Severity::HIGH;

    auto one = AnomalyDetector::summarize({medium});
    REQUIRE_NEAR(one.overall_severity, 0.4, 1e-9);
    REQUIRE_EQ(one.medium_count, 1);

    auto mixed = AnomalyDetector::summarize({medium, high});
    REQUIRE_NEAR(mixed.overall_severity, 0.9, 1e-9);
    REQUIRE_EQ(mixed.total, 2);

    auto many = AnomalyDetector::summarize({high, high, high});
    REQUIRE_NEAR(many.overall_severity, 1.0, 1e-9);
}

//=============================================================================
// Plateaus
//=============================================================================

TEST_CASE_SUITE(Plateau_FiveSessionsOnePercent, Plateau) {
    PlateauDetector detector;
    auto plateaus = detector.detect(series("Overhead Press", {60, 60.3, 60, 60.3, 60.6}, 5));
    REQUIRE_SIZE(plateaus, 1u);
    REQUIRE_EQ(plateaus[0].exercise_name, "overhead press");
    REQUIRE_NEAR(plateaus[0].total_improvement_pct, 1.0, 1e-6);
    REQUIRE_NEAR(plateaus[0].weekly_improvement_pct, 0.25, 1e-6);
    REQUIRE_NEAR(plateaus[0].duration_weeks, 2.0, 1e-9);
    REQUIRE_EQ(plateaus[0].sessions, 5u);
    REQUIRE(PlateauDetector::plateausDetected(plateaus));
}

TEST_CASE_SUITE(Plateau_ThreePercentFastEnoughIsNotPlateau, Plateau) {
    PlateauDetector detector;
    REQUIRE_EMPTY(detector.detect(series("Squat", {100, 101, 101, 102, 103}, 5)));
}

TEST_CASE_SUITE(Plateau_RequiresMinimumSessions, Plateau) {
    PlateauDetector detector;
    REQUIRE_EMPTY(detector.detect(series("Squat", {100, 100, 100, 100}, 5)));
}

TEST_CASE_SUITE(Plateau_DurationGrowsWithSessions, Plateau) {
    PlateauDetector detector;
    auto plateaus = detector.detect(series("Squat", std::vector<double>(9, 100.0), 5));
    REQUIRE_SIZE(plateaus, 1u);
    REQUIRE_NEAR(plateaus[0].duration_weeks, 3.0, 1e-9);
}

TEST_CASE_SUITE(EndToEnd_WeeklyBenchScenario, Plateau) {
    PlateauDetector detector;
    REQUIRE_EMPTY(detector.detect(benchSeries(103)));
    REQUIRE_EMPTY(detector.detect(benchSeries(130)));
}

int main(int argc, char* argv[]) {
    return TestRunner::instance().runMain(argc, argv);
}
