/**
 * @file example_basic.cpp
 * @brief Basic analysis engine example
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "analysis_engine.hpp"
#include "history_repository.hpp"
#include "gc_time_utils.hpp"
#include <iostream>

using namespace gymcoach;

namespace {

WorkoutSession makeSession(time_utils::TimePoint start, int dayOffset, double squat, double bench) {
    WorkoutSession s;
    s.date = time_utils::toDateString(time_utils::addDays(start, dayOffset));
    s.duration_minutes = 60.0;

    ExerciseRecord sq;
    sq.exercise_name = "Back Squat";
    sq.weight = squat;
    sq.reps = 5;
    sq.sets = 3;
    ExerciseRecord bp;
    bp.exercise_name = "Bench Press";
    bp.weight = bench;
    bp.reps = 8;
    bp.sets = 3;
    ExerciseRecord row;
    row.exercise_name = "Barbell Row";
    row.weight = bench * 0.9;
    row.reps = 8;
    row.sets = 3;
    s.exercises = {sq, bp, row};
    return s;
}

} // namespace

int main() {
    std::cout << "=== GymCoach Basic Example ===\n\n";

    auto engine = AnalysisEngine::create(AnalyticsConfig{});
    if (engine.isError()) {
        std::cerr << "Failed to start engine: " << engine.error().toString() << "\n";
        return 1;
    }
    std::cout << "Engine started (v" << VERSION << ", " << engine.value()->workerCount() << " workers)\n\n";

    // Build six weeks of twice-weekly training for one user
    const auto start = *time_utils::parseISO8601("2025-01-06");
    InMemoryHistoryRepository::UserRecord rec;
    rec.profile.user_id = "demo";
    rec.profile.experience_level = ExperienceLevel::INTERMEDIATE;
    rec.profile.goal = GoalDirection::GAIN_MASS;
    rec.profile.equipment = {"barbell"};
    rec.profile.age = 31;
    for (int week = 0; week < 6; ++week) {
        rec.history.workouts.push_back(makeSession(start, week * 7, 100.0 + week * 5.0, 70.0 + week * 2.5));
        rec.history.workouts.push_back(makeSession(start, week * 7 + 3, 100.0 + week * 5.0, 70.0 + week * 2.5));
    }
    for (int week = 0; week < 6; ++week) {
        BodyMeasurement m;
        m.date = time_utils::toDateString(time_utils::addDays(start, week * 7));
        m.weight = 78.0 + week * 0.4;
        m.height_cm = 180.0;
        rec.history.measurements.push_back(m);
    }
    PlannedExercise next;
    next.name = "Back Squat";
    next.weight = 130.0;
    next.reps = 5;
    next.sets = 3;
    next.equipment = "barbell";
    rec.plan.exercises.push_back(next);

    InMemoryHistoryRepository repo;
    if (auto stored = repo.putUser(rec); stored.isError()) {
        std::cerr << "Failed to store user: " << stored.error().toString() << "\n";
        return 1;
    }
    std::cout << "Stored " << rec.history.workouts.size() << " workouts for user 'demo'\n\n";

    // Analyse the last 60 days
    const auto now = time_utils::addDays(start, 40);
    auto results = engine.value()->analyzeUsers(repo, {"demo"}, 60, now);
    const auto& result = results.at("demo");
    if (result.isError()) {
        std::cerr << "Analysis failed: " << result.error().toString() << "\n";
        return 1;
    }
    const auto& report = result.value();

    std::cout << "=== Trends ===\n";
    for (const auto& t : report.trends.toTrendResults()) {
        std::cout << "  " << t.metric_name << ": " << toString(t.direction)
                  << " (" << t.magnitude << ")\n";
    }
    std::cout << "\n=== Decision ===\n";
    std::cout << "  Strategy:    " << toString(report.strategy.primary_action) << "\n";
    std::cout << "  Phase:       " << toString(report.strategy.phase) << "\n";
    std::cout << "  Rationale:   " << report.strategy.rationale << "\n";
    std::cout << "  Injury risk: " << toString(report.injury_risk.level)
              << " (" << report.injury_risk.overall_score << ")\n";
    if (report.adapted_plan) {
        for (const auto& ex : report.adapted_plan->exercises) {
            std::cout << "  Next:        " << ex.name << " " << ex.weight << " kg x " << ex.reps
                      << " x " << ex.sets << "\n";
        }
    }

    std::cout << "\n=== JSON ===\n" << AnalysisEngine::reportToJson(report).dump(2) << "\n";
    return 0;
}
