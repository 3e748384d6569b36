/**
 * @file test_engine.cpp
 * @brief Tests for configuration, argument parsing, repositories and the analysis engine
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "test_framework.hpp"
#include "test_data.hpp"
#include "analysis_engine.hpp"
#include "history_repository.hpp"
#include "gc_config.hpp"
#include "gc_ini.hpp"
#include "gc_args.hpp"
#include "gc_serialization.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <limits>
#include <stdexcept>

using namespace gymcoach;
using namespace gymcoach::testing;
using namespace gymcoach::testdata;

namespace {

const char* HISTORY_DOC = R"({
  "users": [
    {
      "profile": {"user_id": "alice", "experience_level": "beginner", "goal": "lose_weight",
                  "daily_calorie_target": 2000, "equipment": ["dumbbell"], "age": 34},
      "workouts": [
        {"date": "2025-01-06", "exercises": [
          {"name": "Squat", "weight": 60, "reps": 5, "sets": 3},
          {"name": "Row", "weight": "heavy", "reps": 8}]},
        {"date": "not a date", "exercises": []},
        {"date": "2025-01-08", "exercises": [
          {"exercise_name": "Bench Press", "weight": 40, "reps": 8, "sets": 3}]}
      ],
      "measurements": [{"date": "2025-01-06", "weight": 80, "height_cm": 180}],
      "nutrition": [{"date": "2025-01-06", "calories": 2100}],
      "plan": {"name": "week 2", "exercises": [
        {"name": "Squat", "weight": 62.5, "reps": 5, "sets": 3, "equipment": "barbell"}]}
    },
    {"workouts": []},
    {"profile": {"experience_level": "advanced"}}
  ]
})";

/// Eight weekly squat sessions climbing from 100 kg to 128 kg.
TrainingHistory improvingHistory() {
    TrainingHistory h;
    h.workouts = series("Squat", {100, 104, 108, 112, 116, 120, 124, 128}, 5, 3);
    h.measurements = {measurement(0, 82.0, 180.0), measurement(49, 80.0)};
    return h;
}

WorkoutPlan squatPlan() {
    WorkoutPlan plan;
    plan.name = "next block";
    PlannedExercise e;
    e.name = "Squat";
    e.weight = 130.0;
    e.reps = 5;
    e.sets = 3;
    e.equipment = "barbell";
    plan.exercises.push_back(e);
    return plan;
}

AnalyticsConfig sequentialConfig() {
    AnalyticsConfig config;
    config.engine.parallel_analyzers = false;
    config.engine.worker_threads = 2;
    return config;
}

std::string stableDump(AnalysisReport report) {
    report.elapsed_ms = 0.0;
    return AnalysisEngine::reportToJson(report).dump();
}

} // namespace

//=============================================================================
// Configuration
//=============================================================================

TEST_CASE_SUITE(Defaults_AreValid, Config) {
    AnalyticsConfig config;
    REQUIRE_OK(AnalyticsConfigValidator::validate(config));
    REQUIRE_EQ(config.engine.window_days, 90);
    REQUIRE_NEAR(config.plateau.max_total_pct, 2.0, 1e-12);
    REQUIRE_EQ(config.toMap().at("risk.weights.fatigue"), "0.2");
}

TEST_CASE_SUITE(SetFromString_TypedKeys, Config) {
    AnalyticsConfig config;
    REQUIRE_OK(config.setFromString("plateau.max_total_pct", "3.5"));
    REQUIRE_OK(config.setFromString("engine.window_days", "30"));
    REQUIRE_OK(config.setFromString("risk.normalize_weights", "yes"));
    REQUIRE_OK(config.setFromString("risk.weights.injury_history", "0.3"));
    REQUIRE_NEAR(config.plateau.max_total_pct, 3.5, 1e-12);
    REQUIRE_EQ(config.engine.window_days, 30);
    REQUIRE_TRUE(config.risk.normalize_weights);
    REQUIRE_NEAR(config.risk.weight(RiskFactor::INJURY_HISTORY), 0.3, 1e-12);

    REQUIRE_ERR(config.setFromString("plateau.max_total", "3"), ErrorCode::CONFIG_INVALID);
    REQUIRE_ERR(config.setFromString("engine.window_days", "a month"), ErrorCode::CONFIG_INVALID);
    REQUIRE_ERR(config.setFromString("engine.parallel_analyzers", "sometimes"), ErrorCode::CONFIG_INVALID);
}

TEST_CASE_SUITE(SetFromString_CopiesDoNotAlias, Config) {
    AnalyticsConfig original;
    REQUIRE_OK(original.setFromString("risk.high_cutoff", "0.8"));
    AnalyticsConfig copy = original;
    REQUIRE_OK(copy.setFromString("risk.high_cutoff", "0.9"));
    REQUIRE_NEAR(original.risk.high_cutoff, 0.8, 1e-12);
    REQUIRE_NEAR(copy.risk.high_cutoff, 0.9, 1e-12);
}

TEST_CASE_SUITE(Validator_RejectsBadThresholds, Config) {
    AnalyticsConfig config;
    config.risk.medium_cutoff = 0.8;
    config.risk.high_cutoff = 0.5;
    config.engine.window_days = 0;
    auto result = AnalyticsConfigValidator::validate(config);
    REQUIRE_ERR(result, ErrorCode::CONFIG_INVALID);
    REQUIRE_CONTAINS(result.error().message, "risk.*_cutoff");
    REQUIRE_CONTAINS(result.error().message, "engine.window_days");

    AnalyticsConfig zeroWeights;
    zeroWeights.risk.weights.fill(0.0);
    REQUIRE_ERR(AnalyticsConfigValidator::validate(zeroWeights), ErrorCode::CONFIG_INVALID);

    AnalyticsConfig badLevel;
    badLevel.engine.log_level = "LOUD";
    REQUIRE_ERR(AnalyticsConfigValidator::validate(badLevel), ErrorCode::CONFIG_INVALID);

    AnalyticsConfig badTrend;
    badTrend.trend.min_strength_points = 1;
    badTrend.engine.worker_threads = -1;
    REQUIRE_ERR(AnalyticsConfigValidator::validate(badTrend), ErrorCode::CONFIG_INVALID);
}

TEST_CASE_SUITE(Ini_AppliesSections, Config) {
    auto file = ini::IniFile::parse(
        "; thresholds\n"
        "[plateau]\n"
        "max_total_pct = 2.5\n"
        "[risk.weights]\n"
        "fatigue = 0.3\n"
        "[engine]\n"
        "window_days = 60\n"
        "log_level = \"DEBUG\"\n");
    REQUIRE_OK(file);
    auto config = applyIni(file.value());
    REQUIRE_OK(config);
    REQUIRE_NEAR(config->plateau.max_total_pct, 2.5, 1e-12);
    REQUIRE_NEAR(config->risk.weight(RiskFactor::FATIGUE), 0.3, 1e-12);
    REQUIRE_EQ(config->engine.window_days, 60);
    REQUIRE_EQ(config->engine.log_level, "DEBUG");
}

TEST_CASE_SUITE(Ini_ParsesSectionsAndGlobals, Config) {
    auto file = ini::IniFile::parse(
        "# leading comment\n"
        "stray = 1\n"
        "[engine]\n"
        "  log_level = 'INFO'  \n"
        "[risk.weights]\n"
        "fatigue=0.3\n"
        "[engine]\n"
        "window_days = 14\n");
    REQUIRE_OK(file);
    REQUIRE_EQ(file->global().values().at("stray"), "1");
    REQUIRE_SIZE(file->sections(), 2u);
    const auto& engine = file->sections().at("engine").values();
    REQUIRE_EQ(engine.at("log_level"), "INFO");
    REQUIRE_EQ(engine.at("window_days"), "14");
    REQUIRE_EQ(file->sections().at("risk.weights").values().at("fatigue"), "0.3");
}

TEST_CASE_SUITE(SetFromString_RejectsOutOfRangeIntegers, Config) {
    AnalyticsConfig config;
    REQUIRE_ERR(config.setFromString("engine.window_days", "99999999999"), ErrorCode::CONFIG_INVALID);
    REQUIRE_EQ(config.engine.window_days, 90);

    REQUIRE_OK(config.setFromString("engine.worker_threads", "100000"));
    REQUIRE_ERR(AnalyticsConfigValidator::validate(config), ErrorCode::CONFIG_INVALID);
    REQUIRE_OK(config.setFromString("engine.worker_threads", "8"));
    REQUIRE_OK(AnalyticsConfigValidator::validate(config));
}

TEST_CASE_SUITE(Ini_Errors, Config) {
    auto global = ini::IniFile::parse("window_days = 30\n[engine]\nworker_threads = 2\n");
    REQUIRE_OK(global);
    REQUIRE_ERR(applyIni(global.value()), ErrorCode::CONFIG_INVALID);

    auto unknown = ini::IniFile::parse("[plateau]\nstall_weeks = 3\n");
    REQUIRE_OK(unknown);
    REQUIRE_ERR(applyIni(unknown.value()), ErrorCode::CONFIG_INVALID);

    auto invalid = ini::IniFile::parse("[risk]\nmedium_cutoff = 0.9\n");
    REQUIRE_OK(invalid);
    REQUIRE_ERR(applyIni(invalid.value()), ErrorCode::CONFIG_INVALID);

    REQUIRE_ERR(ini::IniFile::parse("[engine\nwindow_days = 3\n"), ErrorCode::CONFIG_PARSE_ERROR);
    REQUIRE_ERR(ini::IniFile::parse("[engine]\nwindow_days\n"), ErrorCode::CONFIG_PARSE_ERROR);
    REQUIRE_ERR(loadConfigFile("/nonexistent/gymcoach.ini"), ErrorCode::CONFIG_MISSING);
}

//=============================================================================
// Command-line arguments
//=============================================================================

TEST_CASE_SUITE(Args_ParsesOptions, Args) {
    args::ArgParser parser("gymcoach");
    parser.addRequired("history", 'H', "history", "FILE")
          .addMulti("user", 'u', "user", "ID")
          .addOption("window", 'w', "window", "90", "DAYS")
          .addFlag("pretty", 'p', "pretty");

    auto opts = parser.parse({"--history", "h.json", "-u", "alice", "-ubob", "--window=30", "-p"});
    REQUIRE_TRUE(opts.success());
    REQUIRE_EQ(opts["history"].asString(), "h.json");
    REQUIRE_SIZE(opts["user"].values(), 2u);
    REQUIRE_EQ(opts["user"].values()[1], "bob");
    REQUIRE_EQ(*opts["window"].asInteger(), 30LL);
    REQUIRE_EQ(opts["window"].count(), 1u);
    REQUIRE_TRUE(opts.has("pretty"));

    auto defaults = parser.parse({"-H", "h.json"});
    REQUIRE_EQ(*defaults["window"].asInteger(), 90LL);
    REQUIRE_FALSE(defaults.has("user"));
}

TEST_CASE_SUITE(Args_Errors, Args) {
    args::ArgParser parser("gymcoach");
    parser.addRequired("history", 'H').addOption("window", 'w');

    auto missing = parser.parse({"-w", "30"});
    REQUIRE_FALSE(missing.success());
    REQUIRE_CONTAINS(missing.error(), "--history");

    auto unknown = parser.parse({"-H", "h.json", "--colour"});
    REQUIRE_CONTAINS(unknown.error(), "Unknown option: --colour");

    auto noValue = parser.parse({"-H"});
    REQUIRE_CONTAINS(noValue.error(), "requires a value");

    auto help = parser.parse({"--help"});
    REQUIRE_TRUE(help.helpRequested());
    REQUIRE_TRUE(help.success());
    REQUIRE_CONTAINS(parser.help(), "--history");

    auto notNumber = parser.parse({"-H", "h.json", "-w", "soon"});
    REQUIRE_FALSE(notNumber["window"].asInteger().has_value());
}

TEST_CASE_SUITE(Args_IntRangeRejectsOverflow, Args) {
    args::ArgParser parser("gymcoach");
    parser.addRequired("history", 'H').addOption("window", 'w');
    const int maxInt = std::numeric_limits<int>::max();

    auto huge = parser.parse({"-H", "h.json", "-w", "99999999999"});
    REQUIRE_TRUE(huge.success());
    REQUIRE_EQ(*huge["window"].asInteger(), 99999999999LL);
    REQUIRE_FALSE(huge["window"].asIntInRange(1, maxInt).has_value());

    auto zero = parser.parse({"-H", "h.json", "-w", "0"});
    REQUIRE_FALSE(zero["window"].asIntInRange(1, maxInt).has_value());
    REQUIRE_EQ(*zero["window"].asIntInRange(0, maxInt), 0);

    auto atLimit = parser.parse({"-H", "h.json", "-w", std::to_string(maxInt)});
    REQUIRE_EQ(*atLimit["window"].asIntInRange(1, maxInt), maxInt);
}

//=============================================================================
// Repositories
//=============================================================================

class RepositoryFixture {
public:
    virtual ~RepositoryFixture() = default;

    virtual void setUp() {
        InMemoryHistoryRepository::UserRecord rec;
        rec.profile = profile("u1");
        rec.history.workouts = {session(70, {lift("Squat", 100, 5)}), session(100, {lift("Squat", 105, 5)}),
                                session(101, {lift("Squat", 110, 5)}), session(10, {lift("Squat", 90, 5)})};
        WorkoutSession bad;
        bad.date = "2025-02-31";
        rec.history.workouts.push_back(bad);
        rec.history.measurements = {measurement(69, 81.0), measurement(95, 80.0)};
        rec.history.nutrition = {nutrition(99, 2000)};
        auto stored = repo.putUser(std::move(rec));
        if (stored.isError()) throw std::runtime_error(stored.error().toString());
    }

    virtual void tearDown() {}

protected:
    InMemoryHistoryRepository repo;
    time_utils::TimePoint now = dayAt(100);
};

TEST_FIXTURE(RepositoryFixture, WindowExcludesOldFutureAndUnparsable) {
    auto workouts = repo.getWorkouts("u1", 30, now);
    REQUIRE_OK(workouts);
    REQUIRE_SIZE(workouts.value(), 2u);
    REQUIRE_EQ(workouts.value()[0].date, day(70));
    REQUIRE_EQ(workouts.value()[1].date, day(100));

    auto measurements = repo.getMeasurements("u1", 30, now);
    REQUIRE_SIZE(measurements.value(), 1u);
    REQUIRE_SIZE(repo.getWorkouts("u1", 365, now).value(), 3u);
}

TEST_FIXTURE(RepositoryFixture, UnknownUserIsNotFound) {
    REQUIRE_ERR(repo.getWorkouts("nobody", 30, now), ErrorCode::NOT_FOUND);
    REQUIRE_ERR(repo.getUserProfile("nobody"), ErrorCode::NOT_FOUND);
    REQUIRE_ERR(repo.getHistory("nobody", 30, now), ErrorCode::NOT_FOUND);
    REQUIRE_TRUE(repo.getWorkouts("nobody", 30, now).error().isLookupError());
}

TEST_FIXTURE(RepositoryFixture, HistoryBundle) {
    auto history = repo.getHistory("u1", 30, now);
    REQUIRE_OK(history);
    REQUIRE_SIZE(history->workouts, 2u);
    REQUIRE_SIZE(history->measurements, 1u);
    REQUIRE_SIZE(history->nutrition, 1u);
    REQUIRE_TRUE(repo.getPlan("u1")->empty());
}

TEST_FIXTURE(RepositoryFixture, AppendAndList) {
    repo.addWorkout("u2", session(100, {lift("Bench Press", 60, 8)}));
    REQUIRE_EQ(repo.userCount(), 2u);
    auto users = repo.listUsers();
    REQUIRE_SIZE(users, 2u);
    REQUIRE_EQ(users[1], "u2");
    REQUIRE_EQ(repo.getUserProfile("u2")->user_id, "u2");

    InMemoryHistoryRepository::UserRecord nameless;
    REQUIRE_ERR(repo.putUser(nameless), ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE_SUITE(Window_Boundaries, Repository) {
    const auto now = dayAt(30);
    REQUIRE_TRUE(inWindow(day(0), 30, now));
    REQUIRE_TRUE(inWindow(day(30), 30, now));
    REQUIRE_FALSE(inWindow(day(31), 30, now));
    REQUIRE_FALSE(inWindow(day(-1), 30, now));
    REQUIRE_FALSE(inWindow("30/01/2025", 30, now));
}

TEST_CASE_SUITE(Json_LoadsAndSkipsMalformed, Repository) {
    auto loaded = JsonHistoryRepository::loadFromString(HISTORY_DOC);
    REQUIRE_OK(loaded);
    const auto& repo = *loaded.value();

    auto users = repo.listUsers();
    REQUIRE_SIZE(users, 1u);
    REQUIRE_EQ(users[0], "alice");

    auto p = repo.getUserProfile("alice");
    REQUIRE_OK(p);
    REQUIRE(p->experience_level == ExperienceLevel::BEGINNER);
    REQUIRE_NEAR(p->daily_calorie_target, 2000.0, 1e-12);
    REQUIRE_EQ(*p->age, 34);
    REQUIRE_SIZE(p->equipment, 1u);

    const auto now = *time_utils::parseISO8601("2025-01-10");
    auto workouts = repo.getWorkouts("alice", 90, now);
    REQUIRE_SIZE(workouts.value(), 2u);
    // The row with a text weight is dropped, the squat survives
    REQUIRE_SIZE(workouts.value()[0].exercises, 1u);
    REQUIRE_EQ(workouts.value()[0].exercises[0].exercise_name, "Squat");
    REQUIRE_EQ(workouts.value()[1].exercises[0].exercise_name, "Bench Press");

    auto m = repo.getMeasurements("alice", 90, now);
    REQUIRE_NEAR(*m.value()[0].height_cm, 180.0, 1e-12);

    auto plan = repo.getPlan("alice");
    REQUIRE_SIZE(plan->exercises, 1u);
    REQUIRE_NEAR(plan->exercises[0].weight, 62.5, 1e-12);
    REQUIRE_EQ(plan->exercises[0].equipment, "barbell");
}

TEST_CASE_SUITE(Json_RejectsCountsOutsideIntRange, Repository) {
    auto decodeExercise = [](const char* text) {
        auto doc = json::parse(text);
        if (doc.isError()) throw std::runtime_error(doc.error().toString());
        return serialization::exerciseFromJson(doc.value());
    };
    REQUIRE_ERR(decodeExercise(R"({"name":"Bench Press","weight":100,"reps":1e12,"sets":3})"),
                ErrorCode::MALFORMED_RECORD);
    REQUIRE_ERR(decodeExercise(R"({"name":"Bench Press","weight":100,"reps":8.7,"sets":3})"),
                ErrorCode::MALFORMED_RECORD);
    REQUIRE_ERR(decodeExercise(R"({"name":"Bench Press","weight":100,"reps":8,"sets":-1})"),
                ErrorCode::MALFORMED_RECORD);
    REQUIRE_ERR(decodeExercise(R"({"name":"Bench Press","weight":100,"reps":8,"sets":3e10})"),
                ErrorCode::MALFORMED_RECORD);

    auto whole = decodeExercise(R"({"name":"Bench Press","weight":100,"reps":8.0,"sets":3})");
    REQUIRE_OK(whole);
    REQUIRE_EQ(whole->reps, 8);
    REQUIRE_EQ(whole->sets, 3);

    auto decodeProfile = [](const char* text) {
        auto doc = json::parse(text);
        if (doc.isError()) throw std::runtime_error(doc.error().toString());
        return serialization::profileFromJson(doc.value());
    };
    REQUIRE_ERR(decodeProfile(R"({"user_id":"ann","age":1e12})"), ErrorCode::MALFORMED_RECORD);
    REQUIRE_ERR(decodeProfile(R"({"user_id":"ann","age":34.5})"), ErrorCode::MALFORMED_RECORD);
    REQUIRE_ERR(decodeProfile(R"({"user_id":"ann","age":"old"})"), ErrorCode::MALFORMED_RECORD);
    auto ann = decodeProfile(R"({"user_id":"ann","age":34})");
    REQUIRE_OK(ann);
    REQUIRE_EQ(*ann->age, 34);

    // An oversized count drops only that exercise, the session survives
    auto loaded = JsonHistoryRepository::loadFromString(R"({"users":[{"profile":{"user_id":"bob"},
        "workouts":[{"date":"2025-01-02","exercises":[
            {"name":"Squat","weight":100,"reps":1e12,"sets":3},
            {"name":"Deadlift","weight":120,"reps":5,"sets":3}]}]}]})");
    REQUIRE_OK(loaded);
    auto workouts = loaded.value()->getWorkouts("bob", 90, *time_utils::parseISO8601("2025-01-10"));
    REQUIRE_OK(workouts);
    REQUIRE_SIZE(workouts.value(), 1u);
    REQUIRE_SIZE(workouts.value()[0].exercises, 1u);
    REQUIRE_EQ(workouts.value()[0].exercises[0].exercise_name, "Deadlift");
}

TEST_CASE_SUITE(Json_DocumentErrors, Repository) {
    REQUIRE_ERR(JsonHistoryRepository::loadFromString("{\"users\": [}"), ErrorCode::PARSE_ERROR);
    REQUIRE_ERR(JsonHistoryRepository::loadFromString("{\"people\": []}"), ErrorCode::PARSE_ERROR);
    REQUIRE_ERR(JsonHistoryRepository::loadFromString("[]"), ErrorCode::PARSE_ERROR);

    auto missing = JsonHistoryRepository::loadFromFile("/nonexistent/history.json");
    REQUIRE_ERR(missing, ErrorCode::IO_ERROR);
    REQUIRE_EQ(missing.error().context, "/nonexistent/history.json");

    auto empty = JsonHistoryRepository::loadFromString("{\"users\": []}");
    REQUIRE_OK(empty);
    REQUIRE_EMPTY(empty.value()->listUsers());
}

//=============================================================================
// Thread pool
//=============================================================================

TEST_CASE_SUITE(ThreadPool_RunsAndPropagates, Engine) {
    ThreadPool pool(3);
    REQUIRE_EQ(pool.threadCount(), 3u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([&counter, i] {
            ++counter;
            return i * i;
        }));
    }
    int sum = 0;
    for (auto& f : results) sum += f.get();
    REQUIRE_EQ(sum, 2470);
    REQUIRE_EQ(counter.load(), 20);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

    pool.shutdown();
    REQUIRE_THROWS_AS(pool.submit([] { return 1; }), std::runtime_error);
}

//=============================================================================
// Analysis engine
//=============================================================================

TEST_CASE_SUITE(Create_RejectsInvalidConfig, Engine) {
    AnalyticsConfig config;
    config.anomaly.high_sigma = 1.0;
    REQUIRE_ERR(AnalysisEngine::create(config), ErrorCode::CONFIG_INVALID);

    auto engine = AnalysisEngine::create(sequentialConfig());
    REQUIRE_OK(engine);
    REQUIRE_EQ(engine.value()->workerCount(), 2u);
}

TEST_CASE_SUITE(AnalyzeUser_InputErrors, Engine) {
    AnalysisEngine engine(sequentialConfig());
    REQUIRE_ERR(engine.analyzeUser(profile(""), improvingHistory(), WorkoutPlan{}, dayAt(50)),
                ErrorCode::INVALID_ARGUMENT);
    REQUIRE_ERR(engine.analyzeUser(profile("u1"), TrainingHistory{}, WorkoutPlan{}, dayAt(50)),
                ErrorCode::INSUFFICIENT_DATA);
}

TEST_CASE_SUITE(SingleSteps, Engine) {
    AnalysisEngine engine(sequentialConfig());
    const auto history = improvingHistory();

    auto trends = engine.analyzeTrends(history);
    REQUIRE_SIZE(trends, 5u);
    REQUIRE_EQ(trends[0].metric_name, "strength");
    REQUIRE(trends[0].direction == TrendDirection::IMPROVING);

    REQUIRE_EMPTY(engine.detectAnomalies(history));
    REQUIRE_EMPTY(engine.detectPlateaus(history));

    TrainingHistory flat;
    flat.workouts = series("Deadlift", std::vector<double>(6, 140.0), 5);
    auto plateaus = engine.detectPlateaus(flat);
    REQUIRE_SIZE(plateaus, 1u);
    REQUIRE_EQ(plateaus[0].exercise_name, "deadlift");

    auto risk = engine.assessRisk(profile("u1"), history, squatPlan());
    REQUIRE_SIZE(risk.factors, static_cast<std::size_t>(RISK_FACTOR_COUNT));
    REQUIRE_GE(risk.overall_score, 0.0);
    REQUIRE_LE(risk.overall_score, 1.0);

    auto strategy = engine.selectAdaptation(TrendReport{}, plateaus, risk, profile("u1"));
    REQUIRE(strategy.primary_action == AdaptationAction::BREAK_PLATEAU);
}

TEST_CASE_SUITE(AnalyzeUser_ImprovingLifterGetsOverload, Engine) {
    AnalysisEngine engine(sequentialConfig());
    auto user = profile("lifter");
    user.goal = GoalDirection::LOSE_WEIGHT;

    auto result = engine.analyzeUser(user, improvingHistory(), squatPlan(), dayAt(50));
    REQUIRE_OK(result);
    const auto& report = result.value();

    REQUIRE_EQ(report.user_id, "lifter");
    REQUIRE_EQ(report.analyzed_at, "2025-02-25T00:00:00Z");
    REQUIRE(report.trends.strength.overall.direction == TrendDirection::IMPROVING);
    REQUIRE(report.trends.volume.trend.direction == TrendDirection::IMPROVING);
    REQUIRE(report.trends.body_composition.trend.direction == TrendDirection::IMPROVING);
    REQUIRE_NEAR(report.trends.consistency.score, 1.0, 1e-9);
    REQUIRE_EMPTY(report.plateaus);
    REQUIRE_EMPTY(report.anomalies);

    REQUIRE(report.strategy.primary_action == AdaptationAction::PROGRESSIVE_OVERLOAD);
    REQUIRE(report.strategy.phase == PeriodizationPhase::ACCUMULATION);

    REQUIRE_TRUE(report.adapted_plan.has_value());
    REQUIRE_NEAR(report.adapted_plan->exercises[0].weight, 136.5, 1e-9);
    REQUIRE_EQ(report.adapted_plan->exercises[0].sets, 3);

    REQUIRE_SIZE(report.alerts, 1u);
    REQUIRE(report.alerts[0].level == AlertLevel::LOW);
    REQUIRE_FALSE(report.nutrition.has_value());
    REQUIRE_NEAR(report.prediction_confidence, 0.9, 1e-9);
    REQUIRE_EMPTY(report.risk_factors);
    REQUIRE_SIZE(report.injury_risk.factors, static_cast<std::size_t>(RISK_FACTOR_COUNT));
}

TEST_CASE_SUITE(AnalyzeUser_SmallGainIsNotAPlateau, Engine) {
    AnalysisEngine engine(sequentialConfig());
    TrainingHistory h;
    h.workouts = series("Bench Press", {100, 100, 101, 101, 102, 102, 103, 103}, 5, 3);

    auto result = engine.analyzeUser(profile("bench"), h, WorkoutPlan{}, dayAt(50));
    REQUIRE_OK(result);
    const auto& strength = result->trends.strength;
    REQUIRE_SIZE(strength.progressions, 1u);
    REQUIRE(strength.progressions[0].direction == TrendDirection::STABLE);
    REQUIRE_EMPTY(result->plateaus);
    REQUIRE_FALSE(result->adapted_plan.has_value());
}

TEST_CASE_SUITE(AnalyzeUser_SparseHistory, Engine) {
    AnalysisEngine engine(sequentialConfig());
    TrainingHistory h;
    h.measurements = {measurement(0, 80.0)};
    auto user = profile("newcomer");
    user.daily_calorie_target = 2200.0;

    auto result = engine.analyzeUser(user, h, WorkoutPlan{}, dayAt(3));
    REQUIRE_OK(result);
    REQUIRE(result->trends.strength.overall.direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE(result->trends.consistency.trend.direction == TrendDirection::INSUFFICIENT_DATA);
    REQUIRE(result->strategy.primary_action == AdaptationAction::MAINTAIN);
    REQUIRE(result->alerts[0].level == AlertLevel::HIGH);
    REQUIRE_CONTAINS(result->alerts[0].message, "no workout data");

    // A calorie target without logged days still yields a (non-computable) nutrition entry
    REQUIRE_TRUE(result->nutrition.has_value());
    REQUIRE_FALSE(result->nutrition->adherence.has_value());
    REQUIRE_SIZE(result->alerts, 2u);
}

TEST_CASE_TAGGED(ParallelMatchesSequential, Engine, "concurrency") {
    AnalyticsConfig parallelConfig;
    parallelConfig.engine.worker_threads = 4;
    AnalysisEngine parallel(parallelConfig);
    AnalysisEngine sequential(sequentialConfig());

    auto user = profile("lifter");
    user.injury_history = {"knee"};
    auto history = improvingHistory();
    history.nutrition = {nutrition(40, 2000), nutrition(41, 2600)};
    user.daily_calorie_target = 2100.0;

    auto a = parallel.analyzeUser(user, history, squatPlan(), dayAt(50));
    auto b = sequential.analyzeUser(user, history, squatPlan(), dayAt(50));
    REQUIRE_OK(a);
    REQUIRE_OK(b);
    REQUIRE_EQ(stableDump(a.value()), stableDump(b.value()));

    // Running again over the same inputs gives the same report
    auto again = parallel.analyzeUser(user, history, squatPlan(), dayAt(50));
    REQUIRE_EQ(stableDump(again.value()), stableDump(a.value()));
}

TEST_CASE_TAGGED(BatchMatchesSingleUser, Engine, "concurrency") {
    InMemoryHistoryRepository repo;
    InMemoryHistoryRepository::UserRecord lifter;
    lifter.profile = profile("lifter");
    lifter.history = improvingHistory();
    lifter.plan = squatPlan();
    REQUIRE_OK(repo.putUser(lifter));

    InMemoryHistoryRepository::UserRecord lapsed;
    lapsed.profile = profile("lapsed");
    lapsed.history.workouts = {session(0, {lift("Squat", 80, 5)})};
    REQUIRE_OK(repo.putUser(lapsed));

    AnalysisEngine engine;
    const auto now = dayAt(50);
    auto results = engine.analyzeUsers(repo, {"lifter", "lapsed", "ghost"}, 30, now);
    REQUIRE_SIZE(results, 3u);
    REQUIRE_ERR(results.at("ghost"), ErrorCode::NOT_FOUND);
    REQUIRE_ERR(results.at("lapsed"), ErrorCode::INSUFFICIENT_DATA);
    REQUIRE_OK(results.at("lifter"));

    auto windowed = repo.getHistory("lifter", 30, now);
    REQUIRE_OK(windowed);
    auto single = engine.analyzeUser(lifter.profile, windowed.value(), lifter.plan, now);
    REQUIRE_OK(single);
    REQUIRE_EQ(stableDump(results.at("lifter").value()), stableDump(single.value()));
}

TEST_CASE_SUITE(ReportToJson_Shape, Engine) {
    AnalysisEngine engine(sequentialConfig());
    auto result = engine.analyzeUser(profile("lifter"), improvingHistory(), squatPlan(), dayAt(50));
    REQUIRE_OK(result);

    auto doc = AnalysisEngine::reportToJson(result.value());
    for (const char* key : {"user_id", "analyzed_at", "trends", "anomalies", "anomaly_summary", "plateaus",
                            "plateaus_detected", "injury_risk", "monitoring_risk", "strategy", "difficulty",
                            "alerts", "prediction_confidence", "risk_factors", "nutrition", "adapted_plan"}) {
        REQUIRE_TRUE(doc.contains(key));
    }
    REQUIRE_EQ(doc["user_id"].asString(), "lifter");
    REQUIRE_FALSE(doc["plateaus_detected"].asBool());
    REQUIRE_TRUE(doc["nutrition"].isNull());
    REQUIRE_TRUE(doc["adapted_plan"].isObject());

    auto reparsed = json::parse(doc.dump(2));
    REQUIRE_OK(reparsed);
    REQUIRE_EQ(reparsed.value().dump(), json::parse(doc.dump())->dump());
}

int main(int argc, char* argv[]) {
    return TestRunner::instance().runMain(argc, argv);
}
