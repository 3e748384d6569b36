/**
 * @file gc_types.hpp
 * @brief Core type definitions for the training analytics engine
 * @version 1.0.0
 * @date 2025
 * @author Bennie Shearer
 *
 * Copyright (c) 2025 Bennie Shearer
 * MIT License - see LICENSE file for details
 *
 * This file contains the record types supplied by callers, the result types
 * produced by each analyzer, and the enumerations shared between them.
 */

#ifndef GYMCOACH_GC_TYPES_HPP
#define GYMCOACH_GC_TYPES_HPP

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include <map>

namespace gymcoach {

//=============================================================================
// Version Information
//=============================================================================
constexpr const char* VERSION = "1.0.0";

//=============================================================================
// Core Enumerations
//=============================================================================

/**
 * @enum TrendDirection
 * @brief Classification of a metric's movement over the analysis window
 */
enum class TrendDirection {
    IMPROVING,
    STABLE,
    DECLINING,
    INSUFFICIENT_DATA   ///< Too few usable records; a valid terminal state
};

enum class AnomalyType { VOLUME, INTENSITY, CONSISTENCY, PROGRESSION };

enum class Severity { MEDIUM, HIGH };

enum class RiskLevel { LOW, MEDIUM, HIGH };

/**
 * @enum AdaptationAction
 * @brief Discrete next-step training directive
 */
enum class AdaptationAction {
    MAINTAIN,
    PROGRESSIVE_OVERLOAD,
    BREAK_PLATEAU,
    REDUCE_LOAD,
    RECOVERY_FOCUS,
    SIMPLIFY
};

enum class PeriodizationPhase { ACCUMULATION, INTENSIFICATION, DELOAD, MAINTENANCE };

enum class ExperienceLevel { BEGINNER, INTERMEDIATE, ADVANCED };

/**
 * @enum GoalDirection
 * @brief Which way body weight should move for the user's goal
 */
enum class GoalDirection {
    LOSE_WEIGHT,    ///< Decreasing weight is improvement
    GAIN_MASS,      ///< Increasing weight is improvement
    MAINTAIN        ///< Staying within the band is the target
};

enum class AlertLevel { LOW, MEDIUM, HIGH };

/**
 * @enum RiskFactor
 * @brief Independently scored components of the injury-risk composite
 */
enum class RiskFactor {
    TRAINING_LOAD,
    MOVEMENT_PATTERN,
    FATIGUE,
    IMBALANCE,
    PROGRESSION,
    EQUIPMENT,
    INJURY_HISTORY,
    AGE_FITNESS
};

constexpr int RISK_FACTOR_COUNT = 8;

//=============================================================================
// Input Records
//=============================================================================

/**
 * @struct ExerciseRecord
 * @brief One performed exercise inside a session
 */
struct ExerciseRecord {
    std::string exercise_name;
    std::string date;           ///< Empty means "same as the session"
    double weight = 0.0;        ///< kg
    int reps = 0;
    int sets = 1;
    std::string equipment;
};

/**
 * @struct WorkoutSession
 * @brief A dated training session; never mutated by the engine
 */
struct WorkoutSession {
    std::string date;           ///< ISO 8601
    std::vector<ExerciseRecord> exercises;
    double duration_minutes = 0.0;

    /// Date used for an exercise record: its own date, else the session's.
    [[nodiscard]] const std::string& dateOf(const ExerciseRecord& record) const {
        return record.date.empty() ? date : record.date;
    }
};

struct BodyMeasurement {
    std::string date;
    double weight = 0.0;                ///< kg
    std::optional<double> body_fat;     ///< percent
    std::optional<double> height_cm;
};

struct NutritionDay {
    std::string date;
    double calories = 0.0;
    double protein_g = 0.0;
    double carbs_g = 0.0;
    double fat_g = 0.0;
};

struct UserProfile {
    std::string user_id;
    ExperienceLevel experience_level = ExperienceLevel::BEGINNER;
    std::vector<std::string> equipment;
    std::vector<std::string> injury_history;
    std::optional<int> age;
    GoalDirection goal = GoalDirection::LOSE_WEIGHT;
    double daily_calorie_target = 0.0;
};

struct PlannedExercise {
    std::string name;
    double weight = 0.0;
    int reps = 0;
    int sets = 1;
    std::string equipment;
};

/**
 * @struct WorkoutPlan
 * @brief The upcoming plan; used for load projections and plan previews
 */
struct WorkoutPlan {
    std::string name;
    std::vector<PlannedExercise> exercises;

    [[nodiscard]] bool empty() const noexcept { return exercises.empty(); }
};

/**
 * @struct TrainingHistory
 * @brief The immutable record slice one analysis run works on
 */
struct TrainingHistory {
    std::vector<WorkoutSession> workouts;
    std::vector<BodyMeasurement> measurements;
    std::vector<NutritionDay> nutrition;
};

//=============================================================================
// Trend Results
//=============================================================================

/**
 * @struct TrendResult
 * @brief One classified metric per analysis run
 */
struct TrendResult {
    std::string metric_name;
    TrendDirection direction = TrendDirection::INSUFFICIENT_DATA;
    double magnitude = 0.0;     ///< percent (percentage points for intensity)
    std::size_t sample_count = 0;

    [[nodiscard]] bool hasData() const noexcept {
        return direction != TrendDirection::INSUFFICIENT_DATA;
    }
};

struct ExerciseProgression {
    std::string exercise_name;
    std::size_t data_points = 0;
    double first_1rm = 0.0;
    double last_1rm = 0.0;
    double total_improvement_pct = 0.0;
    double weekly_improvement_pct = 0.0;
    int64_t days_span = 0;
    TrendDirection direction = TrendDirection::INSUFFICIENT_DATA;
};

struct StrengthTrend {
    std::vector<ExerciseProgression> progressions;  ///< sorted by exercise name
    TrendResult overall;

    [[nodiscard]] bool hasProgressions() const noexcept {
        for (const auto& p : progressions) {
            if (p.direction != TrendDirection::INSUFFICIENT_DATA) return true;
        }
        return false;
    }
};

/**
 * @struct AggregateTrend
 * @brief Recent-window versus earliest-window comparison
 */
struct AggregateTrend {
    TrendResult trend;
    double recent_average = 0.0;
    double earlier_average = 0.0;
};

struct IntensityDistribution {
    int low_sessions = 0;       ///< below 60%
    int moderate_sessions = 0;  ///< 60% to below 80%
    int high_sessions = 0;      ///< 80% and above
};

struct IntensityTrend {
    AggregateTrend window;
    double average_intensity = 0.0;
    IntensityDistribution distribution;
};

struct FrequencyPattern {
    std::map<std::string, int> day_distribution;
    std::size_t total_workouts = 0;
    double avg_workouts_per_week = 0.0;
};

struct ConsistencyTrend {
    TrendResult trend;
    double score = 0.0;
    double average_gap_days = 0.0;
    double gap_stddev = 0.0;
    std::size_t gap_count = 0;
    FrequencyPattern frequency;
};

struct BodyCompositionTrend {
    TrendResult trend;
    double start_weight = 0.0;
    double end_weight = 0.0;
    GoalDirection goal = GoalDirection::LOSE_WEIGHT;
};

struct FatigueIndicator {
    bool high_fatigue = false;
    double fatigue_score = 0.5;
    std::vector<std::string> indicators;
};

/**
 * @struct TrendReport
 * @brief Everything the trend analyzer produces for one history
 */
struct TrendReport {
    StrengthTrend strength;
    AggregateTrend volume;
    IntensityTrend intensity;
    ConsistencyTrend consistency;
    BodyCompositionTrend body_composition;
    FatigueIndicator fatigue;

    /// Flat list: strength overall, volume, intensity, consistency, body composition.
    [[nodiscard]] std::vector<TrendResult> toTrendResults() const {
        return {strength.overall, volume.trend, intensity.window.trend,
                consistency.trend, body_composition.trend};
    }
};

//=============================================================================
// Anomaly, Plateau, Risk and Adaptation Results
//=============================================================================

struct AnomalyRecord {
    AnomalyType type = AnomalyType::VOLUME;
    Severity severity = Severity::MEDIUM;
    double observed_value = 0.0;
    double expected_low = 0.0;
    double expected_high = 0.0;
    std::optional<std::size_t> index;   ///< session or gap index
    std::string reference;              ///< exercise name for progression anomalies
    std::string description;
};

struct AnomalySummary {
    double overall_severity = 0.0;
    int high_count = 0;
    int medium_count = 0;
    int total = 0;
};

struct PlateauRecord {
    std::string exercise_name;
    double total_improvement_pct = 0.0;
    double weekly_improvement_pct = 0.0;
    double duration_weeks = 0.0;
    std::size_t sessions = 0;
};

struct RiskFactorScore {
    RiskFactor factor = RiskFactor::TRAINING_LOAD;
    double score = 0.0;
    double weight = 0.0;
    std::vector<std::string> reasons;
};

/**
 * @struct RiskAssessment
 * @brief Composite risk score with the factors that produced it
 */
struct RiskAssessment {
    double overall_score = 0.0;
    RiskLevel level = RiskLevel::LOW;
    std::vector<RiskFactorScore> factors;   ///< empty for the monitoring variant
    std::vector<std::string> reasons;
};

struct AdaptationStrategy {
    AdaptationAction primary_action = AdaptationAction::MAINTAIN;
    double intensity_delta = 0.0;   ///< fraction, e.g. 0.10 for +10%
    double volume_delta = 0.0;
    std::vector<std::string> secondary_actions;
    PeriodizationPhase phase = PeriodizationPhase::MAINTENANCE;
    std::string rationale;
};

struct DifficultyAdjustment {
    double intensity_change = 0.0;
    double volume_change = 0.0;
    double complexity_change = 0.0;
    std::vector<std::string> reasons;
};

struct ProgressAlert {
    std::string category;
    AlertLevel level = AlertLevel::LOW;
    double score = 0.0;
    std::string message;
};

struct NutritionAdherence {
    std::optional<double> adherence;    ///< nullopt when it cannot be computed
    std::size_t days_evaluated = 0;
    double average_calories = 0.0;
    AlertLevel level = AlertLevel::LOW;
};

/**
 * @struct AnalysisReport
 * @brief Full per-user output of one analysis run
 */
struct AnalysisReport {
    std::string user_id;
    std::string analyzed_at;
    TrendReport trends;
    std::vector<AnomalyRecord> anomalies;
    AnomalySummary anomaly_summary;
    std::vector<PlateauRecord> plateaus;
    RiskAssessment injury_risk;
    RiskAssessment monitoring_risk;
    AdaptationStrategy strategy;
    DifficultyAdjustment difficulty;
    std::vector<ProgressAlert> alerts;
    std::optional<NutritionAdherence> nutrition;
    double prediction_confidence = 0.5;
    std::vector<std::string> risk_factors;
    std::optional<WorkoutPlan> adapted_plan;
    double elapsed_ms = 0.0;
};

//=============================================================================
// Enum Conversions
//=============================================================================

inline std::string toString(TrendDirection d) {
    switch (d) {
        case TrendDirection::IMPROVING: return "improving";
        case TrendDirection::STABLE: return "stable";
        case TrendDirection::DECLINING: return "declining";
        case TrendDirection::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "unknown";
}

inline std::string toString(AnomalyType t) {
    switch (t) {
        case AnomalyType::VOLUME: return "volume";
        case AnomalyType::INTENSITY: return "intensity";
        case AnomalyType::CONSISTENCY: return "consistency";
        case AnomalyType::PROGRESSION: return "progression";
    }
    return "unknown";
}

inline std::string toString(Severity s) {
    return s == Severity::HIGH ? "high" : "medium";
}

inline std::string toString(RiskLevel l) {
    switch (l) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
    }
    return "unknown";
}

inline std::string toString(AdaptationAction a) {
    switch (a) {
        case AdaptationAction::MAINTAIN: return "maintain";
        case AdaptationAction::PROGRESSIVE_OVERLOAD: return "progressive_overload";
        case AdaptationAction::BREAK_PLATEAU: return "break_plateau";
        case AdaptationAction::REDUCE_LOAD: return "reduce_load";
        case AdaptationAction::RECOVERY_FOCUS: return "recovery_focus";
        case AdaptationAction::SIMPLIFY: return "simplify";
    }
    return "unknown";
}

inline std::string toString(PeriodizationPhase p) {
    switch (p) {
        case PeriodizationPhase::ACCUMULATION: return "accumulation";
        case PeriodizationPhase::INTENSIFICATION: return "intensification";
        case PeriodizationPhase::DELOAD: return "deload";
        case PeriodizationPhase::MAINTENANCE: return "maintenance";
    }
    return "unknown";
}

inline std::string toString(ExperienceLevel e) {
    switch (e) {
        case ExperienceLevel::BEGINNER: return "beginner";
        case ExperienceLevel::INTERMEDIATE: return "intermediate";
        case ExperienceLevel::ADVANCED: return "advanced";
    }
    return "unknown";
}

inline std::string toString(GoalDirection g) {
    switch (g) {
        case GoalDirection::LOSE_WEIGHT: return "lose_weight";
        case GoalDirection::GAIN_MASS: return "gain_mass";
        case GoalDirection::MAINTAIN: return "maintain";
    }
    return "unknown";
}

inline std::string toString(AlertLevel l) {
    switch (l) {
        case AlertLevel::LOW: return "low";
        case AlertLevel::MEDIUM: return "medium";
        case AlertLevel::HIGH: return "high";
    }
    return "unknown";
}

inline std::string toString(RiskFactor f) {
    switch (f) {
        case RiskFactor::TRAINING_LOAD: return "training_load";
        case RiskFactor::MOVEMENT_PATTERN: return "movement_pattern";
        case RiskFactor::FATIGUE: return "fatigue";
        case RiskFactor::IMBALANCE: return "imbalance";
        case RiskFactor::PROGRESSION: return "progression";
        case RiskFactor::EQUIPMENT: return "equipment";
        case RiskFactor::INJURY_HISTORY: return "injury_history";
        case RiskFactor::AGE_FITNESS: return "age_fitness";
    }
    return "unknown";
}

inline std::optional<ExperienceLevel> parseExperienceLevel(const std::string& s) {
    if (s == "beginner") return ExperienceLevel::BEGINNER;
    if (s == "intermediate") return ExperienceLevel::INTERMEDIATE;
    if (s == "advanced") return ExperienceLevel::ADVANCED;
    return std::nullopt;
}

inline std::optional<GoalDirection> parseGoalDirection(const std::string& s) {
    if (s == "lose_weight" || s == "weight_loss" || s == "fat_loss") return GoalDirection::LOSE_WEIGHT;
    if (s == "gain_mass" || s == "muscle_gain" || s == "bulk") return GoalDirection::GAIN_MASS;
    if (s == "maintain" || s == "maintenance") return GoalDirection::MAINTAIN;
    return std::nullopt;
}

} // namespace gymcoach

#endif // GYMCOACH_GC_TYPES_HPP
