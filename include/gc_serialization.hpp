/**
 * @file gc_serialization.hpp
 * @brief JSON conversion for records and analysis results
 * @author GymCoach Analytics Team
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - toJson() for every result type
 * - Record decoders returning MALFORMED_RECORD on bad input
 * - List loaders that skip malformed records with a warning
 */

#ifndef GYMCOACH_GC_SERIALIZATION_HPP
#define GYMCOACH_GC_SERIALIZATION_HPP

#include "gc_types.hpp"
#include "gc_json.hpp"
#include "gc_logger.hpp"
#include "gc_time_utils.hpp"
#include "result.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cmath>
#include <limits>

namespace gymcoach {
namespace serialization {

using json::JsonValue;
using json::JsonArray;

// ============================================================================
// Results -> JSON
// ============================================================================

[[nodiscard]] inline JsonValue toJson(const TrendResult& t) {
    return json::object()
        .add("metric", t.metric_name)
        .add("direction", toString(t.direction))
        .add("magnitude", t.magnitude)
        .add("sample_count", t.sample_count)
        .build();
}

[[nodiscard]] inline JsonValue toJson(const ExerciseProgression& p) {
    return json::object()
        .add("exercise", p.exercise_name)
        .add("data_points", p.data_points)
        .add("first_1rm", p.first_1rm)
        .add("last_1rm", p.last_1rm)
        .add("total_improvement_pct", p.total_improvement_pct)
        .add("weekly_improvement_pct", p.weekly_improvement_pct)
        .add("days_span", p.days_span)
        .add("direction", toString(p.direction))
        .build();
}

[[nodiscard]] inline JsonValue toJson(const TrendReport& r) {
    JsonArray progressions;
    for (const auto& p : r.strength.progressions) progressions.push_back(toJson(p));

    json::JsonObject days;
    for (const auto& [day, count] : r.consistency.frequency.day_distribution) days[day] = JsonValue(count);

    return json::object()
        .add("strength", json::object()
            .add("overall", toJson(r.strength.overall))
            .add("exercises", std::move(progressions))
            .build())
        .add("volume", json::object()
            .add("trend", toJson(r.volume.trend))
            .add("recent_average", r.volume.recent_average)
            .add("earlier_average", r.volume.earlier_average)
            .build())
        .add("intensity", json::object()
            .add("trend", toJson(r.intensity.window.trend))
            .add("recent_average", r.intensity.window.recent_average)
            .add("earlier_average", r.intensity.window.earlier_average)
            .add("average_intensity", r.intensity.average_intensity)
            .add("distribution", json::object()
                .add("low", r.intensity.distribution.low_sessions)
                .add("moderate", r.intensity.distribution.moderate_sessions)
                .add("high", r.intensity.distribution.high_sessions)
                .build())
            .build())
        .add("consistency", json::object()
            .add("trend", toJson(r.consistency.trend))
            .add("score", r.consistency.score)
            .add("average_gap_days", r.consistency.average_gap_days)
            .add("gap_stddev", r.consistency.gap_stddev)
            .add("gap_count", r.consistency.gap_count)
            .add("frequency", json::object()
                .add("day_distribution", std::move(days))
                .add("total_workouts", r.consistency.frequency.total_workouts)
                .add("avg_workouts_per_week", r.consistency.frequency.avg_workouts_per_week)
                .build())
            .build())
        .add("body_composition", json::object()
            .add("trend", toJson(r.body_composition.trend))
            .add("start_weight", r.body_composition.start_weight)
            .add("end_weight", r.body_composition.end_weight)
            .add("goal", toString(r.body_composition.goal))
            .build())
        .add("fatigue", json::object()
            .add("high_fatigue", r.fatigue.high_fatigue)
            .add("fatigue_score", r.fatigue.fatigue_score)
            .add("indicators", json::stringArray(r.fatigue.indicators))
            .build())
        .build();
}

[[nodiscard]] inline JsonValue toJson(const AnomalyRecord& a) {
    auto obj = json::object()
        .add("type", toString(a.type))
        .add("severity", toString(a.severity))
        .add("observed_value", a.observed_value)
        .add("expected_range", json::object()
            .add("low", a.expected_low)
            .add("high", a.expected_high)
            .build())
        .add("description", a.description);
    if (a.index) obj.add("index", *a.index);
    if (!a.reference.empty()) obj.add("reference", a.reference);
    return obj.build();
}

[[nodiscard]] inline JsonValue toJson(const AnomalySummary& s) {
    return json::object()
        .add("overall_severity", s.overall_severity)
        .add("high_count", s.high_count)
        .add("medium_count", s.medium_count)
        .add("total", s.total)
        .build();
}

[[nodiscard]] inline JsonValue toJson(const PlateauRecord& p) {
    return json::object()
        .add("exercise", p.exercise_name)
        .add("total_improvement_pct", p.total_improvement_pct)
        .add("weekly_improvement_pct", p.weekly_improvement_pct)
        .add("duration_weeks", p.duration_weeks)
        .add("sessions", p.sessions)
        .build();
}

[[nodiscard]] inline JsonValue toJson(const RiskAssessment& r) {
    json::JsonObject factors;
    for (const auto& f : r.factors) {
        factors[toString(f.factor)] = json::object()
            .add("score", f.score)
            .add("weight", f.weight)
            .add("reasons", json::stringArray(f.reasons))
            .build();
    }
    auto obj = json::object()
        .add("overall_score", r.overall_score)
        .add("level", toString(r.level))
        .add("reasons", json::stringArray(r.reasons));
    if (!factors.empty()) obj.add("factors", std::move(factors));
    return obj.build();
}

[[nodiscard]] inline JsonValue toJson(const AdaptationStrategy& s) {
    return json::object()
        .add("primary_action", toString(s.primary_action))
        .add("intensity_delta", s.intensity_delta)
        .add("volume_delta", s.volume_delta)
        .add("secondary_actions", json::stringArray(s.secondary_actions))
        .add("periodization_phase", toString(s.phase))
        .add("rationale", s.rationale)
        .build();
}

[[nodiscard]] inline JsonValue toJson(const DifficultyAdjustment& d) {
    return json::object()
        .add("intensity_change", d.intensity_change)
        .add("volume_change", d.volume_change)
        .add("complexity_change", d.complexity_change)
        .add("reasons", json::stringArray(d.reasons))
        .build();
}

[[nodiscard]] inline JsonValue toJson(const ProgressAlert& a) {
    return json::object()
        .add("category", a.category)
        .add("level", toString(a.level))
        .add("score", a.score)
        .add("message", a.message)
        .build();
}

[[nodiscard]] inline JsonValue toJson(const NutritionAdherence& n) {
    return json::object()
        .addOptional("adherence", n.adherence)
        .add("days_evaluated", n.days_evaluated)
        .add("average_calories", n.average_calories)
        .add("level", toString(n.level))
        .build();
}

[[nodiscard]] inline JsonValue toJson(const WorkoutPlan& plan) {
    JsonArray exercises;
    for (const auto& ex : plan.exercises) {
        exercises.push_back(json::object()
            .add("name", ex.name)
            .add("weight", ex.weight)
            .add("reps", ex.reps)
            .add("sets", ex.sets)
            .add("equipment", ex.equipment)
            .build());
    }
    return json::object()
        .add("name", plan.name)
        .add("exercises", std::move(exercises))
        .build();
}

[[nodiscard]] inline JsonValue toJson(const AnalysisReport& r) {
    JsonArray anomalies, plateaus, alerts;
    for (const auto& a : r.anomalies) anomalies.push_back(toJson(a));
    for (const auto& p : r.plateaus) plateaus.push_back(toJson(p));
    for (const auto& a : r.alerts) alerts.push_back(toJson(a));

    auto obj = json::object()
        .add("user_id", r.user_id)
        .add("analyzed_at", r.analyzed_at)
        .add("trends", toJson(r.trends))
        .add("anomalies", std::move(anomalies))
        .add("anomaly_summary", toJson(r.anomaly_summary))
        .add("plateaus", std::move(plateaus))
        .add("plateaus_detected", !r.plateaus.empty())
        .add("injury_risk", toJson(r.injury_risk))
        .add("monitoring_risk", toJson(r.monitoring_risk))
        .add("strategy", toJson(r.strategy))
        .add("difficulty", toJson(r.difficulty))
        .add("alerts", std::move(alerts))
        .add("prediction_confidence", r.prediction_confidence)
        .add("risk_factors", json::stringArray(r.risk_factors))
        .add("elapsed_ms", r.elapsed_ms);
    obj.add("nutrition", r.nutrition ? toJson(*r.nutrition) : JsonValue(nullptr));
    obj.add("adapted_plan", r.adapted_plan ? toJson(*r.adapted_plan) : JsonValue(nullptr));
    return obj.build();
}

// ============================================================================
// JSON -> Records
// ============================================================================

namespace detail {

inline Error malformed(const std::string& what) {
    return Error{ErrorCode::MALFORMED_RECORD, what};
}

/// Optional numeric field: absent is fine, present-but-not-a-number is not.
inline bool readNumber(const JsonValue& obj, const std::string& key, double& out) {
    const JsonValue* v = obj.find(key);
    if (!v || v->isNull()) return true;
    auto n = v->getNumber();
    if (!n || !std::isfinite(*n)) return false;
    out = *n;
    return true;
}

/// Whole, non-negative and within int range; anything else is malformed.
inline bool toCount(double d, int& out) {
    if (!std::isfinite(d) || d < 0.0 || d > static_cast<double>(std::numeric_limits<int>::max())) return false;
    if (std::floor(d) != d) return false;
    out = static_cast<int>(d);
    return true;
}

inline bool readInt(const JsonValue& obj, const std::string& key, int& out) {
    const JsonValue* v = obj.find(key);
    if (!v || v->isNull()) return true;
    auto n = v->getNumber();
    return n && toCount(*n, out);
}

} // namespace detail

[[nodiscard]] inline Result<ExerciseRecord> exerciseFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("exercise is not an object");
    ExerciseRecord rec;
    auto name = v.stringAt("name");
    if (!name) name = v.stringAt("exercise_name");
    if (!name || name->empty()) return detail::malformed("exercise without a name");
    rec.exercise_name = *name;
    if (!detail::readNumber(v, "weight", rec.weight)) return detail::malformed("bad weight for " + rec.exercise_name);
    if (!detail::readInt(v, "reps", rec.reps)) return detail::malformed("bad reps for " + rec.exercise_name);
    if (!detail::readInt(v, "sets", rec.sets)) return detail::malformed("bad sets for " + rec.exercise_name);
    rec.equipment = v.stringOr("equipment", "");
    rec.date = v.stringOr("date", "");
    if (!rec.date.empty() && !time_utils::parseISO8601(rec.date)) {
        return detail::malformed("unparsable date '" + rec.date + "' for " + rec.exercise_name);
    }
    return rec;
}

/**
 * @brief Decode a session; malformed exercises inside it are dropped with a warning
 */
[[nodiscard]] inline Result<WorkoutSession> sessionFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("workout is not an object");
    WorkoutSession s;
    s.date = v.stringOr("date", "");
    if (!time_utils::parseISO8601(s.date)) return detail::malformed("workout with unparsable date '" + s.date + "'");
    if (!detail::readNumber(v, "duration_minutes", s.duration_minutes)) {
        return detail::malformed("bad duration for workout on " + s.date);
    }
    if (const JsonValue* list = v.find("exercises"); list && list->isArray()) {
        for (const auto& item : list->asArray()) {
            auto ex = exerciseFromJson(item);
            if (ex.isError()) {
                GC_LOG_WARNING("Serialization", "Skipping exercise in workout " + s.date + ": " + ex.error().message);
                continue;
            }
            s.exercises.push_back(std::move(ex).value());
        }
    }
    return s;
}

[[nodiscard]] inline Result<BodyMeasurement> measurementFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("measurement is not an object");
    BodyMeasurement m;
    m.date = v.stringOr("date", "");
    if (!time_utils::parseISO8601(m.date)) return detail::malformed("measurement with unparsable date '" + m.date + "'");
    if (!detail::readNumber(v, "weight", m.weight)) return detail::malformed("bad weight in measurement " + m.date);
    double value = 0.0;
    if (v.numberAt("body_fat")) {
        if (!detail::readNumber(v, "body_fat", value)) return detail::malformed("bad body fat in " + m.date);
        m.body_fat = value;
    }
    const std::string heightKey = v.contains("height_cm") ? "height_cm" : "height";
    if (v.numberAt(heightKey)) {
        if (!detail::readNumber(v, heightKey, value)) return detail::malformed("bad height in " + m.date);
        m.height_cm = value;
    }
    return m;
}

[[nodiscard]] inline Result<NutritionDay> nutritionFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("nutrition entry is not an object");
    NutritionDay d;
    d.date = v.stringOr("date", "");
    if (!time_utils::parseISO8601(d.date)) return detail::malformed("nutrition entry with unparsable date '" + d.date + "'");
    if (!detail::readNumber(v, "calories", d.calories) ||
        !detail::readNumber(v, "protein_g", d.protein_g) ||
        !detail::readNumber(v, "carbs_g", d.carbs_g) ||
        !detail::readNumber(v, "fat_g", d.fat_g)) {
        return detail::malformed("bad macro value in nutrition entry " + d.date);
    }
    return d;
}

[[nodiscard]] inline Result<UserProfile> profileFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("profile is not an object");
    UserProfile p;
    p.user_id = v.stringOr("user_id", "");
    if (p.user_id.empty()) return detail::malformed("profile without user_id");

    if (auto level = v.stringAt("experience_level")) {
        auto parsed = parseExperienceLevel(*level);
        if (!parsed) return detail::malformed("unknown experience level '" + *level + "' for " + p.user_id);
        p.experience_level = *parsed;
    }
    if (auto goal = v.stringAt("goal")) {
        auto parsed = parseGoalDirection(*goal);
        if (!parsed) return detail::malformed("unknown goal '" + *goal + "' for " + p.user_id);
        p.goal = *parsed;
    }
    p.equipment = v.stringListAt("equipment");
    p.injury_history = v.stringListAt("injury_history");
    if (const JsonValue* age = v.find("age"); age && !age->isNull()) {
        auto n = age->getNumber();
        int years = 0;
        if (!n || !detail::toCount(*n, years)) return detail::malformed("bad age for " + p.user_id);
        p.age = years;
    }
    if (!detail::readNumber(v, "daily_calorie_target", p.daily_calorie_target)) {
        return detail::malformed("bad calorie target for " + p.user_id);
    }
    return p;
}

[[nodiscard]] inline Result<WorkoutPlan> planFromJson(const JsonValue& v) {
    if (!v.isObject()) return detail::malformed("plan is not an object");
    WorkoutPlan plan;
    plan.name = v.stringOr("name", "");
    if (const JsonValue* list = v.find("exercises"); list && list->isArray()) {
        for (const auto& item : list->asArray()) {
            auto ex = exerciseFromJson(item);
            if (ex.isError()) {
                GC_LOG_WARNING("Serialization", "Skipping planned exercise: " + ex.error().message);
                continue;
            }
            PlannedExercise pe;
            pe.name = ex->exercise_name;
            pe.weight = ex->weight;
            pe.reps = ex->reps;
            pe.sets = ex->sets;
            pe.equipment = ex->equipment;
            plan.exercises.push_back(std::move(pe));
        }
    }
    return plan;
}

/**
 * @brief Decode every element of an array field, skipping malformed ones
 * @param owner Label used in warnings (usually the user id)
 */
template<typename T, typename Decoder>
[[nodiscard]] std::vector<T> loadList(const JsonValue& parent, const std::string& key,
                                      const std::string& owner, Decoder decode) {
    std::vector<T> out;
    const JsonValue* list = parent.find(key);
    if (!list) return out;
    if (!list->isArray()) {
        GC_LOG_WARNING("Serialization", owner + ": '" + key + "' is not an array");
        return out;
    }
    for (const auto& item : list->asArray()) {
        auto decoded = decode(item);
        if (decoded.isError()) {
            GC_LOG_WARNING("Serialization", owner + ": skipping " + key + " record: " + decoded.error().message);
            continue;
        }
        out.push_back(std::move(decoded).value());
    }
    return out;
}

} // namespace serialization
} // namespace gymcoach

#endif // GYMCOACH_GC_SERIALIZATION_HPP
