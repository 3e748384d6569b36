/**
 * @file gc_config.hpp
 * @brief Threshold configuration for the analytics engine
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Every cut-point the analyzers use lives here:
 * - Structured per-analyzer configuration with defaults
 * - String keyed setters for INI and command-line overrides
 * - Configuration validation
 * - INI file loading
 */
#ifndef GYMCOACH_GC_CONFIG_HPP
#define GYMCOACH_GC_CONFIG_HPP

#include "gc_types.hpp"
#include "gc_ini.hpp"
#include "gc_logger.hpp"
#include "result.hpp"
#include <map>
#include <array>
#include <sstream>
#include <vector>
#include <string>
#include <limits>
#include <algorithm>
#include <cmath>

namespace gymcoach {

//=============================================================================
// Per-Analyzer Configuration
//=============================================================================

struct TrendConfig {
    int min_strength_points = 3;
    double strength_improving_pct = 5.0;
    double strength_declining_pct = -5.0;
    double overall_improving_pct = 3.0;
    double overall_declining_pct = -3.0;

    int min_aggregate_sessions = 5;
    int window_sessions = 3;
    double volume_change_pct = 10.0;
    double intensity_change_points = 5.0;
    double intensity_low_cutoff = 60.0;
    double intensity_high_cutoff = 80.0;

    int min_consistency_sessions = 5;
    double consistency_good = 0.7;
    double consistency_poor = 0.4;

    int min_measurements = 2;
    double body_change_pct = 2.0;

    int fatigue_min_sessions = 5;
    double fatigue_volume_ratio = 0.8;
    double fatigue_score_floor = 0.7;

    double max_percent_magnitude = 1000.0;
};

struct AnomalyConfig {
    int min_data_points = 5;
    double medium_sigma = 2.0;
    double high_sigma = 3.0;
    double progression_fast_pct = 10.0;
    double progression_decline_pct = -5.0;
};

struct PlateauConfig {
    int min_sessions = 5;
    double max_total_pct = 2.0;
    double max_weekly_pct = 0.5;
    double min_duration_weeks = 2.0;
};

/**
 * @struct RiskConfig
 * @brief Weights and cut-points for both risk variants
 */
struct RiskConfig {
    // Composite weights, indexed by RiskFactor
    std::array<double, RISK_FACTOR_COUNT> weights{0.25, 0.20, 0.20, 0.15, 0.10, 0.05, 0.15, 0.10};
    bool normalize_weights = false;
    double high_cutoff = 0.7;
    double medium_cutoff = 0.4;

    int load_window_sessions = 7;
    double load_no_history_score = 0.3;
    double load_increase_high_pct = 20.0;
    double load_increase_medium_pct = 10.0;
    double load_intensity_high = 85.0;
    double load_intensity_medium = 75.0;
    double load_volume_cv = 0.3;

    double push_pull_high_ratio = 2.0;
    double push_pull_low_ratio = 0.5;
    double knee_hip_ratio = 2.0;
    int variety_min_exercises = 5;
    int variety_min_patterns = 10;

    int fatigue_min_sessions = 5;
    double fatigue_insufficient_score = 0.3;
    double fatigue_drop_high_pct = 20.0;
    double fatigue_drop_medium_pct = 10.0;
    double frequency_high_per_week = 6.0;
    double frequency_medium_per_week = 5.0;

    double progression_fast_pct = 10.0;
    double progression_moderate_pct = 5.0;
    double planned_jump_high_pct = 15.0;
    double planned_jump_medium_pct = 10.0;

    double beginner_max_free_weight = 50.0;
    double intermediate_max_free_weight = 100.0;

    int senior_age = 50;
    int middle_age = 40;
    double obese_bmi = 30.0;
    double overweight_bmi = 25.0;

    // Monitoring variant
    double monitor_high_cutoff = 0.6;
    double monitor_medium_cutoff = 0.3;
    double monitor_frequency_per_week = 6.0;
    double monitor_intensity = 80.0;
    double monitor_weekly_jump_ratio = 1.5;
    int monitor_min_sessions = 4;

    [[nodiscard]] double weight(RiskFactor f) const { return weights[static_cast<std::size_t>(f)]; }
};

struct MonitorConfig {
    double consistency_high_alert = 0.3;
    double consistency_medium_alert = 0.6;
    int missed_workout_days = 3;
    double nutrition_deviation = 0.2;
    double nutrition_high_alert = 0.5;
    double nutrition_medium_alert = 0.7;
};

struct AdaptationConfig {
    double consistency_overload = 0.7;
    double consistency_simplify = 0.4;

    double plateau_intensity = 0.10;
    double reduce_intensity = -0.15;
    double reduce_volume = -0.20;
    double overload_intensity = 0.05;
    double overload_volume = 0.10;
    double recovery_volume = -0.25;
    double simplify_volume = -0.30;

    double difficulty_intensity_high = 85.0;
    double difficulty_intensity_low = 60.0;
    double difficulty_consistency_high = 0.8;
    double difficulty_fatigue_score = 0.8;
};

struct EngineConfig {
    static constexpr int MAX_WORKER_THREADS = 256;

    int worker_threads = 0;     ///< 0 picks hardware concurrency
    int window_days = 90;
    bool parallel_analyzers = true;
    std::string log_level = "WARN";
};

//=============================================================================
// Aggregate Configuration
//=============================================================================

/**
 * @struct AnalyticsConfig
 * @brief All analyzer thresholds, addressable as "section.key"
 */
struct AnalyticsConfig {
    TrendConfig trend;
    AnomalyConfig anomaly;
    PlateauConfig plateau;
    RiskConfig risk;
    MonitorConfig monitor;
    AdaptationConfig adaptation;
    EngineConfig engine;

    /**
     * @brief Set one value from its textual form
     * @param key "section.key", e.g. "plateau.max_total_pct" or "risk.weights.fatigue"
     * @return CONFIG_INVALID for unknown keys or unparsable values
     */
    [[nodiscard]] Result<void> setFromString(const std::string& key, const std::string& value) {
        if (auto it = realFields().find(key); it != realFields().end()) {
            auto parsed = ini::parseDouble(value);
            if (!parsed) return Err(ErrorCode::CONFIG_INVALID, "not a number for " + key + ": " + value);
            *it->second = *parsed;
            return Ok();
        }
        if (auto it = intFields().find(key); it != intFields().end()) {
            auto parsed = ini::parseInteger(value);
            if (!parsed || *parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
                return Err(ErrorCode::CONFIG_INVALID, "not an integer for " + key + ": " + value);
            }
            *it->second = static_cast<int>(*parsed);
            return Ok();
        }
        if (key == "risk.normalize_weights" || key == "engine.parallel_analyzers") {
            auto parsed = ini::parseBool(value);
            if (!parsed) return Err(ErrorCode::CONFIG_INVALID, "not a boolean for " + key + ": " + value);
            (key == "risk.normalize_weights" ? risk.normalize_weights : engine.parallel_analyzers) = *parsed;
            return Ok();
        }
        if (key == "engine.log_level") {
            engine.log_level = value;
            return Ok();
        }
        return Err(ErrorCode::CONFIG_INVALID, "unknown configuration key: " + key);
    }

    [[nodiscard]] static AnalyticsConfig getDefaults() { return AnalyticsConfig{}; }

    /**
     * @brief Flatten to "section.key" -> value text
     */
    [[nodiscard]] std::map<std::string, std::string> toMap() const {
        AnalyticsConfig copy = *this;
        std::map<std::string, std::string> m;
        for (const auto& [key, ptr] : copy.realFields()) {
            std::ostringstream oss;
            oss << *ptr;
            m[key] = oss.str();
        }
        for (const auto& [key, ptr] : copy.intFields()) m[key] = std::to_string(*ptr);
        m["risk.normalize_weights"] = risk.normalize_weights ? "true" : "false";
        m["engine.parallel_analyzers"] = engine.parallel_analyzers ? "true" : "false";
        m["engine.log_level"] = engine.log_level;
        return m;
    }

    [[nodiscard]] std::string toString() const {
        std::ostringstream oss;
        oss << "=== Analytics Configuration ===\n";
        for (const auto& [key, value] : toMap()) oss << key << " = " << value << "\n";
        return oss.str();
    }

private:
    // Bound to this instance; rebuilt lazily so copies never alias the source
    std::map<std::string, double*>& realFields();
    std::map<std::string, int*>& intFields();

    std::map<std::string, double*> real_fields_;
    std::map<std::string, int*> int_fields_;
    const AnalyticsConfig* bound_to_ = nullptr;

    void bind();
};

inline void AnalyticsConfig::bind() {
    if (bound_to_ == this) return;
    real_fields_ = {
        {"trend.strength_improving_pct", &trend.strength_improving_pct},
        {"trend.strength_declining_pct", &trend.strength_declining_pct},
        {"trend.overall_improving_pct", &trend.overall_improving_pct},
        {"trend.overall_declining_pct", &trend.overall_declining_pct},
        {"trend.volume_change_pct", &trend.volume_change_pct},
        {"trend.intensity_change_points", &trend.intensity_change_points},
        {"trend.intensity_low_cutoff", &trend.intensity_low_cutoff},
        {"trend.intensity_high_cutoff", &trend.intensity_high_cutoff},
        {"trend.consistency_good", &trend.consistency_good},
        {"trend.consistency_poor", &trend.consistency_poor},
        {"trend.body_change_pct", &trend.body_change_pct},
        {"trend.fatigue_volume_ratio", &trend.fatigue_volume_ratio},
        {"trend.fatigue_score_floor", &trend.fatigue_score_floor},
        {"trend.max_percent_magnitude", &trend.max_percent_magnitude},

        {"anomaly.medium_sigma", &anomaly.medium_sigma},
        {"anomaly.high_sigma", &anomaly.high_sigma},
        {"anomaly.progression_fast_pct", &anomaly.progression_fast_pct},
        {"anomaly.progression_decline_pct", &anomaly.progression_decline_pct},

        {"plateau.max_total_pct", &plateau.max_total_pct},
        {"plateau.max_weekly_pct", &plateau.max_weekly_pct},
        {"plateau.min_duration_weeks", &plateau.min_duration_weeks},

        {"risk.high_cutoff", &risk.high_cutoff},
        {"risk.medium_cutoff", &risk.medium_cutoff},
        {"risk.load_no_history_score", &risk.load_no_history_score},
        {"risk.load_increase_high_pct", &risk.load_increase_high_pct},
        {"risk.load_increase_medium_pct", &risk.load_increase_medium_pct},
        {"risk.load_intensity_high", &risk.load_intensity_high},
        {"risk.load_intensity_medium", &risk.load_intensity_medium},
        {"risk.load_volume_cv", &risk.load_volume_cv},
        {"risk.push_pull_high_ratio", &risk.push_pull_high_ratio},
        {"risk.push_pull_low_ratio", &risk.push_pull_low_ratio},
        {"risk.knee_hip_ratio", &risk.knee_hip_ratio},
        {"risk.fatigue_insufficient_score", &risk.fatigue_insufficient_score},
        {"risk.fatigue_drop_high_pct", &risk.fatigue_drop_high_pct},
        {"risk.fatigue_drop_medium_pct", &risk.fatigue_drop_medium_pct},
        {"risk.frequency_high_per_week", &risk.frequency_high_per_week},
        {"risk.frequency_medium_per_week", &risk.frequency_medium_per_week},
        {"risk.progression_fast_pct", &risk.progression_fast_pct},
        {"risk.progression_moderate_pct", &risk.progression_moderate_pct},
        {"risk.planned_jump_high_pct", &risk.planned_jump_high_pct},
        {"risk.planned_jump_medium_pct", &risk.planned_jump_medium_pct},
        {"risk.beginner_max_free_weight", &risk.beginner_max_free_weight},
        {"risk.intermediate_max_free_weight", &risk.intermediate_max_free_weight},
        {"risk.obese_bmi", &risk.obese_bmi},
        {"risk.overweight_bmi", &risk.overweight_bmi},
        {"risk.monitor_high_cutoff", &risk.monitor_high_cutoff},
        {"risk.monitor_medium_cutoff", &risk.monitor_medium_cutoff},
        {"risk.monitor_frequency_per_week", &risk.monitor_frequency_per_week},
        {"risk.monitor_intensity", &risk.monitor_intensity},
        {"risk.monitor_weekly_jump_ratio", &risk.monitor_weekly_jump_ratio},

        {"monitor.consistency_high_alert", &monitor.consistency_high_alert},
        {"monitor.consistency_medium_alert", &monitor.consistency_medium_alert},
        {"monitor.nutrition_deviation", &monitor.nutrition_deviation},
        {"monitor.nutrition_high_alert", &monitor.nutrition_high_alert},
        {"monitor.nutrition_medium_alert", &monitor.nutrition_medium_alert},

        {"adaptation.consistency_overload", &adaptation.consistency_overload},
        {"adaptation.consistency_simplify", &adaptation.consistency_simplify},
        {"adaptation.plateau_intensity", &adaptation.plateau_intensity},
        {"adaptation.reduce_intensity", &adaptation.reduce_intensity},
        {"adaptation.reduce_volume", &adaptation.reduce_volume},
        {"adaptation.overload_intensity", &adaptation.overload_intensity},
        {"adaptation.overload_volume", &adaptation.overload_volume},
        {"adaptation.recovery_volume", &adaptation.recovery_volume},
        {"adaptation.simplify_volume", &adaptation.simplify_volume},
        {"adaptation.difficulty_intensity_high", &adaptation.difficulty_intensity_high},
        {"adaptation.difficulty_intensity_low", &adaptation.difficulty_intensity_low},
        {"adaptation.difficulty_consistency_high", &adaptation.difficulty_consistency_high},
        {"adaptation.difficulty_fatigue_score", &adaptation.difficulty_fatigue_score},
    };
    for (int i = 0; i < RISK_FACTOR_COUNT; ++i) {
        real_fields_["risk.weights." + gymcoach::toString(static_cast<RiskFactor>(i))] =
            &risk.weights[static_cast<std::size_t>(i)];
    }

    int_fields_ = {
        {"trend.min_strength_points", &trend.min_strength_points},
        {"trend.min_aggregate_sessions", &trend.min_aggregate_sessions},
        {"trend.window_sessions", &trend.window_sessions},
        {"trend.min_consistency_sessions", &trend.min_consistency_sessions},
        {"trend.min_measurements", &trend.min_measurements},
        {"trend.fatigue_min_sessions", &trend.fatigue_min_sessions},
        {"anomaly.min_data_points", &anomaly.min_data_points},
        {"plateau.min_sessions", &plateau.min_sessions},
        {"risk.load_window_sessions", &risk.load_window_sessions},
        {"risk.variety_min_exercises", &risk.variety_min_exercises},
        {"risk.variety_min_patterns", &risk.variety_min_patterns},
        {"risk.fatigue_min_sessions", &risk.fatigue_min_sessions},
        {"risk.senior_age", &risk.senior_age},
        {"risk.middle_age", &risk.middle_age},
        {"risk.monitor_min_sessions", &risk.monitor_min_sessions},
        {"monitor.missed_workout_days", &monitor.missed_workout_days},
        {"engine.worker_threads", &engine.worker_threads},
        {"engine.window_days", &engine.window_days},
    };
    bound_to_ = this;
}

inline std::map<std::string, double*>& AnalyticsConfig::realFields() { bind(); return real_fields_; }
inline std::map<std::string, int*>& AnalyticsConfig::intFields() { bind(); return int_fields_; }

//=============================================================================
// Configuration Validator
//=============================================================================

/**
 * @class AnalyticsConfigValidator
 * @brief Rejects threshold sets the analyzers cannot work with
 */
class AnalyticsConfigValidator {
public:
    struct ValidationError {
        std::string field;
        std::string message;
    };

    [[nodiscard]] static Result<void> validate(const AnalyticsConfig& config) {
        std::vector<ValidationError> errors;
        const auto& t = config.trend;
        const auto& a = config.anomaly;
        const auto& r = config.risk;

        if (t.min_strength_points < 2) errors.push_back({"trend.min_strength_points", "Must be at least 2"});
        if (t.strength_improving_pct <= t.strength_declining_pct) {
            errors.push_back({"trend.strength_*_pct", "Improving cut-point must exceed declining cut-point"});
        }
        if (t.overall_improving_pct <= t.overall_declining_pct) {
            errors.push_back({"trend.overall_*_pct", "Improving cut-point must exceed declining cut-point"});
        }
        if (t.window_sessions < 1) errors.push_back({"trend.window_sessions", "Must be positive"});
        if (t.min_aggregate_sessions < t.window_sessions) {
            errors.push_back({"trend.min_aggregate_sessions", "Must be at least window_sessions"});
        }
        if (t.volume_change_pct < 0) errors.push_back({"trend.volume_change_pct", "Must not be negative"});
        if (t.intensity_change_points < 0) errors.push_back({"trend.intensity_change_points", "Must not be negative"});
        if (t.intensity_low_cutoff >= t.intensity_high_cutoff) {
            errors.push_back({"trend.intensity_*_cutoff", "Low cutoff must be below high cutoff"});
        }
        if (t.consistency_poor > t.consistency_good) {
            errors.push_back({"trend.consistency_*", "Poor cut-point must not exceed good cut-point"});
        }
        if (t.min_measurements < 2) errors.push_back({"trend.min_measurements", "Must be at least 2"});
        if (t.body_change_pct < 0) errors.push_back({"trend.body_change_pct", "Must not be negative"});
        if (t.max_percent_magnitude <= 0) errors.push_back({"trend.max_percent_magnitude", "Must be positive"});

        if (a.min_data_points < 2) errors.push_back({"anomaly.min_data_points", "Must be at least 2"});
        if (a.medium_sigma <= 0 || a.high_sigma < a.medium_sigma) {
            errors.push_back({"anomaly.*_sigma", "Need 0 < medium_sigma <= high_sigma"});
        }

        if (config.plateau.min_sessions < 2) errors.push_back({"plateau.min_sessions", "Must be at least 2"});

        double weightSum = 0.0;
        for (double w : r.weights) {
            if (w < 0 || !std::isfinite(w)) errors.push_back({"risk.weights", "Weights must be finite and non-negative"});
            weightSum += w;
        }
        if (weightSum <= 0) errors.push_back({"risk.weights", "Weights must not all be zero"});
        if (r.medium_cutoff > r.high_cutoff) {
            errors.push_back({"risk.*_cutoff", "Medium cut-point must not exceed high cut-point"});
        }
        if (r.monitor_medium_cutoff > r.monitor_high_cutoff) {
            errors.push_back({"risk.monitor_*_cutoff", "Medium cut-point must not exceed high cut-point"});
        }
        if (r.load_window_sessions < 1) errors.push_back({"risk.load_window_sessions", "Must be positive"});

        if (config.monitor.nutrition_deviation <= 0) {
            errors.push_back({"monitor.nutrition_deviation", "Must be positive"});
        }
        if (config.engine.worker_threads < 0 || config.engine.worker_threads > EngineConfig::MAX_WORKER_THREADS) {
            errors.push_back({"engine.worker_threads",
                              "Must be between 0 and " + std::to_string(EngineConfig::MAX_WORKER_THREADS)});
        }
        if (config.engine.window_days <= 0) errors.push_back({"engine.window_days", "Must be positive"});
        if (!parseLogLevel(config.engine.log_level)) {
            errors.push_back({"engine.log_level", "Invalid log level: " + config.engine.log_level});
        }

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "Configuration validation failed:\n";
            for (const auto& err : errors) {
                oss << "  - " << err.field << ": " << err.message << "\n";
            }
            return Err(ErrorCode::CONFIG_INVALID, oss.str());
        }
        return Ok();
    }
};

//=============================================================================
// INI Loading
//=============================================================================

/**
 * @brief Apply every key of an INI document on top of @p base
 *
 * Section "risk.weights" with key "fatigue" maps to "risk.weights.fatigue".
 * Keys outside any section are rejected.
 */
[[nodiscard]] inline Result<AnalyticsConfig> applyIni(const ini::IniFile& file,
                                                      AnalyticsConfig base = AnalyticsConfig{}) {
    if (!file.global().empty()) {
        return Err<AnalyticsConfig>(ErrorCode::CONFIG_INVALID,
                                    "key '" + file.global().values().begin()->first + "' outside of a section");
    }
    for (const auto& [sectionName, section] : file.sections()) {
        for (const auto& [key, value] : section.values()) {
            auto applied = base.setFromString(sectionName + "." + key, value);
            if (applied.isError()) return Err<AnalyticsConfig>(applied.error());
        }
    }
    auto valid = AnalyticsConfigValidator::validate(base);
    if (valid.isError()) return Err<AnalyticsConfig>(valid.error());
    return base;
}

/**
 * @brief Load, apply and validate an INI threshold file
 */
[[nodiscard]] inline Result<AnalyticsConfig> loadConfigFile(const std::string& path) {
    auto file = ini::IniFile::load(path);
    if (file.isError()) return Err<AnalyticsConfig>(file.error());
    auto config = applyIni(file.value());
    if (config.isError()) return config.withContext(path);
    GC_LOG_INFO("Config", "Loaded configuration from " + path);
    return config;
}

} // namespace gymcoach

#endif // GYMCOACH_GC_CONFIG_HPP
