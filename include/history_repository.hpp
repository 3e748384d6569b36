/**
 * @file history_repository.hpp
 * @brief Source of per-user training records
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * The analytics engine never talks to storage directly. It reads through
 * HistoryRepository, which is implemented here by an in-memory store and by
 * a loader for the JSON history document:
 *
 *   {"users": [{"profile": {...}, "workouts": [...],
 *               "measurements": [...], "nutrition": [...],
 *               "plan": {...}}]}
 */
#ifndef GYMCOACH_HISTORY_REPOSITORY_HPP
#define GYMCOACH_HISTORY_REPOSITORY_HPP

#include "gc_types.hpp"
#include "gc_time_utils.hpp"
#include "result.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>

namespace gymcoach {

/**
 * @class HistoryRepository
 * @brief Read-only access to user records within a trailing window
 */
class HistoryRepository {
public:
    virtual ~HistoryRepository() = default;

    /**
     * @brief Sessions dated within @p windowDays before @p now
     * @return NOT_FOUND for unknown users
     */
    [[nodiscard]] virtual Result<std::vector<WorkoutSession>> getWorkouts(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const = 0;

    [[nodiscard]] virtual Result<std::vector<BodyMeasurement>> getMeasurements(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const = 0;

    [[nodiscard]] virtual Result<std::vector<NutritionDay>> getNutrition(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const = 0;

    [[nodiscard]] virtual Result<UserProfile> getUserProfile(const std::string& userId) const = 0;

    /// Upcoming plan; an empty plan when none is stored.
    [[nodiscard]] virtual Result<WorkoutPlan> getPlan(const std::string& userId) const = 0;

    [[nodiscard]] virtual std::vector<std::string> listUsers() const = 0;

    /**
     * @brief Convenience bundle of workouts, measurements and nutrition
     */
    [[nodiscard]] Result<TrainingHistory> getHistory(const std::string& userId, int windowDays,
                                                     time_utils::TimePoint now) const;
};

/**
 * @class InMemoryHistoryRepository
 * @brief Thread-safe map-backed repository
 */
class InMemoryHistoryRepository : public HistoryRepository {
public:
    struct UserRecord {
        UserProfile profile;
        TrainingHistory history;
        WorkoutPlan plan;
    };

    InMemoryHistoryRepository() = default;

    /// Insert or replace a user; rejects an empty user id.
    [[nodiscard]] Result<void> putUser(UserRecord record);

    void addWorkout(const std::string& userId, WorkoutSession session);
    void addMeasurement(const std::string& userId, BodyMeasurement measurement);
    void addNutrition(const std::string& userId, NutritionDay day);

    [[nodiscard]] std::size_t userCount() const;

    [[nodiscard]] Result<std::vector<WorkoutSession>> getWorkouts(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const override;
    [[nodiscard]] Result<std::vector<BodyMeasurement>> getMeasurements(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const override;
    [[nodiscard]] Result<std::vector<NutritionDay>> getNutrition(
        const std::string& userId, int windowDays, time_utils::TimePoint now) const override;
    [[nodiscard]] Result<UserProfile> getUserProfile(const std::string& userId) const override;
    [[nodiscard]] Result<WorkoutPlan> getPlan(const std::string& userId) const override;
    [[nodiscard]] std::vector<std::string> listUsers() const override;

private:
    mutable std::mutex mtx_;
    std::map<std::string, UserRecord> users_;
};

/**
 * @class JsonHistoryRepository
 * @brief In-memory repository populated from a JSON history document
 *
 * Malformed records, and user entries without a usable profile, are skipped
 * with a warning. A document that is not valid JSON, or has no "users"
 * array, fails the load.
 */
class JsonHistoryRepository : public InMemoryHistoryRepository {
public:
    [[nodiscard]] static Result<std::unique_ptr<JsonHistoryRepository>> loadFromFile(const std::string& path);
    [[nodiscard]] static Result<std::unique_ptr<JsonHistoryRepository>> loadFromString(const std::string& content);
};

/**
 * @brief True when @p date is at most @p windowDays whole days before @p now
 *
 * Future-dated and unparsable records are never in the window.
 */
[[nodiscard]] bool inWindow(const std::string& date, int windowDays, time_utils::TimePoint now);

} // namespace gymcoach

#endif // GYMCOACH_HISTORY_REPOSITORY_HPP
