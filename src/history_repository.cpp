/**
 * @file history_repository.cpp
 * @brief In-memory and JSON-backed history repositories
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 */

#include "history_repository.hpp"
#include "gc_serialization.hpp"
#include "gc_json.hpp"
#include "gc_logger.hpp"
#include <fstream>
#include <sstream>

namespace gymcoach {

bool inWindow(const std::string& date, int windowDays, time_utils::TimePoint now) {
    auto when = time_utils::parseISO8601(date);
    if (!when) return false;
    const int64_t age = time_utils::wholeDaysBetween(*when, now);
    return age >= 0 && age <= windowDays;
}

namespace {

template<typename T>
std::vector<T> filterWindow(const std::vector<T>& records, int windowDays, time_utils::TimePoint now,
                            const std::string& userId, const char* kind) {
    std::vector<T> out;
    for (const auto& r : records) {
        if (!time_utils::parseISO8601(r.date)) {
            GC_LOG_WARNING("HistoryRepository", userId + ": skipping " + kind + " with unparsable date '" + r.date + "'");
            continue;
        }
        if (inWindow(r.date, windowDays, now)) out.push_back(r);
    }
    return out;
}

Error unknownUser(const std::string& userId) {
    return Error{ErrorCode::NOT_FOUND, "unknown user: " + userId};
}

} // namespace

//=============================================================================
// HistoryRepository
//=============================================================================

Result<TrainingHistory> HistoryRepository::getHistory(const std::string& userId, int windowDays,
                                                      time_utils::TimePoint now) const {
    auto workouts = getWorkouts(userId, windowDays, now);
    if (workouts.isError()) return workouts.error();
    auto measurements = getMeasurements(userId, windowDays, now);
    if (measurements.isError()) return measurements.error();
    auto nutrition = getNutrition(userId, windowDays, now);
    if (nutrition.isError()) return nutrition.error();

    TrainingHistory history;
    history.workouts = std::move(workouts).value();
    history.measurements = std::move(measurements).value();
    history.nutrition = std::move(nutrition).value();
    return history;
}

//=============================================================================
// InMemoryHistoryRepository
//=============================================================================

Result<void> InMemoryHistoryRepository::putUser(UserRecord record) {
    if (record.profile.user_id.empty()) {
        return Err(ErrorCode::INVALID_ARGUMENT, "user record without user_id");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string id = record.profile.user_id;
    users_[id] = std::move(record);
    return Ok();
}

void InMemoryHistoryRepository::addWorkout(const std::string& userId, WorkoutSession session) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& rec = users_[userId];
    rec.profile.user_id = userId;
    rec.history.workouts.push_back(std::move(session));
}

void InMemoryHistoryRepository::addMeasurement(const std::string& userId, BodyMeasurement measurement) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& rec = users_[userId];
    rec.profile.user_id = userId;
    rec.history.measurements.push_back(std::move(measurement));
}

void InMemoryHistoryRepository::addNutrition(const std::string& userId, NutritionDay day) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& rec = users_[userId];
    rec.profile.user_id = userId;
    rec.history.nutrition.push_back(std::move(day));
}

std::size_t InMemoryHistoryRepository::userCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return users_.size();
}

Result<std::vector<WorkoutSession>> InMemoryHistoryRepository::getWorkouts(
    const std::string& userId, int windowDays, time_utils::TimePoint now) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = users_.find(userId);
    if (it == users_.end()) return unknownUser(userId);
    return filterWindow(it->second.history.workouts, windowDays, now, userId, "workout");
}

Result<std::vector<BodyMeasurement>> InMemoryHistoryRepository::getMeasurements(
    const std::string& userId, int windowDays, time_utils::TimePoint now) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = users_.find(userId);
    if (it == users_.end()) return unknownUser(userId);
    return filterWindow(it->second.history.measurements, windowDays, now, userId, "measurement");
}

Result<std::vector<NutritionDay>> InMemoryHistoryRepository::getNutrition(
    const std::string& userId, int windowDays, time_utils::TimePoint now) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = users_.find(userId);
    if (it == users_.end()) return unknownUser(userId);
    return filterWindow(it->second.history.nutrition, windowDays, now, userId, "nutrition entry");
}

Result<UserProfile> InMemoryHistoryRepository::getUserProfile(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = users_.find(userId);
    if (it == users_.end()) return unknownUser(userId);
    return it->second.profile;
}

Result<WorkoutPlan> InMemoryHistoryRepository::getPlan(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = users_.find(userId);
    if (it == users_.end()) return unknownUser(userId);
    return it->second.plan;
}

std::vector<std::string> InMemoryHistoryRepository::listUsers() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> ids;
    ids.reserve(users_.size());
    for (const auto& [id, rec] : users_) ids.push_back(id);
    return ids;
}

//=============================================================================
// JsonHistoryRepository
//=============================================================================

Result<std::unique_ptr<JsonHistoryRepository>> JsonHistoryRepository::loadFromString(const std::string& content) {
    auto doc = json::parse(content);
    if (doc.isError()) return doc.error();

    const json::JsonValue* users = doc->find("users");
    if (!users || !users->isArray()) {
        return Error{ErrorCode::PARSE_ERROR, "history document has no \"users\" array"};
    }

    auto repo = std::make_unique<JsonHistoryRepository>();
    std::size_t index = 0;
    for (const auto& entry : users->asArray()) {
        const std::string label = "users[" + std::to_string(index++) + "]";
        const json::JsonValue* profileJson = entry.find("profile");
        if (!profileJson) {
            GC_LOG_WARNING("HistoryRepository", label + ": missing profile, entry skipped");
            continue;
        }
        auto profile = serialization::profileFromJson(*profileJson);
        if (profile.isError()) {
            GC_LOG_WARNING("HistoryRepository", label + ": " + profile.error().message + ", entry skipped");
            continue;
        }

        UserRecord rec;
        rec.profile = std::move(profile).value();
        const std::string& owner = rec.profile.user_id;
        rec.history.workouts = serialization::loadList<WorkoutSession>(
            entry, "workouts", owner, serialization::sessionFromJson);
        rec.history.measurements = serialization::loadList<BodyMeasurement>(
            entry, "measurements", owner, serialization::measurementFromJson);
        rec.history.nutrition = serialization::loadList<NutritionDay>(
            entry, "nutrition", owner, serialization::nutritionFromJson);

        if (const json::JsonValue* planJson = entry.find("plan")) {
            auto plan = serialization::planFromJson(*planJson);
            if (plan.isError()) {
                GC_LOG_WARNING("HistoryRepository", owner + ": " + plan.error().message + ", plan ignored");
            } else {
                rec.plan = std::move(plan).value();
            }
        }

        GC_LOG_DEBUG("HistoryRepository", owner + ": loaded " + std::to_string(rec.history.workouts.size()) +
                     " workouts, " + std::to_string(rec.history.measurements.size()) + " measurements");
        auto stored = repo->putUser(std::move(rec));
        if (stored.isError()) return stored.error();
    }

    GC_LOG_INFO("HistoryRepository", "Loaded " + std::to_string(repo->userCount()) + " user(s)");
    return repo;
}

Result<std::unique_ptr<JsonHistoryRepository>> JsonHistoryRepository::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::IO_ERROR, "cannot open history file", path};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IO_ERROR, "read failed", path};
    }

    auto loaded = loadFromString(oss.str());
    if (loaded.isError()) {
        Error err = loaded.error();
        err.context = path;
        return err;
    }
    return loaded;
}

} // namespace gymcoach
