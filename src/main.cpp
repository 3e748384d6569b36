/**
 * @file main.cpp
 * @brief gymcoach command-line driver
 * @version 1.0.0
 * @author GymCoach Analytics Team
 * Copyright (c) 2025 GymCoach Analytics Team - MIT License
 *
 * Loads a JSON history document and an optional INI threshold file, analyses
 * the selected users in parallel and prints one JSON document on stdout.
 *
 * Exit codes: 0 success, 1 usage error, 2 load/config error or no user
 * could be analysed.
 */

#include "analysis_engine.hpp"
#include "history_repository.hpp"
#include "gc_args.hpp"
#include "gc_config.hpp"
#include "gc_logger.hpp"
#include "gc_json.hpp"
#include "gc_time_utils.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <limits>

using namespace gymcoach;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_LOAD = 2;

args::ArgParser makeParser() {
    args::ArgParser parser("gymcoach", "Training analytics and adaptation decisions from workout history");
    parser.addRequired("history", 'H', "JSON history document", "FILE")
          .addOption("config", 'c', "INI threshold file", "", "FILE")
          .addMulti("user", 'u', "Analyse only this user id", "ID")
          .addOption("window", 'w', "Trailing window in days (overrides [engine] window_days)", "", "DAYS")
          .addOption("now", 'n', "Reference time, ISO-8601", "", "ISO")
          .addOption("threads", 't', "Worker threads, 0 for hardware concurrency", "", "N")
          .addOption("log-level", 'l', "TRACE, DEBUG, INFO, WARN, ERROR or FATAL", "", "LEVEL")
          .addOption("log-dir", '\0', "Also write logs to files in this directory", "", "DIR")
          .addFlag("pretty", 'p', "Indent the JSON output");
    return parser;
}

int usage(const args::ArgParser& parser, const std::string& message) {
    std::cerr << "gymcoach: " << message << "\n\n" << parser.help();
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = CoachLogger::instance();
    logger.setConsoleOutput(true);

    const auto parser = makeParser();
    const auto opts = parser.parse(argc, argv);
    if (opts.helpRequested()) {
        std::cout << parser.help();
        return 0;
    }
    if (!opts.success()) return usage(parser, opts.error());
    if (!opts.positional().empty()) return usage(parser, "unexpected argument: " + opts.positional().front());

    // Configuration: defaults, then the INI file, then command-line overrides
    AnalyticsConfig config;
    if (opts.has("config")) {
        auto loaded = loadConfigFile(opts["config"].asString());
        if (loaded.isError()) {
            std::cerr << "gymcoach: " << loaded.error().toString() << "\n";
            return EXIT_LOAD;
        }
        config = std::move(loaded).value();
    }

    if (opts.has("log-level")) {
        auto level = parseLogLevel(opts["log-level"].asString());
        if (!level) return usage(parser, "unknown log level: " + opts["log-level"].asString());
        config.engine.log_level = opts["log-level"].asString();
    }
    auto level = parseLogLevel(config.engine.log_level);
    if (!level) return usage(parser, "unknown log level in configuration: " + config.engine.log_level);
    logger.setLevel(*level);
    if (opts.has("log-dir")) {
        if (!logger.initialize(opts["log-dir"].asString(), *level)) {
            std::cerr << "gymcoach: cannot write logs to " << opts["log-dir"].asString() << "\n";
            return EXIT_LOAD;
        }
    }

    if (opts.has("window")) {
        auto days = opts["window"].asIntInRange(1, std::numeric_limits<int>::max());
        if (!days) return usage(parser, "--window expects a positive whole number of days");
        config.engine.window_days = *days;
    }
    if (opts.has("threads")) {
        auto threads = opts["threads"].asIntInRange(0, std::numeric_limits<int>::max());
        if (!threads) return usage(parser, "--threads expects a non-negative integer");
        config.engine.worker_threads = *threads;
    }

    time_utils::TimePoint now = time_utils::now();
    if (opts.has("now")) {
        auto parsed = time_utils::parseISO8601(opts["now"].asString());
        if (!parsed) return usage(parser, "--now is not an ISO-8601 date: " + opts["now"].asString());
        now = *parsed;
    }

    auto engine = AnalysisEngine::create(config);
    if (engine.isError()) {
        std::cerr << "gymcoach: " << engine.error().toString() << "\n";
        return EXIT_LOAD;
    }

    auto repo = JsonHistoryRepository::loadFromFile(opts["history"].asString());
    if (repo.isError()) {
        std::cerr << "gymcoach: " << repo.error().toString() << "\n";
        return EXIT_LOAD;
    }

    std::vector<std::string> users = opts["user"].values();
    if (users.empty()) users = repo.value()->listUsers();

    GC_LOG_INFO("Main", "Analysing " + std::to_string(users.size()) + " user(s) over " +
                std::to_string(config.engine.window_days) + " days");
    const auto results = engine.value()->analyzeUsers(*repo.value(), users,
                                                      config.engine.window_days, now);

    json::JsonObject reports;
    json::JsonObject errors;
    std::size_t succeeded = 0;
    for (const auto& [id, result] : results) {
        if (result.isOk()) {
            reports[id] = AnalysisEngine::reportToJson(result.value());
            ++succeeded;
        } else {
            errors[id] = json::object()
                .add("code", errorCodeToString(result.errorCode()))
                .add("message", result.error().message)
                .build();
        }
    }

    const auto doc = json::object()
        .add("generated_at", time_utils::toISO8601(now))
        .add("window_days", config.engine.window_days)
        .add("reports", std::move(reports))
        .add("errors", std::move(errors))
        .build();
    std::cout << doc.dump(opts.has("pretty") ? 2 : -1) << "\n";

    if (!users.empty() && succeeded == 0) return EXIT_LOAD;
    return 0;
}
