// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view CONNECTION = "Connection";
    inline constexpr std::string_view EXECUTOR = "Executor";
    inline constexpr std::string_view TRANSACTION = "Transaction";
    inline constexpr std::string_view BULK_LOAD = "BulkLoad";
    inline constexpr std::string_view POOL = "Pool";
    inline constexpr std::string_view CLIENT = "Client";
} // namespace logger_tag

struct log_config {
    spdlog::level::level_enum level = spdlog::level::warn;
    // empty: stdout only
    std::string path;
};

// we need a named logger per component, not the default one
inline log_t initialize_logger(std::string name, const log_config& config = {}) {
    if (auto log_ptr = spdlog::get(name); log_ptr) {
        // prevent creating two loggers with same name
        log_ptr->set_level(config.level);
        return log_ptr;
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!config.path.empty()) {
        std::string prefix = config.path;
        std::filesystem::create_directories(prefix);
        if (prefix.back() != '/') {
            prefix += '/';
        }

        using namespace std::chrono;
        system_clock::duration dtn = system_clock::now().time_since_epoch();
        auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true));
    }

    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v");
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

inline log_t get_logger(std::string_view tag) {
    if (auto log_ptr = spdlog::get(std::string(tag)); log_ptr) {
        return log_ptr;
    }
    return initialize_logger(std::string(tag));
}

inline void initialize_all_loggers(const log_config& config) {
    static constexpr std::array<std::string_view, 6> all_loggers = {
        logger_tag::CONNECTION,
        logger_tag::EXECUTOR,
        logger_tag::TRANSACTION,
        logger_tag::BULK_LOAD,
        logger_tag::POOL,
        logger_tag::CLIENT,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), config);
    }
}
