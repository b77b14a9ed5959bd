#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

// =============================================================================
// FILE: dex/core/log.hpp
// BRIEF: Structured logging over spdlog
//
// Level and pattern resolve as: environment (DEX_LOG_LEVEL, DEX_LOG_PATTERN),
// then LogConfig, then the defaults below. Kernels never log; the pipeline
// reports stage boundaries and per-gene losses through this interface.
// =============================================================================

namespace dex::log {

struct LogConfig {
    std::string level;      // empty -> "info"
    std::string pattern;    // empty -> "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"
    std::string logger_name = "dex";
};

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField RealField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void initialize(const LogConfig& config = {});
void shutdown();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace dex::log

#define DEX_LOG_DEBUG(message, ...) ::dex::log::debug((message), ##__VA_ARGS__)
#define DEX_LOG_INFO(message, ...) ::dex::log::info((message), ##__VA_ARGS__)
#define DEX_LOG_WARN(message, ...) ::dex::log::warn((message), ##__VA_ARGS__)
#define DEX_LOG_ERROR(message, ...) ::dex::log::error((message), ##__VA_ARGS__)
