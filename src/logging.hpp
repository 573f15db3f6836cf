// src/logging.hpp
// Internal diagnostics logging on a dedicated spdlog logger.

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace datrack {
namespace logging {

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, int64_t value);
LogField bool_field(std::string_view key, bool value);

// Create the "datrack" logger on first use. The level comes from
// DATRACK_LOG_LEVEL when set, otherwise from `level`. Later calls only
// adjust the level.
void init_logging(const std::string& level);

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

} // namespace logging
} // namespace datrack

#define DATRACK_LOG_DEBUG(message, ...) ::datrack::logging::log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define DATRACK_LOG_INFO(message, ...) ::datrack::logging::log(spdlog::level::info, (message), ##__VA_ARGS__)
#define DATRACK_LOG_WARN(message, ...) ::datrack::logging::log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define DATRACK_LOG_ERROR(message, ...) ::datrack::logging::log(spdlog::level::err, (message), ##__VA_ARGS__)
