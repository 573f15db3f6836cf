// src/logging.cpp
// spdlog-backed logger with key=value fields.

#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>

namespace datrack {
namespace logging {
namespace {

constexpr const char* LOGGER_NAME = "datrack";

std::mutex g_init_mutex;

std::string resolve_level(const std::string& configured) {
    if (const char* level = std::getenv("DATRACK_LOG_LEVEL")) {
        return level;
    }
    return configured.empty() ? "warn" : configured;
}

std::shared_ptr<spdlog::logger> logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) return existing;
    std::lock_guard<std::mutex> lock(g_init_mutex);
    existing = spdlog::get(LOGGER_NAME);
    if (existing) return existing;
    auto created = spdlog::stdout_color_mt(LOGGER_NAME);
    created->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::warn);
    return created;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) out << ' ';
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const std::string& level) {
    auto l = logger();
    l->set_level(spdlog::level::from_str(resolve_level(level)));
    l->flush_on(spdlog::level::warn);
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto l = logger();
    if (!l->should_log(level)) return;

    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        l->log(level, "{}", message);
    } else {
        l->log(level, "{} {}", message, serialized);
    }
}

} // namespace logging
} // namespace datrack
