#include "obs/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <memory>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "errors.h"

namespace runscope::obs {

auto LevelToString(LogLevel level) -> const char* {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

auto ToSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

auto NowIso8601() -> std::string {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now - time_point_cast<seconds>(now)).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", tm, ms);
}

void LogEvent(LogLevel level, const std::string& event, const std::string& component, const nlohmann::json& fields) {
    nlohmann::json j = fields.is_object() ? fields : nlohmann::json{{"value", fields}};
    j["ts"] = NowIso8601();
    j["level"] = LevelToString(level);
    j["event"] = event;
    j["component"] = component;
    if (HasContext()) {
        auto ctx = ContextFields(GetContext());
        for (auto it = ctx.begin(); it != ctx.end(); ++it) {
            if (!j.contains(it.key())) {
                j[it.key()] = it.value();
            }
        }
    }
    spdlog::log(ToSpdlogLevel(level), j.dump());
}

ScopedTimer::ScopedTimer(std::string event, std::string component, nlohmann::json fields)
    : event_(std::move(event)),
      component_(std::move(component)),
      fields_(std::move(fields)),
      start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    if (!stopped_) {
        Stop(LogLevel::Info);
    }
}

auto ScopedTimer::ElapsedMs() const -> double {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
}

void ScopedTimer::Stop(LogLevel level, const nlohmann::json& extra) {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    nlohmann::json payload = fields_;
    if (extra.is_object()) {
        payload.update(extra);
    }
    payload["duration_ms"] = ElapsedMs();
    LogEvent(level, event_, component_, payload);
}

auto ParseSpdlogLevel(const std::string& level) -> spdlog::level::level_enum {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "warning") {
        lowered = "warn";
    }
    if (lowered == "critical") {
        return spdlog::level::critical;
    }
    auto parsed = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && lowered != "off") {
        throw ConfigurationError("Unknown log level: " + level);
    }
    return parsed;
}

void ConfigureLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.file.has_value() && !config.file->empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigurationError("Cannot open log file " + *config.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("runscope", sinks.begin(), sinks.end());
    logger->set_level(ParseSpdlogLevel(config.level));
    spdlog::set_default_logger(logger);
    spdlog::debug("Logger initialized with level {}", config.level);
}

} // namespace runscope::obs
