#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace runscope {
namespace obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

auto LevelToString(LogLevel level) -> const char*;
auto ToSpdlogLevel(LogLevel level) -> spdlog::level::level_enum;

// UTC with millisecond precision, e.g. "2024-01-01T09:30:00.125Z".
auto NowIso8601() -> std::string;

/**
 * @brief Logs one JSON line made of the caller's fields plus ts, level, event and component.
 *
 * Non-empty entries of the active obs::Context are added unless the caller already set a
 * field of the same name.
 */
void LogEvent(LogLevel level,
              const std::string& event,
              const std::string& component,
              const nlohmann::json& fields = nlohmann::json::object());

// Logs `event` with duration_ms when stopped, or on destruction if Stop was never called.
class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object());
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;

    [[nodiscard]] auto ElapsedMs() const -> double;

    // Later calls are ignored. `extra` overrides fields given at construction.
    void Stop(LogLevel level = LogLevel::Info, const nlohmann::json& extra = nlohmann::json::object());

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::string> file;
};

// Installs the default "runscope" logger: colored stdout plus an optional file sink.
void ConfigureLogging(const LoggingConfig& config);

auto ParseSpdlogLevel(const std::string& level) -> spdlog::level::level_enum;

} // namespace obs
} // namespace runscope
