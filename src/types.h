#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace runscope {

enum class RunStatus {
    RUNNING,
    COMPLETED,
    FAILED,
    CRASHED
};

struct MissingValue {};

inline auto operator==(const MissingValue&, const MissingValue&) -> bool { return true; }

// Hyperparameter value as logged by the tracking service.
using ConfigValue = std::variant<MissingValue, double, bool, std::string>;

// Metric name -> values logged over training steps, in step order.
using MetricHistory = std::map<std::string, std::vector<double>>;

struct RunRecord {
    std::string run_id;
    std::string name;
    RunStatus status = RunStatus::COMPLETED;

    MetricHistory metrics;
    std::map<std::string, ConfigValue> config;

    std::optional<std::chrono::system_clock::time_point> created_at;
    std::optional<std::string> commit;
    std::vector<std::string> tags;
};

inline auto RunStatusToString(RunStatus status) -> const char* {
    switch (status) {
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
        case RunStatus::CRASHED: return "crashed";
    }
    return "completed";
}

inline auto ParseRunStatus(const std::string& value) -> std::optional<RunStatus> {
    if (value == "running") { return RunStatus::RUNNING; }
    if (value == "completed" || value == "finished") { return RunStatus::COMPLETED; }
    if (value == "failed") { return RunStatus::FAILED; }
    if (value == "crashed" || value == "killed") { return RunStatus::CRASHED; }
    return std::nullopt;
}

} // namespace runscope
