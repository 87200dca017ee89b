#include "run_records.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "obs/logging.h"
#include "time_format.h"

namespace runscope {

using json = nlohmann::json;

static auto ParseMetricHistory(const std::string& run_id, const std::string& name, const json& value)
    -> std::optional<std::vector<double>> {
    if (value.is_number()) {
        return std::vector<double>{value.get<double>()};
    }
    if (value.is_array()) {
        std::vector<double> history;
        history.reserve(value.size());
        for (const auto& step : value) {
            if (step.is_number()) {
                history.push_back(step.get<double>());
            } else {
                // Keep step positions; the aggregator skips non-finite samples.
                history.push_back(std::numeric_limits<double>::quiet_NaN());
            }
        }
        return history;
    }
    spdlog::debug("Skipping non-numeric metric {} on run {}", name, run_id);
    return std::nullopt;
}

static void FlattenConfig(const std::string& prefix, const json& node, std::map<std::string, ConfigValue>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();
        if (value.is_object()) {
            // W&B style {"value": x, "desc": ...} wrappers collapse to x
            if (value.contains("value") && !value["value"].is_object()) {
                json wrapped = json::object();
                wrapped[it.key()] = value["value"];
                FlattenConfig(prefix, wrapped, out);
            } else {
                FlattenConfig(key, value, out);
            }
        } else if (value.is_boolean()) {
            out[key] = value.get<bool>();
        } else if (value.is_number()) {
            out[key] = value.get<double>();
        } else if (value.is_string()) {
            out[key] = value.get<std::string>();
        } else if (value.is_null()) {
            out[key] = MissingValue{};
        }
        // arrays carry no scalar meaning for clustering and are dropped
    }
}

auto ParseRunRecord(const json& j) -> RunRecord {
    if (!j.is_object()) {
        throw ValidationError("Run record must be a JSON object");
    }
    RunRecord run;
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw ValidationError("Run record is missing a non-empty string 'id'");
    }
    run.run_id = j["id"].get<std::string>();
    run.name = (j.contains("name") && j["name"].is_string()) ? j["name"].get<std::string>() : run.run_id;

    if (j.contains("state") && j["state"].is_string()) {
        auto state = j["state"].get<std::string>();
        auto status = ParseRunStatus(state);
        if (!status.has_value()) {
            throw ValidationError("Run " + run.run_id + " has unknown state '" + state + "'");
        }
        run.status = *status;
    }

    if (j.contains("created_at") && j["created_at"].is_string()) {
        run.created_at = ParseIsoTime(j["created_at"].get<std::string>());
        if (!run.created_at.has_value()) {
            spdlog::warn("Run {} has unparseable created_at '{}'", run.run_id, j["created_at"].get<std::string>());
        }
    }
    if (j.contains("commit") && j["commit"].is_string()) {
        run.commit = j["commit"].get<std::string>();
    }
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& tag : j["tags"]) {
            if (tag.is_string()) {
                run.tags.push_back(tag.get<std::string>());
            }
        }
    }

    if (j.contains("metrics")) {
        const auto& metrics = j["metrics"];
        if (!metrics.is_object()) {
            throw ValidationError("Run " + run.run_id + ": 'metrics' must be an object");
        }
        for (auto it = metrics.begin(); it != metrics.end(); ++it) {
            auto history = ParseMetricHistory(run.run_id, it.key(), it.value());
            if (history.has_value()) {
                run.metrics[it.key()] = std::move(*history);
            }
        }
    }

    if (j.contains("config")) {
        const auto& config = j["config"];
        if (!config.is_object()) {
            throw ValidationError("Run " + run.run_id + ": 'config' must be an object");
        }
        FlattenConfig("", config, run.config);
    }
    return run;
}

auto ParseRunRecords(const json& j) -> std::vector<RunRecord> {
    const json* list = &j;
    if (j.is_object()) {
        if (!j.contains("runs")) {
            throw ValidationError("Expected a JSON array of runs or an object with a 'runs' array");
        }
        list = &j["runs"];
    }
    if (!list->is_array()) {
        throw ValidationError("'runs' must be a JSON array");
    }
    std::vector<RunRecord> runs;
    runs.reserve(list->size());
    for (const auto& item : *list) {
        runs.push_back(ParseRunRecord(item));
    }
    return runs;
}

auto LoadRunRecordsFile(const std::string& path) -> std::vector<RunRecord> {
    std::ifstream f(path);
    if (!f.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "runs_load_error", "run_records",
                      {{"path", path}, {"error_code", obs::kErrInputReadFailed}});
        throw ValidationError("Failed to open runs file: " + path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ValidationError("Runs file " + path + " is not valid JSON: " + e.what());
    }
    auto runs = ParseRunRecords(j);
    spdlog::info("Loaded {} runs from {}", runs.size(), path);
    return runs;
}

auto RunRecordToJson(const RunRecord& run) -> json {
    json j;
    j["id"] = run.run_id;
    j["name"] = run.name;
    j["state"] = RunStatusToString(run.status);
    if (run.created_at.has_value()) {
        j["created_at"] = FormatIsoTime(*run.created_at);
    }
    if (run.commit.has_value()) {
        j["commit"] = *run.commit;
    }
    j["tags"] = run.tags;

    json metrics = json::object();
    for (const auto& [name, history] : run.metrics) {
        json values = json::array();
        for (double v : history) {
            if (std::isfinite(v)) {
                values.push_back(v);
            } else {
                values.push_back(nullptr);
            }
        }
        metrics[name] = values;
    }
    j["metrics"] = metrics;

    json config = json::object();
    for (const auto& [key, value] : run.config) {
        std::visit([&config, &key = key](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, MissingValue>) {
                config[key] = nullptr;
            } else {
                config[key] = v;
            }
        }, value);
    }
    j["config"] = config;
    return j;
}

} // namespace runscope
