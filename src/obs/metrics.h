#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../metrics.h"
#include "obs/logging.h"

namespace runscope {
namespace obs {

// Each Emit* call updates the process registry and logs one debug-level "metric" event.
namespace detail {

inline void LogMetric(const char* type,
                      const std::string& name,
                      const nlohmann::json& value,
                      const std::string& unit,
                      const std::string& component,
                      const metrics::Labels& labels,
                      const nlohmann::json& fields) {
    nlohmann::json payload = fields;
    payload["metric_name"] = name;
    payload["metric_type"] = type;
    payload["value"] = value;
    payload["unit"] = unit;
    if (!labels.empty()) {
        payload["labels"] = labels;
    }
    LogEvent(LogLevel::Debug, "metric", component, payload);
}

} // namespace detail

inline void EmitCounter(const std::string& name,
                        long value,
                        const std::string& unit,
                        const std::string& component,
                        const metrics::Labels& labels = {},
                        const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Increment(name, labels, value);
    detail::LogMetric("counter", name, value, unit, component, labels, fields);
}

inline void EmitGauge(const std::string& name,
                      double value,
                      const std::string& unit,
                      const std::string& component,
                      const metrics::Labels& labels = {},
                      const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().SetGauge(name, labels, value);
    detail::LogMetric("gauge", name, value, unit, component, labels, fields);
}

inline void EmitHistogram(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::string& component,
                          const metrics::Labels& labels = {},
                          const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Observe(name, labels, value);
    detail::LogMetric("histogram", name, value, unit, component, labels, fields);
}

} // namespace obs
} // namespace runscope
