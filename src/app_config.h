#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/tracking_client.h"
#include "clustering/cluster_engine.h"
#include "features/feature_builder.h"
#include "interpret/cluster_interpreter.h"
#include "obs/logging.h"
#include "resilience/resilient_caller.h"
#include "resilience/token_bucket.h"

namespace runscope {

// tracking: 60 calls/minute, llm: 50 calls/minute
auto DefaultRateLimits() -> std::map<std::string, resilience::BucketConfig>;

struct AppConfig {
    features::FeatureConfig features;
    clustering::ClusteringConfig clustering;
    interpret::InterpretationConfig interpretation;
    std::map<std::string, resilience::BucketConfig> rate_limits = DefaultRateLimits();
    resilience::RetryPolicy retry;
    client::TrackingClientConfig tracking;
    obs::LoggingConfig logging;
};

struct ConfigValidationError {
    std::string field;
    std::string message;
};

// Reads the sections present in `j` over the defaults. Throws ConfigurationError on wrong
// types or unknown enum names (ClusteringError for an unknown clustering algorithm).
auto LoadConfigJson(const nlohmann::json& j) -> AppConfig;

// LoadConfigJson + ApplyEnvOverrides + ValidateConfig; throws ConfigurationError listing every
// validation failure.
auto LoadConfigFile(const std::string& path) -> AppConfig;

// Applies RUNSCOPE_* environment variables. Unparseable values are logged and ignored.
void ApplyEnvOverrides(AppConfig& config);

auto ValidateConfig(const AppConfig& config) -> std::vector<ConfigValidationError>;

// Throws ConfigurationError when ValidateConfig reports anything.
void RequireValidConfig(const AppConfig& config);

auto ConfigToJson(const AppConfig& config) -> nlohmann::json;

} // namespace runscope
