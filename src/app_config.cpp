#include "app_config.h"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "errors.h"

namespace runscope {

using json = nlohmann::json;

auto DefaultRateLimits() -> std::map<std::string, resilience::BucketConfig> {
    return {
        {resilience::kTrackingService, resilience::BucketConfig::PerMinute(60.0)},
        {resilience::kLlmService, resilience::BucketConfig::PerMinute(50.0)},
    };
}

namespace {

auto GetEnv(const char* key) -> std::optional<std::string> {
    const char* val = std::getenv(key);
    if (val == nullptr || *val == '\0') {
        return std::nullopt;
    }
    return std::string(val);
}

template <typename Apply>
void OverrideFromEnv(const char* key, Apply apply) {
    auto value = GetEnv(key);
    if (!value.has_value()) {
        return;
    }
    try {
        apply(*value);
        spdlog::debug("Config override from {}", key);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Warn, "config_env_invalid", "config",
                      {{"variable", key}, {"value", *value}, {"error", e.what()}});
    }
}

auto ParseTagComparison(const std::string& op) -> interpret::TagComparison {
    if (op == ">" || op == "gt") {
        return interpret::TagComparison::GREATER;
    }
    if (op == "<" || op == "lt") {
        return interpret::TagComparison::LESS;
    }
    throw ConfigurationError("Unknown tag rule operator '" + op + "' (expected > or <)");
}

void ReadFeatures(const json& j, features::FeatureConfig& out) {
    if (j.contains("aggregation")) {
        out.aggregation = features::ParseMetricAggregation(j.at("aggregation").get<std::string>());
    }
    if (j.contains("metric_aggregation")) {
        for (const auto& [metric, agg] : j.at("metric_aggregation").items()) {
            out.metric_aggregation[metric] = features::ParseMetricAggregation(agg.get<std::string>());
        }
    }
    out.include_config = j.value("include_config", out.include_config);
    if (j.contains("categorical")) {
        out.categorical = features::ParseCategoricalPolicy(j.at("categorical").get<std::string>());
    }
    out.max_categories = j.value("max_categories", out.max_categories);
    out.skip_private_keys = j.value("skip_private_keys", out.skip_private_keys);
    if (j.contains("exclude_keys")) {
        out.exclude_keys = j.at("exclude_keys").get<std::vector<std::string>>();
    }
}

void ReadClustering(const json& j, clustering::ClusteringConfig& out) {
    if (j.contains("algorithm")) {
        out.algorithm = clustering::ParseClusterAlgorithm(j.at("algorithm").get<std::string>());
    }
    out.n_clusters = j.value("n_clusters", out.n_clusters);
    out.auto_select_k = j.value("auto_select_k", out.auto_select_k);
    out.max_auto_k = j.value("max_auto_k", out.max_auto_k);
    out.n_init = j.value("n_init", out.n_init);
    out.max_iter = j.value("max_iter", out.max_iter);
    if (j.contains("seed") && !j.at("seed").is_null()) {
        out.seed = j.at("seed").get<uint64_t>();
    }
    if (j.contains("dbscan")) {
        const auto& db = j.at("dbscan");
        out.dbscan_eps = db.value("eps", out.dbscan_eps);
        out.dbscan_min_samples = db.value("min_samples", out.dbscan_min_samples);
    }
    out.min_runs_for_clustering = j.value("min_runs", out.min_runs_for_clustering);
}

void ReadInterpretation(const json& j, interpret::InterpretationConfig& out) {
    out.primary_metric = j.value("primary_metric", out.primary_metric);
    if (j.contains("direction")) {
        out.direction = interpret::ParseMetricDirection(j.at("direction").get<std::string>());
    }
    out.outlier_factor = j.value("outlier_factor", out.outlier_factor);
    out.top_features = j.value("top_features", out.top_features);
    out.config_features_only = j.value("config_features_only", out.config_features_only);
    if (j.contains("tag_rules")) {
        out.tag_rules.clear();
        for (const auto& rule : j.at("tag_rules")) {
            interpret::TagRule r;
            r.feature = rule.at("feature").get<std::string>();
            r.comparison = ParseTagComparison(rule.at("op").get<std::string>());
            r.threshold = rule.at("threshold").get<double>();
            r.tag = rule.at("tag").get<std::string>();
            out.tag_rules.push_back(std::move(r));
        }
    }
}

void ReadRateLimits(const json& j, std::map<std::string, resilience::BucketConfig>& out) {
    for (const auto& [service, limit] : j.items()) {
        resilience::BucketConfig cfg;
        if (limit.contains("per_minute")) {
            cfg = resilience::BucketConfig::PerMinute(limit.at("per_minute").get<double>());
        }
        cfg.capacity = limit.value("capacity", cfg.capacity);
        cfg.refill_per_second = limit.value("refill_per_second", cfg.refill_per_second);
        out[service] = cfg;
    }
}

void ReadRetry(const json& j, resilience::RetryPolicy& out) {
    out.max_attempts = j.value("max_attempts", out.max_attempts);
    out.min_backoff = std::chrono::milliseconds(j.value("min_backoff_ms", static_cast<long long>(out.min_backoff.count())));
    out.max_backoff = std::chrono::milliseconds(j.value("max_backoff_ms", static_cast<long long>(out.max_backoff.count())));
    out.multiplier = j.value("multiplier", out.multiplier);
    out.jitter_ratio = j.value("jitter_ratio", out.jitter_ratio);
    out.total_budget = std::chrono::milliseconds(j.value("total_budget_ms", static_cast<long long>(out.total_budget.count())));
    if (j.contains("seed") && !j.at("seed").is_null()) {
        out.seed = j.at("seed").get<uint64_t>();
    }
}

void ReadTracking(const json& j, client::TrackingClientConfig& out) {
    out.base_url = j.value("base_url", out.base_url);
    out.runs_path = j.value("runs_path", out.runs_path);
    out.api_key = j.value("api_key", out.api_key);
    out.connect_timeout_s = j.value("connect_timeout_s", out.connect_timeout_s);
    out.read_timeout_s = j.value("read_timeout_s", out.read_timeout_s);
    out.default_limit = j.value("default_limit", out.default_limit);
}

void ReadLogging(const json& j, obs::LoggingConfig& out) {
    out.level = j.value("level", out.level);
    if (j.contains("file") && j.at("file").is_string()) {
        out.file = j.at("file").get<std::string>();
    }
}

} // namespace

auto LoadConfigJson(const json& j) -> AppConfig {
    AppConfig config;
    if (!j.is_object()) {
        throw ConfigurationError("Config root must be a JSON object");
    }
    try {
        if (j.contains("features")) { ReadFeatures(j.at("features"), config.features); }
        if (j.contains("clustering")) { ReadClustering(j.at("clustering"), config.clustering); }
        if (j.contains("interpretation")) { ReadInterpretation(j.at("interpretation"), config.interpretation); }
        if (j.contains("rate_limits")) { ReadRateLimits(j.at("rate_limits"), config.rate_limits); }
        if (j.contains("retry")) { ReadRetry(j.at("retry"), config.retry); }
        if (j.contains("tracking")) { ReadTracking(j.at("tracking"), config.tracking); }
        if (j.contains("logging")) { ReadLogging(j.at("logging"), config.logging); }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }
    return config;
}

auto LoadConfigFile(const std::string& path) -> AppConfig {
    std::ifstream f(path);
    if (!f.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "config_load_error", "config",
                      {{"path", path}, {"error_code", obs::kErrConfig}, {"error", "Failed to open config file"}});
        throw ConfigurationError("Failed to open config file: " + path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Config file " + path + " is not valid JSON: " + e.what());
    }
    auto config = LoadConfigJson(j);
    ApplyEnvOverrides(config);
    RequireValidConfig(config);
    spdlog::info("Loaded config from {}", path);
    return config;
}

void ApplyEnvOverrides(AppConfig& config) {
    OverrideFromEnv("RUNSCOPE_LOG_LEVEL", [&](const std::string& v) {
        static_cast<void>(obs::ParseSpdlogLevel(v));
        config.logging.level = v;
    });
    OverrideFromEnv("RUNSCOPE_LOG_FILE", [&](const std::string& v) { config.logging.file = v; });
    OverrideFromEnv("RUNSCOPE_N_CLUSTERS", [&](const std::string& v) { config.clustering.n_clusters = std::stoi(v); });
    OverrideFromEnv("RUNSCOPE_SEED", [&](const std::string& v) { config.clustering.seed = std::stoull(v); });
    OverrideFromEnv("RUNSCOPE_ALGORITHM", [&](const std::string& v) {
        config.clustering.algorithm = clustering::ParseClusterAlgorithm(v);
    });
    OverrideFromEnv("RUNSCOPE_PRIMARY_METRIC", [&](const std::string& v) { config.interpretation.primary_metric = v; });
    OverrideFromEnv("RUNSCOPE_METRIC_DIRECTION", [&](const std::string& v) {
        config.interpretation.direction = interpret::ParseMetricDirection(v);
    });
    OverrideFromEnv("RUNSCOPE_TRACKING_URL", [&](const std::string& v) { config.tracking.base_url = v; });
    OverrideFromEnv("RUNSCOPE_TRACKING_API_KEY", [&](const std::string& v) { config.tracking.api_key = v; });
    OverrideFromEnv("RUNSCOPE_RETRY_MAX_ATTEMPTS", [&](const std::string& v) { config.retry.max_attempts = std::stoi(v); });
    OverrideFromEnv("RUNSCOPE_TRACKING_RATE_PER_MIN", [&](const std::string& v) {
        config.rate_limits[resilience::kTrackingService] = resilience::BucketConfig::PerMinute(std::stod(v));
    });
    OverrideFromEnv("RUNSCOPE_LLM_RATE_PER_MIN", [&](const std::string& v) {
        config.rate_limits[resilience::kLlmService] = resilience::BucketConfig::PerMinute(std::stod(v));
    });
}

auto ValidateConfig(const AppConfig& config) -> std::vector<ConfigValidationError> {
    std::vector<ConfigValidationError> errors;
    auto fail = [&errors](std::string field, std::string message) {
        errors.push_back({std::move(field), std::move(message)});
    };

    if (config.features.max_categories < 1) {
        fail("features.max_categories", "must be >= 1");
    }

    const auto& c = config.clustering;
    if (c.n_clusters < 1) { fail("clustering.n_clusters", "must be >= 1"); }
    if (c.n_init < 1) { fail("clustering.n_init", "must be >= 1"); }
    if (c.max_iter < 1) { fail("clustering.max_iter", "must be >= 1"); }
    if (c.auto_select_k && c.max_auto_k < 2) { fail("clustering.max_auto_k", "must be >= 2 when auto_select_k is set"); }
    if (!(c.dbscan_eps > 0.0)) { fail("clustering.dbscan.eps", "must be positive"); }
    if (c.dbscan_min_samples < 1) { fail("clustering.dbscan.min_samples", "must be >= 1"); }
    if (c.min_runs_for_clustering < 1) { fail("clustering.min_runs", "must be >= 1"); }

    const auto& i = config.interpretation;
    if (i.primary_metric.empty()) { fail("interpretation.primary_metric", "must not be empty"); }
    if (!(i.outlier_factor > 0.0)) { fail("interpretation.outlier_factor", "must be positive"); }

    if (config.rate_limits.count(resilience::kTrackingService) == 0) {
        fail("rate_limits.tracking", "a limit for the tracking service is required");
    }
    for (const auto& [service, limit] : config.rate_limits) {
        if (!(limit.capacity >= 1.0)) { fail("rate_limits." + service + ".capacity", "must be >= 1"); }
        if (!(limit.refill_per_second >= resilience::kMinRefillPerSecond)) {
            fail("rate_limits." + service + ".refill_per_second", "must be at least one token per day");
        }
    }

    const auto& r = config.retry;
    if (r.max_attempts < 1) { fail("retry.max_attempts", "must be >= 1"); }
    if (r.min_backoff.count() < 0) { fail("retry.min_backoff_ms", "must be >= 0"); }
    if (r.max_backoff < r.min_backoff) { fail("retry.max_backoff_ms", "must be >= min_backoff_ms"); }
    if (!(r.multiplier >= 1.0)) { fail("retry.multiplier", "must be >= 1"); }
    if (!(r.jitter_ratio >= 0.0 && r.jitter_ratio < 1.0)) { fail("retry.jitter_ratio", "must be in [0, 1)"); }
    if (r.total_budget.count() <= 0) { fail("retry.total_budget_ms", "must be positive"); }

    const auto& t = config.tracking;
    if (t.base_url.empty()) { fail("tracking.base_url", "must not be empty"); }
    if (t.connect_timeout_s <= 0) { fail("tracking.connect_timeout_s", "must be positive"); }
    if (t.read_timeout_s <= 0) { fail("tracking.read_timeout_s", "must be positive"); }
    if (t.default_limit < 1) { fail("tracking.default_limit", "must be >= 1"); }

    try {
        static_cast<void>(obs::ParseSpdlogLevel(config.logging.level));
    } catch (const ConfigurationError& e) {
        fail("logging.level", e.what());
    }
    return errors;
}

void RequireValidConfig(const AppConfig& config) {
    auto errors = ValidateConfig(config);
    if (errors.empty()) {
        return;
    }
    json field_errors = json::array();
    std::string summary;
    for (const auto& e : errors) {
        field_errors.push_back({{"field", e.field}, {"message", e.message}});
        summary += (summary.empty() ? "" : "; ") + e.field + ": " + e.message;
    }
    obs::LogEvent(obs::LogLevel::Error, "config_invalid", "config",
                  {{"error_code", obs::kErrConfig}, {"field_errors", field_errors}});
    throw ConfigurationError("Invalid configuration: " + summary);
}

auto ConfigToJson(const AppConfig& config) -> json {
    json j;
    j["features"] = {
        {"aggregation", features::MetricAggregationToString(config.features.aggregation)},
        {"include_config", config.features.include_config},
        {"categorical", features::CategoricalPolicyToString(config.features.categorical)},
        {"max_categories", config.features.max_categories},
        {"skip_private_keys", config.features.skip_private_keys},
        {"exclude_keys", config.features.exclude_keys}};
    json overrides = json::object();
    for (const auto& [metric, agg] : config.features.metric_aggregation) {
        overrides[metric] = features::MetricAggregationToString(agg);
    }
    j["features"]["metric_aggregation"] = overrides;

    const auto& c = config.clustering;
    j["clustering"] = {
        {"algorithm", clustering::ClusterAlgorithmToString(c.algorithm)},
        {"n_clusters", c.n_clusters},
        {"auto_select_k", c.auto_select_k},
        {"max_auto_k", c.max_auto_k},
        {"n_init", c.n_init},
        {"max_iter", c.max_iter},
        {"seed", c.seed.has_value() ? json(*c.seed) : json(nullptr)},
        {"dbscan", {{"eps", c.dbscan_eps}, {"min_samples", c.dbscan_min_samples}}},
        {"min_runs", c.min_runs_for_clustering}};

    const auto& i = config.interpretation;
    j["interpretation"] = {
        {"primary_metric", i.primary_metric},
        {"direction", interpret::MetricDirectionToString(i.direction)},
        {"outlier_factor", i.outlier_factor},
        {"top_features", i.top_features},
        {"config_features_only", i.config_features_only}};
    json rules = json::array();
    for (const auto& rule : i.tag_rules) {
        rules.push_back({{"feature", rule.feature},
                         {"op", rule.comparison == interpret::TagComparison::GREATER ? ">" : "<"},
                         {"threshold", rule.threshold},
                         {"tag", rule.tag}});
    }
    j["interpretation"]["tag_rules"] = rules;

    j["rate_limits"] = json::object();
    for (const auto& [service, limit] : config.rate_limits) {
        j["rate_limits"][service] = {{"capacity", limit.capacity}, {"refill_per_second", limit.refill_per_second}};
    }

    const auto& r = config.retry;
    j["retry"] = {
        {"max_attempts", r.max_attempts},
        {"min_backoff_ms", r.min_backoff.count()},
        {"max_backoff_ms", r.max_backoff.count()},
        {"multiplier", r.multiplier},
        {"jitter_ratio", r.jitter_ratio},
        {"total_budget_ms", r.total_budget.count()}};

    // api_key is never echoed
    j["tracking"] = {
        {"base_url", config.tracking.base_url},
        {"runs_path", config.tracking.runs_path},
        {"connect_timeout_s", config.tracking.connect_timeout_s},
        {"read_timeout_s", config.tracking.read_timeout_s},
        {"default_limit", config.tracking.default_limit}};

    j["logging"] = {{"level", config.logging.level}};
    if (config.logging.file.has_value()) {
        j["logging"]["file"] = *config.logging.file;
    }
    return j;
}

} // namespace runscope
