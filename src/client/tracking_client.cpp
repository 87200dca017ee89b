#include "client/tracking_client.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"
#include "obs/logging.h"
#include "run_records.h"

namespace runscope::client {

auto ClassifyHttpStatus(int status) -> std::optional<FailureKind> {
    if (status >= 200 && status < 400) {
        return std::nullopt;
    }
    switch (status) {
        case 401:
        case 403:
            return FailureKind::AUTHENTICATION;
        case 404:
            return FailureKind::NOT_FOUND;
        case 408:
            return FailureKind::TIMEOUT;
        case 429:
            return FailureKind::RATE_LIMITED;
        default:
            break;
    }
    if (status >= 500) {
        return FailureKind::SERVER;
    }
    // 400, 422 and any other client error
    return FailureKind::INVALID_REQUEST;
}

auto ClassifyTransportError(httplib::Error error) -> FailureKind {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return FailureKind::TIMEOUT;
        default:
            return FailureKind::CONNECTION;
    }
}

void ValidateName(const std::string& value, const std::string& what) {
    bool blank = std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (value.empty() || blank) {
        throw ValidationError(what + " name cannot be empty");
    }
    if (value.size() > kMaxNameLength) {
        throw ValidationError(fmt::format("{} name too long (max {} characters)", what, kMaxNameLength));
    }
}

TrackingClient::TrackingClient(TrackingClientConfig config, std::shared_ptr<resilience::ResilientCaller> caller)
    : config_(std::move(config)), caller_(std::move(caller)) {
    if (!caller_) {
        throw ConfigurationError("TrackingClient requires a ResilientCaller");
    }
}

auto TrackingClient::GetOnce(const std::string& path, const httplib::Params& params) const -> std::string {
    httplib::Client cli(config_.base_url);
    cli.set_connection_timeout(config_.connect_timeout_s, 0);
    cli.set_read_timeout(config_.read_timeout_s, 0);

    httplib::Headers headers = {{"Accept", "application/json"}};
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }
    if (obs::HasContext() && !obs::GetContext().request_id.empty()) {
        headers.emplace("X-Request-ID", obs::GetContext().request_id);
    }

    auto res = cli.Get(path, params, headers);
    if (!res) {
        auto err = res.error();
        throw ServiceError(resilience::kTrackingService, ClassifyTransportError(err),
                           fmt::format("GET {} failed: {}", path, httplib::to_string(err)));
    }
    if (auto kind = ClassifyHttpStatus(res->status)) {
        throw ServiceError(resilience::kTrackingService, *kind,
                           fmt::format("GET {} returned HTTP {}", path, res->status));
    }
    return res->body;
}

auto TrackingClient::FetchRuns(const std::string& entity, const std::string& project, size_t limit)
    -> std::vector<RunRecord> {
    ValidateName(entity, "Entity");
    ValidateName(project, "Project");
    if (limit == 0) {
        limit = config_.default_limit;
    }

    obs::Context ctx = obs::CurrentContext();
    ctx.entity = entity;
    ctx.project = project;
    obs::ScopedContext scoped(ctx);

    obs::ScopedTimer timer("runs_fetched", "tracking_client", {{"limit", limit}});
    httplib::Params params = {{"entity", entity}, {"project", project}, {"limit", std::to_string(limit)}};

    last_stats_ = resilience::CallStats{};
    std::string body = caller_->Execute(
        resilience::kTrackingService,
        [this, &params]() { return GetOnce(config_.runs_path, params); },
        &last_stats_);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Tracking service returned malformed JSON: ") + e.what());
    }
    auto runs = ParseRunRecords(j);
    if (runs.size() > limit) {
        runs.resize(limit);
    }
    timer.Stop(obs::LogLevel::Info, {{"runs", runs.size()}, {"attempts", last_stats_.attempts}});
    spdlog::info("Fetched {} runs from {}/{}", runs.size(), entity, project);
    return runs;
}

} // namespace runscope::client
