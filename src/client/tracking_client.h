#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <httplib.h>

#include "errors.h"
#include "resilience/resilient_caller.h"
#include "types.h"

namespace runscope::client {

struct TrackingClientConfig {
    std::string base_url = "http://localhost:8080";
    std::string runs_path = "/api/runs";
    std::string api_key; // sent as a bearer token when non-empty
    int connect_timeout_s = 5;
    int read_timeout_s = 30;
    size_t default_limit = 100;
};

inline constexpr size_t kMaxNameLength = 100;

// Maps an HTTP status to a failure kind; nullopt for statuses that are not failures.
auto ClassifyHttpStatus(int status) -> std::optional<FailureKind>;

auto ClassifyTransportError(httplib::Error error) -> FailureKind;

// Throws ValidationError for an empty (or all-whitespace) name or one longer than kMaxNameLength.
void ValidateName(const std::string& value, const std::string& what);

/**
 * @brief Reads runs from the remote tracking service.
 *
 * Every request goes through ResilientCaller::Execute under the "tracking" service, so it is
 * rate limited and transient failures (connection errors, timeouts, 429, 5xx) are retried.
 */
class TrackingClient {
public:
    TrackingClient(TrackingClientConfig config, std::shared_ptr<resilience::ResilientCaller> caller);

    auto FetchRuns(const std::string& entity, const std::string& project, size_t limit = 0)
        -> std::vector<RunRecord>;

    // Stats of the most recent FetchRuns call.
    [[nodiscard]] auto last_call_stats() const -> const resilience::CallStats& { return last_stats_; }

private:
    auto GetOnce(const std::string& path, const httplib::Params& params) const -> std::string;

    TrackingClientConfig config_;
    std::shared_ptr<resilience::ResilientCaller> caller_;
    resilience::CallStats last_stats_;
};

} // namespace runscope::client
