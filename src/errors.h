#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "obs/error_codes.h"

namespace runscope {

/**
 * @brief Base for every error raised by runscope. Carries a stable error code for logs.
 */
class RunscopeError : public std::runtime_error {
public:
    RunscopeError(const std::string& message, const char* code)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] auto code() const -> const char* { return code_; }

private:
    const char* code_;
};

// Malformed or insufficient input to the feature builder or record parser.
class ValidationError : public RunscopeError {
public:
    explicit ValidationError(const std::string& message)
        : RunscopeError(message, obs::kErrValidation) {}
};

// Algorithmic preconditions violated or numerical failure in the cluster engine.
class ClusteringError : public RunscopeError {
public:
    explicit ClusteringError(const std::string& message)
        : RunscopeError(message, obs::kErrClustering) {}
};

class ConfigurationError : public RunscopeError {
public:
    explicit ConfigurationError(const std::string& message)
        : RunscopeError(message, obs::kErrConfig) {}
};

enum class FailureKind {
    CONNECTION,
    TIMEOUT,
    RATE_LIMITED,
    SERVER,
    AUTHENTICATION,
    NOT_FOUND,
    INVALID_REQUEST
};

inline auto IsTransient(FailureKind kind) -> bool {
    switch (kind) {
        case FailureKind::CONNECTION:
        case FailureKind::TIMEOUT:
        case FailureKind::RATE_LIMITED:
        case FailureKind::SERVER:
            return true;
        case FailureKind::AUTHENTICATION:
        case FailureKind::NOT_FOUND:
        case FailureKind::INVALID_REQUEST:
            return false;
    }
    return false;
}

inline auto FailureKindToString(FailureKind kind) -> const char* {
    switch (kind) {
        case FailureKind::CONNECTION: return "connection";
        case FailureKind::TIMEOUT: return "timeout";
        case FailureKind::RATE_LIMITED: return "rate_limited";
        case FailureKind::SERVER: return "server";
        case FailureKind::AUTHENTICATION: return "authentication";
        case FailureKind::NOT_FOUND: return "not_found";
        case FailureKind::INVALID_REQUEST: return "invalid_request";
    }
    return "unknown";
}

inline auto FailureKindCode(FailureKind kind) -> const char* {
    switch (kind) {
        case FailureKind::CONNECTION: return obs::kErrServiceConnection;
        case FailureKind::TIMEOUT: return obs::kErrServiceTimeout;
        case FailureKind::RATE_LIMITED: return obs::kErrServiceRateLimited;
        case FailureKind::SERVER: return obs::kErrServiceServer;
        case FailureKind::AUTHENTICATION: return obs::kErrServiceAuthentication;
        case FailureKind::NOT_FOUND: return obs::kErrServiceNotFound;
        case FailureKind::INVALID_REQUEST: return obs::kErrServiceInvalidRequest;
    }
    return obs::kErrInternal;
}

/**
 * @brief Failure of one outbound call to an external service.
 *
 * Operations passed to ResilientCaller::Execute report failures by throwing this type;
 * the kind decides whether the call is retried.
 */
class ServiceError : public RunscopeError {
public:
    ServiceError(std::string service, FailureKind kind, const std::string& message)
        : RunscopeError(message, FailureKindCode(kind)), service_(std::move(service)), kind_(kind) {}

    [[nodiscard]] auto service() const -> const std::string& { return service_; }
    [[nodiscard]] auto kind() const -> FailureKind { return kind_; }
    [[nodiscard]] auto transient() const -> bool { return IsTransient(kind_); }

private:
    std::string service_;
    FailureKind kind_;
};

enum class ExhaustionReason {
    MAX_ATTEMPTS,
    TIME_BUDGET
};

/**
 * @brief A transient failure persisted until the retry policy gave up.
 *
 * Distinct from ServiceError so callers can tell "gave up after N tries"
 * from "failed immediately, don't retry".
 */
class RetriesExhaustedError : public RunscopeError {
public:
    RetriesExhaustedError(std::string service,
                          int attempts,
                          ExhaustionReason reason,
                          FailureKind last_kind,
                          std::string last_message)
        : RunscopeError(Describe(service, attempts, reason, last_message), obs::kErrRetriesExhausted),
          service_(std::move(service)),
          attempts_(attempts),
          reason_(reason),
          last_kind_(last_kind),
          last_message_(std::move(last_message)) {}

    [[nodiscard]] auto service() const -> const std::string& { return service_; }
    [[nodiscard]] auto attempts() const -> int { return attempts_; }
    [[nodiscard]] auto reason() const -> ExhaustionReason { return reason_; }
    [[nodiscard]] auto last_kind() const -> FailureKind { return last_kind_; }
    [[nodiscard]] auto last_message() const -> const std::string& { return last_message_; }

private:
    static auto Describe(const std::string& service, int attempts, ExhaustionReason reason,
                         const std::string& last_message) -> std::string {
        std::string why = reason == ExhaustionReason::MAX_ATTEMPTS ? "retries exhausted" : "time budget exceeded";
        return service + ": " + why + " after " + std::to_string(attempts) + " attempt(s): " + last_message;
    }

    std::string service_;
    int attempts_;
    ExhaustionReason reason_;
    FailureKind last_kind_;
    std::string last_message_;
};

} // namespace runscope
