#pragma once

namespace runscope {
namespace obs {

inline constexpr const char* kErrValidation = "E_VALIDATION";
inline constexpr const char* kErrClustering = "E_CLUSTERING";
inline constexpr const char* kErrConfig = "E_CONFIG";

inline constexpr const char* kErrServiceConnection = "E_SERVICE_CONNECTION";
inline constexpr const char* kErrServiceTimeout = "E_SERVICE_TIMEOUT";
inline constexpr const char* kErrServiceRateLimited = "E_SERVICE_RATE_LIMITED";
inline constexpr const char* kErrServiceServer = "E_SERVICE_SERVER";
inline constexpr const char* kErrServiceAuthentication = "E_SERVICE_AUTHENTICATION";
inline constexpr const char* kErrServiceNotFound = "E_SERVICE_NOT_FOUND";
inline constexpr const char* kErrServiceInvalidRequest = "E_SERVICE_INVALID_REQUEST";
inline constexpr const char* kErrRetriesExhausted = "E_RETRIES_EXHAUSTED";

inline constexpr const char* kErrReportWriteFailed = "E_REPORT_WRITE_FAILED";
inline constexpr const char* kErrInputReadFailed = "E_INPUT_READ_FAILED";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace runscope
