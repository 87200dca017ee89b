#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace runscope {

/**
 * @brief Parses a run timestamp as logged by tracking services.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" (a space may replace the 'T'), an optional fractional part
 * that is truncated, and an optional zone suffix: "Z", "+HH:MM" or "-HH:MM". Without a
 * suffix the time is taken as UTC. Returns nullopt for anything else.
 */
auto ParseIsoTime(const std::string& iso) -> std::optional<std::chrono::system_clock::time_point>;

// Whole seconds, UTC, e.g. "2024-01-01T00:00:00Z".
auto FormatIsoTime(std::chrono::system_clock::time_point tp) -> std::string;

} // namespace runscope
