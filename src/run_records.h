#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"

namespace runscope {

/**
 * @brief Decodes one run as returned by the tracking service.
 *
 * Metrics may be a scalar (one-step history) or an array; nested config objects are
 * flattened into dotted keys. Throws ValidationError on a missing id or unknown state.
 */
auto ParseRunRecord(const nlohmann::json& j) -> RunRecord;

/**
 * @brief Accepts either a JSON array of runs or an object with a "runs" array.
 */
auto ParseRunRecords(const nlohmann::json& j) -> std::vector<RunRecord>;

auto LoadRunRecordsFile(const std::string& path) -> std::vector<RunRecord>;

auto RunRecordToJson(const RunRecord& run) -> nlohmann::json;

} // namespace runscope
