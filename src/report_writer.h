#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "analysis_pipeline.h"

namespace runscope {

// Structured report consumed by the dashboard and the summary prompt builder. Clusters are
// listed best first.
auto ToJson(const AnalysisReport& report) -> nlohmann::json;

// Throws RunscopeError (E_REPORT_WRITE_FAILED) when the file cannot be written.
void WriteReportJson(const AnalysisReport& report, const std::string& output_path);

} // namespace runscope
