#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app_config.h"
#include "clustering/cluster_engine.h"
#include "clustering/projection.h"
#include "contract.h"
#include "interpret/cluster_interpreter.h"
#include "types.h"

namespace runscope {

struct RunInfo {
    std::string name;
    RunStatus status = RunStatus::COMPLETED;
};

// Everything one analysis produced; rendered by report_writer.
struct AnalysisReport {
    std::string analysis_id;
    std::string generated_at;
    double duration_ms = 0.0;

    std::map<std::string, RunInfo> runs; // by run id
    FeatureMatrix matrix;
    clustering::ClusteringResult clustering;
    clustering::Projection projection;
    interpret::Interpretation interpretation;

    nlohmann::json config; // effective configuration, secrets removed
};

auto GenerateAnalysisId() -> std::string;

/**
 * @brief Feature building, clustering, 2-D projection and interpretation for one batch of runs.
 *
 * Sets analysis_id in the logging context for the duration of the call. Errors from the
 * stages propagate unchanged after one structured error log line.
 */
auto RunAnalysis(const std::vector<RunRecord>& runs, const AppConfig& config) -> AnalysisReport;

} // namespace runscope
