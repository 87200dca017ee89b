#include "analysis_pipeline.h"

#include <array>
#include <chrono>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include "errors.h"
#include "features/feature_builder.h"
#include "obs/context.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace runscope {

auto GenerateAnalysisId() -> std::string {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    std::array<char, 37> uuid{};
    uuid_unparse_lower(binuuid, uuid.data());
    return {uuid.data()};
}

auto RunAnalysis(const std::vector<RunRecord>& runs, const AppConfig& config) -> AnalysisReport {
    AnalysisReport report;
    report.analysis_id = GenerateAnalysisId();
    report.generated_at = obs::NowIso8601();
    report.config = ConfigToJson(config);

    obs::Context ctx = obs::CurrentContext();
    ctx.analysis_id = report.analysis_id;
    obs::ScopedContext scoped(ctx);

    auto start = std::chrono::steady_clock::now();
    obs::LogEvent(obs::LogLevel::Info, "analysis_start", "pipeline", {{"runs", runs.size()}});

    for (const auto& run : runs) {
        report.runs[run.run_id] = RunInfo{run.name.empty() ? run.run_id : run.name, run.status};
    }

    try {
        report.matrix = features::FeatureBuilder(config.features).Build(runs);
        report.clustering = clustering::ClusterEngine(config.clustering).Cluster(report.matrix);
        report.projection = clustering::ProjectToPlane(report.matrix.standardized);
        report.interpretation = interpret::Interpret(report.clustering, report.matrix, config.interpretation);
    } catch (const RunscopeError& e) {
        obs::LogEvent(obs::LogLevel::Error, "analysis_error", "pipeline",
                      {{"error_code", e.code()}, {"error", e.what()}});
        throw;
    }

    auto end = std::chrono::steady_clock::now();
    report.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    obs::EmitHistogram("analysis_duration_ms", report.duration_ms, "ms", "pipeline",
                       {{"outcome", clustering::ClusteringOutcomeToString(report.clustering.outcome)}});

    nlohmann::json fields = {
        {"duration_ms", report.duration_ms},
        {"runs", report.matrix.num_runs()},
        {"features", report.matrix.num_features()},
        {"clusters", report.clustering.realized_k},
        {"outcome", clustering::ClusteringOutcomeToString(report.clustering.outcome)}};
    if (report.interpretation.best_label.has_value()) {
        fields["best_cluster"] = *report.interpretation.best_label;
    }
    obs::LogEvent(obs::LogLevel::Info, "analysis_end", "pipeline", fields);
    if (!report.interpretation.primary_metric_found) {
        spdlog::warn("Primary metric '{}' is not among the features; clusters ranked by size",
                     report.interpretation.primary_metric);
    }
    return report;
}

} // namespace runscope
