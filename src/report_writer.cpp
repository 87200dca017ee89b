#include "report_writer.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace runscope {

using json = nlohmann::json;

namespace {

auto OptionalNumber(const std::optional<double>& v) -> json {
    return v.has_value() ? json(*v) : json(nullptr);
}

auto FindSummary(const clustering::ClusteringResult& result, int label) -> const clustering::ClusterSummary* {
    for (const auto& cluster : result.clusters) {
        if (cluster.label == label) {
            return &cluster;
        }
    }
    return nullptr;
}

auto ClusterJson(const interpret::ClusterInterpretation& ci,
                 const clustering::ClusterSummary* summary,
                 const FeatureMatrix& matrix) -> json {
    json c;
    c["label"] = ci.label;
    c["rank"] = ci.rank;
    c["size"] = ci.size;
    c["is_noise"] = ci.is_noise;
    c["description"] = ci.description;
    c["tags"] = ci.tags;
    c["primary_metric_mean"] = OptionalNumber(ci.primary_metric_mean);
    c["members"] = ci.member_ids;
    c["outliers"] = ci.outlier_ids;

    json top = json::array();
    for (const auto& dev : ci.top_features) {
        top.push_back({{"feature", dev.feature},
                       {"deviation", dev.deviation},
                       {"cluster_mean", dev.cluster_mean},
                       {"global_mean", dev.global_mean}});
    }
    c["top_features"] = top;

    if (summary != nullptr) {
        c["centroid"] = summary->centroid;
        c["mean_distance"] = summary->mean_distance;
        json stats = json::object();
        for (size_t j = 0; j < matrix.num_features(); ++j) {
            stats[matrix.features[j].name] = {{"mean", summary->feature_mean[j]},
                                              {"std", summary->feature_stddev[j]},
                                              {"min", summary->feature_min[j]},
                                              {"max", summary->feature_max[j]}};
        }
        c["stats"] = stats;
    }
    return c;
}

} // namespace

auto ToJson(const AnalysisReport& report) -> json {
    const auto& result = report.clustering;
    const auto& matrix = report.matrix;
    const auto& interp = report.interpretation;

    json j;
    j["analysis_id"] = report.analysis_id;
    j["generated_at"] = report.generated_at;
    j["duration_ms"] = report.duration_ms;

    j["outcome"] = clustering::ClusteringOutcomeToString(result.outcome);
    j["algorithm"] = clustering::ClusterAlgorithmToString(result.algorithm);
    j["requested_k"] = result.requested_k;
    j["realized_k"] = result.realized_k;
    j["converged"] = result.converged;
    j["iterations"] = result.iterations;
    j["restarts"] = result.restarts;
    j["inertia"] = result.inertia;
    j["silhouette"] = OptionalNumber(result.silhouette);
    j["seed"] = result.seed_used;
    if (!result.auto_k_scores.empty()) {
        json scores = json::array();
        for (const auto& [k, score] : result.auto_k_scores) {
            scores.push_back({{"k", k}, {"silhouette", score}});
        }
        j["auto_k_scores"] = scores;
    }

    json features = json::array();
    for (size_t c = 0; c < matrix.num_features(); ++c) {
        const auto& f = matrix.features[c];
        features.push_back({{"name", f.name},
                            {"kind", FeatureKindToString(f.kind)},
                            {"source_key", f.source_key},
                            {"mean", matrix.column_mean[c]},
                            {"stddev", matrix.column_stddev[c]},
                            {"imputed_count", matrix.imputed_count(c)}});
    }
    j["features"] = features;

    json assignment = json::object();
    for (const auto& [run_id, label] : result.assignment) {
        assignment[run_id] = label;
    }
    j["assignment"] = assignment;

    j["primary_metric"] = {{"name", interp.primary_metric},
                           {"direction", interpret::MetricDirectionToString(interp.direction)},
                           {"found", interp.primary_metric_found}};
    j["best_cluster"] = interp.best_label.has_value() ? json(*interp.best_label) : json(nullptr);
    j["worst_cluster"] = interp.worst_label.has_value() ? json(*interp.worst_label) : json(nullptr);

    std::set<std::string> outliers;
    json clusters = json::array();
    for (const auto& ci : interp.ranked) {
        clusters.push_back(ClusterJson(ci, FindSummary(result, ci.label), matrix));
        outliers.insert(ci.outlier_ids.begin(), ci.outlier_ids.end());
    }
    j["clusters"] = clusters;

    json runs = json::array();
    for (size_t r = 0; r < matrix.num_runs(); ++r) {
        const auto& id = matrix.run_ids[r];
        json run = {{"id", id}, {"cluster", result.labels[r]}, {"outlier", outliers.count(id) > 0}};
        auto info = report.runs.find(id);
        if (info != report.runs.end()) {
            run["name"] = info->second.name;
            run["status"] = RunStatusToString(info->second.status);
        }
        if (r < report.projection.coords.rows) {
            run["x"] = report.projection.coords(r, 0);
            run["y"] = report.projection.coords(r, 1);
        }
        runs.push_back(run);
    }
    j["runs"] = runs;
    j["projection"] = {{"explained_variance", report.projection.explained_variance}};
    j["config"] = report.config;
    return j;
}

void WriteReportJson(const AnalysisReport& report, const std::string& output_path) {
    auto j = ToJson(report);
    std::ofstream out(output_path);
    if (!out.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "report_write_error", "report",
                      {{"path", output_path}, {"error_code", obs::kErrReportWriteFailed},
                       {"error", "Failed to open output path"}});
        throw RunscopeError("Failed to open output path: " + output_path, obs::kErrReportWriteFailed);
    }
    out << j.dump(2);
    out.flush();
    out.close();
    if (out.fail()) {
        throw RunscopeError("Failed to write report: " + output_path, obs::kErrReportWriteFailed);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(output_path, ec);
    if (!ec) {
        obs::EmitCounter("report_bytes_written", static_cast<long>(size), "bytes", "report",
                         {}, {{"path", output_path}});
    }
    spdlog::info("Wrote report for analysis {} to {}", report.analysis_id, output_path);
}

} // namespace runscope
