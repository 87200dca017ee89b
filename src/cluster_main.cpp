#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>


#include "analysis_pipeline.h"
#include "app_config.h"
#include "client/tracking_client.h"
#include "errors.h"
#include "metrics.h"
#include "obs/logging.h"
#include "report_writer.h"
#include "resilience/rate_limiter.h"
#include "resilience/resilient_caller.h"
#include "run_records.h"

static void PrintUsage() {
    std::cerr << "Usage: runscope_cluster (--runs <file.json> | --entity <name> --project <name>)\n"
              << "                        [--config <file.json>] [--k <n>] [--auto-k] [--algorithm kmeans|dbscan]\n"
              << "                        [--seed <n>] [--primary-metric <name>] [--direction higher|lower]\n"
              << "                        [--limit <n>] [--output <report.json>] [--log-level <level>]\n"
              << "                        [--dump-metrics]" << std::endl;
}

int main(int argc, char** argv) {
    std::string runs_path;
    std::string config_path;
    std::string entity;
    std::string project;
    std::string output_path = "runscope_report.json";
    std::optional<std::string> k_arg;
    std::optional<std::string> seed_arg;
    std::optional<std::string> algorithm_arg;
    std::optional<std::string> primary_metric;
    std::optional<std::string> direction_arg;
    std::optional<std::string> log_level;
    std::optional<std::string> limit_arg;
    bool auto_k = false;
    bool dump_metrics = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--runs" && i + 1 < argc) {
            runs_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--entity" && i + 1 < argc) {
            entity = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            project = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--k" && i + 1 < argc) {
            k_arg = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed_arg = argv[++i];
        } else if (arg == "--algorithm" && i + 1 < argc) {
            algorithm_arg = argv[++i];
        } else if (arg == "--primary-metric" && i + 1 < argc) {
            primary_metric = argv[++i];
        } else if (arg == "--direction" && i + 1 < argc) {
            direction_arg = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit_arg = argv[++i];
        } else if (arg == "--auto-k") {
            auto_k = true;
        } else if (arg == "--dump-metrics") {
            dump_metrics = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            PrintUsage();
            return 2;
        }
    }

    if (runs_path.empty() && (entity.empty() || project.empty())) {
        std::cerr << "Missing input: pass --runs or both --entity and --project." << std::endl;
        PrintUsage();
        return 2;
    }

    try {
        runscope::AppConfig config;
        if (!config_path.empty()) {
            config = runscope::LoadConfigFile(config_path);
        } else {
            runscope::ApplyEnvOverrides(config);
        }

        if (k_arg) { config.clustering.n_clusters = std::stoi(*k_arg); }
        if (seed_arg) { config.clustering.seed = std::stoull(*seed_arg); }
        if (algorithm_arg) { config.clustering.algorithm = runscope::clustering::ParseClusterAlgorithm(*algorithm_arg); }
        if (auto_k) { config.clustering.auto_select_k = true; }
        if (primary_metric) { config.interpretation.primary_metric = *primary_metric; }
        if (direction_arg) { config.interpretation.direction = runscope::interpret::ParseMetricDirection(*direction_arg); }
        if (log_level) { config.logging.level = *log_level; }
        runscope::RequireValidConfig(config);

        runscope::obs::ConfigureLogging(config.logging);

        std::vector<runscope::RunRecord> runs;
        if (!runs_path.empty()) {
            runs = runscope::LoadRunRecordsFile(runs_path);
        } else {
            auto limiter = std::make_shared<runscope::resilience::RateLimiter>(config.rate_limits);
            auto caller = std::make_shared<runscope::resilience::ResilientCaller>(limiter, config.retry);
            runscope::client::TrackingClient client(config.tracking, caller);
            size_t limit = limit_arg ? std::stoul(*limit_arg) : 0;
            runs = client.FetchRuns(entity, project, limit);
        }

        std::cout << "Analyzing " << runs.size() << " runs"
                  << " algorithm=" << runscope::clustering::ClusterAlgorithmToString(config.clustering.algorithm)
                  << " k=" << (config.clustering.auto_select_k ? std::string("auto") : std::to_string(config.clustering.n_clusters))
                  << " primary_metric=" << config.interpretation.primary_metric
                  << std::endl;

        auto report = runscope::RunAnalysis(runs, config);
        runscope::WriteReportJson(report, output_path);

        const auto& result = report.clustering;
        std::cout << "Outcome: " << runscope::clustering::ClusteringOutcomeToString(result.outcome)
                  << " clusters=" << result.realized_k
                  << " converged=" << (result.converged ? "true" : "false")
                  << " inertia=" << result.inertia;
        if (result.silhouette) {
            std::cout << " silhouette=" << *result.silhouette;
        }
        std::cout << std::endl;
        for (const auto& cluster : report.interpretation.ranked) {
            std::cout << "  #" << cluster.rank << " cluster " << cluster.label
                      << " (" << cluster.size << " runs): " << cluster.description << std::endl;
        }
        std::cout << "Report path: " << output_path << std::endl;

        if (dump_metrics) {
            std::cout << runscope::metrics::MetricsRegistry::Instance().ToPrometheus();
        }
    } catch (const runscope::RunscopeError& e) {
        runscope::obs::LogEvent(runscope::obs::LogLevel::Error, "cli_error", "cli",
                                {{"error_code", e.code()}, {"error", e.what()}});
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        runscope::obs::LogEvent(runscope::obs::LogLevel::Error, "cli_error", "cli",
                                {{"error_code", runscope::obs::kErrInternal}, {"error", e.what()}});
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
