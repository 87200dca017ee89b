#pragma once

#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace runscope::metrics {

using Labels = std::map<std::string, std::string>;

// Upper bounds (ms) of the cumulative histogram buckets; +Inf is implicit.
inline const std::vector<double> kLatencyBucketsMs = {1, 5, 10, 50, 100, 500, 1000, 5000, 10000, 60000};

struct HistogramStats {
    long count = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    std::vector<long> buckets = std::vector<long>(kLatencyBucketsMs.size(), 0); // cumulative

    [[nodiscard]] auto mean() const -> double { return count > 0 ? sum / static_cast<double>(count) : 0.0; }
};

/**
 * @brief Process-wide store for counters, gauges and histograms keyed by name and label set.
 *
 * All methods are thread-safe. Series are never dropped except by Reset().
 */
class MetricsRegistry {
public:
    static auto Instance() -> MetricsRegistry&;

    void Increment(const std::string& name, const Labels& labels, long value = 1);
    void SetGauge(const std::string& name, const Labels& labels, double value);
    void Observe(const std::string& name, const Labels& labels, double value);

    auto GetCounter(const std::string& name, const Labels& labels = {}) -> long;
    auto GetGauge(const std::string& name, const Labels& labels = {}) -> double;
    auto GetHistogram(const std::string& name, const Labels& labels = {}) -> HistogramStats;

    // Prometheus text exposition format, one # TYPE line per metric name.
    auto ToPrometheus() -> std::string;

    void Reset();

private:
    using SeriesKey = std::pair<std::string, Labels>;

    MetricsRegistry() = default;

    std::mutex mutex_;
    std::map<SeriesKey, long> counters_;
    std::map<SeriesKey, double> gauges_;
    std::map<SeriesKey, HistogramStats> histograms_;
};

} // namespace runscope::metrics
