#include "metrics.h"

#include <algorithm>

#include <fmt/format.h>

namespace runscope::metrics {

namespace {

auto EscapeLabelValue(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

auto FormatSeries(const std::string& name, const Labels& labels, const std::string& le = "") -> std::string {
    if (labels.empty() && le.empty()) {
        return name;
    }
    std::string out = name + "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        out += fmt::format("{}{}=\"{}\"", first ? "" : ",", key, EscapeLabelValue(value));
        first = false;
    }
    if (!le.empty()) {
        out += fmt::format("{}le=\"{}\"", first ? "" : ",", le);
    }
    return out + "}";
}

template <typename Map, typename WriteSeries>
void WriteFamily(std::string& out, const Map& series, const char* type, WriteSeries write) {
    const std::string* current = nullptr;
    for (const auto& [key, value] : series) {
        if (current == nullptr || *current != key.first) {
            out += fmt::format("# TYPE {} {}\n", key.first, type);
            current = &key.first;
        }
        write(key.first, key.second, value);
    }
}

} // namespace

auto MetricsRegistry::Instance() -> MetricsRegistry& {
    static MetricsRegistry instance;
    return instance;
}

void MetricsRegistry::Increment(const std::string& name, const Labels& labels, long value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[{name, labels}] += value;
}

void MetricsRegistry::SetGauge(const std::string& name, const Labels& labels, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[{name, labels}] = value;
}

void MetricsRegistry::Observe(const std::string& name, const Labels& labels, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& h = histograms_[{name, labels}];
    h.count++;
    h.sum += value;
    h.min = std::min(h.min, value);
    h.max = std::max(h.max, value);
    for (size_t b = 0; b < kLatencyBucketsMs.size(); ++b) {
        if (value <= kLatencyBucketsMs[b]) {
            h.buckets[b]++;
        }
    }
}

auto MetricsRegistry::GetCounter(const std::string& name, const Labels& labels) -> long {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find({name, labels});
    return it == counters_.end() ? 0 : it->second;
}

auto MetricsRegistry::GetGauge(const std::string& name, const Labels& labels) -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find({name, labels});
    return it == gauges_.end() ? 0.0 : it->second;
}

auto MetricsRegistry::GetHistogram(const std::string& name, const Labels& labels) -> HistogramStats {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find({name, labels});
    return it == histograms_.end() ? HistogramStats{} : it->second;
}

auto MetricsRegistry::ToPrometheus() -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    WriteFamily(out, counters_, "counter", [&out](const std::string& name, const Labels& labels, long value) {
        out += fmt::format("{} {}\n", FormatSeries(name, labels), value);
    });
    WriteFamily(out, gauges_, "gauge", [&out](const std::string& name, const Labels& labels, double value) {
        out += fmt::format("{} {:.6f}\n", FormatSeries(name, labels), value);
    });
    WriteFamily(out, histograms_, "histogram",
                [&out](const std::string& name, const Labels& labels, const HistogramStats& h) {
                    for (size_t b = 0; b < kLatencyBucketsMs.size(); ++b) {
                        out += fmt::format("{} {}\n", FormatSeries(name + "_bucket", labels, fmt::format("{}", kLatencyBucketsMs[b])),
                                           h.buckets[b]);
                    }
                    out += fmt::format("{} {}\n", FormatSeries(name + "_bucket", labels, "+Inf"), h.count);
                    out += fmt::format("{} {:.6f}\n", FormatSeries(name + "_sum", labels), h.sum);
                    out += fmt::format("{} {}\n", FormatSeries(name + "_count", labels), h.count);
                });
    return out;
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

} // namespace runscope::metrics
