#include <gtest/gtest.h>

#include <string>

#include "metrics.h"
#include "obs/metrics.h"

TEST(ObsMetricsTest, EmitCounterUpdatesRegistry) {
    auto before = runscope::metrics::MetricsRegistry::Instance().GetCounter("test_obs_counter", {{"service", "x"}});
    runscope::obs::EmitCounter("test_obs_counter", 3, "count", "test", {{"service", "x"}});
    auto& registry = runscope::metrics::MetricsRegistry::Instance();
    EXPECT_EQ(registry.GetCounter("test_obs_counter", {{"service", "x"}}), before + 3);

    auto text = registry.ToPrometheus();
    EXPECT_NE(text.find("test_obs_counter{service=\"x\"}"), std::string::npos);
}

TEST(ObsMetricsTest, EmitHistogramUpdatesRegistry) {
    runscope::obs::EmitHistogram("test_obs_latency_ms", 12.5, "ms", "test");
    auto text = runscope::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_latency_ms_count"), std::string::npos);
    EXPECT_NE(text.find("test_obs_latency_ms_sum"), std::string::npos);

    auto stats = runscope::metrics::MetricsRegistry::Instance().GetHistogram("test_obs_latency_ms");
    EXPECT_GE(stats.count, 1);
    EXPECT_LE(stats.min, 12.5);
}

TEST(ObsMetricsTest, EmitGaugeOverwrites) {
    runscope::obs::EmitGauge("test_obs_gauge", 1.0, "units", "test");
    runscope::obs::EmitGauge("test_obs_gauge", 7.0, "units", "test");
    auto text = runscope::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_gauge 7.0"), std::string::npos);
}

TEST(ObsMetricsTest, HistogramBucketsAreCumulative) {
    auto& registry = runscope::metrics::MetricsRegistry::Instance();
    runscope::metrics::Labels labels = {{"service", "bucket_test"}};
    registry.Observe("test_bucket_wait_ms", labels, 3.0);
    registry.Observe("test_bucket_wait_ms", labels, 70.0);

    auto stats = registry.GetHistogram("test_bucket_wait_ms", labels);
    EXPECT_EQ(stats.count, 2);
    EXPECT_DOUBLE_EQ(stats.mean(), 36.5);
    EXPECT_EQ(stats.buckets[0], 0);  // le 1
    EXPECT_EQ(stats.buckets[1], 1);  // le 5
    EXPECT_EQ(stats.buckets[4], 2);  // le 100

    auto text = registry.ToPrometheus();
    EXPECT_NE(text.find("# TYPE test_bucket_wait_ms histogram"), std::string::npos);
    EXPECT_NE(text.find("test_bucket_wait_ms_bucket{service=\"bucket_test\",le=\"5\"} 1"), std::string::npos);
    EXPECT_NE(text.find("test_bucket_wait_ms_bucket{service=\"bucket_test\",le=\"+Inf\"} 2"), std::string::npos);
}

TEST(ObsMetricsTest, GaugeIsReadable) {
    runscope::obs::EmitGauge("test_obs_runs", 12.0, "runs", "test", {{"project", "vision"}});
    EXPECT_DOUBLE_EQ(runscope::metrics::MetricsRegistry::Instance().GetGauge("test_obs_runs", {{"project", "vision"}}),
                     12.0);
}
