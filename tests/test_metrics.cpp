#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace erebus;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    reg.increment_counter("erebus_messages_published_total");
    reg.increment_counter("erebus_messages_published_total", 2.0);
    EXPECT_EQ(reg.get_counter("erebus_messages_published_total"), 3.0);
    EXPECT_EQ(reg.get_counter("never_touched"), 0.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("erebus_messages_published_total 3"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE erebus_messages_published_total counter"), std::string::npos);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge("erebus_active_shards", 4.0);
    EXPECT_EQ(reg.get_gauge("erebus_active_shards"), 4.0);

    reg.increment_gauge("erebus_active_shards");
    EXPECT_EQ(reg.get_gauge("erebus_active_shards"), 5.0);

    reg.decrement_gauge("erebus_active_shards", 2.0);
    EXPECT_EQ(reg.get_gauge("erebus_active_shards"), 3.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("erebus_active_shards 3"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE erebus_active_shards gauge"), std::string::npos);
}

TEST(MetricsTest, ResetClearsEverything) {
    auto& reg = MetricsRegistry::instance();
    reg.increment_counter("erebus_connections_accepted_total");
    reg.set_gauge("erebus_active_shards", 1.0);
    reg.reset();
    EXPECT_TRUE(reg.collect_prometheus().empty());
}

TEST(MetricsTest, LabeledSeries) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.describe("erebus_publish_rejected_total", "Publish packets refused");

    reg.increment_counter("erebus_publish_rejected_total", 1.0, {{"code", "FORBIDDEN"}});
    reg.increment_counter("erebus_publish_rejected_total", 1.0, {{"code", "FORBIDDEN"}});
    reg.increment_counter("erebus_publish_rejected_total", 1.0, {{"code", "INTERNAL"}});

    EXPECT_EQ(reg.get_counter("erebus_publish_rejected_total", {{"code", "FORBIDDEN"}}), 2.0);
    EXPECT_EQ(reg.get_counter("erebus_publish_rejected_total"), 3.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("# HELP erebus_publish_rejected_total Publish packets refused"), std::string::npos);
    EXPECT_NE(prometheus.find("erebus_publish_rejected_total{code=\"FORBIDDEN\"} 2"), std::string::npos);
    EXPECT_NE(prometheus.find("erebus_publish_rejected_total{code=\"INTERNAL\"} 1"), std::string::npos);
}

TEST(MetricsTest, LabelValuesAreEscaped) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge("erebus_test_gauge", 1.0, {{"region", "eu\"west"}});
    EXPECT_NE(reg.collect_prometheus().find("erebus_test_gauge{region=\"eu\\\"west\"} 1"), std::string::npos);
}
