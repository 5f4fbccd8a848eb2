#include "metapipe/util/Metrics.hpp"
#include "metapipe/nodes/NodeIn.hpp"
#include "metapipe/nodes/NodeProc.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

using namespace metapipe;
using metapipe::util::MetricRegistry;

TEST(MetricsTest, CountersAccumulate) {
    auto& m = MetricRegistry::instance();
    m.reset();
    METAPIPE_METRIC_HIT("test.hits");
    METAPIPE_METRIC_INC("test.hits", 2.0);
    EXPECT_DOUBLE_EQ(m.counter("test.hits"), 3.0);
    EXPECT_DOUBLE_EQ(m.counter("test.never"), 0.0);
}

TEST(MetricsTest, GaugesOverwrite) {
    auto& m = MetricRegistry::instance();
    m.reset();
    METAPIPE_METRIC_SET("test.gauge", 5.0);
    METAPIPE_METRIC_SET("test.gauge", 2.0);
    EXPECT_DOUBLE_EQ(m.gauge("test.gauge"), 2.0);
    EXPECT_EQ(m.snapshotGauges().size(), 1u);
}

TEST(MetricsTest, ConcurrentIncrementsAreNotLost) {
    auto& m = MetricRegistry::instance();
    m.reset();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 1000; ++i) METAPIPE_METRIC_HIT("test.concurrent");
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_DOUBLE_EQ(m.counter("test.concurrent"), 4000.0);
}

TEST(MetricsTest, PropagationIsCounted) {
    auto& m = MetricRegistry::instance();
    m.reset();
    auto src = std::make_shared<NodeIn>(std::make_shared<FunctionProducer>(
        PortList{"a"}, [] { return ValueMap{ {"a", 1} }; }));
    auto join = std::make_shared<NodeProc>(std::make_shared<FunctionTransform>(
        ParamList{ {"a", true}, {"b", true} }, PortList{"c"},
        [](const ValueMap&) { return ValueMap{ {"c", 0} }; }));
    src->attach(*join, "a", "a");
    src->run();

    EXPECT_DOUBLE_EQ(m.counter("propagation.waves"), 1.0);
    EXPECT_DOUBLE_EQ(m.counter("propagation.deliveries"), 1.0);
    EXPECT_DOUBLE_EQ(m.counter("node.runs"), 1.0);      // the source only
    EXPECT_DOUBLE_EQ(m.counter("node.not_ready"), 1.0); // join still waits for b
}
