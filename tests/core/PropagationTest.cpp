#include "metapipe/Propagation.hpp"
#include "metapipe/Errors.hpp"
#include "metapipe/nodes/NodeIn.hpp"
#include "metapipe/nodes/NodeOut.hpp"
#include "metapipe/nodes/NodeProc.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace metapipe;

namespace {

class PropagationTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = propagationLimits(); }
    void TearDown() override { setPropagationLimits(saved_); }

    static void limit(std::size_t depth, std::size_t deliveries) {
        PropagationLimits l;
        l.maxDepth = depth;
        l.maxDeliveries = deliveries;
        setPropagationLimits(l);
    }

private:
    PropagationLimits saved_;
};

std::shared_ptr<NodeIn> constantSource(const std::string& port, Value v) {
    return std::make_shared<NodeIn>(std::make_shared<FunctionProducer>(
        PortList{port}, [port, v] { return ValueMap{ {port, v} }; }));
}

// x -> y = x + 1
std::shared_ptr<NodeProc> increment(const std::string& name = "inc") {
    return std::make_shared<NodeProc>(std::make_shared<FunctionTransform>(
        ParamList{ {"x", true} }, PortList{"y"},
        [](const ValueMap& in) { return ValueMap{ {"y", std::get<int>(in.at("x")) + 1} }; }),
        name);
}

std::shared_ptr<NodeOut> recorder(std::vector<int>& seen, const std::string& port = "z") {
    return std::make_shared<NodeOut>(std::make_shared<FunctionSink>(
        ParamList{ {port, true} },
        [&seen, port](const ValueMap& in) { seen.push_back(std::get<int>(in.at(port))); }));
}

} // namespace

TEST_F(PropagationTest, NoWaveOutsideDispatch) {
    EXPECT_FALSE(Propagation::inWave());
    EXPECT_EQ(Propagation::depth(), 0u);
}

TEST_F(PropagationTest, SelfLoopRaisesGraphCycleErrorInsteadOfOverflowing) {
    limit(16, 1000000);
    auto node = increment();
    node->attach(*node, "y", "x");
    node->observer().consuming()["x"] = 0;

    EXPECT_THROW(node->run(), GraphCycleError);
    // one direct run plus one per delivery at depths 1..16
    EXPECT_EQ(node->runs(), 17u);
    EXPECT_FALSE(Propagation::inWave());
}

TEST_F(PropagationTest, TwoNodeCycleIsDetected) {
    limit(32, 1000000);
    auto a = increment("a");
    auto b = increment("b");
    a->attach(*b, "y", "x");
    b->attach(*a, "y", "x");
    a->observer().consuming()["x"] = 0;
    EXPECT_THROW(a->run(), GraphCycleError);
    EXPECT_FALSE(Propagation::inWave());
}

TEST_F(PropagationTest, NextWaveRunsCleanlyAfterAbort) {
    limit(8, 1000000);
    auto node = increment();
    node->attach(*node, "y", "x");
    node->observer().consuming()["x"] = 0;
    EXPECT_THROW(node->run(), GraphCycleError);

    node->detach(*node);
    std::vector<int> seen;
    auto sink = recorder(seen);
    node->attach(*sink, "y", "z");
    node->observer().consuming()["x"] = 41;
    EXPECT_NO_THROW(node->run());
    EXPECT_EQ(seen, (std::vector<int>{42}));
}

TEST_F(PropagationTest, DeliveryBudgetIsEnforced) {
    limit(1024, 3);
    auto src = constantSource("v", 1);
    std::vector<int> seen;
    auto sink = recorder(seen);
    for (int i = 0; i < 5; ++i) src->attach(*sink, "v", "z");

    EXPECT_THROW(src->run(), GraphCycleError);
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(PropagationTest, LongChainCompletesWithinDepthLimit) {
    const int length = 5000;
    limit(length + 1, 1000000);

    auto src = constantSource("y", 0);
    std::vector<std::shared_ptr<NodeProc>> chain;
    ObservableNode* tail = src.get();
    for (int i = 0; i < length; ++i) {
        chain.push_back(increment("inc" + std::to_string(i)));
        tail->attach(*chain.back(), "y", "x");
        tail = chain.back().get();
    }
    std::vector<int> seen;
    auto sink = recorder(seen);
    tail->attach(*sink, "y", "z");

    EXPECT_NO_THROW(src->run());
    EXPECT_EQ(seen, (std::vector<int>{length}));
}

TEST_F(PropagationTest, ChainDeeperThanLimitIsRejected) {
    limit(3, 1000000);
    auto src = constantSource("y", 0);
    auto a = increment("a");
    auto b = increment("b");
    auto c = increment("c");
    src->attach(*a, "y", "x");
    a->attach(*b, "y", "x");
    b->attach(*c, "y", "x");
    std::vector<int> seen;
    auto sink = recorder(seen);
    c->attach(*sink, "y", "z");

    EXPECT_THROW(src->run(), GraphCycleError);
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(c->runs(), 1u);
}

TEST_F(PropagationTest, NestedNotifyIsQueuedOneLevelDeeper) {
    auto src = constantSource("y", 0);
    auto mid = increment();
    std::vector<std::size_t> depths;
    bool inWave = false;
    auto sink = std::make_shared<NodeOut>(std::make_shared<FunctionSink>(
        ParamList{ {"z", true} },
        [&](const ValueMap&) {
            depths.push_back(Propagation::depth());
            inWave = Propagation::inWave();
        }));
    src->attach(*mid, "y", "x");
    mid->attach(*sink, "y", "z");

    src->run();
    EXPECT_TRUE(inWave);
    EXPECT_EQ(depths, (std::vector<std::size_t>{2}));
    EXPECT_FALSE(Propagation::inWave());
}

// Depth first: a's downstream (c) runs before a's sibling b is delivered.
TEST_F(PropagationTest, DownstreamRunsBeforeNextSibling) {
    std::vector<std::string> order;
    auto tracer = [&order](const std::string& name) {
        return std::make_shared<NodeProc>(std::make_shared<FunctionTransform>(
            ParamList{ {"x", true} }, PortList{"y"},
            [&order, name](const ValueMap& in) {
                order.push_back(name);
                return ValueMap{ {"y", in.at("x")} };
            }), name);
    };
    auto src = constantSource("y", 1);
    auto a = tracer("a");
    auto b = tracer("b");
    auto c = tracer("c");
    src->attach(*a, "y", "x");
    src->attach(*b, "y", "x");
    a->attach(*c, "y", "x");

    src->run();
    EXPECT_EQ(order, (std::vector<std::string>{"a", "c", "b"}));
}

TEST_F(PropagationTest, UnitFailureAbortsWaveAndResetsState) {
    auto src = constantSource("y", 0);
    bool fail = true;
    auto flaky = std::make_shared<NodeProc>(std::make_shared<FunctionTransform>(
        ParamList{ {"x", true} }, PortList{"y"},
        [&fail](const ValueMap& in) {
            if (fail) throw std::runtime_error("boom");
            return ValueMap{ {"y", in.at("x")} };
        }));
    std::vector<int> seen;
    auto sink = recorder(seen);
    src->attach(*flaky, "y", "x");
    flaky->attach(*sink, "y", "z");

    EXPECT_THROW(src->run(), std::runtime_error);
    EXPECT_FALSE(Propagation::inWave());
    // inputs stay put when the unit throws
    EXPECT_TRUE(flaky->observer().has("x"));

    fail = false;
    EXPECT_NO_THROW(src->run());
    EXPECT_EQ(seen, (std::vector<int>{0}));
}
