#include <benchmark/benchmark.h>
#include "metapipe/nodes/NodeIn.hpp"
#include "metapipe/nodes/NodeOut.hpp"
#include "metapipe/nodes/NodeProc.hpp"
#include "metapipe/util/Logger.hpp"
#include <memory>
#include <vector>

namespace {

std::shared_ptr<metapipe::NodeProc> increment() {
    using namespace metapipe;
    return std::make_shared<NodeProc>(std::make_shared<FunctionTransform>(
        ParamList{ {"v", true} }, PortList{"v"},
        [](const ValueMap& in) { return ValueMap{ {"v", std::get<int>(in.at("v")) + 1} }; }));
}

std::shared_ptr<metapipe::NodeOut> discard() {
    using namespace metapipe;
    return std::make_shared<NodeOut>(std::make_shared<FunctionSink>(
        ParamList{ {"v", true} }, [](const ValueMap& in) { auto n = in.size(); benchmark::DoNotOptimize(n); }));
}

std::shared_ptr<metapipe::NodeIn> counter() {
    using namespace metapipe;
    auto n = std::make_shared<int>(0);
    return std::make_shared<NodeIn>(std::make_shared<FunctionProducer>(
        PortList{"v"}, [n] { return ValueMap{ {"v", ++*n} }; }));
}

} // namespace

// One wave down a linear chain of state.range(0) transforms
static void BM_ChainPropagation(benchmark::State& state) {
    metapipe::util::logger().setLevel(metapipe::util::LogLevel::Warn);

    auto src = counter();
    std::vector<std::shared_ptr<metapipe::NodeProc>> chain;
    metapipe::ObservableNode* tail = src.get();
    for (int i = 0; i < state.range(0); ++i) {
        chain.push_back(increment());
        tail->attach(*chain.back(), "v", "v");
        tail = chain.back().get();
    }
    auto sink = discard();
    tail->attach(*sink, "v", "v");

    for (auto _ : state) {
        src->run();
    }

    state.SetItemsProcessed(state.iterations() * (state.range(0) + 1));
}

// One wave from a single source into state.range(0) sinks
static void BM_FanOutPropagation(benchmark::State& state) {
    metapipe::util::logger().setLevel(metapipe::util::LogLevel::Warn);

    auto src = counter();
    std::vector<std::shared_ptr<metapipe::NodeOut>> sinks;
    for (int i = 0; i < state.range(0); ++i) {
        sinks.push_back(discard());
        src->attach(*sinks.back(), "v", "v");
    }

    for (auto _ : state) {
        src->run();
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ChainPropagation)->Arg(8)->Arg(64)->Arg(512)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_FanOutPropagation)->Arg(8)->Arg(64)->Arg(512)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
