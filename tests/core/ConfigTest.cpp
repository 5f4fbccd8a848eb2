#include "metapipe/util/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace metapipe;
using metapipe::util::Config;

static std::string writeConfig(const std::string& name, const std::string& body) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}

TEST(ConfigTest, DefaultsMatchPropagationDefaults) {
    Config cfg;
    EXPECT_EQ(cfg.maxPropagationDepth, PropagationLimits{}.maxDepth);
    EXPECT_EQ(cfg.maxWaveDeliveries, PropagationLimits{}.maxDeliveries);
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_FALSE(cfg.logJson);
    EXPECT_TRUE(cfg.logFile.empty());
}

TEST(ConfigTest, LoadsKnownKeys) {
    auto path = writeConfig("metapipe_cfg_known.conf",
        "maxPropagationDepth = 64\n"
        "maxWaveDeliveries=500\r\n"
        "logLevel=debug\n"
        "logJson=true\n"
        "logFile=/tmp/metapipe.log\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.maxPropagationDepth, 64u);
    EXPECT_EQ(cfg.maxWaveDeliveries, 500u);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_TRUE(cfg.logJson);
    EXPECT_EQ(cfg.logFile, "/tmp/metapipe.log");

    auto l = cfg.limits();
    EXPECT_EQ(l.maxDepth, 64u);
    EXPECT_EQ(l.maxDeliveries, 500u);
    std::remove(path.c_str());
}

TEST(ConfigTest, IgnoresCommentsBlankLinesAndUnknownKeys) {
    auto path = writeConfig("metapipe_cfg_comments.conf",
        "# comment\n"
        "; another\n"
        "\n"
        "futureKnob=1\n"
        "no equals sign here\n"
        "maxPropagationDepth=12\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.maxPropagationDepth, 12u);
    EXPECT_EQ(cfg.maxWaveDeliveries, PropagationLimits{}.maxDeliveries);
    std::remove(path.c_str());
}

TEST(ConfigTest, ZeroLimitsFallBackToDefaults) {
    auto path = writeConfig("metapipe_cfg_zero.conf",
        "maxPropagationDepth=0\nmaxWaveDeliveries=0\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.maxPropagationDepth, PropagationLimits{}.maxDepth);
    EXPECT_EQ(cfg.maxWaveDeliveries, PropagationLimits{}.maxDeliveries);
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReturnsFalse) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile(::testing::TempDir() + "metapipe_no_such_file.conf"));
    EXPECT_EQ(cfg.maxPropagationDepth, PropagationLimits{}.maxDepth);
}

TEST(ConfigTest, NegativeOrMalformedLimitsFallBackToDefaults) {
    auto path = writeConfig("metapipe_cfg_bad.conf",
        "maxPropagationDepth=-1\n"
        "maxWaveDeliveries=abc\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.maxPropagationDepth, PropagationLimits{}.maxDepth);
    EXPECT_EQ(cfg.maxWaveDeliveries, PropagationLimits{}.maxDeliveries);
    std::remove(path.c_str());
}

TEST(ConfigTest, TrailingGarbageOrOverflowFallsBackToDefaults) {
    auto path = writeConfig("metapipe_cfg_garbage.conf",
        "maxPropagationDepth=12abc\n"
        "maxWaveDeliveries=99999999999999999999999999\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.maxPropagationDepth, PropagationLimits{}.maxDepth);
    EXPECT_EQ(cfg.maxWaveDeliveries, PropagationLimits{}.maxDeliveries);
    std::remove(path.c_str());
}
