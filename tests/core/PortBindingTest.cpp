#include "metapipe/PortBinding.hpp"
#include "metapipe/Errors.hpp"
#include <gtest/gtest.h>

using namespace metapipe;

namespace {
const PortList kOutputs{"raw", "events"};
const ParamList kInputs{ {"raw", true}, {"picks", false} };
}

TEST(PortBindingTest, AcceptsDeclaredPorts) {
    EXPECT_NO_THROW(validateBinding(kOutputs, kInputs, {"raw", "raw"}));
    EXPECT_NO_THROW(validateBinding(kOutputs, kInputs, {"events", "raw"}));
}

TEST(PortBindingTest, AcceptsOptionalParameterAsDestination) {
    EXPECT_NO_THROW(validateBinding(kOutputs, kInputs, {"events", "picks"}));
}

TEST(PortBindingTest, RejectsUnknownSource) {
    try {
        validateBinding(kOutputs, kInputs, {"absent", "raw"});
        FAIL() << "expected PortError";
    } catch (const PortError& e) {
        EXPECT_EQ(e.side(), PortError::Side::Source);
        EXPECT_EQ(e.port(), "absent");
        EXPECT_NE(std::string(e.what()).find("raw, events"), std::string::npos);
    }
}

TEST(PortBindingTest, RejectsUnknownDestination) {
    try {
        validateBinding(kOutputs, kInputs, {"raw", "absent"});
        FAIL() << "expected PortError";
    } catch (const PortError& e) {
        EXPECT_EQ(e.side(), PortError::Side::Destination);
        EXPECT_EQ(e.port(), "absent");
    }
}

TEST(PortBindingTest, SourceIsCheckedFirst) {
    try {
        validateBinding(kOutputs, kInputs, {"nope", "nope"});
        FAIL() << "expected PortError";
    } catch (const PortError& e) {
        EXPECT_EQ(e.side(), PortError::Side::Source);
    }
}

TEST(PortBindingTest, HelpersFindDeclaredNames) {
    EXPECT_TRUE(hasPort(kOutputs, "events"));
    EXPECT_FALSE(hasPort(kOutputs, "picks"));
    ASSERT_NE(findParam(kInputs, "picks"), nullptr);
    EXPECT_FALSE(findParam(kInputs, "picks")->required);
    EXPECT_EQ(findParam(kInputs, "events"), nullptr);
}
