/**
 * @file test_RunLengthSpacing.cpp
 * @brief Unit tests for run-length cell width decoding
 */

#include <gtest/gtest.h>
#include "ubcio/IO/RunLengthSpacing.h"
#include "ubcio/Core/UbcException.h"

#include <string>
#include <vector>

using namespace ubcio;

TEST(RunLengthSpacing, PlainWidthsPassThrough) {
    const std::vector<std::string> tokens = {"1.0", "2.5", "3"};
    const AxisSpacing widths = RunLengthSpacing::decode(tokens, 3, 0);

    ASSERT_EQ(widths.size(), 3u);
    EXPECT_DOUBLE_EQ(widths[0], 1.0);
    EXPECT_DOUBLE_EQ(widths[1], 2.5);
    EXPECT_DOUBLE_EQ(widths[2], 3.0);
}

TEST(RunLengthSpacing, SingleRunFillsAxis) {
    const AxisSpacing widths = RunLengthSpacing::decode({"5*10.0"}, 5, 2);

    ASSERT_EQ(widths.size(), 5u);
    for (real_t w : widths) {
        EXPECT_DOUBLE_EQ(w, 10.0);
    }
}

TEST(RunLengthSpacing, MixedTokensKeepOrder) {
    const AxisSpacing widths = RunLengthSpacing::expand({"2*50", "25", "3*10", "100"});

    const AxisSpacing expected = {50.0, 50.0, 25.0, 10.0, 10.0, 10.0, 100.0};
    EXPECT_EQ(widths, expected);
}

TEST(RunLengthSpacing, CountOfOneIsOneWidth) {
    const AxisSpacing widths = RunLengthSpacing::expand({"1*7.5"});
    ASSERT_EQ(widths.size(), 1u);
    EXPECT_DOUBLE_EQ(widths[0], 7.5);
}

TEST(RunLengthSpacing, ScientificNotationWidths) {
    const AxisSpacing widths = RunLengthSpacing::expand({"2*1.5e2", "2.0E-1"});
    const AxisSpacing expected = {150.0, 150.0, 0.2};
    ASSERT_EQ(widths.size(), expected.size());
    for (std::size_t i = 0; i < widths.size(); ++i) {
        EXPECT_DOUBLE_EQ(widths[i], expected[i]);
    }
}

TEST(RunLengthSpacing, IsRun) {
    EXPECT_TRUE(RunLengthSpacing::is_run("3*2.0"));
    EXPECT_FALSE(RunLengthSpacing::is_run("2.0"));
}

TEST(RunLengthSpacing, CountMismatchIsFormatError) {
    EXPECT_THROW(RunLengthSpacing::decode({"4*10.0"}, 5, 0), FormatError);
    EXPECT_THROW(RunLengthSpacing::decode({"1", "1", "1"}, 2, 1), FormatError);
}

TEST(RunLengthSpacing, CountMismatchNamesAxis) {
    try {
        RunLengthSpacing::decode({"2*1.0"}, 3, 1, "mesh.msh", 4);
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.message();
        EXPECT_NE(msg.find("axis 1"), std::string::npos) << msg;
        EXPECT_NE(msg.find("mesh.msh"), std::string::npos) << msg;
        EXPECT_NE(msg.find("line 4"), std::string::npos) << msg;
    }
}

TEST(RunLengthSpacing, MalformedRunTokens) {
    EXPECT_THROW(RunLengthSpacing::expand({"*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"3*"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"0*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"-2*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"2.5*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"2*3*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"a*10"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"2*ten"}), FormatError);
}

TEST(RunLengthSpacing, NonNumericWidth) {
    EXPECT_THROW(RunLengthSpacing::expand({"1.0", "abc"}), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"1.0x"}), FormatError);
}

TEST(RunLengthSpacing, HugeRunCountStopsAtDeclaredCells) {
    try {
        RunLengthSpacing::decode({"2000000000*1.0"}, 5, 0, "big.msh", 3);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.message();
        EXPECT_NE(msg.find("expands past the 5 widths"), std::string::npos) << msg;
        EXPECT_NE(msg.find("big.msh"), std::string::npos) << msg;
        EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
    }
}

TEST(RunLengthSpacing, ExpandHonoursWidthLimit) {
    EXPECT_EQ(RunLengthSpacing::expand({"2*1.0", "3"}, "", 0, 3).size(), 3u);
    EXPECT_THROW(RunLengthSpacing::expand({"2*1.0", "3", "4"}, "", 0, 3), FormatError);
    EXPECT_THROW(RunLengthSpacing::expand({"1", "3*2.0"}, "", 0, 3), FormatError);
    EXPECT_EQ(RunLengthSpacing::expand({"4*1.0"}).size(), 4u);
}

TEST(RunLengthSpacing, ZeroWidthIsFormatError) {
    try {
        RunLengthSpacing::decode({"1.0", "0.0", "-5.0"}, 3, 0, "flat.msh", 3);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.message();
        EXPECT_NE(msg.find("axis 0"), std::string::npos) << msg;
        EXPECT_NE(msg.find("cell 2"), std::string::npos) << msg;
        EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
    }
    EXPECT_THROW(RunLengthSpacing::decode({"2*0"}, 2, 1), FormatError);
}

TEST(RunLengthSpacing, MixedSignWidthsAreFormatError) {
    try {
        RunLengthSpacing::decode({"1", "-1"}, 2, 2, "fold.msh", 5);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.message();
        EXPECT_NE(msg.find("axis 2"), std::string::npos) << msg;
        EXPECT_NE(msg.find("changes sign"), std::string::npos) << msg;
    }
    EXPECT_THROW(RunLengthSpacing::decode({"-2", "2*3"}, 3, 0), FormatError);
}

TEST(RunLengthSpacing, AllNegativeWidthsAreAccepted) {
    const AxisSpacing widths = RunLengthSpacing::decode({"2*-1.5", "-3"}, 3, 2);
    const AxisSpacing expected = {-1.5, -1.5, -3.0};
    EXPECT_EQ(widths, expected);
}

TEST(RunLengthSpacing, NonFiniteWidthIsFormatError) {
    EXPECT_THROW(RunLengthSpacing::decode({"1", "inf"}, 2, 0), FormatError);
    EXPECT_THROW(RunLengthSpacing::decode({"nan"}, 1, 0), FormatError);
}
