/**
 * @file test_UbcTokenizer.cpp
 * @brief Unit tests for content line splitting and strict token parsing
 */

#include <gtest/gtest.h>
#include "ubcio/IO/UbcTokenizer.h"
#include "ubcio/Core/UbcException.h"
#include "ubcio/Tests/Unit/UbcTestFiles.h"

#include <sstream>

using namespace ubcio;

TEST(UbcTokenizer, StripComment) {
    EXPECT_EQ(UbcTokenizer::strip_comment("1 2 3 ! cells"), "1 2 3 ");
    EXPECT_EQ(UbcTokenizer::strip_comment("! whole line"), "");
    EXPECT_EQ(UbcTokenizer::strip_comment("no comment"), "no comment");
}

TEST(UbcTokenizer, SplitOnAnyWhitespace) {
    const auto tokens = UbcTokenizer::split("  4\t5   6\r");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "4");
    EXPECT_EQ(tokens[1], "5");
    EXPECT_EQ(tokens[2], "6");
}

TEST(UbcTokenizer, ContentLinesSkipBlankAndCommentLines) {
    std::istringstream in("! header comment\n"
                          "2 2 1\n"
                          "\n"
                          "   \n"
                          "0 0 0 ! origin\n");
    const auto lines = UbcTokenizer::read_content_lines(in);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].number, 2);
    EXPECT_EQ(lines[0].tokens.size(), 3u);
    EXPECT_EQ(lines[1].number, 5);
    EXPECT_EQ(lines[1].tokens.size(), 3u);
}

TEST(UbcTokenizer, ReadContentLinesFromFile) {
    test::ScratchFile file("tokens.txt", "1 2\n3\n");
    const auto lines = UbcTokenizer::read_content_lines(file.path());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].tokens[0], "3");
}

TEST(UbcTokenizer, MissingFileIsFileError) {
    EXPECT_THROW(UbcTokenizer::read_content_lines(test::missing_path("tokens.txt")), FileError);
}

TEST(UbcTokenizer, ParseIntIsStrict) {
    EXPECT_EQ(UbcTokenizer::parse_int("42", "f", 1, "count"), 42);
    EXPECT_EQ(UbcTokenizer::parse_int("+7", "f", 1, "count"), 7);
    EXPECT_EQ(UbcTokenizer::parse_int("-3", "f", 1, "count"), -3);

    EXPECT_THROW(UbcTokenizer::parse_int("4.0", "f", 1, "count"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_int("12abc", "f", 1, "count"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_int("", "f", 1, "count"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_int("+", "f", 1, "count"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_int("99999999999", "f", 1, "count"), FormatError);
}

TEST(UbcTokenizer, ParseSizeAcceptsLargeCounts) {
    EXPECT_EQ(UbcTokenizer::parse_size("99999999999", "f", 1, "cells"), 99999999999LL);
    EXPECT_THROW(UbcTokenizer::parse_size("1e3", "f", 1, "cells"), FormatError);
}

TEST(UbcTokenizer, ParseRealIsStrict) {
    EXPECT_DOUBLE_EQ(UbcTokenizer::parse_real("-12.5", "f", 1, "x"), -12.5);
    EXPECT_DOUBLE_EQ(UbcTokenizer::parse_real("1e3", "f", 1, "x"), 1000.0);
    EXPECT_DOUBLE_EQ(UbcTokenizer::parse_real("3", "f", 1, "x"), 3.0);

    EXPECT_THROW(UbcTokenizer::parse_real("1.0.0", "f", 1, "x"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_real("abc", "f", 1, "x"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_real("", "f", 1, "x"), FormatError);
    EXPECT_THROW(UbcTokenizer::parse_real("1e999", "f", 1, "x"), FormatError);
}

TEST(UbcTokenizer, ErrorMessageCarriesLocation) {
    try {
        UbcTokenizer::parse_real("oops", "model.den", 17, "model value");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.status(), UbcStatus::FormatError);
        const std::string msg = e.message();
        EXPECT_NE(msg.find("file 'model.den' line 17"), std::string::npos) << msg;
        EXPECT_NE(msg.find("model value"), std::string::npos) << msg;
        EXPECT_NE(msg.find("'oops'"), std::string::npos) << msg;
    }
}

TEST(UbcTokenizer, ParseRealsNeedsEnoughTokens) {
    ContentLine line;
    line.number = 2;
    line.tokens = {"1", "2"};
    EXPECT_THROW(UbcTokenizer::parse_reals(line, 3, "f", "origin"), FormatError);

    line.tokens = {"1", "2", "3", "4"};
    const auto values = UbcTokenizer::parse_reals(line, 3, "f", "origin");
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values[2], 3.0);
}
