/**
 * @file test_UbcModelReader.cpp
 * @brief Unit tests for the UBC 2D and 3D model readers
 */

#include <gtest/gtest.h>
#include "ubcio/IO/UbcModelReader.h"
#include "ubcio/Core/UbcException.h"
#include "ubcio/Tests/Unit/UbcTestFiles.h"

#include <sstream>

using namespace ubcio;

TEST(UbcModelReader, Model3DFlattensAllTokens) {
    std::istringstream in("1.0 2.0\n3.0\n\n4.0 5.0 6.0 ! trailing comment\n");
    const ModelArray model = UbcModelReader::read_3d(in);
    EXPECT_EQ(model, (ModelArray{1.0, 2.0, 3.0, 4.0, 5.0, 6.0}));
}

TEST(UbcModelReader, Model3DRejectsBadValues) {
    std::istringstream bad("1.0 two 3.0\n");
    EXPECT_THROW(UbcModelReader::read_3d(bad), FormatError);

    std::istringstream empty("\n! only a comment\n");
    EXPECT_THROW(UbcModelReader::read_3d(empty), FormatError);
}

TEST(UbcModelReader, Model2DIsColumnMajor) {
    // Three columns (X) by two rows (Z)
    std::istringstream in("3 2\n"
                          "1 2 3\n"
                          "4 5 6\n");
    const ModelArray model = UbcModelReader::read_2d(in);
    EXPECT_EQ(model, (ModelArray{1.0, 4.0, 2.0, 5.0, 3.0, 6.0}));
}

TEST(UbcModelReader, Model2DAcceptsEitherMatchingDimension) {
    // Columns match dim0, rows do not match dim1
    std::istringstream cols_match("2 9\n1 2\n3 4\n");
    EXPECT_EQ(UbcModelReader::read_2d(cols_match).size(), 4u);

    // Rows match dim1, columns do not match dim0
    std::istringstream rows_match("9 2\n1 2 3\n4 5 6\n");
    EXPECT_EQ(UbcModelReader::read_2d(rows_match).size(), 6u);
}

TEST(UbcModelReader, Model2DImproperlyFormatted) {
    std::istringstream no_match("4 4\n1 2\n3 4\n");
    try {
        UbcModelReader::read_2d(no_match, "model2d.den");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(e.message().find("Model file 'model2d.den' improperly formatted"), std::string::npos)
            << e.message();
    }

    std::istringstream ragged("2 2\n1 2\n3\n");
    EXPECT_THROW(UbcModelReader::read_2d(ragged), FormatError);

    std::istringstream bad_header("2 2 2\n1 2\n3 4\n");
    EXPECT_THROW(UbcModelReader::read_2d(bad_header), FormatError);

    std::istringstream header_only("2 2\n");
    EXPECT_THROW(UbcModelReader::read_2d(header_only), FormatError);
}

TEST(UbcModelReader, ReadFromFile) {
    test::ScratchFile file("model.den", "1 2 3 4\n");
    EXPECT_EQ(UbcModelReader::read_3d(file.path()).size(), 4u);
    EXPECT_THROW(UbcModelReader::read_3d(test::missing_path("model.den")), FileError);
    EXPECT_THROW(UbcModelReader::read_2d(test::missing_path("model2d.den")), FileError);
}
