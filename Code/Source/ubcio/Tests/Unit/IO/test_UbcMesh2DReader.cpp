/**
 * @file test_UbcMesh2DReader.cpp
 * @brief Unit tests for the UBC 2D mesh reader
 */

#include <gtest/gtest.h>
#include "ubcio/IO/UbcMesh2DReader.h"
#include "ubcio/Core/UbcException.h"
#include "ubcio/Tests/Unit/UbcTestFiles.h"

#include <sstream>

using namespace ubcio;

namespace {

RectilinearMesh read_text(const std::string& text) {
    std::istringstream in(text);
    return UbcMesh2DReader::read(in, "test2d.msh");
}

// X: 0 -> 10 in 2 cells, 10 -> 40 in 3 cells; Z: 0 -> 5 in 1 cell, 5 -> 25 in 4 cells
const char* const kTwoSegmentMesh =
    "2\n"
    "0 10 2\n"
    "40 3\n"
    "2\n"
    "0 5 1\n"
    "25 4\n";

} // namespace

TEST(UbcMesh2DReader, SubdividesSegments) {
    const RectilinearMesh mesh = read_text(kTwoSegmentMesh);

    EXPECT_EQ(mesh.format, UbcFormat::Mesh2D);
    EXPECT_EQ(mesh.axes[0], (CoordinateAxis{0.0, 5.0, 10.0, 20.0, 30.0, 40.0}));
    EXPECT_EQ(mesh.axes[2], (CoordinateAxis{0.0, 5.0, 10.0, 15.0, 20.0, 25.0}));
}

TEST(UbcMesh2DReader, SingleNodeYAxis) {
    const RectilinearMesh mesh = read_text(kTwoSegmentMesh);

    EXPECT_EQ(mesh.axes[1], (CoordinateAxis{0.0}));
    EXPECT_EQ(mesh.node_dims, (std::array<index_t, 3>{{6, 1, 6}}));
    EXPECT_EQ(mesh.cell_counts, (std::array<index_t, 3>{{5, 1, 5}}));
    EXPECT_DOUBLE_EQ(mesh.origin[0], 0.0);
    EXPECT_DOUBLE_EQ(mesh.origin[1], 0.0);
    EXPECT_DOUBLE_EQ(mesh.origin[2], 0.0);
}

TEST(UbcMesh2DReader, ControlPointsAreExact) {
    // 1/3 does not divide evenly in binary; the segment end must still be the declared value
    const RectilinearMesh mesh = read_text("1\n-1.0 0.0 3\n1\n100 101 7\n");

    ASSERT_EQ(mesh.axes[0].size(), 4u);
    EXPECT_EQ(mesh.axes[0].front(), -1.0);
    EXPECT_EQ(mesh.axes[0].back(), 0.0);
    EXPECT_NEAR(mesh.axes[0][1], -2.0 / 3.0, 1e-12);
    EXPECT_EQ(mesh.axes[2].front(), 100.0);
    EXPECT_EQ(mesh.axes[2].back(), 101.0);
    EXPECT_DOUBLE_EQ(mesh.origin[2], 100.0);
}

TEST(UbcMesh2DReader, CommentsAndBlankLines) {
    const RectilinearMesh mesh = read_text("! x block\n1\n0 4 4\n\n! z block\n1\n0 2 2\n");
    EXPECT_EQ(mesh.cell_counts, (std::array<index_t, 3>{{4, 1, 2}}));
}

TEST(UbcMesh2DReader, ReadFromFile) {
    test::ScratchFile file("mesh2d.msh", kTwoSegmentMesh);
    const RectilinearMesh mesh = UbcMesh2DReader::read(file.path());
    EXPECT_EQ(mesh.n_cells(), 25);
}

TEST(UbcMesh2DReader, BlockShapeErrors) {
    // Missing origin on the first line of a block
    EXPECT_THROW(read_text("1\n10 2\n1\n0 5 1\n"), FormatError);
    // Extra value on a continuation line
    EXPECT_THROW(read_text("2\n0 10 2\n40 3 1\n1\n0 5 1\n"), FormatError);
    // Count line with two values
    EXPECT_THROW(read_text("1 2\n0 10 2\n1\n0 5 1\n"), FormatError);
    // Block shorter than declared
    EXPECT_THROW(read_text("3\n0 10 2\n40 3\n1\n0 5 1\n"), FormatError);
    // Z block missing
    EXPECT_THROW(read_text("1\n0 10 2\n"), FormatError);
    // Trailing content
    EXPECT_THROW(read_text("1\n0 10 2\n1\n0 5 1\n7\n"), FormatError);
}

TEST(UbcMesh2DReader, ValueErrors) {
    EXPECT_THROW(read_text("0\n1\n0 5 1\n"), FormatError);
    EXPECT_THROW(read_text("1\n0 10 0\n1\n0 5 1\n"), FormatError);
    EXPECT_THROW(read_text("1\n0 10 2.5\n1\n0 5 1\n"), FormatError);
    EXPECT_THROW(read_text("1\n10 0 2\n1\n0 5 1\n"), FormatError);
    EXPECT_THROW(read_text("1\n0 ten 2\n1\n0 5 1\n"), FormatError);
}

TEST(UbcMesh2DReader, MissingFile) {
    EXPECT_THROW(UbcMesh2DReader::read(test::missing_path("mesh2d.msh")), FileError);
}

TEST(UbcMesh2DReader, BuildCoordinates) {
    const CoordinateAxis coords = UbcMesh2DReader::build_coordinates({0.0, 4.0, 5.0}, {4, 2});
    EXPECT_EQ(coords, (CoordinateAxis{0.0, 1.0, 2.0, 3.0, 4.0, 4.5, 5.0}));
}
