/**
 * @file test_CellOrdering.cpp
 * @brief Unit tests for the file-order to grid-order cell permutation
 */

#include <gtest/gtest.h>
#include "ubcio/Grid/CellOrdering.h"
#include "ubcio/Core/UbcException.h"

#include <algorithm>
#include <numeric>
#include <random>
#include <set>

using namespace ubcio;

class CellOrderingTest : public ::testing::Test {
protected:
    std::mt19937 rng{42};

    std::array<index_t, 3> random_dims() {
        std::uniform_int_distribution<index_t> dist(1, 7);
        return {{dist(rng), dist(rng), dist(rng)}};
    }

    static std::vector<real_t> iota_values(const std::array<index_t, 3>& dims) {
        std::vector<real_t> values(static_cast<std::size_t>(dims[0]) * dims[1] * dims[2]);
        std::iota(values.begin(), values.end(), 0.0);
        return values;
    }
};

TEST_F(CellOrderingTest, ExplicitSmallGrid) {
    // (n1, n2, n3) = (2, 1, 3): file order is i-major, grid order is k-major
    const std::array<index_t, 3> dims = {{2, 1, 3}};
    const std::vector<real_t> file = {0, 1, 2, 3, 4, 5};

    const std::vector<real_t> grid = CellOrdering::file_to_grid_order(dims, file);
    const std::vector<real_t> expected = {0, 3, 1, 4, 2, 5};
    EXPECT_EQ(grid, expected);
}

TEST_F(CellOrderingTest, IndexFormulas) {
    const std::array<index_t, 3> dims = {{3, 4, 5}};
    EXPECT_EQ(CellOrdering::file_index(dims, 1, 2, 3), (1 * 4 + 2) * 5 + 3);
    EXPECT_EQ(CellOrdering::grid_index(dims, 1, 2, 3), (3 * 3 + 1) * 4 + 2);
    EXPECT_EQ(CellOrdering::grid_shape(dims), (std::array<index_t, 3>{{5, 3, 4}}));
}

TEST_F(CellOrderingTest, EveryValueLandsAtItsGridIndex) {
    for (int trial = 0; trial < 20; ++trial) {
        const auto dims = random_dims();
        const auto file = iota_values(dims);
        const auto grid = CellOrdering::file_to_grid_order(dims, file);

        for (index_t i = 0; i < dims[0]; ++i) {
            for (index_t j = 0; j < dims[1]; ++j) {
                for (index_t k = 0; k < dims[2]; ++k) {
                    EXPECT_EQ(grid[CellOrdering::grid_index(dims, i, j, k)],
                              file[CellOrdering::file_index(dims, i, j, k)]);
                }
            }
        }
    }
}

TEST_F(CellOrderingTest, IsABijection) {
    for (int trial = 0; trial < 20; ++trial) {
        const auto dims = random_dims();
        const auto grid = CellOrdering::file_to_grid_order(dims, iota_values(dims));

        const std::set<real_t> distinct(grid.begin(), grid.end());
        EXPECT_EQ(distinct.size(), grid.size());

        std::vector<real_t> sorted = grid;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_EQ(sorted, iota_values(dims));
    }
}

TEST_F(CellOrderingTest, InverseRestoresFileOrder) {
    std::uniform_real_distribution<real_t> value(-1.0e3, 1.0e3);
    for (int trial = 0; trial < 20; ++trial) {
        const auto dims = random_dims();
        std::vector<real_t> file(static_cast<std::size_t>(dims[0]) * dims[1] * dims[2]);
        for (auto& v : file) {
            v = value(rng);
        }

        const auto grid = CellOrdering::file_to_grid_order(dims, file);
        EXPECT_EQ(CellOrdering::grid_to_file_order(dims, grid), file);
    }
}

TEST_F(CellOrderingTest, ThreeApplicationsAreIdentity) {
    // The permutation cycles the axes, so applying it with the rotated shape
    // three times returns to the starting order
    for (int trial = 0; trial < 20; ++trial) {
        const auto dims = random_dims();
        const auto file = iota_values(dims);

        auto shape = dims;
        auto values = file;
        for (int step = 0; step < 3; ++step) {
            values = CellOrdering::file_to_grid_order(shape, values);
            shape = CellOrdering::grid_shape(shape);
        }
        EXPECT_EQ(shape, dims);
        EXPECT_EQ(values, file);
    }
}

TEST_F(CellOrderingTest, DegenerateAxesKeepOrder) {
    // With n1 = n2 = 1 the file and grid orders coincide
    const std::array<index_t, 3> dims = {{1, 1, 6}};
    const auto values = iota_values(dims);
    EXPECT_EQ(CellOrdering::file_to_grid_order(dims, values), values);
}

TEST_F(CellOrderingTest, SizeMismatch) {
    const std::array<index_t, 3> dims = {{2, 2, 2}};

    try {
        CellOrdering::file_to_grid_order(dims, std::vector<real_t>(9, 1.0));
        FAIL() << "Expected SizeMismatchError";
    } catch (const SizeMismatchError& e) {
        EXPECT_EQ(e.kind(), SizeMismatchError::Kind::Surplus);
        EXPECT_EQ(e.expected(), 8);
        EXPECT_EQ(e.actual(), 9);
    }

    try {
        CellOrdering::file_to_grid_order(dims, std::vector<real_t>(7, 1.0));
        FAIL() << "Expected SizeMismatchError";
    } catch (const SizeMismatchError& e) {
        EXPECT_EQ(e.kind(), SizeMismatchError::Kind::Deficit);
        EXPECT_EQ(e.status(), UbcStatus::SizeMismatch);
    }

    EXPECT_NO_THROW(CellOrdering::check_size(dims, 8));
}
