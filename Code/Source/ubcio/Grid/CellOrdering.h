/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef UBCIO_CELL_ORDERING_H
#define UBCIO_CELL_ORDERING_H

#include "../Core/UbcTypes.h"
#include <array>
#include <vector>

namespace ubcio {

/**
 * @brief Permutation between model-file order and grid cell order
 *
 * A model file lists n1*n2*n3 values with the last axis varying fastest.
 * The grid expects a different storage order. The conversion is the
 * transpose obtained by reshaping the flat array to (n1, n2, n3), swapping
 * axes 0 and 1, then axes 0 and 2, and flattening again:
 *
 *   out[(k*n1 + i)*n2 + j] = in[(i*n2 + j)*n3 + k]
 *
 * The result has shape (n3, n1, n2). The transform is a cyclic rotation of
 * the three axes, so applying it three times (with the dims rotated to
 * match) is the identity; grid_to_file_order is its direct inverse.
 *
 * Lengths never change under this transform, so a wrong permutation is
 * silent. Keep changes here covered by test_CellOrdering.
 */
class CellOrdering {
public:
  /**
   * @brief Index in the grid-ordered array of file index (i, j, k)
   */
  static size_type grid_index(const std::array<index_t, 3>& dims,
                              index_t i, index_t j, index_t k) {
    return (static_cast<size_type>(k) * dims[0] + i) * dims[1] + j;
  }

  /**
   * @brief Index in the file-ordered array of file index (i, j, k)
   */
  static size_type file_index(const std::array<index_t, 3>& dims,
                              index_t i, index_t j, index_t k) {
    return (static_cast<size_type>(i) * dims[1] + j) * dims[2] + k;
  }

  /**
   * @brief Reorder file-ordered values into grid cell order
   * @param dims Cell counts (n1, n2, n3); values.size() must equal n1*n2*n3
   * @throws SizeMismatchError if the sizes differ
   */
  static std::vector<real_t> file_to_grid_order(const std::array<index_t, 3>& dims,
                                                const std::vector<real_t>& values);

  /**
   * @brief Inverse of file_to_grid_order for the same dims
   */
  static std::vector<real_t> grid_to_file_order(const std::array<index_t, 3>& dims,
                                                const std::vector<real_t>& values);

  /**
   * @brief Shape of the grid-ordered array, (n3, n1, n2)
   */
  static std::array<index_t, 3> grid_shape(const std::array<index_t, 3>& dims) {
    return {{dims[2], dims[0], dims[1]}};
  }

  /**
   * @brief Throw SizeMismatchError unless values.size() == n1*n2*n3
   */
  static void check_size(const std::array<index_t, 3>& dims, size_type n_values);
};

} // namespace ubcio

#endif // UBCIO_CELL_ORDERING_H
