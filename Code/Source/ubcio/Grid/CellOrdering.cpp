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

#include "CellOrdering.h"
#include "../Core/UbcException.h"

namespace ubcio {

void CellOrdering::check_size(const std::array<index_t, 3>& dims, size_type n_values) {
  const size_type n_cells = static_cast<size_type>(dims[0]) * dims[1] * dims[2];

  if (n_cells < n_values) {
    throw SizeMismatchError("This model file has more data than the given mesh has cells to hold.",
                            SizeMismatchError::Kind::Surplus, n_cells, n_values,
                            __FILE__, __LINE__, __FUNCTION__);
  }
  if (n_cells > n_values) {
    throw SizeMismatchError("This model file does not have enough data to fill the given mesh's cells.",
                            SizeMismatchError::Kind::Deficit, n_cells, n_values,
                            __FILE__, __LINE__, __FUNCTION__);
  }
}

std::vector<real_t> CellOrdering::file_to_grid_order(const std::array<index_t, 3>& dims,
                                                     const std::vector<real_t>& values) {
  check_size(dims, static_cast<size_type>(values.size()));

  std::vector<real_t> out(values.size());
  for (index_t i = 0; i < dims[0]; ++i) {
    for (index_t j = 0; j < dims[1]; ++j) {
      for (index_t k = 0; k < dims[2]; ++k) {
        out[grid_index(dims, i, j, k)] = values[file_index(dims, i, j, k)];
      }
    }
  }
  return out;
}

std::vector<real_t> CellOrdering::grid_to_file_order(const std::array<index_t, 3>& dims,
                                                     const std::vector<real_t>& values) {
  check_size(dims, static_cast<size_type>(values.size()));

  std::vector<real_t> out(values.size());
  for (index_t i = 0; i < dims[0]; ++i) {
    for (index_t j = 0; j < dims[1]; ++j) {
      for (index_t k = 0; k < dims[2]; ++k) {
        out[file_index(dims, i, j, k)] = values[grid_index(dims, i, j, k)];
      }
    }
  }
  return out;
}

} // namespace ubcio
