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

#ifndef UBCIO_GRID_DATA_PLACER_H
#define UBCIO_GRID_DATA_PLACER_H

#include "GridBackend.h"
#include "../Core/UbcTypes.h"
#include <array>
#include <string>

namespace ubcio {

/**
 * @brief Places model values onto the cells of a grid
 *
 * The model array must hold exactly one value per cell. Too many and too
 * few values are both rejected with a SizeMismatchError; nothing is ever
 * truncated or padded.
 */
class GridDataPlacer {
public:
  /// Name used when neither a data name nor a model file name is given
  static constexpr const char* DEFAULT_DATA_NAME = "Data";

  /**
   * @brief Reorder a model array into grid cell order
   * @param cell_counts Cells along each axis of the target grid
   * @param model Values in model-file order
   * @param data_name Attribute name; empty selects default_data_name(model_filename)
   * @param model_filename Model file the values came from
   * @throws SizeMismatchError if model.size() != n1*n2*n3
   */
  static PlacedCellData place(const std::array<index_t, 3>& cell_counts,
                              const ModelArray& model,
                              const std::string& data_name = "",
                              const std::string& model_filename = "");

  /**
   * @brief Reorder a model array and attach it to a backend grid
   */
  static PlacedCellData place_on_grid(GridBackend& backend,
                                      GridHandle grid,
                                      const std::array<index_t, 3>& cell_counts,
                                      const ModelArray& model,
                                      const std::string& data_name = "",
                                      const std::string& model_filename = "");

  /**
   * @brief Base name of the model file, or DEFAULT_DATA_NAME if empty
   */
  static std::string default_data_name(const std::string& model_filename);
};

} // namespace ubcio

#endif // UBCIO_GRID_DATA_PLACER_H
