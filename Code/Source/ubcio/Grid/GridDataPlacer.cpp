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

#include "GridDataPlacer.h"
#include "CellOrdering.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <filesystem>

namespace ubcio {

std::string GridDataPlacer::default_data_name(const std::string& model_filename) {
  if (model_filename.empty()) {
    return DEFAULT_DATA_NAME;
  }
  const std::string base = std::filesystem::path(model_filename).filename().string();
  return base.empty() ? std::string(DEFAULT_DATA_NAME) : base;
}

PlacedCellData GridDataPlacer::place(const std::array<index_t, 3>& cell_counts,
                                     const ModelArray& model,
                                     const std::string& data_name,
                                     const std::string& model_filename) {
  PlacedCellData placed;
  placed.name = data_name.empty() ? default_data_name(model_filename) : data_name;

  try {
    placed.values = CellOrdering::file_to_grid_order(cell_counts, model);
  } catch (SizeMismatchError& e) {
    if (!model_filename.empty()) {
      e.add_context("Placing model file '" + model_filename + "'");
    }
    throw;
  }

  ubcTrace() << "[ubcio] placed " << placed.values.size() << " values as '" << placed.name
             << "'" << std::endl;
  return placed;
}

PlacedCellData GridDataPlacer::place_on_grid(GridBackend& backend,
                                             GridHandle grid,
                                             const std::array<index_t, 3>& cell_counts,
                                             const ModelArray& model,
                                             const std::string& data_name,
                                             const std::string& model_filename) {
  PlacedCellData placed = place(cell_counts, model, data_name, model_filename);
  backend.attach_cell_array(grid, placed.name, placed.values);
  return placed;
}

} // namespace ubcio
