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

#ifndef UBCIO_GRID_BACKEND_H
#define UBCIO_GRID_BACKEND_H

#include "../Core/UbcTypes.h"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ubcio {

/**
 * @brief Opaque reference to a grid owned by a GridBackend
 */
struct GridHandle {
  int64_t id = -1;

  bool valid() const { return id >= 0; }
  bool operator==(const GridHandle& other) const { return id == other.id; }
  bool operator!=(const GridHandle& other) const { return id != other.id; }
};

/**
 * @brief Collaborator that materializes grid objects
 *
 * The readers only produce coordinates, dimensions and reordered cell
 * values; a backend turns them into an actual grid (VTK in VtkGridBackend).
 * Handles are only ever passed back to the backend that issued them.
 */
class GridBackend {
public:
  virtual ~GridBackend() = default;

  /**
   * @brief Allocate a rectilinear grid
   * @param dims Number of nodes along each axis
   */
  virtual GridHandle allocate_rectilinear_grid(const std::array<index_t, 3>& dims) = 0;

  /**
   * @brief Set the node coordinates of one axis of a rectilinear grid
   * @param axis 0, 1 or 2
   */
  virtual void set_axis_coordinates(GridHandle grid, int axis, const CoordinateAxis& coords) = 0;

  /**
   * @brief Attach a named per-cell array, values in grid cell order
   */
  virtual void attach_cell_array(GridHandle grid, const std::string& name,
                                 const std::vector<real_t>& values) = 0;

  virtual GridHandle allocate_unstructured_grid() = 0;
};

} // namespace ubcio

#endif // UBCIO_GRID_BACKEND_H
