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

#ifndef UBCIO_VTK_GRID_BACKEND_H
#define UBCIO_VTK_GRID_BACKEND_H

#include "GridBackend.h"

#include <vtkSmartPointer.h>

#include <string>
#include <vector>

// Forward declarations for VTK classes
class vtkDataSet;
class vtkRectilinearGrid;
class vtkUnstructuredGrid;

namespace ubcio {

/**
 * @brief GridBackend producing VTK data sets
 *
 * Rectilinear grids become vtkRectilinearGrid, unstructured grids
 * vtkUnstructuredGrid, and cell arrays vtkDoubleArray attached to the cell
 * data. The backend owns every grid it allocates; the raw pointers returned
 * by the accessors stay valid for the lifetime of the backend.
 */
class VtkGridBackend : public GridBackend {
public:
  VtkGridBackend();
  ~VtkGridBackend() override;

  GridHandle allocate_rectilinear_grid(const std::array<index_t, 3>& dims) override;

  void set_axis_coordinates(GridHandle grid, int axis, const CoordinateAxis& coords) override;

  void attach_cell_array(GridHandle grid, const std::string& name,
                         const std::vector<real_t>& values) override;

  GridHandle allocate_unstructured_grid() override;

  /**
   * @brief Data set behind a handle
   * @throws RegistryError if the handle was not issued by this backend
   */
  vtkDataSet* dataset(GridHandle grid) const;

  /**
   * @return The rectilinear grid, or nullptr if the handle refers to another type
   */
  vtkRectilinearGrid* rectilinear_grid(GridHandle grid) const;

  vtkUnstructuredGrid* unstructured_grid(GridHandle grid) const;

  std::size_t n_grids() const { return grids_.size(); }

  /**
   * @brief Write a grid to disk
   *
   * The writer is chosen from the extension: ".vtr" (XML rectilinear grid),
   * ".vtu" (XML unstructured grid) or ".vtk" (legacy, any data set).
   *
   * @throws FileError if the extension does not fit the grid or writing fails
   */
  void write(GridHandle grid, const std::string& filename, bool compress = true) const;

private:
  std::vector<vtkSmartPointer<vtkDataSet>> grids_;
};

} // namespace ubcio

#endif // UBCIO_VTK_GRID_BACKEND_H
