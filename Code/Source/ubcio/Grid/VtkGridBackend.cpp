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

#include "VtkGridBackend.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

// VTK includes
#include <vtkCellData.h>
#include <vtkDataSet.h>
#include <vtkDataSetWriter.h>
#include <vtkDoubleArray.h>
#include <vtkRectilinearGrid.h>
#include <vtkUnstructuredGrid.h>
#include <vtkXMLRectilinearGridWriter.h>
#include <vtkXMLUnstructuredGridWriter.h>
#include <vtkZLibDataCompressor.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ubcio {

namespace {

vtkSmartPointer<vtkDoubleArray> to_vtk_array(const std::vector<real_t>& values) {
  vtkSmartPointer<vtkDoubleArray> array = vtkSmartPointer<vtkDoubleArray>::New();
  array->SetNumberOfComponents(1);
  array->SetNumberOfTuples(static_cast<vtkIdType>(values.size()));
  for (std::size_t i = 0; i < values.size(); ++i) {
    array->SetValue(static_cast<vtkIdType>(i), values[i]);
  }
  return array;
}

std::string lower_extension(const std::string& filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace

VtkGridBackend::VtkGridBackend() = default;
VtkGridBackend::~VtkGridBackend() = default;

GridHandle VtkGridBackend::allocate_rectilinear_grid(const std::array<index_t, 3>& dims) {
  for (int a = 0; a < 3; ++a) {
    if (dims[a] <= 0) {
      UBCIO_THROW(FormatError, "VtkGridBackend: node count of axis " + std::to_string(a) +
                               " must be positive, got " + std::to_string(dims[a]));
    }
  }

  vtkSmartPointer<vtkRectilinearGrid> grid = vtkSmartPointer<vtkRectilinearGrid>::New();
  grid->SetDimensions(dims[0], dims[1], dims[2]);

  grids_.push_back(grid);
  return GridHandle{static_cast<int64_t>(grids_.size()) - 1};
}

GridHandle VtkGridBackend::allocate_unstructured_grid() {
  vtkSmartPointer<vtkUnstructuredGrid> grid = vtkSmartPointer<vtkUnstructuredGrid>::New();
  grids_.push_back(grid);
  return GridHandle{static_cast<int64_t>(grids_.size()) - 1};
}

vtkDataSet* VtkGridBackend::dataset(GridHandle grid) const {
  if (!grid.valid() || grid.id >= static_cast<int64_t>(grids_.size())) {
    UBCIO_THROW(RegistryError, "VtkGridBackend: unknown grid handle " + std::to_string(grid.id));
  }
  return grids_[static_cast<std::size_t>(grid.id)];
}

vtkRectilinearGrid* VtkGridBackend::rectilinear_grid(GridHandle grid) const {
  return vtkRectilinearGrid::SafeDownCast(dataset(grid));
}

vtkUnstructuredGrid* VtkGridBackend::unstructured_grid(GridHandle grid) const {
  return vtkUnstructuredGrid::SafeDownCast(dataset(grid));
}

void VtkGridBackend::set_axis_coordinates(GridHandle grid, int axis, const CoordinateAxis& coords) {
  vtkRectilinearGrid* rgrid = rectilinear_grid(grid);
  if (!rgrid) {
    UBCIO_THROW(RegistryError, "VtkGridBackend: grid " + std::to_string(grid.id) +
                               " is not a rectilinear grid");
  }
  if (axis < 0 || axis > 2) {
    UBCIO_THROW(RegistryError, "VtkGridBackend: axis must be 0, 1 or 2, got " + std::to_string(axis));
  }

  int dims[3];
  rgrid->GetDimensions(dims);
  if (static_cast<int>(coords.size()) != dims[axis]) {
    UBCIO_THROW(FormatError, "VtkGridBackend: axis " + std::to_string(axis) + " has " +
                             std::to_string(dims[axis]) + " nodes but " +
                             std::to_string(coords.size()) + " coordinates were given");
  }

  vtkSmartPointer<vtkDoubleArray> array = to_vtk_array(coords);
  switch (axis) {
    case 0: rgrid->SetXCoordinates(array); break;
    case 1: rgrid->SetYCoordinates(array); break;
    default: rgrid->SetZCoordinates(array); break;
  }
}

void VtkGridBackend::attach_cell_array(GridHandle grid, const std::string& name,
                                       const std::vector<real_t>& values) {
  vtkDataSet* ds = dataset(grid);

  const auto n_cells = static_cast<long long>(ds->GetNumberOfCells());
  const auto n_values = static_cast<long long>(values.size());
  if (n_cells != n_values) {
    throw SizeMismatchError("VtkGridBackend: cell array '" + name + "' does not match the grid",
                            n_values > n_cells ? SizeMismatchError::Kind::Surplus
                                               : SizeMismatchError::Kind::Deficit,
                            n_cells, n_values, __FILE__, __LINE__, __FUNCTION__);
  }

  vtkSmartPointer<vtkDoubleArray> array = to_vtk_array(values);
  array->SetName(name.c_str());
  // THIS IS CELL DATA
  ds->GetCellData()->AddArray(array);
}

void VtkGridBackend::write(GridHandle grid, const std::string& filename, bool compress) const {
  vtkDataSet* ds = dataset(grid);
  const std::string ext = lower_extension(filename);
  int status = 0;

  if (ext == ".vtr") {
    vtkRectilinearGrid* rgrid = vtkRectilinearGrid::SafeDownCast(ds);
    if (!rgrid) {
      UBCIO_THROW(FileError, "VtkGridBackend: '" + filename + "' needs a rectilinear grid");
    }
    vtkSmartPointer<vtkXMLRectilinearGridWriter> writer =
        vtkSmartPointer<vtkXMLRectilinearGridWriter>::New();
    writer->SetFileName(filename.c_str());
    writer->SetInputData(rgrid);
    if (compress) {
      vtkSmartPointer<vtkZLibDataCompressor> compressor =
          vtkSmartPointer<vtkZLibDataCompressor>::New();
      writer->SetCompressor(compressor);
    } else {
      writer->SetCompressor(nullptr);
    }
    status = writer->Write();
  } else if (ext == ".vtu") {
    vtkUnstructuredGrid* ugrid = vtkUnstructuredGrid::SafeDownCast(ds);
    if (!ugrid) {
      UBCIO_THROW(FileError, "VtkGridBackend: '" + filename + "' needs an unstructured grid");
    }
    vtkSmartPointer<vtkXMLUnstructuredGridWriter> writer =
        vtkSmartPointer<vtkXMLUnstructuredGridWriter>::New();
    writer->SetFileName(filename.c_str());
    writer->SetInputData(ugrid);
    if (compress) {
      vtkSmartPointer<vtkZLibDataCompressor> compressor =
          vtkSmartPointer<vtkZLibDataCompressor>::New();
      writer->SetCompressor(compressor);
    } else {
      writer->SetCompressor(nullptr);
    }
    status = writer->Write();
  } else if (ext == ".vtk") {
    vtkSmartPointer<vtkDataSetWriter> writer = vtkSmartPointer<vtkDataSetWriter>::New();
    writer->SetFileName(filename.c_str());
    writer->SetInputData(ds);
    writer->SetFileTypeToBinary();
    status = writer->Write();
  } else {
    UBCIO_THROW(FileError, "VtkGridBackend: unsupported output extension '" + ext +
                           "' (use .vtr, .vtu or .vtk)");
  }

  if (status != 1) {
    UBCIO_THROW(FileError, "VtkGridBackend: failed to write '" + filename + "'");
  }
  ubcTrace() << "[ubcio] wrote grid " << grid.id << " to '" << filename << "'" << std::endl;
}

} // namespace ubcio
