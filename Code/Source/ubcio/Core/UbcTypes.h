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

#ifndef UBCIO_TYPES_H
#define UBCIO_TYPES_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ubcio {

// ------------------------
// Fundamental type aliases
// ------------------------
using index_t = int32_t;      // cell / node counts along one axis
using size_type = int64_t;    // flat array sizes (n1*n2*n3 can exceed 2^31)
using real_t  = double;       // coordinates and model values

/// Node coordinates along one axis (length = cell count + 1).
using CoordinateAxis = std::vector<real_t>;

/// Cell widths along one axis (length = cell count).
using AxisSpacing = std::vector<real_t>;

/// Flat model values, in the storage order of the model file.
using ModelArray = std::vector<real_t>;

/**
 * @brief Whole extent (0, n1, 0, n2, 0, n3) of a mesh.
 *
 * The upper bounds are CELL counts. A grid built from the same mesh has
 * n+1 nodes along each axis, so this is not a node-based allocation size.
 */
using Extent = std::array<index_t, 6>;

// ---------
// Enums
// ---------
enum class UbcFormat {
  Mesh2D,
  Mesh3D,
  OcTree
};

inline const char* to_string(UbcFormat format)
{
  switch (format) {
    case UbcFormat::Mesh2D: return "ubc2d";
    case UbcFormat::Mesh3D: return "ubc3d";
    case UbcFormat::OcTree: return "ubcoctree";
  }
  return "unknown";
}

// --------------------
// Mesh descriptions
// --------------------

/// Easting, Northing, Elevation of the southwest-top corner (down is positive Z).
using Origin = std::array<real_t, 3>;

struct MeshHeader {
  std::array<index_t, 3> cell_counts = {{0, 0, 0}};
  std::vector<index_t> padding;   // OcTree only, unused downstream
};

/**
 * @brief Rectilinear grid description produced by the 2D and 3D mesh readers.
 *
 * axes[a] holds node_dims[a] coordinates. For 2D meshes axis 1 (Y) is the
 * single coordinate [0] and cell_counts[1] is 1.
 */
struct RectilinearMesh {
  std::string filename;
  UbcFormat format = UbcFormat::Mesh3D;
  std::array<index_t, 3> cell_counts = {{0, 0, 0}};
  std::array<index_t, 3> node_dims = {{0, 0, 0}};
  Origin origin = {{0, 0, 0}};
  std::array<CoordinateAxis, 3> axes;

  size_type n_cells() const {
    return static_cast<size_type>(cell_counts[0]) * cell_counts[1] * cell_counts[2];
  }
};

/**
 * @brief Parsed UBC OcTree mesh (header and index table only).
 */
struct OcTreeMesh {
  std::string filename;
  MeshHeader header;
  Origin origin = {{0, 0, 0}};
  std::array<real_t, 3> core_widths = {{0, 0, 0}};
  size_type n_cells = 0;
  index_t row_width = 0;
  std::vector<index_t> index_table;   // n_cells rows of row_width ints

  const index_t* row(size_type r) const { return index_table.data() + r * row_width; }
};

/// Values reordered into grid cell order, ready to attach as cell data.
struct PlacedCellData {
  std::string name;
  std::vector<real_t> values;
};

// --------------------
// I/O options
// --------------------
struct UbcIOOptions {
  std::string format;                                     // "ubc2d", "ubc3d", "ubcoctree", empty = detect
  std::string mesh_path;
  std::string model_path;                                 // optional
  std::string data_name;                                  // empty = model file base name
};

} // namespace ubcio

#endif // UBCIO_TYPES_H
