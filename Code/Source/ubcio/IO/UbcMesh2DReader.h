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

#ifndef UBCIO_MESH_2D_READER_H
#define UBCIO_MESH_2D_READER_H

#include "UbcTokenizer.h"
#include "../Core/UbcTypes.h"
#include <istream>
#include <string>
#include <vector>

namespace ubcio {

/**
 * @brief UBC 2D mesh reader
 *
 * The file describes each axis as a list of segments between control
 * points, each segment divided into a number of equal cells:
 *
 *   NX                  ! segments along X
 *   X0 X1 N1            ! origin, first control point, cells in segment
 *   X2 N2
 *   ...
 *   NZ                  ! segments along Z (depth, positive down)
 *   Z0 Z1 M1
 *   Z2 M2
 *   ...
 *
 * The result is a rectilinear mesh with X and Z axes and a single-node Y
 * axis [0], i.e. node dims (nx+1, 1, nz+1) and cell counts (nx, 1, nz).
 *
 * @see https://giftoolscookbook.readthedocs.io/en/latest/content/fileFormats/mesh2Dfile.html
 */
class UbcMesh2DReader {
public:
  /**
   * @brief Read a UBC 2D mesh file
   * @throws FileError if the file cannot be opened
   * @throws FormatError if a block is short or holds malformed values
   */
  static RectilinearMesh read(const std::string& filename);

  static RectilinearMesh read(std::istream& in, const std::string& filename = "<stream>");

  /**
   * @brief Node coordinates for one axis
   *
   * Segment i runs from points[i] to points[i+1] and is split into
   * subdivisions[i] equal cells. Interior boundaries are start + j*w; the
   * last boundary of every segment is the control point itself.
   */
  static CoordinateAxis build_coordinates(const std::vector<real_t>& points,
                                          const std::vector<index_t>& subdivisions);

private:
  struct AxisBlock {
    std::vector<real_t> points;         // segments + 1 control points
    std::vector<index_t> subdivisions;  // cells per segment
  };

  /**
   * @brief Parse the count line at lines[pos] and the block that follows
   * @param pos Index of the count line, advanced past the block on return
   */
  static AxisBlock parse_axis_block(const std::vector<ContentLine>& lines,
                                    std::size_t& pos,
                                    const std::string& filename,
                                    const std::string& axis_name);
};

} // namespace ubcio

#endif // UBCIO_MESH_2D_READER_H
