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

#ifndef UBCIO_MESH_3D_READER_H
#define UBCIO_MESH_3D_READER_H

#include "UbcTokenizer.h"
#include "../Core/UbcTypes.h"
#include <istream>
#include <string>
#include <vector>

namespace ubcio {

/**
 * @brief UBC 3D (tensor) mesh reader
 *
 * File layout:
 *   n1 n2 n3            ! cells along Easting, Northing, Elevation
 *   E0 N0 Z0            ! southwest-top corner, Z positive down
 *   dE ...              ! n1 widths, "count*width" runs allowed
 *   dN ...              ! n2 widths
 *   dZ ...              ! n3 widths
 *
 * Node coordinates along each axis are the running sum of the widths
 * starting from the origin component. The vertical axis uses the same
 * additive rule as the horizontal ones.
 *
 * @see https://giftoolscookbook.readthedocs.io/en/latest/content/fileFormats/mesh3Dfile.html
 */
class UbcMesh3DReader {
public:
  /**
   * @brief Read a UBC 3D mesh file
   * @return Mesh with three axes of n_i + 1 nodes and node dims (n1+1, n2+1, n3+1)
   * @throws FileError if the file cannot be opened
   * @throws FormatError naming the axis if a spacing line does not expand
   *         to the declared cell count
   */
  static RectilinearMesh read(const std::string& filename);

  static RectilinearMesh read(std::istream& in, const std::string& filename = "<stream>");

  /**
   * @brief Running sum of widths starting at origin
   */
  static CoordinateAxis accumulate_axis(real_t origin, const AxisSpacing& widths);

private:
  static std::array<index_t, 3> parse_cell_counts(const ContentLine& line,
                                                  const std::string& filename);
};

} // namespace ubcio

#endif // UBCIO_MESH_3D_READER_H
