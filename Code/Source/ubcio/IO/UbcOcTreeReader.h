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

#ifndef UBCIO_OCTREE_READER_H
#define UBCIO_OCTREE_READER_H

#include "UbcTokenizer.h"
#include "../Core/UbcTypes.h"
#include <istream>
#include <string>

namespace ubcio {

/**
 * @brief UBC OcTree mesh reader (header and index table)
 *
 * File layout:
 *   n1 n2 n3 p1 p2 p3 p4 p5 p6   ! core cells per axis, then padding
 *   E0 N0 Z0                     ! southwest-top corner
 *   wE wN wZ                     ! core cell widths
 *   N                            ! number of cells
 *   i j k size                   ! N rows of the cell index table
 *
 * The core mesh must be cubic (n1 == n2 == n3). The index table is read and
 * checked for shape only; turning it into cell topology is not supported
 * (see GridBuilder::build for OcTreeMesh).
 */
class UbcOcTreeReader {
public:
  /**
   * @brief Read a UBC OcTree mesh file
   * @throws FileError if the file cannot be opened
   * @throws UnsupportedGeometryError if the core dimensions differ; this is
   *         raised before any later line of the file is read
   * @throws FormatError on any other shape or parse failure
   */
  static OcTreeMesh read(const std::string& filename);

  static OcTreeMesh read(std::istream& in, const std::string& filename = "<stream>");

  /// Minimum number of values in one index table row (corner i, j, k and size)
  static constexpr index_t MIN_ROW_WIDTH = 4;

private:
  static MeshHeader parse_header(const ContentLine& line, const std::string& filename);
};

} // namespace ubcio

#endif // UBCIO_OCTREE_READER_H
