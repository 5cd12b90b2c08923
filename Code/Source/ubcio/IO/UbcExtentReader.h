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

#ifndef UBCIO_EXTENT_READER_H
#define UBCIO_EXTENT_READER_H

#include "../Core/UbcTypes.h"
#include <istream>
#include <string>

namespace ubcio {

/**
 * @brief Cheap whole-extent discovery for UBC mesh files
 *
 * The returned Extent holds CELL counts: (0, n1, 0, n2, 0, n3). A grid built
 * from the same file allocates n+1 nodes per axis, so callers that size
 * node arrays from the extent must add one per axis themselves.
 */
class UbcExtentReader {
public:
  /**
   * @brief Extent of a UBC 3D or OcTree mesh from its header line
   *
   * Only the stream up to and including the first content line is read.
   *
   * @throws FileError if the file cannot be opened
   * @throws FormatError if the header has fewer than three integers
   */
  static Extent read_extent_3d(const std::string& filename);

  static Extent read_extent_3d(std::istream& in, const std::string& filename = "<stream>");

  /**
   * @brief Extent of a UBC 2D mesh: (0, nx, 0, 1, 0, nz)
   *
   * The 2D format spreads the cell counts over every block line, so this
   * parses the whole mesh header.
   */
  static Extent read_extent_2d(const std::string& filename);
};

} // namespace ubcio

#endif // UBCIO_EXTENT_READER_H
