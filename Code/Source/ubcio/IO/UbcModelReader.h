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

#ifndef UBCIO_MODEL_READER_H
#define UBCIO_MODEL_READER_H

#include "../Core/UbcTypes.h"
#include <istream>
#include <string>

namespace ubcio {

/**
 * @brief Readers for UBC model files (one value per mesh cell)
 *
 * 2D and 3D model files use different conventions:
 * - 2D: a header line "dim0 dim1" followed by a table of values, one table
 *   row per line. The table is flattened column by column.
 * - 3D: no header; every value of the file in order.
 *
 * The returned arrays are in file order. Use GridDataPlacer to move them
 * into grid cell order.
 */
class UbcModelReader {
public:
  /**
   * @brief Read a 2D model file
   *
   * Valid if the table has dim1 rows or dim0 columns; all rows must have the
   * same number of values.
   *
   * @throws FileError if the file cannot be opened
   * @throws FormatError ("model file improperly formatted") otherwise
   */
  static ModelArray read_2d(const std::string& filename);

  static ModelArray read_2d(std::istream& in, const std::string& filename = "<stream>");

  /**
   * @brief Read a 3D model file
   * @throws FileError if the file cannot be opened
   * @throws FormatError on a non-numeric token or an empty file
   */
  static ModelArray read_3d(const std::string& filename);

  static ModelArray read_3d(std::istream& in, const std::string& filename = "<stream>");
};

} // namespace ubcio

#endif // UBCIO_MODEL_READER_H
