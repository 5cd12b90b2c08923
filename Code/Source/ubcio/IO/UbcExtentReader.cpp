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

#include "UbcExtentReader.h"
#include "UbcMesh2DReader.h"
#include "UbcTokenizer.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <fstream>

namespace ubcio {

Extent UbcExtentReader::read_extent_3d(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcExtentReader: Cannot open file: " + filename);
  }
  return read_extent_3d(file, filename);
}

Extent UbcExtentReader::read_extent_3d(std::istream& in, const std::string& filename) {
  int line_number = 0;
  ContentLine header;
  if (!UbcTokenizer::next_content_line(in, line_number, header)) {
    UBCIO_THROW(FormatError, "UbcExtentReader: file '" + filename + "' has no header line");
  }

  if (header.tokens.size() < 3) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, header.number) +
                             ": header must start with three cell counts, found " +
                             std::to_string(header.tokens.size()) + " value(s)");
  }

  Extent extent = {{0, 0, 0, 0, 0, 0}};
  for (int a = 0; a < 3; ++a) {
    extent[2 * a + 1] = UbcTokenizer::parse_int(header.tokens[a], filename, header.number,
                                                "cell count of axis " + std::to_string(a));
  }

  ubcTrace() << "[ubcio] extent of '" << filename << "': " << extent[1] << " x "
             << extent[3] << " x " << extent[5] << " cells" << std::endl;
  return extent;
}

Extent UbcExtentReader::read_extent_2d(const std::string& filename) {
  const RectilinearMesh mesh = UbcMesh2DReader::read(filename);
  return {{0, mesh.cell_counts[0], 0, mesh.cell_counts[1], 0, mesh.cell_counts[2]}};
}

} // namespace ubcio
