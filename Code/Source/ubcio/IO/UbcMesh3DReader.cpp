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

#include "UbcMesh3DReader.h"
#include "RunLengthSpacing.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <fstream>

namespace ubcio {

RectilinearMesh UbcMesh3DReader::read(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcMesh3DReader: Cannot open file: " + filename);
  }
  return read(file, filename);
}

RectilinearMesh UbcMesh3DReader::read(std::istream& in, const std::string& filename) {
  const auto lines = UbcTokenizer::read_content_lines(in);

  // Header, origin and one spacing line per axis
  if (lines.size() < 5) {
    UBCIO_THROW(FormatError, "UbcMesh3DReader: file '" + filename + "' has " +
                             std::to_string(lines.size()) +
                             " content lines, a 3D mesh needs a header, an origin and three spacing lines");
  }

  RectilinearMesh mesh;
  mesh.filename = filename;
  mesh.format = UbcFormat::Mesh3D;
  mesh.cell_counts = parse_cell_counts(lines[0], filename);

  const auto origin = UbcTokenizer::parse_reals(lines[1], 3, filename, "origin");
  mesh.origin = {{origin[0], origin[1], origin[2]}};

  for (int a = 0; a < 3; ++a) {
    const ContentLine& line = lines[2 + a];
    const AxisSpacing widths = RunLengthSpacing::decode(line.tokens, mesh.cell_counts[a], a,
                                                        filename, line.number);
    mesh.axes[a] = accumulate_axis(mesh.origin[a], widths);
    mesh.node_dims[a] = mesh.cell_counts[a] + 1;
  }

  if (lines.size() > 5) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, lines[5].number) +
                             ": unexpected content after the Z spacing line");
  }

  ubcTrace() << "[ubcio] 3D mesh '" << filename << "': " << mesh.cell_counts[0] << " x "
             << mesh.cell_counts[1] << " x " << mesh.cell_counts[2] << " cells" << std::endl;
  return mesh;
}

std::array<index_t, 3> UbcMesh3DReader::parse_cell_counts(const ContentLine& line,
                                                          const std::string& filename) {
  if (line.tokens.size() < 3) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                             ": header must hold three cell counts, found " +
                             std::to_string(line.tokens.size()) + " value(s)");
  }

  // Trailing values (padding) are allowed and ignored
  std::array<index_t, 3> counts = {{0, 0, 0}};
  for (int a = 0; a < 3; ++a) {
    counts[a] = UbcTokenizer::parse_int(line.tokens[a], filename, line.number,
                                        "cell count of axis " + std::to_string(a));
    UBCIO_THROW_IF(counts[a] <= 0, FormatError,
                   UbcTokenizer::location(filename, line.number) +
                   ": cell count of axis " + std::to_string(a) + " must be positive");
  }
  return counts;
}

CoordinateAxis UbcMesh3DReader::accumulate_axis(real_t origin, const AxisSpacing& widths) {
  CoordinateAxis coords(widths.size() + 1);
  coords[0] = origin;
  for (std::size_t j = 1; j < coords.size(); ++j) {
    coords[j] = coords[j - 1] + widths[j - 1];
  }
  return coords;
}

} // namespace ubcio
