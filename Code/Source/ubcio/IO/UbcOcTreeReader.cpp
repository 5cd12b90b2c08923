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

#include "UbcOcTreeReader.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <fstream>

namespace ubcio {

OcTreeMesh UbcOcTreeReader::read(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcOcTreeReader: Cannot open file: " + filename);
  }
  return read(file, filename);
}

OcTreeMesh UbcOcTreeReader::read(std::istream& in, const std::string& filename) {
  int line_number = 0;
  ContentLine line;

  auto next_line = [&](const char* what) {
    if (!UbcTokenizer::next_content_line(in, line_number, line)) {
      UBCIO_THROW(FormatError, "UbcOcTreeReader: file '" + filename + "' ends before the " + what);
    }
  };

  OcTreeMesh mesh;
  mesh.filename = filename;

  next_line("header");
  mesh.header = parse_header(line, filename);

  next_line("origin");
  const auto origin = UbcTokenizer::parse_reals(line, 3, filename, "origin");
  mesh.origin = {{origin[0], origin[1], origin[2]}};

  next_line("core cell widths");
  const auto widths = UbcTokenizer::parse_reals(line, 3, filename, "core cell widths");
  mesh.core_widths = {{widths[0], widths[1], widths[2]}};

  next_line("cell count");
  if (line.tokens.size() != 1) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                             ": expected a single cell count, found " +
                             std::to_string(line.tokens.size()) + " values");
  }
  mesh.n_cells = UbcTokenizer::parse_size(line.tokens[0], filename, line.number, "cell count");
  if (mesh.n_cells <= 0) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                             ": cell count must be positive");
  }

  // Index table
  size_type rows = 0;
  while (UbcTokenizer::next_content_line(in, line_number, line)) {
    const auto width = static_cast<index_t>(line.tokens.size());
    if (rows == 0) {
      if (width < MIN_ROW_WIDTH) {
        UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                                 ": index table rows need at least " + std::to_string(MIN_ROW_WIDTH) +
                                 " values, found " + std::to_string(width));
      }
      // The declared count is not trusted for allocation; the row check below reports it
      mesh.row_width = width;
    } else if (width != mesh.row_width) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                               ": index table row has " + std::to_string(width) +
                               " values, previous rows have " + std::to_string(mesh.row_width));
    }

    for (const auto& token : line.tokens) {
      mesh.index_table.push_back(UbcTokenizer::parse_int(token, filename, line.number, "cell index"));
    }
    ++rows;
  }

  if (rows != mesh.n_cells) {
    UBCIO_THROW(FormatError, "UbcOcTreeReader: file '" + filename + "' declares " +
                             std::to_string(mesh.n_cells) + " cells but the index table has " +
                             std::to_string(rows) + " rows");
  }

  ubcTrace() << "[ubcio] OcTree mesh '" << filename << "': core " << mesh.header.cell_counts[0]
             << "^3, " << mesh.n_cells << " cells" << std::endl;
  return mesh;
}

MeshHeader UbcOcTreeReader::parse_header(const ContentLine& line, const std::string& filename) {
  if (line.tokens.size() < 3) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                             ": header must hold three core cell counts, found " +
                             std::to_string(line.tokens.size()) + " value(s)");
  }

  MeshHeader header;
  for (int a = 0; a < 3; ++a) {
    header.cell_counts[a] = UbcTokenizer::parse_int(line.tokens[a], filename, line.number,
                                                    "core cell count of axis " + std::to_string(a));
    if (header.cell_counts[a] <= 0) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                               ": core cell count of axis " + std::to_string(a) + " must be positive");
    }
  }
  for (std::size_t t = 3; t < line.tokens.size(); ++t) {
    header.padding.push_back(UbcTokenizer::parse_int(line.tokens[t], filename, line.number, "padding"));
  }

  const auto& n = header.cell_counts;
  if (n[0] != n[1] || n[1] != n[2]) {
    UBCIO_THROW(UnsupportedGeometryError,
                "OcTree meshes must have the same number of cells in all directions (" +
                UbcTokenizer::location(filename, line.number) + " declares " +
                std::to_string(n[0]) + " x " + std::to_string(n[1]) + " x " + std::to_string(n[2]) + ")");
  }

  return header;
}

} // namespace ubcio
