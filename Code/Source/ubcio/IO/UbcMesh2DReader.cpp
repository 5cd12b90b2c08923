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

#include "UbcMesh2DReader.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <fstream>
#include <numeric>

namespace ubcio {

RectilinearMesh UbcMesh2DReader::read(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcMesh2DReader: Cannot open file: " + filename);
  }
  return read(file, filename);
}

RectilinearMesh UbcMesh2DReader::read(std::istream& in, const std::string& filename) {
  const auto lines = UbcTokenizer::read_content_lines(in);

  std::size_t pos = 0;
  AxisBlock xblock = parse_axis_block(lines, pos, filename, "X");
  AxisBlock zblock = parse_axis_block(lines, pos, filename, "Z");

  if (pos != lines.size()) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, lines[pos].number) +
                             ": unexpected content after the Z block");
  }

  RectilinearMesh mesh;
  mesh.filename = filename;
  mesh.format = UbcFormat::Mesh2D;
  mesh.axes[0] = build_coordinates(xblock.points, xblock.subdivisions);
  mesh.axes[1] = CoordinateAxis{0.0};
  mesh.axes[2] = build_coordinates(zblock.points, zblock.subdivisions);
  mesh.origin = {{xblock.points.front(), 0.0, zblock.points.front()}};

  for (int a = 0; a < 3; ++a) {
    mesh.node_dims[a] = static_cast<index_t>(mesh.axes[a].size());
  }
  mesh.cell_counts = {{mesh.node_dims[0] - 1, 1, mesh.node_dims[2] - 1}};

  ubcTrace() << "[ubcio] 2D mesh '" << filename << "': " << mesh.cell_counts[0]
             << " x " << mesh.cell_counts[2] << " cells" << std::endl;
  return mesh;
}

UbcMesh2DReader::AxisBlock UbcMesh2DReader::parse_axis_block(const std::vector<ContentLine>& lines,
                                                             std::size_t& pos,
                                                             const std::string& filename,
                                                             const std::string& axis_name) {
  if (pos >= lines.size()) {
    UBCIO_THROW(FormatError, "UbcMesh2DReader: file '" + filename + "' ends before the " +
                             axis_name + " segment count");
  }

  const ContentLine& count_line = lines[pos];
  if (count_line.tokens.size() != 1) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, count_line.number) +
                             ": expected a single " + axis_name + " segment count, found " +
                             std::to_string(count_line.tokens.size()) + " values");
  }
  const index_t n = UbcTokenizer::parse_int(count_line.tokens[0], filename, count_line.number,
                                            axis_name + " segment count");
  if (n <= 0) {
    UBCIO_THROW(FormatError, UbcTokenizer::location(filename, count_line.number) +
                             ": " + axis_name + " segment count must be positive");
  }
  ++pos;

  if (lines.size() - pos < static_cast<std::size_t>(n)) {
    UBCIO_THROW(FormatError, "UbcMesh2DReader: file '" + filename + "' declares " +
                             std::to_string(n) + " " + axis_name + " segments but only " +
                             std::to_string(lines.size() - pos) + " lines follow");
  }

  AxisBlock block;
  block.points.reserve(n + 1);
  block.subdivisions.reserve(n);

  for (index_t i = 0; i < n; ++i, ++pos) {
    const ContentLine& line = lines[pos];
    // The first line also carries the origin of the axis
    const std::size_t expected = (i == 0) ? 3 : 2;
    if (line.tokens.size() != expected) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                               ": expected " + std::to_string(expected) + " values in " +
                               axis_name + " segment " + std::to_string(i + 1) + ", found " +
                               std::to_string(line.tokens.size()));
    }

    std::size_t t = 0;
    if (i == 0) {
      block.points.push_back(UbcTokenizer::parse_real(line.tokens[t++], filename, line.number,
                                                      axis_name + " origin"));
    }
    const real_t point = UbcTokenizer::parse_real(line.tokens[t++], filename, line.number,
                                                  axis_name + " control point");
    const index_t cells = UbcTokenizer::parse_int(line.tokens[t], filename, line.number,
                                                  axis_name + " cells per segment");
    if (cells <= 0) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                               ": " + axis_name + " cells per segment must be positive");
    }
    if (!(point > block.points.back())) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line.number) +
                               ": " + axis_name + " control points must be strictly increasing");
    }

    block.points.push_back(point);
    block.subdivisions.push_back(cells);
  }

  return block;
}

CoordinateAxis UbcMesh2DReader::build_coordinates(const std::vector<real_t>& points,
                                                  const std::vector<index_t>& subdivisions) {
  const size_type total = std::accumulate(subdivisions.begin(), subdivisions.end(), size_type(0));

  CoordinateAxis coords;
  coords.reserve(static_cast<std::size_t>(total) + 1);
  coords.push_back(points.front());

  for (std::size_t s = 0; s < subdivisions.size(); ++s) {
    const real_t start = points[s];
    const real_t stop = points[s + 1];
    const index_t num = subdivisions[s];
    const real_t w = (stop - start) / num;

    for (index_t j = 1; j < num; ++j) {
      coords.push_back(start + j * w);
    }
    coords.push_back(stop);
  }

  return coords;
}

} // namespace ubcio
