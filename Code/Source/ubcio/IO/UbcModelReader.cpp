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

#include "UbcModelReader.h"
#include "UbcTokenizer.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include <fstream>

namespace ubcio {

ModelArray UbcModelReader::read_2d(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcModelReader: Cannot open file: " + filename);
  }
  return read_2d(file, filename);
}

ModelArray UbcModelReader::read_2d(std::istream& in, const std::string& filename) {
  const auto lines = UbcTokenizer::read_content_lines(in);
  const std::string improper = "Model file '" + filename + "' improperly formatted";

  if (lines.size() < 2) {
    UBCIO_THROW(FormatError, improper + ": expected a 'dim0 dim1' header followed by values");
  }

  const ContentLine& header = lines[0];
  if (header.tokens.size() != 2) {
    UBCIO_THROW(FormatError, improper + ": " + UbcTokenizer::location(filename, header.number) +
                             " must hold two dimensions, found " + std::to_string(header.tokens.size()));
  }
  const index_t dim0 = UbcTokenizer::parse_int(header.tokens[0], filename, header.number, "model dimension 0");
  const index_t dim1 = UbcTokenizer::parse_int(header.tokens[1], filename, header.number, "model dimension 1");

  const std::size_t n_rows = lines.size() - 1;
  const std::size_t n_cols = lines[1].tokens.size();

  std::vector<real_t> table;
  table.reserve(n_rows * n_cols);
  for (std::size_t r = 0; r < n_rows; ++r) {
    const ContentLine& line = lines[r + 1];
    if (line.tokens.size() != n_cols) {
      UBCIO_THROW(FormatError, improper + ": " + UbcTokenizer::location(filename, line.number) +
                               " has " + std::to_string(line.tokens.size()) + " values, the first row has " +
                               std::to_string(n_cols));
    }
    for (const auto& token : line.tokens) {
      table.push_back(UbcTokenizer::parse_real(token, filename, line.number, "model value"));
    }
  }

  // Either dimension matching the table shape is accepted
  if (static_cast<index_t>(n_rows) != dim1 && static_cast<index_t>(n_cols) != dim0) {
    UBCIO_THROW(FormatError, improper + ": header declares " + std::to_string(dim0) + " x " +
                             std::to_string(dim1) + " but the table is " + std::to_string(n_rows) +
                             " rows of " + std::to_string(n_cols) + " values");
  }

  // Column-major flatten: row index varies fastest
  ModelArray model(table.size());
  std::size_t k = 0;
  for (std::size_t c = 0; c < n_cols; ++c) {
    for (std::size_t r = 0; r < n_rows; ++r) {
      model[k++] = table[r * n_cols + c];
    }
  }

  ubcTrace() << "[ubcio] 2D model '" << filename << "': " << model.size() << " values" << std::endl;
  return model;
}

ModelArray UbcModelReader::read_3d(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "UbcModelReader: Cannot open file: " + filename);
  }
  return read_3d(file, filename);
}

ModelArray UbcModelReader::read_3d(std::istream& in, const std::string& filename) {
  ModelArray model;
  int line_number = 0;
  ContentLine line;

  while (UbcTokenizer::next_content_line(in, line_number, line)) {
    for (const auto& token : line.tokens) {
      model.push_back(UbcTokenizer::parse_real(token, filename, line.number, "model value"));
    }
  }

  if (model.empty()) {
    UBCIO_THROW(FormatError, "Model file '" + filename + "' improperly formatted: no values");
  }

  ubcTrace() << "[ubcio] 3D model '" << filename << "': " << model.size() << " values" << std::endl;
  return model;
}

} // namespace ubcio
