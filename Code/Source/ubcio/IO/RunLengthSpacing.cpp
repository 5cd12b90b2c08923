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

#include "RunLengthSpacing.h"
#include "UbcTokenizer.h"
#include "../Core/UbcException.h"

#include <algorithm>
#include <cmath>

namespace ubcio {

bool RunLengthSpacing::is_run(const std::string& token) {
  return token.find('*') != std::string::npos;
}

AxisSpacing RunLengthSpacing::expand(const std::vector<std::string>& tokens,
                                     const std::string& filename,
                                     int line,
                                     size_type max_widths) {
  AxisSpacing widths;
  widths.reserve(tokens.size());

  auto check_room = [&](size_type adding, const std::string& token) {
    if (max_widths >= 0 && static_cast<size_type>(widths.size()) + adding > max_widths) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line) + ": token '" + token +
                               "' expands past the " + std::to_string(max_widths) +
                               " widths declared for the axis");
    }
  };

  for (const auto& token : tokens) {
    if (!is_run(token)) {
      check_room(1, token);
      widths.push_back(UbcTokenizer::parse_real(token, filename, line, "cell width"));
      continue;
    }

    const size_t star = token.find('*');
    if (token.find('*', star + 1) != std::string::npos) {
      UBCIO_THROW(FormatError, UbcTokenizer::location(filename, line) +
                               ": run-length token '" + token + "' has more than one '*'");
    }

    const index_t count = UbcTokenizer::parse_int(token.substr(0, star), filename, line,
                                                  "run-length count in '" + token + "'");
    UBCIO_THROW_IF(count <= 0, FormatError,
                   UbcTokenizer::location(filename, line) +
                   ": run-length count must be positive in '" + token + "'");
    const real_t width = UbcTokenizer::parse_real(token.substr(star + 1), filename, line,
                                                  "run-length width in '" + token + "'");

    check_room(count, token);
    widths.insert(widths.end(), static_cast<size_t>(count), width);
  }

  return widths;
}

AxisSpacing RunLengthSpacing::decode(const std::vector<std::string>& tokens,
                                     index_t expected_cells,
                                     int axis,
                                     const std::string& filename,
                                     int line) {
  const std::string where = UbcTokenizer::location(filename, line) +
                            ": spacing for axis " + std::to_string(axis);

  // Bounded by the header so a bad run count cannot allocate without limit
  const AxisSpacing widths = expand(tokens, filename, line, std::max<size_type>(expected_cells, 0));

  if (static_cast<size_type>(widths.size()) != expected_cells) {
    UBCIO_THROW(FormatError, where + " expands to " + std::to_string(widths.size()) +
                             " widths but the header declares " +
                             std::to_string(expected_cells) + " cells");
  }

  // Coordinates are running sums, so every width must push the same way
  for (std::size_t c = 0; c < widths.size(); ++c) {
    const real_t w = widths[c];
    if (!std::isfinite(w) || w == 0.0) {
      UBCIO_THROW(FormatError, where + ": width of cell " + std::to_string(c + 1) +
                               " must be finite and non-zero");
    }
    if ((w > 0.0) != (widths[0] > 0.0)) {
      UBCIO_THROW(FormatError, where + ": width of cell " + std::to_string(c + 1) +
                               " changes sign, the axis would not be monotonic");
    }
  }

  return widths;
}

} // namespace ubcio
