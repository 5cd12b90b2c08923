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

#ifndef UBCIO_RUN_LENGTH_SPACING_H
#define UBCIO_RUN_LENGTH_SPACING_H

#include "../Core/UbcTypes.h"
#include <string>
#include <vector>

namespace ubcio {

/**
 * @brief Decoder for the compressed cell-width notation of UBC 3D meshes
 *
 * A spacing line is a list of widths where any entry may be written as
 * "<count>*<width>", meaning count consecutive cells of the same width:
 *
 *   3*2.0 4.0   ->   2.0 2.0 2.0 4.0
 *
 * Runs are expanded in place, so the order of the line is preserved.
 */
class RunLengthSpacing {
public:
  /**
   * @brief Expand the tokens of one spacing line
   * @param tokens Tokens of the line, comment already stripped
   * @param expected_cells Cell count declared for this axis
   * @param axis Axis index (0, 1, 2) used in error messages
   * @param filename Source file used in error messages
   * @param line Source line used in error messages
   * @return Exactly expected_cells widths, all non-zero and of one sign
   * @throws FormatError on a malformed token, if the expanded length
   *         differs from expected_cells, or if a width is zero, not finite
   *         or of the opposite sign to the first width
   */
  static AxisSpacing decode(const std::vector<std::string>& tokens,
                            index_t expected_cells,
                            int axis,
                            const std::string& filename = "",
                            int line = 0);

  /**
   * @brief Expand without checking the resulting length or the widths
   * @param max_widths Upper bound on the expanded length, negative for none
   * @throws FormatError as soon as a token would exceed max_widths
   */
  static AxisSpacing expand(const std::vector<std::string>& tokens,
                            const std::string& filename = "",
                            int line = 0,
                            size_type max_widths = -1);

  /**
   * @brief True if the token uses the count*width form
   */
  static bool is_run(const std::string& token);
};

} // namespace ubcio

#endif // UBCIO_RUN_LENGTH_SPACING_H
