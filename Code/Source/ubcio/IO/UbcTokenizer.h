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

#ifndef UBCIO_TOKENIZER_H
#define UBCIO_TOKENIZER_H

#include "../Core/UbcTypes.h"
#include <istream>
#include <string>
#include <vector>

namespace ubcio {

/**
 * @brief One non-empty line of a UBC text file after comment stripping
 */
struct ContentLine {
  int number = 0;                    // 1-based line number in the file
  std::vector<std::string> tokens;   // whitespace-separated tokens
};

/**
 * @brief Line and token helpers shared by the UBC readers
 *
 * UBC files are line oriented. A '!' starts a comment that runs to the end
 * of the line. Lines that are empty after stripping the comment are skipped,
 * but the file line numbers are kept so that error messages point at
 * the right place in the file.
 *
 * All numeric conversions are strict: a token must be consumed completely
 * or a FormatError is raised.
 */
class UbcTokenizer {
public:
  /**
   * @brief Remove a trailing '!' comment
   */
  static std::string strip_comment(const std::string& line);

  /**
   * @brief Split on whitespace
   */
  static std::vector<std::string> split(const std::string& text);

  /**
   * @brief Read every content line of a file
   * @throws FileError if the file cannot be opened
   */
  static std::vector<ContentLine> read_content_lines(const std::string& filename);

  /**
   * @brief Read content lines from a stream
   */
  static std::vector<ContentLine> read_content_lines(std::istream& in);

  /**
   * @brief Advance the stream to the next content line
   * @param in Stream positioned anywhere
   * @param line_number Running 1-based line counter, updated in place
   * @param out Filled with the next content line
   * @return False if the stream ended first
   */
  static bool next_content_line(std::istream& in, int& line_number, ContentLine& out);

  /**
   * @brief Parse an integer token
   * @param what Short description of the field for the error message
   * @throws FormatError if the token is not an integer
   */
  static index_t parse_int(const std::string& token, const std::string& filename,
                           int line, const std::string& what);

  /**
   * @brief Parse a 64-bit integer token (cell totals)
   */
  static size_type parse_size(const std::string& token, const std::string& filename,
                              int line, const std::string& what);

  /**
   * @brief Parse a floating-point token
   * @throws FormatError if the token is not a number
   */
  static real_t parse_real(const std::string& token, const std::string& filename,
                           int line, const std::string& what);

  /**
   * @brief Parse the first n tokens of a line as reals
   * @throws FormatError if the line has fewer than n tokens
   */
  static std::vector<real_t> parse_reals(const ContentLine& line, std::size_t n,
                                         const std::string& filename, const std::string& what);

  /**
   * @brief "file 'name' line N" for error messages
   */
  static std::string location(const std::string& filename, int line);
};

} // namespace ubcio

#endif // UBCIO_TOKENIZER_H
