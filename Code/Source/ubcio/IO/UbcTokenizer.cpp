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

#include "UbcTokenizer.h"
#include "../Core/UbcException.h"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ubcio {

std::string UbcTokenizer::strip_comment(const std::string& line) {
  size_t pos = line.find('!');
  if (pos == std::string::npos) {
    return line;
  }
  return line.substr(0, pos);
}

std::vector<std::string> UbcTokenizer::split(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream iss(text);
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

bool UbcTokenizer::next_content_line(std::istream& in, int& line_number, ContentLine& out) {
  std::string line;
  while (std::getline(in, line)) {
    ++line_number;
    auto tokens = split(strip_comment(line));
    if (tokens.empty()) {
      continue;
    }
    out.number = line_number;
    out.tokens = std::move(tokens);
    return true;
  }
  return false;
}

std::vector<ContentLine> UbcTokenizer::read_content_lines(std::istream& in) {
  std::vector<ContentLine> lines;
  int line_number = 0;
  ContentLine line;
  while (next_content_line(in, line_number, line)) {
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<ContentLine> UbcTokenizer::read_content_lines(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    UBCIO_THROW(FileError, "Cannot open file: " + filename);
  }
  return read_content_lines(file);
}

std::string UbcTokenizer::location(const std::string& filename, int line) {
  std::ostringstream oss;
  oss << "file '" << filename << "' line " << line;
  return oss.str();
}

index_t UbcTokenizer::parse_int(const std::string& token, const std::string& filename,
                                int line, const std::string& what) {
  index_t value = 0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  if (!token.empty() && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || first == last) {
    UBCIO_THROW(FormatError, location(filename, line) + ": expected an integer for " + what +
                             ", found '" + token + "'");
  }
  return value;
}

size_type UbcTokenizer::parse_size(const std::string& token, const std::string& filename,
                                   int line, const std::string& what) {
  size_type value = 0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  if (!token.empty() && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || first == last) {
    UBCIO_THROW(FormatError, location(filename, line) + ": expected an integer for " + what +
                             ", found '" + token + "'");
  }
  return value;
}

real_t UbcTokenizer::parse_real(const std::string& token, const std::string& filename,
                                int line, const std::string& what) {
  if (token.empty()) {
    UBCIO_THROW(FormatError, location(filename, line) + ": empty token for " + what);
  }
  errno = 0;
  char* end = nullptr;
  const real_t value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size() || (errno == ERANGE && std::abs(value) == HUGE_VAL)) {
    UBCIO_THROW(FormatError, location(filename, line) + ": expected a number for " + what +
                             ", found '" + token + "'");
  }
  return value;
}

std::vector<real_t> UbcTokenizer::parse_reals(const ContentLine& line, std::size_t n,
                                              const std::string& filename, const std::string& what) {
  if (line.tokens.size() < n) {
    UBCIO_THROW(FormatError, location(filename, line.number) + ": expected " + std::to_string(n) +
                             " values for " + what + ", found " + std::to_string(line.tokens.size()));
  }
  std::vector<real_t> values(n);
  for (std::size_t i = 0; i < n; ++i) {
    values[i] = parse_real(line.tokens[i], filename, line.number, what);
  }
  return values;
}

} // namespace ubcio
