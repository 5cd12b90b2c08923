#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <streambuf>
#include <string>

namespace ubcio {

namespace detail {

inline std::string trim_copy(std::string s)
{
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

inline std::string lower_copy(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool parse_bool_relaxed(const std::string& raw)
{
  const auto v = lower_copy(trim_copy(raw));
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    return true;
  }
  return false;
}

class NullBuffer final : public std::streambuf {
public:
  int overflow(int ch) override { return traits_type::not_eof(ch); }
};

inline std::ostream& null_stream()
{
  static NullBuffer buf;
  static std::ostream os(&buf);
  return os;
}

} // namespace detail

/// Reader diagnostics are printed only when UBCIO_TRACE is set to a true value.
inline bool ubcTraceEnabled()
{
  if (const char* env = std::getenv("UBCIO_TRACE")) {
    return detail::parse_bool_relaxed(env);
  }
  return false;
}

inline std::ostream& ubcTrace()
{
  return ubcTraceEnabled() ? std::cout : detail::null_stream();
}

} // namespace ubcio
