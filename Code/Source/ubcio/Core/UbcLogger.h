// SPDX-FileCopyrightText: Copyright (c) Stanford University, The Regents of the University of California, and others.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef UBCIO_LOGGER_H
#define UBCIO_LOGGER_H

#include <fstream>
#include <sstream>
#include <string>

namespace ubcio {

/// @brief Line-oriented progress log of a conversion job.
///
/// Until initialize() is called every message is dropped, so a job
/// without a Log_file runs the same code path silently.
//
class UbcLogger {

  public:
    UbcLogger() = default;

    UbcLogger(const std::string& file_name, bool echo = false)
    {
      initialize(file_name, echo);
    }

    /// @brief Open (truncate) the log file.
    /// @throws FileError if the file cannot be opened for writing
    void initialize(const std::string& file_name, bool echo = false);

    bool is_initialized() const { return log_file_.is_open(); }

    const std::string& file_name() const { return file_name_; }

    /// @brief Write the arguments separated by single spaces as one line
    template<typename... Args>
    void log_message(const Args&... args)
    {
      if (!is_initialized()) {
        return;
      }
      std::ostringstream line;
      bool first = true;
      ((line << (first ? "" : " ") << args, first = false), ...);
      write_line(line.str());
    }

  private:
    void write_line(const std::string& line);

    bool echo_ = false;
    std::string file_name_;
    std::ofstream log_file_;
};

} // namespace ubcio

#endif // UBCIO_LOGGER_H
