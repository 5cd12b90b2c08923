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

#ifndef UBCIO_EXCEPTION_H
#define UBCIO_EXCEPTION_H

/**
 * @file UbcException.h
 * @brief Exception hierarchy for the UBC mesh/model readers
 *
 * Every reader failure is raised at the point of detection as one of the
 * types below. Messages name the input file, the line or axis involved and
 * the expectation that was violated.
 */

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>

#if defined(__GNUC__) || defined(__clang__)
    #define UBCIO_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define UBCIO_UNLIKELY(x) (x)
#endif

namespace ubcio {

enum class UbcStatus : std::uint8_t {
    Success             = 0,
    FormatError         = 1,
    UnsupportedGeometry = 2,
    SizeMismatch        = 3,
    NotImplemented      = 4,
    IOError             = 5,
    RegistryError       = 6,
    ConfigError         = 7,
    Unknown             = 255
};

inline const char* status_to_string(UbcStatus status) noexcept {
    switch(status) {
        case UbcStatus::Success:             return "Success";
        case UbcStatus::FormatError:         return "Format error";
        case UbcStatus::UnsupportedGeometry: return "Unsupported geometry";
        case UbcStatus::SizeMismatch:        return "Size mismatch";
        case UbcStatus::NotImplemented:      return "Not implemented";
        case UbcStatus::IOError:             return "I/O error";
        case UbcStatus::RegistryError:       return "Registry error";
        case UbcStatus::ConfigError:         return "Configuration error";
        default:                             return "Unknown error";
    }
}

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all reader exceptions
 *
 * Carries the message, a status code and the source location of the throw.
 */
class UbcException : public std::exception {
public:
    UbcException(const std::string& message,
                 UbcStatus status = UbcStatus::Unknown)
        : message_(message),
          status_(status),
          file_(""),
          line_(0),
          function_("") {
        build_what();
    }

    UbcException(const std::string& message,
                 const char* file,
                 int line,
                 const char* function = "",
                 UbcStatus status = UbcStatus::Unknown)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function) {
        build_what();
    }

    UbcException(const UbcException&) = default;

    virtual ~UbcException() noexcept = default;

    virtual const char* what() const noexcept override {
        return what_.c_str();
    }

    /**
     * @brief Message without the status and location decoration
     */
    const std::string& message() const noexcept {
        return message_;
    }

    UbcStatus status() const noexcept {
        return status_;
    }

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    const std::string& function() const noexcept {
        return function_;
    }

    /**
     * @brief Prefix the message with the calling context
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    UbcStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    std::string what_;

    void build_what() {
        std::ostringstream oss;
        oss << "[UBC IO] " << status_to_string(status_) << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";
        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

/**
 * @brief Header or body of an input file does not have the expected shape
 */
class FormatError : public UbcException {
public:
    FormatError(const std::string& message,
                const char* file = "",
                int line = 0,
                const char* function = "")
        : UbcException(message, file, line, function, UbcStatus::FormatError) {}

protected:
    FormatError(const std::string& message,
                const char* file,
                int line,
                const char* function,
                UbcStatus status)
        : UbcException(message, file, line, function, status) {}
};

/**
 * @brief Geometry the readers cannot represent (OcTree with a non-cubic core)
 */
class UnsupportedGeometryError : public FormatError {
public:
    UnsupportedGeometryError(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : FormatError(message, file, line, function, UbcStatus::UnsupportedGeometry) {}
};

/**
 * @brief Model value count does not match the mesh cell count
 */
class SizeMismatchError : public UbcException {
public:
    enum class Kind { Surplus, Deficit };

    SizeMismatchError(const std::string& message,
                      Kind kind,
                      long long expected,
                      long long actual,
                      const char* file = "",
                      int line = 0,
                      const char* function = "")
        : UbcException(build_message(message, expected, actual), file, line, function,
                       UbcStatus::SizeMismatch),
          kind_(kind),
          expected_(expected),
          actual_(actual) {}

    Kind kind() const noexcept { return kind_; }
    long long expected() const noexcept { return expected_; }
    long long actual() const noexcept { return actual_; }

private:
    Kind kind_;
    long long expected_;
    long long actual_;

    static std::string build_message(const std::string& msg, long long expected, long long actual) {
        return msg + " (mesh cells: " + std::to_string(expected) +
               ", model values: " + std::to_string(actual) + ")";
    }
};

class NotImplementedError : public UbcException {
public:
    NotImplementedError(const std::string& feature,
                        const char* file = "",
                        int line = 0,
                        const char* function = "")
        : UbcException("Feature not implemented: " + feature, file, line, function,
                       UbcStatus::NotImplemented) {}
};

/**
 * @brief Input file cannot be opened or read
 */
class FileError : public UbcException {
public:
    FileError(const std::string& message,
              const char* file = "",
              int line = 0,
              const char* function = "")
        : UbcException(message, file, line, function, UbcStatus::IOError) {}
};

class RegistryError : public UbcException {
public:
    RegistryError(const std::string& message,
                  const char* file = "",
                  int line = 0,
                  const char* function = "")
        : UbcException(message, file, line, function, UbcStatus::RegistryError) {}
};

class ConfigError : public UbcException {
public:
    ConfigError(const std::string& message,
                const char* file = "",
                int line = 0,
                const char* function = "")
        : UbcException(message, file, line, function, UbcStatus::ConfigError) {}
};

} // namespace ubcio

// ============================================================================
// Exception Macros
// ============================================================================

#define UBCIO_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define UBCIO_THROW_IF(condition, ExceptionType, message) \
    do { \
        if (UBCIO_UNLIKELY(condition)) { \
            UBCIO_THROW(ExceptionType, message); \
        } \
    } while(0)

#define UBCIO_NOT_IMPLEMENTED(feature) \
    UBCIO_THROW(::ubcio::NotImplementedError, feature)

#endif // UBCIO_EXCEPTION_H
