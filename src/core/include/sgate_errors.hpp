#ifndef SGATE_ERRORS_HPP
#define SGATE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace sgate {

enum class ErrorCode {
    VALIDATION,
    PARSE,
    CONFLICT,
    FATAL_CONFIG,
    IO
};

const char* error_code_to_string(ErrorCode code) noexcept;

/// CLI exit status for an error: 1 for bad input, 2 for everything else.
int exit_code_for(ErrorCode code) noexcept;

/**
 * @brief Base of all engine errors
 */
class GateError : public std::runtime_error {
public:
    GateError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Bad input. Raised before any state is touched.
class ValidationError : public GateError {
public:
    explicit ValidationError(const std::string& what)
        : GateError(ErrorCode::VALIDATION, what) {}

protected:
    ValidationError(ErrorCode code, const std::string& what)
        : GateError(code, what) {}
};

/// Malformed line in an input file.
class ParseError : public ValidationError {
public:
    ParseError(const std::string& file, size_t line, const std::string& detail)
        : ValidationError(ErrorCode::PARSE,
                          file + ":" + std::to_string(line) + ": " + detail)
        , file_(file), line_(line) {}

    const std::string& file() const noexcept { return file_; }
    size_t line() const noexcept { return line_; }

private:
    std::string file_;
    size_t line_;
};

/// SID collision or concurrent writer.
class ConflictError : public GateError {
public:
    explicit ConflictError(const std::string& what)
        : GateError(ErrorCode::CONFLICT, what) {}
};

/// The mutation would leave the system in a broken state; prior state kept.
class FatalConfigError : public GateError {
public:
    explicit FatalConfigError(const std::string& what)
        : GateError(ErrorCode::FATAL_CONFIG, what) {}
};

/// Filesystem failure. Message includes strerror(errno).
class IOError : public GateError {
public:
    IOError(const std::string& what, int err);
    explicit IOError(const std::string& what)
        : GateError(ErrorCode::IO, what), errno_(0) {}

    int error_number() const noexcept { return errno_; }

private:
    int errno_;
};

} // namespace sgate

#endif // SGATE_ERRORS_HPP
