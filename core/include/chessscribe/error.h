#pragma once

/// \file error.h
/// \brief Typed error hierarchy for ChessScribe.
///
/// Public functions throw subclasses of ChessScribe::Error instead of plain
/// std::runtime_error, so callers can tell a fatal configuration problem from
/// a per-item failure that the pipeline converts into an absent field.

#include "export.h"

#include <stdexcept>
#include <string>

namespace ChessScribe {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,     ///< Caller supplied invalid arguments or data.
    IOError,          ///< File, document or stream I/O failure.
    FormatError,      ///< Data format / parsing error (JSON, response body, ...).
    ConfigError,      ///< Invalid configuration; fatal at startup.
    RecognitionError, ///< External position-recognition call failed.
    InternalError,    ///< Logic error inside the library.
};

/// Base exception for all ChessScribe errors.
class CHESSSCRIBE_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// File / document / stream I/O failure.
class CHESSSCRIBE_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Invalid input arguments or data.
class CHESSSCRIBE_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// Data format / parsing failure.
class CHESSSCRIBE_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Unusable configuration (bad pattern, out-of-range grid, ...).
class CHESSSCRIBE_API ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error(ErrorCode::ConfigError, msg) {}
};

/// Position-recognition call failed (timeout, transport, malformed response).
class CHESSSCRIBE_API RecognitionError : public Error {
public:
    explicit RecognitionError(const std::string& msg)
        : Error(ErrorCode::RecognitionError, msg) {}
};

} // namespace ChessScribe
