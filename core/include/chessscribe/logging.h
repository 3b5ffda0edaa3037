/// \file logging.h
/// \brief Logging initialization and utilities.

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace ChessScribe {

/// Installs the "chessscribe" default logger: a colored console sink, plus a
/// plain file sink when \p log_file is set (the file keeps every level down
/// to debug so a run can be audited after the fact).
/// Call once at the start of main() before any logging.
/// \param level Console log level (default: info)
/// \param log_file Optional run log; parent directories are created. Throws IOError.
void InitLogging(spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& log_file     = "");

/// Parses a log level string to spdlog level enum.
/// \param str Log level string ("trace", "debug", "info", "warn", "error", "off")
/// \return Parsed log level, or spdlog::level::info if unrecognized
spdlog::level::level_enum ParseLogLevel(const std::string& str);

} // namespace ChessScribe
