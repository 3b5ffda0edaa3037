#include "chessscribe/logging.h"
#include "chessscribe/error.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ChessScribe {

namespace {

constexpr const char* kLoggerName    = "chessscribe";
constexpr const char* kConsoleFormat = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFileFormat    = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

} // namespace

void InitLogging(spdlog::level::level_enum level, const std::string& log_file) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(level);
    console->set_pattern(kConsoleFormat);
    std::vector<spdlog::sink_ptr> sinks{console};

    // The file sink records debug detail regardless of the console level.
    spdlog::level::level_enum logger_level = level;
    if (!log_file.empty()) {
        const std::filesystem::path path(log_file);
        std::error_code ec;
        if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path(), ec); }
        if (ec) { throw IOError("Cannot create log directory for " + log_file + ": " + ec.message()); }

        std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
        try {
            file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError("Cannot open log file " + log_file + ": " + e.what());
        }
        const auto file_level = std::min(level, spdlog::level::debug);
        file->set_level(file_level);
        file->set_pattern(kFileFormat);
        sinks.push_back(file);
        logger_level = file_level;
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(logger_level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum ParseLogLevel(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "trace") { return spdlog::level::trace; }
    if (s == "debug") { return spdlog::level::debug; }
    if (s == "info") { return spdlog::level::info; }
    if (s == "warn" || s == "warning") { return spdlog::level::warn; }
    if (s == "error" || s == "err") { return spdlog::level::err; }
    if (s == "critical") { return spdlog::level::critical; }
    if (s == "off") { return spdlog::level::off; }
    return spdlog::level::info;
}

} // namespace ChessScribe
