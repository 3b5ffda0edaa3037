/// \file cli_options.h
/// \brief Command-line options shared by the extraction front ends.

#pragma once

#include "chessscribe/config.h"
#include "chessscribe/error.h"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ChessScribe::cli {

struct CommonOptions {
    std::string config_path;
    std::string preset;
    std::string pdf_path;
    std::string out_dir;

    bool pages_set  = false;
    int page_start  = 0;
    int page_end    = 0;

    bool max_diagrams_set = false;
    int max_diagrams      = 0;

    std::string structure;

    bool api_set = false;
    bool api     = false;

    std::string log_level = "info";
    std::string log_file;
};

inline void PrintCommonUsage() {
    std::printf(
        "  --config PATH       JSON configuration file\n"
        "  --preset NAME       woodpecker|combinational_motifs (when no --config)\n"
        "  --pdf PATH          Input PDF (overrides pdf_path)\n"
        "  --out DIR           Output directory (default: data_output)\n"
        "  --pages A-B         1-based inclusive page range (A- or -B leave one side open)\n"
        "  --max-diagrams N    Stop after N diagrams (0 = unlimited)\n"
        "  --structure NAME    header_image_solution|image_header_solution|\n"
        "                      header_solution_image|flexible\n"
        "  --api 0|1           Call the position-recognition service\n"
        "  --log-level LEVEL   Log level: trace/debug/info/warn/error/off (default: info)\n"
        "  --log-file PATH     Also write a debug-level run log to PATH\n");
}

inline bool ParseInt(const char* s, int& out) {
    if (!s) { return false; }
    try {
        size_t idx = 0;
        int value  = std::stoi(s, &idx, 10);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::logic_error&) { return false; }
}

inline bool ParseBool(const char* s, bool& out) {
    if (!s) { return false; }
    std::string v(s);
    if (v == "1" || v == "true" || v == "TRUE" || v == "True") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "False") {
        out = false;
        return true;
    }
    return false;
}

/// "A-B", "A-", "-B" or "A".
inline bool ParsePageRange(const std::string& s, int& first, int& last) {
    const size_t dash = s.find('-');
    if (dash == std::string::npos) {
        if (!ParseInt(s.c_str(), first) || first < 1) { return false; }
        last = first;
        return true;
    }
    const std::string a = s.substr(0, dash);
    const std::string b = s.substr(dash + 1);
    first = 0;
    last  = 0;
    if (!a.empty() && (!ParseInt(a.c_str(), first) || first < 1)) { return false; }
    if (!b.empty() && (!ParseInt(b.c_str(), last) || last < 1)) { return false; }
    return !(a.empty() && b.empty());
}

/// Consumes argv[i] (and its value) when it is a shared option.
/// \return 1 consumed, 0 not a shared option, -1 invalid value
inline int ParseCommonArg(int argc, char** argv, int& i, CommonOptions& opt) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) { return 0; }

    if (arg == "--config") {
        opt.config_path = argv[++i];
        return 1;
    }
    if (arg == "--preset") {
        opt.preset = argv[++i];
        return 1;
    }
    if (arg == "--pdf") {
        opt.pdf_path = argv[++i];
        return 1;
    }
    if (arg == "--out") {
        opt.out_dir = argv[++i];
        return 1;
    }
    if (arg == "--pages") {
        if (!ParsePageRange(argv[++i], opt.page_start, opt.page_end)) {
            std::fprintf(stderr, "Invalid --pages value\n");
            return -1;
        }
        opt.pages_set = true;
        return 1;
    }
    if (arg == "--max-diagrams") {
        if (!ParseInt(argv[++i], opt.max_diagrams) || opt.max_diagrams < 0) {
            std::fprintf(stderr, "Invalid --max-diagrams value\n");
            return -1;
        }
        opt.max_diagrams_set = true;
        return 1;
    }
    if (arg == "--structure") {
        opt.structure = argv[++i];
        return 1;
    }
    if (arg == "--api") {
        if (!ParseBool(argv[++i], opt.api)) {
            std::fprintf(stderr, "Invalid --api value\n");
            return -1;
        }
        opt.api_set = true;
        return 1;
    }
    if (arg == "--log-level") {
        opt.log_level = argv[++i];
        return 1;
    }
    if (arg == "--log-file") {
        opt.log_file = argv[++i];
        return 1;
    }
    return 0;
}

/// Loads the file (or preset), applies command-line overrides and validates.
/// Throws ConfigError / FormatError / IOError.
inline ExtractorConfig LoadConfig(const CommonOptions& opt, const std::string& default_preset) {
    ExtractorConfig cfg = opt.config_path.empty()
                              ? ExtractorConfig::ForPreset(opt.preset.empty() ? default_preset : opt.preset)
                              : ExtractorConfig::LoadFromJson(opt.config_path);

    if (!opt.pdf_path.empty()) { cfg.pdf_path = opt.pdf_path; }
    if (!opt.out_dir.empty()) { cfg.output.dir = opt.out_dir; }
    if (opt.pages_set) {
        cfg.page_start = opt.page_start;
        cfg.page_end   = opt.page_end;
    }
    if (opt.max_diagrams_set) { cfg.max_diagrams = opt.max_diagrams; }
    if (!opt.structure.empty()) { cfg.structure = FromDiagramStructureString(opt.structure); }
    if (opt.api_set) { cfg.recognition.enabled = opt.api; }

    cfg.Validate();
    if (cfg.pdf_path.empty()) { throw ConfigError("No input PDF (use --pdf or pdf_path)"); }
    return cfg;
}

/// <out_dir>/<pdf stem><suffix>
inline std::string OutputPath(const ExtractorConfig& cfg, const std::string& suffix) {
    std::string stem = std::filesystem::path(cfg.pdf_path).stem().string();
    if (stem.empty()) { stem = "output"; }
    for (char& c : stem) {
        if (c == ' ') { c = '_'; }
    }
    return (std::filesystem::path(cfg.output.dir) / (stem + suffix)).string();
}

} // namespace ChessScribe::cli
