#include "cli_options.h"

#include "chessscribe/document.h"
#include "chessscribe/logging.h"
#include "chessscribe/pipeline.h"
#include "chessscribe/record_io.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

using namespace ChessScribe;

namespace {

struct Options {
    cli::CommonOptions common;
    bool inspect = false;
};

void PrintUsage(const char* exe) {
    std::printf("Usage: %s --pdf book.pdf [--config config.json] [--out DIR]\n"
                "Extracts header/diagram/solution triples from a linear chess book.\n"
                "Options:\n",
                exe);
    cli::PrintCommonUsage();
    std::printf("  --inspect           Log every block with its pattern verdicts and role\n");
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const int consumed = cli::ParseCommonArg(argc, argv, i, opt.common);
        if (consumed < 0) { return false; }
        if (consumed > 0) { continue; }

        const std::string arg = argv[i];
        if (arg == "--inspect") {
            opt.inspect = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        }
        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    if (!ParseArgs(argc, argv, opt)) { return 1; }

    try {
        InitLogging(ParseLogLevel(opt.common.log_level), opt.common.log_file);
        ExtractorConfig cfg = cli::LoadConfig(opt.common, "woodpecker");
        if (opt.inspect) { cfg.inspect_blocks = true; }
        spdlog::debug("Effective configuration:\n{}", cfg.ToJsonString());

        std::filesystem::create_directories(cfg.output.dir);

        std::unique_ptr<RecognitionClient> recognition;
        if (cfg.recognition.enabled) {
            recognition = std::make_unique<RecognitionClient>(cfg.recognition,
                                                              ChessvisionTransport(cfg.recognition));
        }

        MuPdfDocument document(cfg.pdf_path);
        DiagramRunResult result = ExtractDiagrams(document, cfg, recognition.get());

        if (cfg.output.write_json) {
            WriteDiagramsJson(cli::OutputPath(cfg, "_diagrams.json"), result.diagrams);
        }
        if (cfg.output.write_csv) {
            WriteDiagramsCsv(cli::OutputPath(cfg, "_diagrams.csv"), result.diagrams);
        }
        LogSummary(result.summary);
    } catch (const std::exception& e) {
        spdlog::error("Failed: {}", e.what());
        return 1;
    }

    return 0;
}
