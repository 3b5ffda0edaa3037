#include "cli_options.h"

#include "chessscribe/document.h"
#include "chessscribe/logging.h"
#include "chessscribe/ocr.h"
#include "chessscribe/pipeline.h"
#include "chessscribe/record_io.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace ChessScribe;

namespace {

struct Options {
    cli::CommonOptions common;
    int rows                = 0;
    int cols                = 0;
    int first_numbered_page = -1;
    bool ocr                = true;
    bool previews_set       = false;
    bool previews           = false;
};

void PrintUsage(const char* exe) {
    std::printf("Usage: %s --pdf book.pdf [--config config.json] [--out DIR]\n"
                "Analyzes grid-layout pages (bubbles, boards) section by section.\n"
                "Options:\n",
                exe);
    cli::PrintCommonUsage();
    std::printf("  --rows N            Grid rows (default 3)\n"
                "  --cols N            Grid columns (default 2)\n"
                "  --first-page N      Page holding diagrams 1..rows*cols (0 = number per page)\n"
                "  --ocr 0|1           Read bubble digits with Tesseract (default 1)\n"
                "  --previews 0|1      Save an annotated image of every page\n");
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const int consumed = cli::ParseCommonArg(argc, argv, i, opt.common);
        if (consumed < 0) { return false; }
        if (consumed > 0) { continue; }

        const std::string arg = argv[i];
        if (arg == "--rows" && i + 1 < argc) {
            if (!cli::ParseInt(argv[++i], opt.rows) || opt.rows < 1) {
                std::fprintf(stderr, "Invalid --rows value\n");
                return false;
            }
            continue;
        }
        if (arg == "--cols" && i + 1 < argc) {
            if (!cli::ParseInt(argv[++i], opt.cols) || opt.cols < 1) {
                std::fprintf(stderr, "Invalid --cols value\n");
                return false;
            }
            continue;
        }
        if (arg == "--first-page" && i + 1 < argc) {
            if (!cli::ParseInt(argv[++i], opt.first_numbered_page) || opt.first_numbered_page < 0) {
                std::fprintf(stderr, "Invalid --first-page value\n");
                return false;
            }
            continue;
        }
        if (arg == "--ocr" && i + 1 < argc) {
            if (!cli::ParseBool(argv[++i], opt.ocr)) {
                std::fprintf(stderr, "Invalid --ocr value\n");
                return false;
            }
            continue;
        }
        if (arg == "--previews" && i + 1 < argc) {
            if (!cli::ParseBool(argv[++i], opt.previews)) {
                std::fprintf(stderr, "Invalid --previews value\n");
                return false;
            }
            opt.previews_set = true;
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
        ExtractorConfig cfg = cli::LoadConfig(opt.common, "combinational_motifs");
        if (opt.rows > 0) { cfg.grid.rows = opt.rows; }
        if (opt.cols > 0) { cfg.grid.cols = opt.cols; }
        if (opt.first_numbered_page >= 0) { cfg.grid.first_numbered_page = opt.first_numbered_page; }
        if (opt.previews_set) { cfg.output.save_previews = opt.previews; }
        cfg.Validate();
        spdlog::debug("Effective configuration:\n{}", cfg.ToJsonString());

        std::filesystem::create_directories(cfg.output.dir);

        std::unique_ptr<TesseractDigitReader> tesseract;
        DigitReader reader;
        if (opt.ocr) {
            tesseract = std::make_unique<TesseractDigitReader>(cfg.ocr);
            reader    = tesseract->AsDigitReader();
        }

        std::unique_ptr<RecognitionClient> recognition;
        if (cfg.recognition.enabled) {
            recognition = std::make_unique<RecognitionClient>(cfg.recognition,
                                                              ChessvisionTransport(cfg.recognition));
        }

        MuPdfDocument document(cfg.pdf_path);

        // The CSV grows page by page so an interrupted run keeps what it had.
        std::unique_ptr<GridCsvWriter> csv;
        GridPageSink on_page;
        if (cfg.output.write_csv) {
            csv = std::make_unique<GridCsvWriter>(cli::OutputPath(cfg, "_sections.csv"),
                                                  cfg.output.pad_empty_bubbles);
            on_page = [&csv](int, const std::vector<GridSection>& sections) { csv->Append(sections); };
        }

        GridRunResult result = ExtractGridSections(document, cfg, reader, recognition.get(), on_page);

        if (cfg.output.write_json) {
            WriteGridSectionsJson(cli::OutputPath(cfg, "_sections.json"), result.sections);
        }
        if (csv) { spdlog::info("Wrote {} sections to {}", csv->rows_written(), csv->path()); }
        LogSummary(result.summary);
    } catch (const std::exception& e) {
        spdlog::error("Failed: {}", e.what());
        return 1;
    }

    return 0;
}
