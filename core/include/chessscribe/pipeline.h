/// \file pipeline.h
/// \brief End-to-end extraction runs for linear and grid-layout books.

#pragma once

#include "assembler.h"
#include "block_stream.h"
#include "config.h"
#include "diagram.h"
#include "document.h"
#include "grid.h"
#include "ocr.h"
#include "pattern.h"
#include "recognition.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ChessScribe {

/// Skip and failure counts reported at the end of a run.
struct RunSummary {
    int pages        = 0;
    int pages_failed = 0;
    int blocks       = 0;

    int headers               = 0;
    int solutions             = 0;
    int images                = 0;
    int non_chessboard_images = 0;

    int diagrams          = 0;
    int partial_diagrams  = 0;
    int dropped_as_noise  = 0;
    int unresolved        = 0;
    int cross_page        = 0;
    int white_to_move     = 0;
    int black_to_move     = 0;
    int turn_disagreements = 0;

    int sections            = 0; ///< Grid runs only.
    int chessboard_sections = 0;
    int bubbles             = 0;

    int recognition_attempted = 0;
    int recognition_succeeded = 0;
    int recognition_failed    = 0;
    int images_saved          = 0;
    int image_save_failures   = 0;

    bool reached_max_diagrams = false;
};

/// Logs a summary at info level.
void LogSummary(const RunSummary& summary);

struct DiagramRunResult {
    std::vector<Diagram> diagrams;
    RunSummary summary;
};

struct GridRunResult {
    std::vector<GridSection> sections;
    RunSummary summary;
};

/// One block as seen by the role classifiers.
struct BlockInspection {
    int page         = 0;
    int index        = 0;
    int global_index = 0;
    BlockKind kind   = BlockKind::Text;
    cv::Rect2f bbox;
    std::string text;      ///< Single-line preview of a text block.
    cv::Size image_size;   ///< Image blocks only.
    bool header_match   = false;
    bool solution_match = false;
    std::optional<Role> role; ///< Header wins over Solution; images pass the chessboard check.
    double chessboard_confidence = 0.0;
};

/// Classifies every block of a stream (up to page_end) with the configured
/// patterns and chessboard validator and logs one line per block, grouped by
/// page. Used to tune patterns for a new book.
std::vector<BlockInspection> InspectBlocks(const BlockStream& stream, const ExtractorConfig& config);

/// Builds the Diagram record for one assembly (header, solution and
/// chessboard fields; recognition fields are left unset).
Diagram BuildDiagram(const BlockStream& stream, const Assembly& assembly, const Pattern& header,
                     const Pattern& solution, int full_move_max_chars);

/// Linear books: block stream, structural assembly, parsing, recognition.
/// \param recognition Optional; nullptr or a disabled client skips recognition
DiagramRunResult ExtractDiagrams(DocumentSource& source, const ExtractorConfig& config,
                                 RecognitionClient* recognition = nullptr);

/// Same as ExtractDiagrams on an already built stream.
DiagramRunResult ExtractDiagrams(const BlockStream& stream, const ExtractorConfig& config,
                                 RecognitionClient* recognition = nullptr);

/// Analyzes one rendered page of a grid-layout book.
std::vector<GridSection> AnalyzeGridPage(const cv::Mat& page_image, int page_number,
                                         const ExtractorConfig& config, const DigitReader& reader,
                                         RecognitionClient* recognition = nullptr,
                                         RunSummary* summary = nullptr);

/// Receives the sections of each page as soon as it is analyzed.
using GridPageSink = std::function<void(int page, const std::vector<GridSection>& sections)>;

/// Grid books: render each page, divide it, analyze bubbles and boards.
/// \param on_page Optional; called once per analyzed page (failed pages are skipped)
GridRunResult ExtractGridSections(DocumentSource& source, const ExtractorConfig& config,
                                  const DigitReader& reader,
                                  RecognitionClient* recognition = nullptr,
                                  const GridPageSink& on_page = nullptr);

} // namespace ChessScribe
