/// \file config.h
/// \brief Extractor configuration: loading, presets and validation.

#pragma once

#include "block_stream.h"
#include "bubble.h"
#include "chessboard.h"
#include "common.h"
#include "grid.h"
#include "ocr.h"
#include "pattern.h"
#include "recognition.h"

#include <string>

namespace ChessScribe {

/// Where and what to write.
struct OutputConfig {
    std::string dir             = "data_output";
    std::string images_subdir   = "extracted_images";
    std::string previews_subdir = "preview_images";

    bool save_chessboard_images     = false;
    bool save_non_chessboard_images = false;
    bool save_all_images            = false; ///< Every examined image, whatever its verdict.
    bool save_previews              = false; ///< Grid runs: annotated page per rendered page.
    bool pad_empty_bubbles          = false; ///< Grid CSV only: two placeholder bubbles for empty cells.
    bool write_json                 = true;
    bool write_csv                  = true;

    /// <dir>/<images_subdir>
    std::string ImagesDir() const;

    /// <dir>/<previews_subdir>
    std::string PreviewsDir() const;
};

/// Complete configuration of one extraction run.
struct ExtractorConfig {
    std::string preset   = "woodpecker";
    std::string pdf_path;

    int page_start   = 0; ///< 1-based inclusive (0 = first page).
    int page_end     = 0; ///< 1-based inclusive (0 = last page).
    int max_diagrams = 0; ///< 0 = unlimited.

    DiagramStructure structure = DiagramStructure::HeaderImageSolution;
    int max_search_distance    = 20;

    PatternSpec header_pattern   = BuiltinHeaderPattern();
    PatternSpec solution_pattern = BuiltinSolutionPattern();
    int full_move_max_chars      = 80;

    /// Logs every block with its role before assembling (pattern tuning).
    bool inspect_blocks = false;

    ChessboardConfig chessboard;
    GridConfig grid;
    BubbleConfig bubble;
    RecognitionConfig recognition;
    OcrConfig ocr;
    OutputConfig output;

    PageRange Pages() const { return PageRange{page_start, page_end}; }

    /// Throws ConfigError describing the first invalid setting, including
    /// patterns that do not compile.
    void Validate() const;

    /// Defaults for a named book preset ("woodpecker", "combinational_motifs").
    /// Throws ConfigError for unknown names.
    static ExtractorConfig ForPreset(const std::string& name);

    /// Loads a JSON configuration file; keys not present keep the preset's defaults.
    static ExtractorConfig LoadFromJson(const std::string& path);

    /// Parses a JSON configuration string.
    static ExtractorConfig FromJsonString(const std::string& json_str);

    /// Serializes the effective configuration (for logging and reproducibility).
    std::string ToJsonString() const;
};

} // namespace ChessScribe
