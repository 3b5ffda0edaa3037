/// \file bubble.h
/// \brief Detects and reads the bubble markers above a grid cell.

#pragma once

#include "grid.h"
#include "ocr.h"

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Bubble detection thresholds.
struct BubbleConfig {
    float bubble_area_ratio = 0.35f; ///< Top share of the cell searched for bubbles.
    int bubble_area_px      = 0;     ///< Absolute height; overrides the ratio when > 0.
    float skip_left_ratio   = 0.25f; ///< Left share reserved for the printed diagram number.

    double min_area        = 30.0;
    double max_area        = 2500.0;
    double min_circularity = 0.6;
    float min_aspect       = 0.6f;
    float max_aspect       = 1.6f;

    double fill_threshold = 128.0; ///< Mean interior gray below this = Filled.
    int min_separation_px = 12;    ///< Closer candidates are duplicates.
    int max_bubbles       = 2;
    int ocr_scale         = 4;     ///< Upscale factor before OCR.

    /// Height in pixels of the bubble area for a cell of the given height.
    int AreaHeight(int cell_height) const;
};

/// Finds bubbles in the top strip of a cell and reads their digits.
class BubbleAnalyzer {
public:
    /// \param reader Digit OCR; may be empty, in which case digits stay unset.
    explicit BubbleAnalyzer(const BubbleConfig& config = {}, DigitReader reader = nullptr);

    /// Analyzes one cell image (BGR or grayscale). Never throws for image
    /// content; an empty cell yields no bubbles.
    std::vector<Bubble> Analyze(const cv::Mat& cell) const;

    const BubbleConfig& config() const { return config_; }

private:
    std::optional<int> ReadDigit(const cv::Mat& gray, const cv::Rect& box, FillStyle style) const;

    BubbleConfig config_;
    DigitReader reader_;
};

} // namespace ChessScribe
