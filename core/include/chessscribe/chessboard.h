/// \file chessboard.h
/// \brief Contour-based chessboard classifier for image regions.

#pragma once

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Tunable thresholds of the chessboard heuristic.
struct ChessboardConfig {
    double canny_low     = 10.0;
    double canny_high    = 50.0;
    double epsilon_ratio = 0.03; ///< approxPolyDP epsilon as a fraction of the perimeter.

    float cell_aspect_min = 0.4f; ///< Accepted w/h range of one square.
    float cell_aspect_max = 1.8f;
    int min_cell_px       = 5;    ///< Minimum side of one square.

    int min_square_count        = 4;
    int max_square_count        = 0;  ///< 0 = no upper bound.
    int saturation_square_count = 32; ///< Square count at which confidence saturates.

    float max_region_aspect = 2.0f; ///< Long/short side of the whole region (0 = disabled).

    double uniformity_tolerance = 3.0;  ///< Area factor around the median square area.
    double min_uniform_fraction = 0.3;  ///< Required share of uniform squares (0 = disabled).
};

/// Classification result.
struct ChessboardVerdict {
    bool is_chessboard      = false;
    double confidence       = 0.0; ///< [0, 1]
    int square_count        = 0;
    double uniform_fraction = 0.0;
    float aspect_ratio      = 0.0f; ///< Long/short side of the region.
};

/// Heuristic chessboard detector: counts square-like contours and checks
/// their size uniformity and the region's proportions.
class ChessboardValidator {
public:
    explicit ChessboardValidator(const ChessboardConfig& config = {});

    /// Classifies an image (BGR, BGRA or grayscale). Empty images are rejected.
    ChessboardVerdict Validate(const cv::Mat& image) const;

    /// Shorthand for Validate(image).is_chessboard.
    bool IsChessboard(const cv::Mat& image) const { return Validate(image).is_chessboard; }

    const ChessboardConfig& config() const { return config_; }

private:
    ChessboardConfig config_;
};

} // namespace ChessScribe
