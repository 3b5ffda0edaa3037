/// \file grid.h
/// \brief Grid-layout pages: fixed cell division and per-cell records.

#pragma once

#include "common.h"

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Grid division settings.
struct GridConfig {
    int rows                = 3;
    int cols                = 2;
    float render_dpi        = 150.0f;
    int first_numbered_page = 0; ///< Page holding diagrams 1..rows*cols (0 = number per page).
    int body_padding_px     = 10; ///< Inset of the cell body handed to the validator.

    static constexpr int kMaxCells = 12;
};

/// Small circular marker above a grid cell.
struct Bubble {
    std::optional<int> digit;
    FillStyle fill_style = FillStyle::Outlined;
    cv::Rect bbox;            ///< Cell coordinates.
    double circularity = 0.0; ///< 4*pi*area / perimeter^2
};

/// Geometry of one cell of a page.
struct GridCell {
    int row            = 0;
    int col            = 0;
    int section_number = 0; ///< 1-based, row-major.
    cv::Rect bbox;          ///< Page coordinates.
};

/// One analyzed cell.
struct GridSection {
    int page           = 0;
    int row            = 0;
    int col            = 0;
    int section_number = 0;
    int diagram_number = 0; ///< Column-major numbering.
    cv::Rect bbox;
    std::vector<Bubble> bubbles; ///< Left to right; empty when none were found.

    bool is_chessboard           = false;
    double chessboard_confidence = 0.0;

    std::optional<std::string> fen;
    std::optional<std::string> turn; ///< As reported by the recognition service.
    std::optional<std::string> image_path;
};

/// Splits a page of the given size into rows x cols cells that tile it
/// exactly (the last row/column absorbs the remainder). Row-major order.
/// Throws ConfigError when the grid is out of range or larger than the page.
std::vector<GridCell> DivideIntoSections(const cv::Size& page_size, const GridConfig& config);

/// Column-major diagram number of a cell (left column top to bottom first).
int DiagramNumberForCell(const GridConfig& config, int page, int row, int col);

/// Region of a cell below its bubble area, inset by the padding. Cell coordinates.
cv::Rect CellBodyRect(const cv::Size& cell_size, int bubble_area_height, int padding);

/// Copy of a rendered page annotated with its analyzed sections: cell borders
/// and labels, bubble boxes with their digits, and the chessboard verdict.
/// Throws InputError for an empty page.
cv::Mat DrawGridPreview(const cv::Mat& page_image, const std::vector<GridSection>& sections);

} // namespace ChessScribe
