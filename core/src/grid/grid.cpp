#include "chessscribe/grid.h"
#include "chessscribe/error.h"
#include "detail/cv_utils.h"

#include <spdlog/fmt/fmt.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>

namespace ChessScribe {

std::vector<GridCell> DivideIntoSections(const cv::Size& page_size, const GridConfig& config) {
    const int rows = config.rows;
    const int cols = config.cols;
    if (rows < 1 || cols < 1 || rows > GridConfig::kMaxCells || cols > GridConfig::kMaxCells) {
        throw ConfigError("Grid dimensions out of range: " + std::to_string(rows) + "x" +
                          std::to_string(cols));
    }
    if (page_size.width < cols || page_size.height < rows) {
        throw ConfigError("Page " + std::to_string(page_size.width) + "x" +
                          std::to_string(page_size.height) + " is too small for a " +
                          std::to_string(rows) + "x" + std::to_string(cols) + " grid");
    }

    const int cell_w = page_size.width / cols;
    const int cell_h = page_size.height / rows;

    std::vector<GridCell> cells;
    cells.reserve(static_cast<size_t>(rows * cols));
    for (int r = 0; r < rows; ++r) {
        const int y = r * cell_h;
        const int h = (r == rows - 1) ? page_size.height - y : cell_h;
        for (int c = 0; c < cols; ++c) {
            const int x = c * cell_w;
            const int w = (c == cols - 1) ? page_size.width - x : cell_w;

            GridCell cell;
            cell.row            = r;
            cell.col            = c;
            cell.section_number = r * cols + c + 1;
            cell.bbox           = cv::Rect(x, y, w, h);
            cells.push_back(cell);
        }
    }
    return cells;
}

int DiagramNumberForCell(const GridConfig& config, int page, int row, int col) {
    int number = col * config.rows + row + 1;
    if (config.first_numbered_page > 0) {
        number += (page - config.first_numbered_page) * config.rows * config.cols;
    }
    return number;
}

cv::Rect CellBodyRect(const cv::Size& cell_size, int bubble_area_height, int padding) {
    const int top = std::clamp(bubble_area_height, 0, cell_size.height);
    const cv::Rect body(0, top, cell_size.width, cell_size.height - top);
    if (body.empty()) { return {}; }

    const int pad = std::max(0, padding);
    cv::Rect inset(body.x + pad, body.y + pad, body.width - 2 * pad, body.height - 2 * pad);
    if (inset.width <= 0 || inset.height <= 0) { return body; }
    return inset;
}

namespace {

const cv::Scalar kSectionColor(0, 0, 255);
const cv::Scalar kBubbleColor(255, 0, 0);
const cv::Scalar kBoardColor(0, 160, 0);
const cv::Scalar kNoBoardColor(0, 0, 200);

// Label on a white backing box so it stays readable over the page.
void PutLabel(cv::Mat& img, const std::string& text, cv::Point origin, const cv::Scalar& color,
              double scale) {
    int baseline        = 0;
    const cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, 1, &baseline);
    const cv::Rect box  = detail::ClampRect(
        cv::Rect(origin.x - 2, origin.y - size.height - 2, size.width + 4, size.height + baseline + 4),
        img.size());
    if (box.empty()) { return; }
    img(box).setTo(cv::Scalar(255, 255, 255));
    cv::putText(img, text, origin, cv::FONT_HERSHEY_SIMPLEX, scale, color, 1, cv::LINE_AA);
}

} // namespace

cv::Mat DrawGridPreview(const cv::Mat& page_image, const std::vector<GridSection>& sections) {
    if (page_image.empty()) { throw InputError("DrawGridPreview: page image is empty"); }

    cv::Mat preview = detail::EnsureBgr(page_image).clone();
    const double scale = std::clamp(preview.cols / 1600.0, 0.4, 1.2);
    const int line_h   = static_cast<int>(28 * scale) + 6;

    for (const GridSection& s : sections) {
        const cv::Rect cell = detail::ClampRect(s.bbox, preview.size());
        if (cell.empty()) { continue; }
        cv::rectangle(preview, cell, kSectionColor, 2);

        cv::Point at(cell.x + 8, cell.y + line_h);
        PutLabel(preview, fmt::format("S{} (R{},C{}) D{}", s.section_number, s.row, s.col, s.diagram_number),
                 at, kSectionColor, scale);

        if (s.is_chessboard) {
            PutLabel(preview, fmt::format("CHESS {:.2f}", s.chessboard_confidence),
                     cv::Point(at.x, at.y + line_h), kBoardColor, scale);
        } else {
            PutLabel(preview, "NO CHESS", cv::Point(at.x, at.y + line_h), kNoBoardColor, scale);
        }

        // Bubble boxes are stored in cell coordinates.
        for (size_t i = 0; i < s.bubbles.size(); ++i) {
            const Bubble& b    = s.bubbles[i];
            const cv::Rect box = detail::ClampRect(b.bbox + cell.tl(), preview.size());
            if (box.empty()) { continue; }
            cv::rectangle(preview, box, kBubbleColor, 2);
            const std::string label = b.digit ? std::to_string(*b.digit) : "?";
            PutLabel(preview, fmt::format("N{}:{} {}", i + 1, label, ToFillStyleString(b.fill_style)),
                     cv::Point(box.x, box.y + box.height + line_h), kBubbleColor, scale * 0.8);
        }
    }
    return preview;
}

} // namespace ChessScribe
