#include "chessscribe/chessboard.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace ChessScribe {
namespace {

// Bounding box of a square-like quadrilateral, or an empty rect when the
// contour does not qualify.
static cv::Rect SquareCandidate(const std::vector<cv::Point>& contour, const ChessboardConfig& cfg) {
    const double peri = cv::arcLength(contour, true);
    if (peri <= 0.0) { return {}; }

    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, cfg.epsilon_ratio * peri, true);
    if (approx.size() != 4) { return {}; }

    cv::Rect box = cv::boundingRect(approx);
    if (box.width < cfg.min_cell_px || box.height < cfg.min_cell_px) { return {}; }

    const float aspect = static_cast<float>(box.width) / static_cast<float>(box.height);
    if (aspect < cfg.cell_aspect_min || aspect > cfg.cell_aspect_max) { return {}; }
    return box;
}

static double Median(std::vector<double> values) {
    if (values.empty()) { return 0.0; }
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    return values[mid];
}

static double UniformFraction(const std::vector<double>& areas, double tolerance) {
    if (areas.empty()) { return 0.0; }
    const double median = Median(areas);
    if (median <= 0.0 || tolerance <= 1.0) { return 0.0; }

    const double lo = median / tolerance;
    const double hi = median * tolerance;
    const auto uniform =
        std::count_if(areas.begin(), areas.end(), [&](double a) { return a >= lo && a <= hi; });
    return static_cast<double>(uniform) / static_cast<double>(areas.size());
}

} // namespace

ChessboardValidator::ChessboardValidator(const ChessboardConfig& config) : config_(config) {}

ChessboardVerdict ChessboardValidator::Validate(const cv::Mat& image) const {
    ChessboardVerdict verdict;
    if (image.empty()) { return verdict; }

    const int long_side  = std::max(image.cols, image.rows);
    const int short_side = std::min(image.cols, image.rows);
    verdict.aspect_ratio = short_side > 0 ? static_cast<float>(long_side) / short_side : 0.0f;

    cv::Mat gray = detail::ToGray(image);
    cv::Mat blurred, edges;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Canny(blurred, edges, config_.canny_low, config_.canny_high);

    std::vector<std::vector<cv::Point>> contours;
    std::vector<cv::Vec4i> hierarchy;
    cv::findContours(edges, contours, hierarchy, cv::RETR_TREE, cv::CHAIN_APPROX_SIMPLE);

    std::vector<double> areas;
    for (const auto& contour : contours) {
        cv::Rect box = SquareCandidate(contour, config_);
        if (box.empty()) { continue; }
        areas.push_back(static_cast<double>(box.area()));
    }

    verdict.square_count     = static_cast<int>(areas.size());
    verdict.uniform_fraction = UniformFraction(areas, config_.uniformity_tolerance);

    const int saturation = std::max(1, config_.saturation_square_count);
    verdict.confidence =
        std::min(1.0, static_cast<double>(verdict.square_count) / saturation) * verdict.uniform_fraction;

    bool ok = verdict.square_count >= config_.min_square_count;
    if (ok && config_.max_square_count > 0) { ok = verdict.square_count <= config_.max_square_count; }
    if (ok && config_.max_region_aspect > 0.0f) { ok = verdict.aspect_ratio <= config_.max_region_aspect; }
    if (ok && config_.min_uniform_fraction > 0.0) {
        ok = verdict.uniform_fraction >= config_.min_uniform_fraction;
    }
    verdict.is_chessboard = ok;

    spdlog::debug("Chessboard check {}x{}: squares={} uniform={:.2f} aspect={:.2f} -> {}", image.cols,
                  image.rows, verdict.square_count, verdict.uniform_fraction, verdict.aspect_ratio,
                  ok ? "accept" : "reject");
    return verdict;
}

} // namespace ChessScribe
