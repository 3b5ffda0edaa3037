#include "chessscribe/bubble.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace ChessScribe {
namespace {

constexpr double kPi            = 3.14159265358979323846;
constexpr double kInteriorInset = 0.15; // Share of the box trimmed on each side before OCR.

struct Candidate {
    Bubble bubble;
    double area = 0.0;
};

static std::optional<int> FirstDigitRun(const std::string& text) {
    auto begin = std::find_if(text.begin(), text.end(),
                              [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (begin == text.end()) { return std::nullopt; }
    auto end = std::find_if(begin, text.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) == 0; });
    const std::string run(begin, end);
    if (run.size() > 6) { return std::nullopt; }
    return std::stoi(run);
}

static FillStyle ClassifyFill(const cv::Mat& strip, const std::vector<cv::Point>& contour,
                              const cv::Rect& box, double threshold) {
    cv::Mat mask = cv::Mat::zeros(strip.size(), CV_8UC1);
    cv::drawContours(mask, std::vector<std::vector<cv::Point>>{contour}, 0, cv::Scalar(255),
                     cv::FILLED);

    // Erode past the ring so only the interior is measured.
    const int k = std::max(3, std::min(box.width, box.height) / 5);
    cv::Mat eroded;
    cv::erode(mask, eroded, cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k)));
    if (cv::countNonZero(eroded) > 0) { mask = eroded; }

    const double mean = cv::mean(strip, mask)[0];
    return mean < threshold ? FillStyle::Filled : FillStyle::Outlined;
}

} // namespace

int BubbleConfig::AreaHeight(int cell_height) const {
    if (cell_height <= 0) { return 0; }
    int h = bubble_area_px > 0 ? bubble_area_px
                               : static_cast<int>(std::lround(cell_height * bubble_area_ratio));
    return std::clamp(h, 1, cell_height);
}

BubbleAnalyzer::BubbleAnalyzer(const BubbleConfig& config, DigitReader reader)
    : config_(config), reader_(std::move(reader)) {}

std::vector<Bubble> BubbleAnalyzer::Analyze(const cv::Mat& cell) const {
    std::vector<Bubble> bubbles;
    cv::Mat gray = detail::ToGray(cell);
    if (gray.empty()) { return bubbles; }

    const int area_h   = config_.AreaHeight(gray.rows);
    const int skip     = static_cast<int>(gray.cols * config_.skip_left_ratio);
    const cv::Rect roi = detail::ClampRect(cv::Rect(skip, 0, gray.cols - skip, area_h), gray.size());
    if (roi.empty()) { return bubbles; }

    cv::Mat strip = gray(roi).clone();
    cv::Mat binary;
    cv::threshold(strip, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<Candidate> candidates;
    for (const auto& contour : contours) {
        const double area = cv::contourArea(contour);
        if (area < config_.min_area || area > config_.max_area) { continue; }

        const double peri = cv::arcLength(contour, true);
        if (peri <= 0.0) { continue; }
        const double circularity = 4.0 * kPi * area / (peri * peri);
        if (circularity < config_.min_circularity) { continue; }

        const cv::Rect box = cv::boundingRect(contour);
        if (box.height <= 0) { continue; }
        const float aspect = static_cast<float>(box.width) / static_cast<float>(box.height);
        if (aspect < config_.min_aspect || aspect > config_.max_aspect) { continue; }

        Candidate c;
        c.area               = area;
        c.bubble.bbox        = box;
        c.bubble.circularity = circularity;
        c.bubble.fill_style  = ClassifyFill(strip, contour, box, config_.fill_threshold);
        candidates.push_back(c);
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.bubble.bbox.x < b.bubble.bbox.x; });

    std::vector<Candidate> unique;
    for (const Candidate& c : candidates) {
        if (!unique.empty() &&
            std::abs(c.bubble.bbox.x - unique.back().bubble.bbox.x) < config_.min_separation_px) {
            if (c.area > unique.back().area) { unique.back() = c; }
            continue;
        }
        unique.push_back(c);
    }
    if (config_.max_bubbles >= 0 && static_cast<int>(unique.size()) > config_.max_bubbles) {
        unique.resize(static_cast<size_t>(config_.max_bubbles));
    }

    for (Candidate& c : unique) {
        c.bubble.digit = ReadDigit(strip, c.bubble.bbox, c.bubble.fill_style);
        c.bubble.bbox.x += roi.x;
        c.bubble.bbox.y += roi.y;
        bubbles.push_back(c.bubble);
    }

    spdlog::debug("Bubble analysis: {} contours, {} candidates, {} bubbles", contours.size(),
                  candidates.size(), bubbles.size());
    return bubbles;
}

std::optional<int> BubbleAnalyzer::ReadDigit(const cv::Mat& gray, const cv::Rect& box,
                                             FillStyle style) const {
    if (!reader_) { return std::nullopt; }

    const int dx = static_cast<int>(box.width * kInteriorInset);
    const int dy = static_cast<int>(box.height * kInteriorInset);
    cv::Rect interior(box.x + dx, box.y + dy, box.width - 2 * dx, box.height - 2 * dy);
    interior = detail::ClampRect(interior, gray.size());
    if (interior.empty()) { return std::nullopt; }

    cv::Mat crop = gray(interior).clone();
    if (style == FillStyle::Filled) { cv::bitwise_not(crop, crop); }

    const int scale = std::max(1, config_.ocr_scale);
    cv::Mat scaled;
    cv::resize(crop, scaled, cv::Size(), scale, scale, cv::INTER_CUBIC);
    cv::copyMakeBorder(scaled, scaled, 8, 8, 8, 8, cv::BORDER_CONSTANT, cv::Scalar(255));

    std::string text;
    try {
        text = reader_(scaled);
    } catch (const std::exception& e) {
        spdlog::warn("Digit OCR failed: {}", e.what());
        return std::nullopt;
    }
    return FirstDigitRun(text);
}

} // namespace ChessScribe
