#include <gtest/gtest.h>
#include "chessscribe/bubble.h"
#include "chessscribe/error.h"
#include "chessscribe/grid.h"

#include <opencv2/imgproc.hpp>

using namespace ChessScribe;

static cv::Mat MakeCell(int width = 400, int height = 300) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
}

static void DrawOutlined(cv::Mat& img, cv::Point center, int radius = 15) {
    cv::circle(img, center, radius, cv::Scalar(0, 0, 0), 3);
}

static void DrawFilled(cv::Mat& img, cv::Point center, int radius = 15) {
    cv::circle(img, center, radius, cv::Scalar(0, 0, 0), cv::FILLED);
}

static DigitReader FixedReader(const std::string& text) {
    return [text](const cv::Mat&) { return text; };
}

TEST(GridDivide, TilesPageExactly) {
    GridConfig cfg;
    const cv::Size page(1001, 1502);
    auto cells = DivideIntoSections(page, cfg);

    ASSERT_EQ(cells.size(), 6u);
    long long area = 0;
    for (size_t i = 0; i < cells.size(); ++i) {
        area += cells[i].bbox.area();
        EXPECT_EQ(cells[i].section_number, static_cast<int>(i) + 1);
        for (size_t j = i + 1; j < cells.size(); ++j) {
            EXPECT_TRUE((cells[i].bbox & cells[j].bbox).empty());
        }
        EXPECT_EQ((cells[i].bbox & cv::Rect(0, 0, page.width, page.height)), cells[i].bbox);
    }
    EXPECT_EQ(area, static_cast<long long>(page.width) * page.height);

    EXPECT_EQ(cells[1].row, 0);
    EXPECT_EQ(cells[1].col, 1);
    EXPECT_EQ(cells[1].bbox.width, 501);
    EXPECT_EQ(cells[5].bbox.height, 502);
}

TEST(GridDivide, OtherShapes) {
    GridConfig cfg;
    cfg.rows = 4;
    cfg.cols = 3;
    EXPECT_EQ(DivideIntoSections(cv::Size(900, 1200), cfg).size(), 12u);

    cfg.rows = 1;
    cfg.cols = 1;
    auto single = DivideIntoSections(cv::Size(50, 70), cfg);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].bbox, cv::Rect(0, 0, 50, 70));
}

TEST(GridDivide, InvalidGridThrows) {
    GridConfig cfg;
    cfg.rows = 0;
    EXPECT_THROW(DivideIntoSections(cv::Size(100, 100), cfg), ConfigError);

    cfg.rows = 13;
    EXPECT_THROW(DivideIntoSections(cv::Size(1000, 1000), cfg), ConfigError);

    cfg.rows = 3;
    EXPECT_THROW(DivideIntoSections(cv::Size(1, 2), cfg), ConfigError);
}

TEST(GridNumbering, ColumnMajor) {
    GridConfig cfg;
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 0, 0), 1);
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 1, 0), 2);
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 2, 0), 3);
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 0, 1), 4);
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 2, 1), 6);
}

TEST(GridNumbering, OffsetByFirstNumberedPage) {
    GridConfig cfg;
    cfg.first_numbered_page = 5;
    EXPECT_EQ(DiagramNumberForCell(cfg, 5, 0, 0), 1);
    EXPECT_EQ(DiagramNumberForCell(cfg, 6, 0, 0), 7);
    EXPECT_EQ(DiagramNumberForCell(cfg, 7, 1, 1), 17);
}

TEST(GridBody, BelowBubbleAreaWithPadding) {
    EXPECT_EQ(CellBodyRect(cv::Size(400, 300), 105, 10), cv::Rect(10, 115, 380, 175));
    EXPECT_EQ(CellBodyRect(cv::Size(400, 300), 105, 0), cv::Rect(0, 105, 400, 195));
    EXPECT_TRUE(CellBodyRect(cv::Size(400, 300), 300, 10).empty());
}

TEST(Bubble, AreaHeight) {
    BubbleConfig cfg;
    EXPECT_EQ(cfg.AreaHeight(300), 105);
    cfg.bubble_area_px = 80;
    EXPECT_EQ(cfg.AreaHeight(300), 80);
    EXPECT_EQ(cfg.AreaHeight(50), 50);
}

TEST(Bubble, DetectsOutlinedAndFilled) {
    cv::Mat cell = MakeCell();
    DrawFilled(cell, cv::Point(260, 50));
    DrawOutlined(cell, cv::Point(200, 50));

    BubbleAnalyzer analyzer(BubbleConfig{}, FixedReader("7"));
    auto bubbles = analyzer.Analyze(cell);

    ASSERT_EQ(bubbles.size(), 2u);
    EXPECT_LT(bubbles[0].bbox.x, bubbles[1].bbox.x);
    EXPECT_EQ(bubbles[0].fill_style, FillStyle::Outlined);
    EXPECT_EQ(bubbles[1].fill_style, FillStyle::Filled);
    EXPECT_EQ(bubbles[0].digit, 7);
    EXPECT_EQ(bubbles[1].digit, 7);
    EXPECT_GE(bubbles[0].circularity, 0.6);
    EXPECT_NEAR(bubbles[0].bbox.x + bubbles[0].bbox.width / 2.0, 200.0, 3.0);
}

TEST(Bubble, EmptyCellHasNoBubbles) {
    BubbleAnalyzer analyzer(BubbleConfig{}, FixedReader("1"));
    EXPECT_TRUE(analyzer.Analyze(MakeCell()).empty());
    EXPECT_TRUE(analyzer.Analyze(cv::Mat()).empty());
}

TEST(Bubble, IgnoresLeftMarginAndBody) {
    cv::Mat cell = MakeCell();
    DrawFilled(cell, cv::Point(50, 50));   // printed diagram number area
    DrawFilled(cell, cv::Point(250, 200)); // inside the board area
    BubbleAnalyzer analyzer;
    EXPECT_TRUE(analyzer.Analyze(cell).empty());
}

TEST(Bubble, KeepsAtMostTwoLeftmost) {
    cv::Mat cell = MakeCell();
    DrawOutlined(cell, cv::Point(320, 50));
    DrawFilled(cell, cv::Point(200, 50));
    DrawOutlined(cell, cv::Point(260, 50));

    auto bubbles = BubbleAnalyzer().Analyze(cell);
    ASSERT_EQ(bubbles.size(), 2u);
    EXPECT_NEAR(bubbles[0].bbox.x + bubbles[0].bbox.width / 2.0, 200.0, 3.0);
    EXPECT_NEAR(bubbles[1].bbox.x + bubbles[1].bbox.width / 2.0, 260.0, 3.0);
}

TEST(Bubble, RejectsNonCircularShapes) {
    cv::Mat cell = MakeCell();
    cv::rectangle(cell, cv::Rect(180, 45, 60, 8), cv::Scalar(0, 0, 0), cv::FILLED);
    EXPECT_TRUE(BubbleAnalyzer().Analyze(cell).empty());
}

TEST(Bubble, DigitParsing) {
    cv::Mat cell = MakeCell();
    DrawOutlined(cell, cv::Point(200, 50));

    EXPECT_FALSE(BubbleAnalyzer(BubbleConfig{}, nullptr).Analyze(cell)[0].digit.has_value());
    EXPECT_FALSE(BubbleAnalyzer(BubbleConfig{}, FixedReader("")).Analyze(cell)[0].digit.has_value());
    EXPECT_EQ(BubbleAnalyzer(BubbleConfig{}, FixedReader("a12b")).Analyze(cell)[0].digit, 12);
}

TEST(GridPreview, MarksSectionsAndBubbles) {
    const cv::Mat page = MakeCell(400, 300);

    GridSection s;
    s.section_number = 1;
    s.diagram_number = 4;
    s.bbox           = cv::Rect(0, 0, 200, 300);
    Bubble b;
    b.digit = 2;
    b.bbox  = cv::Rect(100, 200, 30, 30);
    s.bubbles.push_back(b);

    GridSection other = s;
    other.section_number = 2;
    other.bbox           = cv::Rect(200, 0, 200, 300);
    other.is_chessboard  = true;

    const cv::Mat preview = DrawGridPreview(page, {s, other});
    ASSERT_EQ(preview.size(), page.size());
    ASSERT_EQ(preview.type(), CV_8UC3);

    // Section border in red, bubble box in blue (cell offset applied).
    EXPECT_EQ(preview.at<cv::Vec3b>(150, 200), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(preview.at<cv::Vec3b>(215, 100), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(preview.at<cv::Vec3b>(200, 300), cv::Vec3b(255, 0, 0));

    // The input is left untouched.
    EXPECT_EQ(cv::countNonZero(page.reshape(1) != 255), 0);

    EXPECT_THROW(DrawGridPreview(cv::Mat(), {s}), InputError);
}
