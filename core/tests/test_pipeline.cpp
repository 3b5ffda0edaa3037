#include <gtest/gtest.h>
#include "chessscribe/chessscribe.h"

#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <set>
#include <vector>

using namespace ChessScribe;

static cv::Mat MakeBoard(int cell = 40) {
    const int margin = 10;
    cv::Mat img(8 * cell + 2 * margin, 8 * cell + 2 * margin, CV_8UC3, cv::Scalar(255, 255, 255));
    for (int r = 0; r < 8; ++r) {
        for (int c = 0; c < 8; ++c) {
            const cv::Rect square(margin + c * cell, margin + r * cell, cell, cell);
            if ((r + c) % 2 == 1) { cv::rectangle(img, square, cv::Scalar(0, 0, 0), cv::FILLED); }
            cv::rectangle(img, square, cv::Scalar(0, 0, 0), 2);
        }
    }
    return img;
}

static PageRegion TextRegion(float y, const std::string& text) {
    PageRegion r;
    r.bbox = cv::Rect2f(20.0f, y, 300.0f, 12.0f);
    r.text = text;
    return r;
}

static PageRegion ImageRegion(float y, const cv::Mat& image) {
    PageRegion r;
    r.kind  = BlockKind::Image;
    r.bbox  = cv::Rect2f(20.0f, y, 200.0f, 200.0f);
    r.image = image;
    return r;
}

// One page per diagram: header, board, solution.
static BlockStream MakeBook(int diagrams) {
    std::vector<Page> pages;
    for (int i = 1; i <= diagrams; ++i) {
        Page page;
        page.number = i;
        page.regions.push_back(TextRegion(10.0f, std::to_string(i) + ". Tal - Botvinnik, Moscow 1960"));
        page.regions.push_back(ImageRegion(40.0f, MakeBoard()));
        page.regions.push_back(TextRegion(260.0f, std::to_string(i) + ".Rxf7! and wins"));
        pages.push_back(page);
    }
    return BuildBlockStream(pages);
}

static ExtractorConfig RecognitionConfigFor() {
    ExtractorConfig cfg;
    cfg.recognition.enabled     = true;
    cfg.recognition.min_delay_s = 0.0;
    cfg.recognition.max_delay_s = 0.0;
    cfg.recognition.seed        = 1;
    return cfg;
}

class FakeBook : public DocumentSource {
public:
    explicit FakeBook(int pages) : pages_(pages) {}

    int PageCount() const override { return pages_; }

    Page LoadPage(int page_number) override {
        Page page;
        page.number = page_number;
        page.regions.push_back(TextRegion(10.0f, std::to_string(page_number) + ". Tal - Botvinnik, Moscow 1960"));
        page.regions.push_back(ImageRegion(40.0f, MakeBoard()));
        page.regions.push_back(TextRegion(260.0f, std::to_string(page_number) + "...Qh4 draws"));
        return page;
    }

    cv::Mat RenderPage(int page_number, float) override {
        if (failing_.count(page_number) > 0) { throw IOError("cannot render page"); }
        if (corrupt_.count(page_number) > 0) {
            throw cv::Exception(cv::Error::StsBadSize, "bad raster", "RenderPage", __FILE__, __LINE__);
        }
        ++rendered;
        cv::Mat page(600, 800, CV_8UC3, cv::Scalar(255, 255, 255));
        MakeBoard(30).copyTo(page(cv::Rect(60, 260, 260, 260)));
        cv::circle(page, cv::Point(200, 50), 15, cv::Scalar(0, 0, 0), 3);
        return page;
    }

    std::set<int> failing_;
    std::set<int> corrupt_;
    int rendered = 0;

private:
    int pages_;
};

TEST(ExtractDiagrams, BuildsCompleteRecords) {
    ExtractorConfig cfg = ExtractorConfig{};
    DiagramRunResult result = ExtractDiagrams(MakeBook(2), cfg);

    ASSERT_EQ(result.diagrams.size(), 2u);
    const Diagram& d = result.diagrams[0];
    EXPECT_EQ(d.diagram_number, 1);
    EXPECT_EQ(d.players, "Tal - Botvinnik");
    EXPECT_EQ(d.year, "1960");
    EXPECT_EQ(d.image_page, 1);
    EXPECT_EQ(d.header_page, 1);
    EXPECT_EQ(d.solution_page, 1);
    EXPECT_EQ(d.solution_move_number, 1);
    EXPECT_EQ(d.solution_move_clean, "Rxf7");
    EXPECT_EQ(d.solution_move_annotated, "Rxf7!");
    EXPECT_EQ(d.turn_from_text, "white");
    EXPECT_EQ(d.header_global_index, 0);
    EXPECT_EQ(d.image_global_index, 1);
    EXPECT_EQ(d.solution_global_index, 2);
    EXPECT_GT(d.chessboard_confidence, 0.0);
    EXPECT_FALSE(d.fen.has_value());
    EXPECT_FALSE(d.image_path.has_value());

    EXPECT_EQ(result.summary.diagrams, 2);
    EXPECT_EQ(result.summary.headers, 2);
    EXPECT_EQ(result.summary.solutions, 2);
    EXPECT_EQ(result.summary.images, 2);
    EXPECT_EQ(result.summary.white_to_move, 2);
    EXPECT_EQ(result.summary.cross_page, 0);
    EXPECT_EQ(result.summary.recognition_attempted, 0);
}

TEST(ExtractDiagrams, RecognitionFailureLeavesOneNullFen) {
    int calls = 0;
    RecognitionClient client(
        RecognitionConfigFor().recognition,
        [&](const cv::Mat&) {
            if (++calls == 2) { throw RecognitionError("timed out"); }
            return RecognitionResult{"8/8/8/8/8/8/8/K6k", "b"};
        },
        [](std::chrono::milliseconds) {});

    DiagramRunResult result = ExtractDiagrams(MakeBook(3), RecognitionConfigFor(), &client);

    ASSERT_EQ(result.diagrams.size(), 3u);
    int missing = 0;
    for (const Diagram& d : result.diagrams) {
        if (!d.fen) { ++missing; }
    }
    EXPECT_EQ(missing, 1);
    EXPECT_FALSE(result.diagrams[1].fen.has_value());
    EXPECT_EQ(result.diagrams[2].turn_from_api, "b");

    EXPECT_EQ(result.summary.recognition_attempted, 3);
    EXPECT_EQ(result.summary.recognition_succeeded, 2);
    EXPECT_EQ(result.summary.recognition_failed, 1);
    EXPECT_EQ(result.summary.turn_disagreements, 2);
}

TEST(ExtractDiagrams, NonChessboardImagesAreSkipped) {
    std::vector<Page> pages(1);
    pages[0].number = 1;
    pages[0].regions.push_back(TextRegion(10.0f, "4. Tal - Botvinnik, Moscow 1960"));
    pages[0].regions.push_back(ImageRegion(40.0f, cv::Mat(200, 200, CV_8UC3, cv::Scalar(255, 255, 255))));
    pages[0].regions.push_back(ImageRegion(250.0f, MakeBoard()));
    pages[0].regions.push_back(TextRegion(460.0f, "4...Qh4"));

    DiagramRunResult result = ExtractDiagrams(BuildBlockStream(pages), ExtractorConfig{});
    ASSERT_EQ(result.diagrams.size(), 1u);
    EXPECT_EQ(result.diagrams[0].image_global_index, 2);
    EXPECT_EQ(result.diagrams[0].turn_from_text, "black");
    EXPECT_EQ(result.summary.non_chessboard_images, 1);
    EXPECT_EQ(result.summary.black_to_move, 1);
}

static BlockStream MakeMixedPage() {
    std::vector<Page> pages(1);
    pages[0].number = 1;
    pages[0].regions.push_back(TextRegion(10.0f, "4. Tal - Botvinnik, Moscow 1960"));
    pages[0].regions.push_back(ImageRegion(40.0f, cv::Mat(200, 200, CV_8UC3, cv::Scalar(255, 255, 255))));
    pages[0].regions.push_back(ImageRegion(250.0f, MakeBoard()));
    pages[0].regions.push_back(TextRegion(460.0f, "4...Qh4"));
    return BuildBlockStream(pages);
}

TEST(ExtractDiagrams, SaveAllImagesKeepsEveryExaminedImage) {
    const auto dir = std::filesystem::temp_directory_path() / "chessscribe_save_all_test";
    std::filesystem::remove_all(dir);

    ExtractorConfig cfg;
    cfg.output.dir             = dir.string();
    cfg.output.save_all_images = true;

    DiagramRunResult result = ExtractDiagrams(MakeMixedPage(), cfg);
    ASSERT_EQ(result.diagrams.size(), 1u);
    EXPECT_EQ(result.summary.images_saved, 2);
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cfg.output.ImagesDir()) / "debug_page_1_block_1.png"));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cfg.output.ImagesDir()) / "debug_page_1_block_2.png"));
    EXPECT_FALSE(result.diagrams[0].image_path.has_value());

    std::filesystem::remove_all(dir);
}

TEST(InspectBlocks, ReportsPatternVerdictsAndRoles) {
    const BlockStream stream = MakeMixedPage();
    auto blocks              = InspectBlocks(stream, ExtractorConfig{});

    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Text);
    EXPECT_TRUE(blocks[0].header_match);
    EXPECT_EQ(blocks[0].role, Role::Header);
    EXPECT_EQ(blocks[0].text, "4. Tal - Botvinnik, Moscow 1960");

    EXPECT_EQ(blocks[1].kind, BlockKind::Image);
    EXPECT_FALSE(blocks[1].role.has_value());
    EXPECT_EQ(blocks[1].image_size, cv::Size(200, 200));

    EXPECT_EQ(blocks[2].role, Role::Image);
    EXPECT_GT(blocks[2].chessboard_confidence, 0.0);

    EXPECT_FALSE(blocks[3].header_match);
    EXPECT_TRUE(blocks[3].solution_match);
    EXPECT_EQ(blocks[3].role, Role::Solution);
    EXPECT_EQ(blocks[3].global_index, 3);
}

TEST(InspectBlocks, StopsAtPageEndAndLeavesExtractionUnchanged) {
    ExtractorConfig cfg;
    cfg.page_end = 2;
    EXPECT_EQ(InspectBlocks(MakeBook(3), cfg).size(), 6u);

    ExtractorConfig inspecting;
    inspecting.inspect_blocks = true;
    DiagramRunResult plain    = ExtractDiagrams(MakeBook(2), ExtractorConfig{});
    DiagramRunResult with     = ExtractDiagrams(MakeBook(2), inspecting);
    ASSERT_EQ(with.diagrams.size(), plain.diagrams.size());
    EXPECT_EQ(with.diagrams[1].solution_move_clean, plain.diagrams[1].solution_move_clean);
    EXPECT_EQ(with.summary.images, plain.summary.images);
}

TEST(ExtractDiagrams, FromDocumentHonorsPageRange) {
    FakeBook book(5);
    ExtractorConfig cfg;
    cfg.page_start = 2;
    cfg.page_end   = 3;

    DiagramRunResult result = ExtractDiagrams(book, cfg);
    ASSERT_EQ(result.diagrams.size(), 2u);
    EXPECT_EQ(result.diagrams[0].image_page, 2);
    EXPECT_EQ(result.diagrams[1].image_page, 3);
    EXPECT_EQ(result.summary.pages, 2);

    cfg.max_search_distance = 0;
    EXPECT_THROW(ExtractDiagrams(book, cfg), ConfigError);
}

TEST(GridPipeline, AnalyzesEachCell) {
    ExtractorConfig cfg;
    cfg.grid.rows = 1;
    cfg.grid.cols = 2;

    int calls = 0;
    RecognitionClient client(
        RecognitionConfigFor().recognition,
        [&](const cv::Mat&) {
            ++calls;
            return RecognitionResult{"8/8/8/8/8/8/8/K6k", "w"};
        },
        [](std::chrono::milliseconds) {});

    FakeBook book(1);
    RunSummary summary;
    auto sections = AnalyzeGridPage(book.RenderPage(1, 144.0f), 1, cfg,
                                    [](const cv::Mat&) { return std::string("5"); }, &client, &summary);

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].diagram_number, 1);
    EXPECT_EQ(sections[1].diagram_number, 2);
    EXPECT_TRUE(sections[0].is_chessboard);
    EXPECT_FALSE(sections[1].is_chessboard);
    ASSERT_EQ(sections[0].bubbles.size(), 1u);
    EXPECT_EQ(sections[0].bubbles[0].digit, 5);
    EXPECT_EQ(sections[0].bubbles[0].fill_style, FillStyle::Outlined);
    EXPECT_TRUE(sections[1].bubbles.empty());
    EXPECT_EQ(sections[0].fen, "8/8/8/8/8/8/8/K6k");
    EXPECT_FALSE(sections[1].fen.has_value());
    EXPECT_EQ(calls, 1);

    EXPECT_EQ(summary.sections, 2);
    EXPECT_EQ(summary.chessboard_sections, 1);
    EXPECT_EQ(summary.bubbles, 1);

    EXPECT_THROW(AnalyzeGridPage(cv::Mat(), 1, cfg, nullptr), InputError);
}

TEST(GridPipeline, FailedPagesAreCounted) {
    ExtractorConfig cfg;
    FakeBook book(3);
    book.failing_ = {2};

    GridRunResult result = ExtractGridSections(book, cfg, nullptr);
    EXPECT_EQ(result.summary.pages, 2);
    EXPECT_EQ(result.summary.pages_failed, 1);
    EXPECT_EQ(result.sections.size(), 12u);
    EXPECT_EQ(book.rendered, 2);
    EXPECT_EQ(result.sections.front().page, 1);
    EXPECT_EQ(result.sections.back().page, 3);
}

TEST(GridPipeline, OpenCvFailureIsContainedToItsPage) {
    ExtractorConfig cfg;
    FakeBook book(3);
    book.corrupt_ = {1};

    GridRunResult result = ExtractGridSections(book, cfg, nullptr);
    EXPECT_EQ(result.summary.pages, 2);
    EXPECT_EQ(result.summary.pages_failed, 1);
    EXPECT_EQ(result.sections.size(), 12u);
    EXPECT_EQ(result.sections.front().page, 2);
}

TEST(GridPipeline, DeliversEachPageAndWritesPreviews) {
    const auto dir = std::filesystem::temp_directory_path() / "chessscribe_grid_pages_test";
    std::filesystem::remove_all(dir);

    ExtractorConfig cfg;
    cfg.output.dir           = dir.string();
    cfg.output.save_previews = true;
    FakeBook book(3);
    book.failing_ = {2};

    std::vector<int> delivered;
    size_t delivered_sections = 0;
    GridRunResult result = ExtractGridSections(book, cfg, nullptr, nullptr,
                                               [&](int page, const std::vector<GridSection>& sections) {
                                                   delivered.push_back(page);
                                                   delivered_sections += sections.size();
                                                   for (const GridSection& s : sections) {
                                                       EXPECT_EQ(s.page, page);
                                                   }
                                               });

    EXPECT_EQ(delivered, std::vector<int>({1, 3}));
    EXPECT_EQ(delivered_sections, result.sections.size());

    const std::filesystem::path previews(cfg.output.PreviewsDir());
    EXPECT_TRUE(std::filesystem::exists(previews / "preview_page_1.png"));
    EXPECT_FALSE(std::filesystem::exists(previews / "preview_page_2.png"));
    EXPECT_TRUE(std::filesystem::exists(previews / "preview_page_3.png"));
    EXPECT_EQ(result.summary.images_saved, 2);

    std::filesystem::remove_all(dir);
}
