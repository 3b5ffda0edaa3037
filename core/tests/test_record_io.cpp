#include <gtest/gtest.h>
#include "chessscribe/record_io.h"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace ChessScribe;

static Diagram MakeFullDiagram() {
    Diagram d;
    d.diagram_number          = 12;
    d.players                 = "Alekhine - Capablanca";
    d.year                    = "1927";
    d.image_page              = 5;
    d.header_page             = 4;
    d.solution_page           = 5;
    d.solution_move_number    = 31;
    d.solution_move_clean     = "Qxf7+";
    d.solution_move_annotated = "Qxf7+!!";
    d.solution_full_move      = "31.Qxf7+!! Kxf7\n32.Rd7+";
    d.solution_full_text      = "31.Qxf7+!! Kxf7\n32.Rd7+ wins";
    d.turn_from_text          = "white";
    d.fen                     = "8/8/8/8/8/8/8/K6k";
    d.turn_from_api           = "w";
    d.image_path              = "out/diagram_012_page_5.png";
    d.chessboard_confidence   = 0.87654;
    d.header_global_index     = 40;
    d.image_global_index      = 41;
    d.solution_global_index   = 43;
    return d;
}

static std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST(DiagramRecord, CrossPage) {
    Diagram d;
    d.image_page = 3;
    EXPECT_FALSE(d.IsCrossPage());

    d.solution_page = 4;
    EXPECT_TRUE(d.IsCrossPage());

    d.header_page = 3;
    EXPECT_FALSE(d.IsCrossPage());

    d.header_page = 2;
    EXPECT_TRUE(d.IsCrossPage());
}

TEST(DiagramRecord, JsonKeysFollowFieldNames) {
    nlohmann::json j = DiagramToJson(MakeFullDiagram());
    ASSERT_EQ(j.size(), DiagramFieldNames().size());
    for (const std::string& name : DiagramFieldNames()) { EXPECT_TRUE(j.contains(name)) << name; }

    EXPECT_EQ(j["diagram_number"], 12);
    EXPECT_EQ(j["players"], "Alekhine - Capablanca");
    EXPECT_EQ(j["solution_full_text"], "31.Qxf7+!! Kxf7\n32.Rd7+ wins");
    EXPECT_EQ(j["image_global_index"], 41);
}

TEST(DiagramRecord, AbsentFieldsAreNull) {
    Diagram d;
    d.image_page         = 2;
    d.image_global_index = 7;
    nlohmann::json j     = DiagramToJson(d);

    EXPECT_TRUE(j["diagram_number"].is_null());
    EXPECT_TRUE(j["header_page"].is_null());
    EXPECT_TRUE(j["solution_move_clean"].is_null());
    EXPECT_TRUE(j["fen"].is_null());
    EXPECT_TRUE(j["image_path"].is_null());
    EXPECT_EQ(j["image_page"], 2);
}

TEST(DiagramRecord, CsvRow) {
    std::vector<std::string> row = DiagramToCsvRow(MakeFullDiagram());
    ASSERT_EQ(row.size(), DiagramFieldNames().size());
    EXPECT_EQ(row[0], "12");
    EXPECT_EQ(row[9], "31.Qxf7+!! Kxf7 32.Rd7+");
    EXPECT_EQ(row[10], "31.Qxf7+!! Kxf7 32.Rd7+ wins");
    EXPECT_EQ(row[15], "0.877");

    Diagram empty;
    std::vector<std::string> sparse = DiagramToCsvRow(empty);
    EXPECT_EQ(sparse[0], "");
    EXPECT_EQ(sparse[3], "0");
    EXPECT_EQ(sparse[15], "0.000");
}

TEST(Csv, QuoteField) {
    EXPECT_EQ(QuoteCsvField(""), "\"\"");
    EXPECT_EQ(QuoteCsvField("a,b"), "\"a,b\"");
    EXPECT_EQ(QuoteCsvField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

static GridSection MakeSection(bool with_bubbles) {
    GridSection s;
    s.page                  = 9;
    s.row                   = 1;
    s.col                   = 0;
    s.section_number        = 3;
    s.diagram_number        = 2;
    s.bbox                  = cv::Rect(0, 400, 500, 400);
    s.is_chessboard         = true;
    s.chessboard_confidence = 0.5;
    if (with_bubbles) {
        Bubble a;
        a.digit      = 3;
        a.fill_style = FillStyle::Outlined;
        Bubble b;
        b.fill_style = FillStyle::Filled;
        s.bubbles    = {a, b};
    }
    return s;
}

TEST(GridRecord, CsvRowWithBubbles) {
    std::vector<std::string> row = GridSectionToCsvRow(MakeSection(true), true);
    ASSERT_EQ(row.size(), GridSectionFieldNames().size());
    EXPECT_EQ(row[0], "9");
    EXPECT_EQ(row[4], "true");
    EXPECT_EQ(row[5], "0.500");
    EXPECT_EQ(row[6], "2");
    EXPECT_EQ(row[7], "3,");
    EXPECT_EQ(row[8], "outlined,filled");
    EXPECT_EQ(row[9], "3_outlined,_filled");
    EXPECT_EQ(row[14], "0,400,500,400");
}

TEST(GridRecord, PlaceholderPadding) {
    std::vector<std::string> padded = GridSectionToCsvRow(MakeSection(false), true);
    EXPECT_EQ(padded[6], "0");
    EXPECT_EQ(padded[7], "0,0");
    EXPECT_EQ(padded[8], "placeholder,placeholder");
    EXPECT_EQ(padded[9], "0_placeholder,0_placeholder");

    std::vector<std::string> plain = GridSectionToCsvRow(MakeSection(false), false);
    EXPECT_EQ(plain[7], "");
    EXPECT_EQ(plain[8], "");
}

TEST(GridRecord, JsonHasNoPlaceholders) {
    nlohmann::json j = GridSectionToJson(MakeSection(false));
    EXPECT_TRUE(j["bubbles"].is_array());
    EXPECT_TRUE(j["bubbles"].empty());
    EXPECT_TRUE(j["fen"].is_null());
    EXPECT_EQ(j["coordinates"], nlohmann::json({0, 400, 500, 400}));

    nlohmann::json with = GridSectionToJson(MakeSection(true));
    ASSERT_EQ(with["bubbles"].size(), 2u);
    EXPECT_EQ(with["bubbles"][0]["digit"], 3);
    EXPECT_TRUE(with["bubbles"][1]["digit"].is_null());
    EXPECT_EQ(with["bubbles"][1]["fill_style"], "filled");
}

TEST(RecordFiles, WritesCsvAndJson) {
    const auto dir = std::filesystem::temp_directory_path() / "chessscribe_record_test";
    std::filesystem::remove_all(dir);

    const auto csv_path  = dir / "nested" / "book_diagrams.csv";
    const auto json_path = dir / "nested" / "book_diagrams.json";
    WriteDiagramsCsv(csv_path.string(), {MakeFullDiagram(), Diagram{}});
    WriteDiagramsJson(json_path.string(), {MakeFullDiagram()});

    const std::string csv = ReadAll(csv_path);
    ASSERT_GE(csv.size(), 3u);
    EXPECT_EQ(csv.substr(0, 3), "\xEF\xBB\xBF");
    EXPECT_EQ(csv.substr(3, 18), "\"diagram_number\",\"");
    EXPECT_NE(csv.find("\r\n\"12\",\"Alekhine - Capablanca\""), std::string::npos);

    // One header line and two records.
    size_t lines = 0;
    for (size_t pos = csv.find("\r\n"); pos != std::string::npos; pos = csv.find("\r\n", pos + 2)) { ++lines; }
    EXPECT_EQ(lines, 3u);

    nlohmann::json j = nlohmann::json::parse(ReadAll(json_path));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["fen"], "8/8/8/8/8/8/8/K6k");

    WriteGridSectionsCsv((dir / "grid.csv").string(), {MakeSection(false)}, true);
    EXPECT_NE(ReadAll(dir / "grid.csv").find("\"0_placeholder,0_placeholder\""), std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(RecordFiles, GridCsvGrowsPageByPage) {
    const auto dir = std::filesystem::temp_directory_path() / "chessscribe_grid_csv_test";
    std::filesystem::remove_all(dir);
    const auto path = dir / "book_sections.csv";

    auto count_lines = [](const std::string& text) {
        size_t lines = 0;
        for (size_t pos = text.find("\r\n"); pos != std::string::npos; pos = text.find("\r\n", pos + 2)) {
            ++lines;
        }
        return lines;
    };

    GridCsvWriter writer(path.string(), true);
    std::string csv = ReadAll(path);
    EXPECT_EQ(csv.substr(0, 3), "\xEF\xBB\xBF");
    EXPECT_EQ(count_lines(csv), 1u);

    // Rows are on disk while the writer is still open.
    writer.Append({MakeSection(true), MakeSection(false)});
    csv = ReadAll(path);
    EXPECT_EQ(count_lines(csv), 3u);
    EXPECT_NE(csv.find("\"3_outlined,_filled\""), std::string::npos);

    writer.Append({MakeSection(false)});
    EXPECT_EQ(count_lines(ReadAll(path)), 4u);
    EXPECT_EQ(writer.rows_written(), 3);

    std::filesystem::remove_all(dir);
}
