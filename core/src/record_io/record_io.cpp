#include "chessscribe/record_io.h"
#include "chessscribe/error.h"
#include "chessscribe/notation.h"
#include "detail/json_utils.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace ChessScribe {

using nlohmann::json;

namespace {

constexpr const char* kUtf8Bom          = "\xEF\xBB\xBF";
constexpr const char* kCsvLineEnd       = "\r\n";
constexpr const char* kPlaceholderDigit = "0";
constexpr const char* kPlaceholderStyle = "placeholder";
constexpr int kPlaceholderBubbles       = 2;

template <typename T>
static std::string OptionalCell(const std::optional<T>& value) {
    if (!value) { return {}; }
    if constexpr (std::is_same_v<T, std::string>) {
        return *value;
    } else {
        return std::to_string(*value);
    }
}

static std::string FormatConfidence(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    return ss.str();
}

static std::string RectCell(const cv::Rect& r) {
    return std::to_string(r.x) + "," + std::to_string(r.y) + "," + std::to_string(r.width) + "," +
           std::to_string(r.height);
}

static std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) { out += sep; }
        out += parts[i];
    }
    return out;
}

static std::ofstream OpenForWrite(const std::string& path) {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) { throw IOError("Failed to create directory for " + path + ": " + ec.message()); }
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) { throw IOError("Failed to open file: " + path); }
    return out;
}

static void WriteCsvRow(std::ostream& out, const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) { out << ','; }
        out << QuoteCsvField(row[i]);
    }
    out << kCsvLineEnd;
}

static void WriteCsv(const std::string& path, const std::vector<std::string>& header,
                     const std::vector<std::vector<std::string>>& rows) {
    std::ofstream out = OpenForWrite(path);
    out << kUtf8Bom;
    WriteCsvRow(out, header);
    for (const auto& row : rows) { WriteCsvRow(out, row); }
    if (!out.good()) { throw IOError("Failed to write csv: " + path); }
}

static void WriteJson(const std::string& path, const json& j) {
    std::ofstream out = OpenForWrite(path);
    out << j.dump(2);
    if (!out.good()) { throw IOError("Failed to write json: " + path); }
}

} // namespace

const std::vector<std::string>& DiagramFieldNames() {
    static const std::vector<std::string> names = {
        "diagram_number", "players", "year",
        "image_page", "header_page", "solution_page",
        "solution_move_number", "solution_move_clean", "solution_move_annotated",
        "solution_full_move", "solution_full_text", "turn_from_text",
        "fen", "turn_from_api", "image_path",
        "chessboard_confidence", "header_global_index", "image_global_index",
        "solution_global_index",
    };
    return names;
}

const std::vector<std::string>& GridSectionFieldNames() {
    static const std::vector<std::string> names = {
        "page_number", "section_number", "row", "col",
        "chessboard_detected", "chessboard_confidence",
        "bubble_count", "bubble_numbers", "bubble_colors", "bubble_details",
        "diagram_number", "fen", "turn", "image_path", "coordinates",
    };
    return names;
}

json DiagramToJson(const Diagram& d) {
    json j;
    j["diagram_number"]          = detail::OptionalToJson(d.diagram_number);
    j["players"]                 = detail::OptionalToJson(d.players);
    j["year"]                    = detail::OptionalToJson(d.year);
    j["image_page"]              = d.image_page;
    j["header_page"]             = detail::OptionalToJson(d.header_page);
    j["solution_page"]           = detail::OptionalToJson(d.solution_page);
    j["solution_move_number"]    = detail::OptionalToJson(d.solution_move_number);
    j["solution_move_clean"]     = detail::OptionalToJson(d.solution_move_clean);
    j["solution_move_annotated"] = detail::OptionalToJson(d.solution_move_annotated);
    j["solution_full_move"]      = detail::OptionalToJson(d.solution_full_move);
    j["solution_full_text"]      = detail::OptionalToJson(d.solution_full_text);
    j["turn_from_text"]          = detail::OptionalToJson(d.turn_from_text);
    j["fen"]                     = detail::OptionalToJson(d.fen);
    j["turn_from_api"]           = detail::OptionalToJson(d.turn_from_api);
    j["image_path"]              = detail::OptionalToJson(d.image_path);
    j["chessboard_confidence"]   = d.chessboard_confidence;
    j["header_global_index"]     = detail::OptionalToJson(d.header_global_index);
    j["image_global_index"]      = d.image_global_index;
    j["solution_global_index"]   = detail::OptionalToJson(d.solution_global_index);
    return j;
}

json GridSectionToJson(const GridSection& s) {
    json j;
    j["page_number"]           = s.page;
    j["section_number"]        = s.section_number;
    j["row"]                   = s.row;
    j["col"]                   = s.col;
    j["chessboard_detected"]   = s.is_chessboard;
    j["chessboard_confidence"] = s.chessboard_confidence;
    j["diagram_number"]        = s.diagram_number;
    j["fen"]                   = detail::OptionalToJson(s.fen);
    j["turn"]                  = detail::OptionalToJson(s.turn);
    j["image_path"]            = detail::OptionalToJson(s.image_path);
    j["coordinates"]           = {s.bbox.x, s.bbox.y, s.bbox.width, s.bbox.height};

    j["bubbles"] = json::array();
    for (const Bubble& b : s.bubbles) {
        json jb;
        jb["digit"]       = detail::OptionalToJson(b.digit);
        jb["fill_style"]  = ToFillStyleString(b.fill_style);
        jb["bbox"]        = {b.bbox.x, b.bbox.y, b.bbox.width, b.bbox.height};
        jb["circularity"] = b.circularity;
        j["bubbles"].push_back(jb);
    }
    return j;
}

std::vector<std::string> DiagramToCsvRow(const Diagram& d) {
    return {
        OptionalCell(d.diagram_number),
        OptionalCell(d.players),
        OptionalCell(d.year),
        std::to_string(d.image_page),
        OptionalCell(d.header_page),
        OptionalCell(d.solution_page),
        OptionalCell(d.solution_move_number),
        OptionalCell(d.solution_move_clean),
        OptionalCell(d.solution_move_annotated),
        ToCsvSafeText(OptionalCell(d.solution_full_move)),
        ToCsvSafeText(OptionalCell(d.solution_full_text)),
        OptionalCell(d.turn_from_text),
        OptionalCell(d.fen),
        OptionalCell(d.turn_from_api),
        OptionalCell(d.image_path),
        FormatConfidence(d.chessboard_confidence),
        OptionalCell(d.header_global_index),
        std::to_string(d.image_global_index),
        OptionalCell(d.solution_global_index),
    };
}

std::vector<std::string> GridSectionToCsvRow(const GridSection& s, bool pad_empty_bubbles) {
    std::vector<std::string> numbers;
    std::vector<std::string> styles;
    std::vector<std::string> details;
    for (const Bubble& b : s.bubbles) {
        numbers.push_back(OptionalCell(b.digit));
        styles.push_back(ToFillStyleString(b.fill_style));
        details.push_back(numbers.back() + "_" + styles.back());
    }
    if (s.bubbles.empty() && pad_empty_bubbles) {
        for (int i = 0; i < kPlaceholderBubbles; ++i) {
            numbers.emplace_back(kPlaceholderDigit);
            styles.emplace_back(kPlaceholderStyle);
            details.push_back(std::string(kPlaceholderDigit) + "_" + kPlaceholderStyle);
        }
    }

    return {
        std::to_string(s.page),
        std::to_string(s.section_number),
        std::to_string(s.row),
        std::to_string(s.col),
        s.is_chessboard ? "true" : "false",
        FormatConfidence(s.chessboard_confidence),
        std::to_string(s.bubbles.size()),
        Join(numbers, ","),
        Join(styles, ","),
        Join(details, ","),
        std::to_string(s.diagram_number),
        OptionalCell(s.fen),
        OptionalCell(s.turn),
        OptionalCell(s.image_path),
        RectCell(s.bbox),
    };
}

std::string QuoteCsvField(const std::string& field) {
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') { out += '"'; }
        out += c;
    }
    out += '"';
    return out;
}

void WriteDiagramsJson(const std::string& path, const std::vector<Diagram>& diagrams) {
    json j = json::array();
    for (const Diagram& d : diagrams) { j.push_back(DiagramToJson(d)); }
    WriteJson(path, j);
    spdlog::info("Wrote {} diagrams to {}", diagrams.size(), path);
}

void WriteDiagramsCsv(const std::string& path, const std::vector<Diagram>& diagrams) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(diagrams.size());
    for (const Diagram& d : diagrams) { rows.push_back(DiagramToCsvRow(d)); }
    WriteCsv(path, DiagramFieldNames(), rows);
    spdlog::info("Wrote {} diagrams to {}", diagrams.size(), path);
}

void WriteGridSectionsJson(const std::string& path, const std::vector<GridSection>& sections) {
    json j = json::array();
    for (const GridSection& s : sections) { j.push_back(GridSectionToJson(s)); }
    WriteJson(path, j);
    spdlog::info("Wrote {} sections to {}", sections.size(), path);
}

void WriteGridSectionsCsv(const std::string& path, const std::vector<GridSection>& sections,
                          bool pad_empty_bubbles) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(sections.size());
    for (const GridSection& s : sections) { rows.push_back(GridSectionToCsvRow(s, pad_empty_bubbles)); }
    WriteCsv(path, GridSectionFieldNames(), rows);
    spdlog::info("Wrote {} sections to {}", sections.size(), path);
}

GridCsvWriter::GridCsvWriter(const std::string& path, bool pad_empty_bubbles)
    : path_(path), pad_empty_bubbles_(pad_empty_bubbles), out_(OpenForWrite(path)) {
    out_ << kUtf8Bom;
    WriteCsvRow(out_, GridSectionFieldNames());
    out_.flush();
    if (!out_.good()) { throw IOError("Failed to write csv: " + path_); }
}

void GridCsvWriter::Append(const std::vector<GridSection>& sections) {
    for (const GridSection& s : sections) {
        WriteCsvRow(out_, GridSectionToCsvRow(s, pad_empty_bubbles_));
        ++rows_written_;
    }
    out_.flush();
    if (!out_.good()) { throw IOError("Failed to write csv: " + path_); }
}

} // namespace ChessScribe
