#include "chessscribe/config.h"
#include "chessscribe/error.h"
#include "detail/json_utils.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace ChessScribe {

using nlohmann::json;

namespace {

static PatternSpec PatternFromJson(const json& j, const PatternSpec& fallback) {
    // A bare string keeps the default group layout.
    if (j.is_string()) {
        PatternSpec spec = fallback;
        spec.regex       = j.get<std::string>();
        return spec;
    }
    if (!j.is_object()) { throw FormatError("pattern must be a string or an object"); }

    PatternSpec spec;
    spec.regex = j.value("regex", fallback.regex);
    if (!j.contains("groups")) {
        spec.groups = fallback.groups;
        return spec;
    }
    const auto& groups = j.at("groups");
    if (!groups.is_object()) { throw FormatError("pattern groups must be an object"); }
    for (const auto& [name, index] : groups.items()) {
        if (!index.is_number_integer()) { throw FormatError("group index of '" + name + "' must be an integer"); }
        spec.groups[FromCaptureRoleString(name)] = index.get<int>();
    }
    return spec;
}

static json PatternToJson(const PatternSpec& spec) {
    json j;
    j["regex"]  = spec.regex;
    j["groups"] = json::object();
    for (const auto& [role, index] : spec.groups) { j["groups"][ToCaptureRoleString(role)] = index; }
    return j;
}

static void ReadChessboard(const json& j, ChessboardConfig& c) {
    c.canny_low               = j.value("canny_low", c.canny_low);
    c.canny_high              = j.value("canny_high", c.canny_high);
    c.epsilon_ratio           = j.value("epsilon_ratio", c.epsilon_ratio);
    c.cell_aspect_min         = j.value("cell_aspect_min", c.cell_aspect_min);
    c.cell_aspect_max         = j.value("cell_aspect_max", c.cell_aspect_max);
    c.min_cell_px             = j.value("min_cell_px", c.min_cell_px);
    c.min_square_count        = j.value("min_square_count", c.min_square_count);
    c.max_square_count        = j.value("max_square_count", c.max_square_count);
    c.saturation_square_count = j.value("saturation_square_count", c.saturation_square_count);
    c.max_region_aspect       = j.value("max_region_aspect", c.max_region_aspect);
    c.uniformity_tolerance    = j.value("uniformity_tolerance", c.uniformity_tolerance);
    c.min_uniform_fraction    = j.value("min_uniform_fraction", c.min_uniform_fraction);
}

static json ChessboardToJson(const ChessboardConfig& c) {
    json j;
    j["canny_low"]               = c.canny_low;
    j["canny_high"]              = c.canny_high;
    j["epsilon_ratio"]           = c.epsilon_ratio;
    j["cell_aspect_min"]         = c.cell_aspect_min;
    j["cell_aspect_max"]         = c.cell_aspect_max;
    j["min_cell_px"]             = c.min_cell_px;
    j["min_square_count"]        = c.min_square_count;
    j["max_square_count"]        = c.max_square_count;
    j["saturation_square_count"] = c.saturation_square_count;
    j["max_region_aspect"]       = c.max_region_aspect;
    j["uniformity_tolerance"]    = c.uniformity_tolerance;
    j["min_uniform_fraction"]    = c.min_uniform_fraction;
    return j;
}

static void ReadGrid(const json& j, GridConfig& g) {
    g.rows                = j.value("rows", g.rows);
    g.cols                = j.value("cols", g.cols);
    g.render_dpi          = j.value("render_dpi", g.render_dpi);
    g.first_numbered_page = j.value("first_numbered_page", g.first_numbered_page);
    g.body_padding_px     = j.value("body_padding_px", g.body_padding_px);
}

static void ReadBubble(const json& j, BubbleConfig& b) {
    b.bubble_area_ratio = j.value("bubble_area_ratio", b.bubble_area_ratio);
    b.bubble_area_px    = j.value("bubble_area_px", b.bubble_area_px);
    b.skip_left_ratio   = j.value("skip_left_ratio", b.skip_left_ratio);
    b.min_area          = j.value("min_area", b.min_area);
    b.max_area          = j.value("max_area", b.max_area);
    b.min_circularity   = j.value("min_circularity", b.min_circularity);
    b.min_aspect        = j.value("min_aspect", b.min_aspect);
    b.max_aspect        = j.value("max_aspect", b.max_aspect);
    b.fill_threshold    = j.value("fill_threshold", b.fill_threshold);
    b.min_separation_px = j.value("min_separation_px", b.min_separation_px);
    b.max_bubbles       = j.value("max_bubbles", b.max_bubbles);
    b.ocr_scale         = j.value("ocr_scale", b.ocr_scale);
}

static void ReadRecognition(const json& j, RecognitionConfig& r) {
    r.enabled     = j.value("enabled", r.enabled);
    r.endpoint    = j.value("endpoint", r.endpoint);
    r.path        = j.value("path", r.path);
    r.min_delay_s = j.value("min_delay_s", r.min_delay_s);
    r.max_delay_s = j.value("max_delay_s", r.max_delay_s);
    r.timeout_s   = j.value("timeout_s", r.timeout_s);
    r.seed        = j.value("seed", r.seed);
}

static void ReadOcr(const json& j, OcrConfig& o) {
    o.tessdata_path  = j.value("tessdata_path", o.tessdata_path);
    o.language       = j.value("language", o.language);
    o.min_confidence = j.value("min_confidence", o.min_confidence);
}

static void ReadOutput(const json& j, OutputConfig& o) {
    o.dir                        = j.value("dir", o.dir);
    o.images_subdir              = j.value("images_subdir", o.images_subdir);
    o.previews_subdir            = j.value("previews_subdir", o.previews_subdir);
    o.save_chessboard_images     = j.value("save_chessboard_images", o.save_chessboard_images);
    o.save_non_chessboard_images = j.value("save_non_chessboard_images", o.save_non_chessboard_images);
    o.save_all_images            = j.value("save_all_images", o.save_all_images);
    o.save_previews              = j.value("save_previews", o.save_previews);
    o.pad_empty_bubbles          = j.value("pad_empty_bubbles", o.pad_empty_bubbles);
    o.write_json                 = j.value("write_json", o.write_json);
    o.write_csv                  = j.value("write_csv", o.write_csv);
}

static const json& Section(const json& j, const char* key) {
    static const json kEmpty = json::object();
    if (!j.contains(key) || j.at(key).is_null()) { return kEmpty; }
    if (!j.at(key).is_object()) { throw FormatError(std::string("'") + key + "' must be an object"); }
    return j.at(key);
}

static ExtractorConfig ConfigFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("configuration must be a JSON object"); }

    ExtractorConfig cfg;
    try {
        cfg = ExtractorConfig::ForPreset(j.value("preset", cfg.preset));
        cfg.pdf_path            = j.value("pdf_path", cfg.pdf_path);
        cfg.page_start          = j.value("page_start", cfg.page_start);
        cfg.page_end            = j.value("page_end", cfg.page_end);
        cfg.max_diagrams        = j.value("max_diagrams", cfg.max_diagrams);
        cfg.max_search_distance = j.value("max_search_distance", cfg.max_search_distance);
        cfg.full_move_max_chars = j.value("full_move_max_chars", cfg.full_move_max_chars);
        cfg.inspect_blocks      = j.value("inspect_blocks", cfg.inspect_blocks);

        if (j.contains("diagram_structure")) {
            cfg.structure = detail::ParseDiagramStructure(j.at("diagram_structure"), cfg.structure);
        }
        if (j.contains("header_pattern")) {
            cfg.header_pattern = PatternFromJson(j.at("header_pattern"), BuiltinHeaderPattern());
        }
        if (j.contains("solution_pattern")) {
            cfg.solution_pattern = PatternFromJson(j.at("solution_pattern"), BuiltinSolutionPattern());
        }

        ReadChessboard(Section(j, "chessboard"), cfg.chessboard);
        ReadGrid(Section(j, "grid"), cfg.grid);
        ReadBubble(Section(j, "bubble"), cfg.bubble);
        ReadRecognition(Section(j, "recognition"), cfg.recognition);
        ReadOcr(Section(j, "ocr"), cfg.ocr);
        ReadOutput(Section(j, "output"), cfg.output);
    } catch (const json::exception& e) {
        throw FormatError(std::string("Invalid configuration value: ") + e.what());
    }
    return cfg;
}

static void Require(bool condition, const std::string& message) {
    if (!condition) { throw ConfigError(message); }
}

} // namespace

std::string OutputConfig::ImagesDir() const {
    return (std::filesystem::path(dir) / images_subdir).string();
}

std::string OutputConfig::PreviewsDir() const {
    return (std::filesystem::path(dir) / previews_subdir).string();
}

ExtractorConfig ExtractorConfig::ForPreset(const std::string& name) {
    ExtractorConfig cfg;
    cfg.preset = name;
    if (name == "woodpecker") { return cfg; }
    if (name == "combinational_motifs") {
        cfg.structure                = DiagramStructure::Flexible;
        cfg.grid.rows                = 3;
        cfg.grid.cols                = 2;
        cfg.grid.render_dpi          = 144.0f;
        cfg.output.images_subdir     = "section_images";
        cfg.output.pad_empty_bubbles = true;
        return cfg;
    }
    throw ConfigError("Unknown preset: " + name);
}

void ExtractorConfig::Validate() const {
    Require(page_start >= 0 && page_end >= 0, "page_start and page_end must be non-negative");
    Require(page_start == 0 || page_end == 0 || page_start <= page_end,
            "page_start must not exceed page_end");
    Require(max_diagrams >= 0, "max_diagrams must be non-negative");
    Require(max_search_distance >= 1, "max_search_distance must be at least 1");
    Require(full_move_max_chars >= 0, "full_move_max_chars must be non-negative");

    // Compile both patterns; Pattern::Compile reports the details.
    Pattern::Compile(header_pattern);
    Pattern::Compile(solution_pattern);

    const ChessboardConfig& c = chessboard;
    Require(c.canny_low >= 0.0 && c.canny_low <= c.canny_high, "chessboard: canny thresholds out of order");
    Require(c.epsilon_ratio > 0.0 && c.epsilon_ratio < 1.0, "chessboard: epsilon_ratio must be in (0, 1)");
    Require(c.cell_aspect_min > 0.0f && c.cell_aspect_min <= c.cell_aspect_max,
            "chessboard: cell aspect range out of order");
    Require(c.min_cell_px >= 1, "chessboard: min_cell_px must be at least 1");
    Require(c.min_square_count >= 0, "chessboard: min_square_count must be non-negative");
    Require(c.max_square_count == 0 || c.max_square_count >= c.min_square_count,
            "chessboard: max_square_count below min_square_count");
    Require(c.saturation_square_count >= 1, "chessboard: saturation_square_count must be at least 1");
    Require(c.max_region_aspect >= 0.0f, "chessboard: max_region_aspect must be non-negative");
    Require(c.uniformity_tolerance >= 1.0, "chessboard: uniformity_tolerance must be at least 1");
    Require(c.min_uniform_fraction >= 0.0 && c.min_uniform_fraction <= 1.0,
            "chessboard: min_uniform_fraction must be in [0, 1]");

    Require(grid.rows >= 1 && grid.rows <= GridConfig::kMaxCells, "grid: rows must be in [1, 12]");
    Require(grid.cols >= 1 && grid.cols <= GridConfig::kMaxCells, "grid: cols must be in [1, 12]");
    Require(grid.render_dpi > 0.0f, "grid: render_dpi must be positive");
    Require(grid.first_numbered_page >= 0, "grid: first_numbered_page must be non-negative");
    Require(grid.body_padding_px >= 0, "grid: body_padding_px must be non-negative");

    const BubbleConfig& b = bubble;
    Require(b.bubble_area_ratio > 0.0f && b.bubble_area_ratio < 1.0f,
            "bubble: bubble_area_ratio must be in (0, 1)");
    Require(b.bubble_area_px >= 0, "bubble: bubble_area_px must be non-negative");
    Require(b.skip_left_ratio >= 0.0f && b.skip_left_ratio < 1.0f,
            "bubble: skip_left_ratio must be in [0, 1)");
    Require(b.min_area >= 0.0 && b.min_area <= b.max_area, "bubble: area range out of order");
    Require(b.min_circularity >= 0.0 && b.min_circularity <= 1.0,
            "bubble: min_circularity must be in [0, 1]");
    Require(b.min_aspect > 0.0f && b.min_aspect <= b.max_aspect, "bubble: aspect range out of order");
    Require(b.fill_threshold >= 0.0 && b.fill_threshold <= 255.0,
            "bubble: fill_threshold must be in [0, 255]");
    Require(b.min_separation_px >= 0, "bubble: min_separation_px must be non-negative");
    Require(b.max_bubbles >= 0, "bubble: max_bubbles must be non-negative");
    Require(b.ocr_scale >= 1, "bubble: ocr_scale must be at least 1");

    Require(recognition.min_delay_s >= 0.0, "recognition: min_delay_s must be non-negative");
    Require(recognition.min_delay_s <= recognition.max_delay_s,
            "recognition: min_delay_s must not exceed max_delay_s");
    Require(recognition.timeout_s > 0.0, "recognition: timeout_s must be positive");
    Require(!recognition.enabled || !recognition.endpoint.empty(), "recognition: endpoint is empty");

    Require(ocr.min_confidence >= 0 && ocr.min_confidence <= 100,
            "ocr: min_confidence must be in [0, 100]");
    Require(!output.dir.empty(), "output: dir is empty");
}

ExtractorConfig ExtractorConfig::LoadFromJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw IOError("Failed to open file: " + path); }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) { throw FormatError("Malformed JSON in " + path); }
    ExtractorConfig cfg = ConfigFromJson(j);
    spdlog::info("Config loaded: preset={}, structure={}, path={}", cfg.preset,
                 ToDiagramStructureString(cfg.structure), path);
    return cfg;
}

ExtractorConfig ExtractorConfig::FromJsonString(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded()) { throw FormatError("Malformed JSON configuration"); }
    return ConfigFromJson(j);
}

std::string ExtractorConfig::ToJsonString() const {
    json j;
    j["preset"]              = preset;
    j["pdf_path"]            = pdf_path;
    j["page_start"]          = page_start;
    j["page_end"]            = page_end;
    j["max_diagrams"]        = max_diagrams;
    j["diagram_structure"]   = ToDiagramStructureString(structure);
    j["max_search_distance"] = max_search_distance;
    j["header_pattern"]      = PatternToJson(header_pattern);
    j["solution_pattern"]    = PatternToJson(solution_pattern);
    j["full_move_max_chars"] = full_move_max_chars;
    j["inspect_blocks"]      = inspect_blocks;
    j["chessboard"]          = ChessboardToJson(chessboard);

    j["grid"] = {{"rows", grid.rows},
                 {"cols", grid.cols},
                 {"render_dpi", grid.render_dpi},
                 {"first_numbered_page", grid.first_numbered_page},
                 {"body_padding_px", grid.body_padding_px}};

    j["bubble"] = {{"bubble_area_ratio", bubble.bubble_area_ratio},
                   {"bubble_area_px", bubble.bubble_area_px},
                   {"skip_left_ratio", bubble.skip_left_ratio},
                   {"min_area", bubble.min_area},
                   {"max_area", bubble.max_area},
                   {"min_circularity", bubble.min_circularity},
                   {"min_aspect", bubble.min_aspect},
                   {"max_aspect", bubble.max_aspect},
                   {"fill_threshold", bubble.fill_threshold},
                   {"min_separation_px", bubble.min_separation_px},
                   {"max_bubbles", bubble.max_bubbles},
                   {"ocr_scale", bubble.ocr_scale}};

    j["recognition"] = {{"enabled", recognition.enabled},
                        {"endpoint", recognition.endpoint},
                        {"path", recognition.path},
                        {"min_delay_s", recognition.min_delay_s},
                        {"max_delay_s", recognition.max_delay_s},
                        {"timeout_s", recognition.timeout_s},
                        {"seed", recognition.seed}};

    j["ocr"] = {{"tessdata_path", ocr.tessdata_path},
                {"language", ocr.language},
                {"min_confidence", ocr.min_confidence}};

    j["output"] = {{"dir", output.dir},
                   {"images_subdir", output.images_subdir},
                   {"previews_subdir", output.previews_subdir},
                   {"save_chessboard_images", output.save_chessboard_images},
                   {"save_non_chessboard_images", output.save_non_chessboard_images},
                   {"save_all_images", output.save_all_images},
                   {"save_previews", output.save_previews},
                   {"pad_empty_bubbles", output.pad_empty_bubbles},
                   {"write_json", output.write_json},
                   {"write_csv", output.write_csv}};
    return j.dump(4);
}

} // namespace ChessScribe
