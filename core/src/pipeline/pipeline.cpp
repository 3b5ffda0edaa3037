#include "chessscribe/pipeline.h"
#include "chessscribe/bubble.h"
#include "chessscribe/chessboard.h"
#include "chessscribe/encoding.h"
#include "chessscribe/error.h"
#include "chessscribe/notation.h"
#include "chessscribe/solution.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ChessScribe {
namespace {

std::string ImagePath(const ExtractorConfig& config, const std::string& file_name) {
    return (std::filesystem::path(config.output.ImagesDir()) / file_name).string();
}

// Normalizes a reported side to move, or nullopt when it cannot be read.
std::optional<Turn> ReadTurn(const std::string& text) {
    if (text.empty()) { return std::nullopt; }
    try {
        return FromTurnString(text);
    } catch (const FormatError&) { return std::nullopt; }
}

void AddRecognitionDelta(RunSummary& summary, const RecognitionStats& before,
                         const RecognitionStats& after) {
    summary.recognition_attempted += after.attempted - before.attempted;
    summary.recognition_succeeded += after.succeeded - before.succeeded;
    summary.recognition_failed += after.failed - before.failed;
}

constexpr int kInspectPreviewChars = 80;

std::string InspectPreview(const std::string& text) {
    const std::string line = ToCsvSafeText(text);
    std::string preview    = TruncateUtf8(line, kInspectPreviewChars);
    if (preview.size() < line.size()) { preview += "..."; }
    return preview;
}

bool SaveCounted(const cv::Mat& image, const std::string& path, RunSummary& summary) {
    if (SaveImage(image, path)) {
        ++summary.images_saved;
        return true;
    }
    ++summary.image_save_failures;
    spdlog::warn("Failed to save image {}", path);
    return false;
}

} // namespace

bool Diagram::IsCrossPage() const {
    const std::optional<int> reference = header_page ? header_page : solution_page;
    return reference && *reference != image_page;
}

void LogSummary(const RunSummary& s) {
    spdlog::info("Summary: pages={} (failed {}), blocks={}", s.pages, s.pages_failed, s.blocks);
    if (s.sections > 0) {
        spdlog::info("  sections={}, chessboards={}, bubbles={}", s.sections, s.chessboard_sections,
                     s.bubbles);
    } else {
        spdlog::info("  headers={}, solutions={}, images={} (non-chessboard {})", s.headers,
                     s.solutions, s.images, s.non_chessboard_images);
        spdlog::info("  diagrams={} (partial {}, cross-page {}), noise={}, unresolved={}",
                     s.diagrams, s.partial_diagrams, s.cross_page, s.dropped_as_noise,
                     s.unresolved);
        spdlog::info("  white to move={}, black to move={}, turn disagreements={}",
                     s.white_to_move, s.black_to_move, s.turn_disagreements);
    }
    if (s.recognition_attempted > 0) {
        spdlog::info("  recognition: attempted={}, succeeded={}, failed={}",
                     s.recognition_attempted, s.recognition_succeeded, s.recognition_failed);
    }
    if (s.images_saved > 0 || s.image_save_failures > 0) {
        spdlog::info("  images saved={}, save failures={}", s.images_saved, s.image_save_failures);
    }
    if (s.reached_max_diagrams) { spdlog::info("  stopped at the diagram limit"); }
}

std::vector<BlockInspection> InspectBlocks(const BlockStream& stream, const ExtractorConfig& config) {
    const Pattern header   = Pattern::Compile(config.header_pattern);
    const Pattern solution = Pattern::Compile(config.solution_pattern);
    const ChessboardValidator validator(config.chessboard);

    std::map<int, double> confidence;
    ImageAcceptor acceptor = [&](const Block& block) {
        const ChessboardVerdict verdict = validator.Validate(block.image);
        confidence[block.global_index]  = verdict.confidence;
        return verdict.is_chessboard;
    };
    const AssemblyContext context(stream, header, solution, acceptor, config.max_search_distance);

    std::vector<BlockInspection> out;
    int current_page = 0;
    int text_blocks  = 0;
    int image_blocks = 0;
    for (size_t pos = 0; pos < stream.size(); ++pos) {
        const Block& block = stream[pos];
        if (config.page_end > 0 && block.page > config.page_end) { break; }
        if (block.page != current_page) {
            current_page = block.page;
            spdlog::info("Page {} blocks:", current_page);
        }

        BlockInspection b;
        b.page         = block.page;
        b.index        = block.index;
        b.global_index = block.global_index;
        b.kind         = block.kind;
        b.bbox         = block.bbox;
        b.role         = context.RoleOf(pos);

        const std::string role = b.role ? ToRoleString(*b.role) : "-";
        if (block.IsText()) {
            ++text_blocks;
            b.text           = InspectPreview(block.text);
            b.header_match   = Matches(header, block.text);
            b.solution_match = Matches(solution, block.text);
            spdlog::info("  {:3d}. [TEXT] #{} pos:({:.0f},{:.0f}) \"{}\" -> {}{}", b.index + 1,
                         b.global_index, b.bbox.x, b.bbox.y, b.text, role,
                         b.header_match && b.solution_match ? " (also matches solution)" : "");
        } else {
            ++image_blocks;
            b.image_size = block.image.size();
            auto it      = confidence.find(block.global_index);
            if (it != confidence.end()) { b.chessboard_confidence = it->second; }
            spdlog::info("  {:3d}. [IMAGE] #{} pos:({:.0f},{:.0f}) {}x{} -> {} (chessboard {:.2f})",
                         b.index + 1, b.global_index, b.bbox.x, b.bbox.y, b.image_size.width,
                         b.image_size.height, role, b.chessboard_confidence);
        }
        out.push_back(std::move(b));
    }

    spdlog::info("Inspection: {} text blocks, {} image blocks", text_blocks, image_blocks);
    return out;
}

Diagram BuildDiagram(const BlockStream& stream, const Assembly& assembly, const Pattern& header,
                     const Pattern& solution, int full_move_max_chars) {
    const RoleAssignment& roles = assembly.roles;
    if (!roles.image) { throw InputError("BuildDiagram: assembly has no image"); }

    Diagram d;
    const Block& image   = stream[*roles.image];
    d.image_page         = image.page;
    d.image_global_index = image.global_index;

    if (roles.header) {
        const Block& block    = stream[*roles.header];
        d.header_page         = block.page;
        d.header_global_index = block.global_index;
        if (auto info = MatchHeader(header, block.text)) {
            d.diagram_number = info->diagram_number;
            d.players        = info->players;
            d.year           = info->year;
        }
    }

    if (roles.solution) {
        const Block& block      = stream[*roles.solution];
        d.solution_page         = block.page;
        d.solution_global_index = block.global_index;
        if (auto details = ParseSolution(solution, block.text, full_move_max_chars)) {
            d.solution_move_number    = details->move_number;
            d.solution_move_clean     = details->move_clean;
            d.solution_move_annotated = details->move_annotated;
            d.solution_full_move      = details->full_move;
            d.solution_full_text      = details->full_text;
            d.turn_from_text          = ToTurnString(details->turn);
        }
    }
    return d;
}

DiagramRunResult ExtractDiagrams(DocumentSource& source, const ExtractorConfig& config,
                                 RecognitionClient* recognition) {
    config.Validate();
    BlockStream stream = BuildBlockStream(source, config.Pages());
    return ExtractDiagrams(stream, config, recognition);
}

DiagramRunResult ExtractDiagrams(const BlockStream& stream, const ExtractorConfig& config,
                                 RecognitionClient* recognition) {
    DiagramRunResult result;
    RunSummary& summary  = result.summary;
    summary.pages        = stream.pages_visited;
    summary.pages_failed = stream.pages_failed;
    summary.blocks       = static_cast<int>(stream.size());

    if (config.inspect_blocks) { InspectBlocks(stream, config); }

    // === 1. Matchers and image acceptor ===
    const Pattern header   = Pattern::Compile(config.header_pattern);
    const Pattern solution = Pattern::Compile(config.solution_pattern);
    const ChessboardValidator validator(config.chessboard);

    std::map<int, ChessboardVerdict> verdicts;
    ImageAcceptor acceptor = [&](const Block& block) {
        if (config.output.save_all_images) {
            const std::string name =
                fmt::format("debug_page_{}_block_{}.png", block.page, block.global_index);
            SaveCounted(block.image, ImagePath(config, name), summary);
        }
        ChessboardVerdict verdict   = validator.Validate(block.image);
        verdicts[block.global_index] = verdict;
        if (!verdict.is_chessboard && config.output.save_non_chessboard_images) {
            const std::string name = fmt::format("non_chessboard_page_{}_block_{}.png", block.page,
                                                 block.global_index);
            SaveCounted(block.image, ImagePath(config, name), summary);
        }
        return verdict.is_chessboard;
    };

    // === 2. Structural assembly ===
    AssemblerConfig assembler_config;
    assembler_config.structure           = config.structure;
    assembler_config.max_search_distance = config.max_search_distance;
    assembler_config.max_diagrams        = config.max_diagrams;
    assembler_config.page_end            = config.page_end;

    const DiagramAssembler assembler(assembler_config, header, solution, acceptor);
    const AssemblyResult assembled = assembler.Run(stream);
    const AssemblyStats& stats     = assembled.stats;

    summary.headers               = stats.headers;
    summary.solutions             = stats.solutions;
    summary.images                = stats.images;
    summary.non_chessboard_images = stats.rejected_images;
    summary.partial_diagrams      = stats.partial;
    summary.dropped_as_noise      = stats.dropped_as_noise;
    summary.unresolved            = stats.unresolved;
    summary.reached_max_diagrams  = stats.reached_max_diagrams;

    // === 3. Parse, save and recognize each diagram ===
    const bool recognize = recognition && recognition->enabled();
    const RecognitionStats before = recognize ? recognition->stats() : RecognitionStats{};

    int sequence = 0;
    for (const Assembly& assembly : assembled.assemblies) {
        ++sequence;
        Diagram d = BuildDiagram(stream, assembly, header, solution, config.full_move_max_chars);
        const Block& image = stream[*assembly.roles.image];

        auto verdict = verdicts.find(image.global_index);
        if (verdict != verdicts.end()) { d.chessboard_confidence = verdict->second.confidence; }

        if (config.output.save_chessboard_images) {
            const std::string name =
                fmt::format("diagram_{:03d}_page_{}.png", d.diagram_number.value_or(sequence), d.image_page);
            const std::string path = ImagePath(config, name);
            if (SaveCounted(image.image, path, summary)) { d.image_path = path; }
        }

        if (recognize) {
            if (auto recognized = recognition->Recognize(image.image)) {
                d.fen = recognized->fen;
                if (!recognized->turn.empty()) { d.turn_from_api = recognized->turn; }
            }
        }

        if (d.turn_from_text && d.turn_from_api) {
            auto api_turn = ReadTurn(*d.turn_from_api);
            if (api_turn && ToTurnString(*api_turn) != *d.turn_from_text) {
                ++summary.turn_disagreements;
                spdlog::debug("Diagram {}: text says {}, recognition says {}", sequence,
                              *d.turn_from_text, *d.turn_from_api);
            }
        }

        if (d.IsCrossPage()) { ++summary.cross_page; }
        if (d.turn_from_text == ToTurnString(Turn::White)) { ++summary.white_to_move; }
        if (d.turn_from_text == ToTurnString(Turn::Black)) { ++summary.black_to_move; }

        spdlog::info("Diagram {}: #{} {} (page {}) {}", sequence,
                     d.diagram_number ? std::to_string(*d.diagram_number) : "?",
                     d.players.value_or("-"), d.image_page, d.solution_move_annotated.value_or("-"));
        result.diagrams.push_back(std::move(d));
    }

    if (recognize) { AddRecognitionDelta(summary, before, recognition->stats()); }
    summary.diagrams = static_cast<int>(result.diagrams.size());
    return result;
}

std::vector<GridSection> AnalyzeGridPage(const cv::Mat& page_image, int page_number,
                                         const ExtractorConfig& config, const DigitReader& reader,
                                         RecognitionClient* recognition, RunSummary* summary) {
    if (page_image.empty()) { throw InputError("AnalyzeGridPage: page image is empty"); }

    const std::vector<GridCell> cells = DivideIntoSections(page_image.size(), config.grid);
    const BubbleAnalyzer analyzer(config.bubble, reader);
    const ChessboardValidator validator(config.chessboard);
    const bool recognize = recognition && recognition->enabled();

    RunSummary scratch;
    RunSummary& counts = summary ? *summary : scratch;

    std::vector<GridSection> sections;
    sections.reserve(cells.size());
    for (const GridCell& cell : cells) {
        const cv::Mat cell_image = page_image(cell.bbox);

        GridSection s;
        s.page           = page_number;
        s.row            = cell.row;
        s.col            = cell.col;
        s.section_number = cell.section_number;
        s.diagram_number = DiagramNumberForCell(config.grid, page_number, cell.row, cell.col);
        s.bbox           = cell.bbox;
        s.bubbles        = analyzer.Analyze(cell_image);

        const cv::Rect body = CellBodyRect(cell_image.size(), config.bubble.AreaHeight(cell_image.rows),
                                           config.grid.body_padding_px);
        const cv::Mat body_image = body.empty() ? cv::Mat() : cell_image(body);

        const ChessboardVerdict verdict = validator.Validate(body_image);
        s.is_chessboard                 = verdict.is_chessboard;
        s.chessboard_confidence         = verdict.confidence;

        if (config.output.save_all_images || (s.is_chessboard && config.output.save_chessboard_images)) {
            const std::string name = fmt::format("page_{}_section_{}.png", page_number, s.section_number);
            const std::string path = ImagePath(config, name);
            if (SaveCounted(cell_image, path, counts)) { s.image_path = path; }
        }

        if (s.is_chessboard && recognize) {
            if (auto recognized = recognition->Recognize(body_image)) {
                s.fen = recognized->fen;
                if (!recognized->turn.empty()) { s.turn = recognized->turn; }
            }
        }

        spdlog::debug("Page {} section {}: diagram {}, {} bubbles, chessboard={}", page_number,
                      s.section_number, s.diagram_number, s.bubbles.size(), s.is_chessboard);
        ++counts.sections;
        counts.bubbles += static_cast<int>(s.bubbles.size());
        if (s.is_chessboard) { ++counts.chessboard_sections; }
        sections.push_back(std::move(s));
    }
    return sections;
}

GridRunResult ExtractGridSections(DocumentSource& source, const ExtractorConfig& config,
                                  const DigitReader& reader, RecognitionClient* recognition,
                                  const GridPageSink& on_page) {
    config.Validate();

    GridRunResult result;
    RunSummary& summary = result.summary;

    const int page_count = source.PageCount();
    const int first      = std::max(1, config.page_start);
    const int last       = config.page_end > 0 ? std::min(config.page_end, page_count) : page_count;

    const bool recognize          = recognition && recognition->enabled();
    const RecognitionStats before = recognize ? recognition->stats() : RecognitionStats{};

    for (int p = first; p <= last; ++p) {
        // A failing page is counted and skipped; the run goes on.
        cv::Mat page_image;
        std::vector<GridSection> sections;
        try {
            page_image = source.RenderPage(p, config.grid.render_dpi);
            sections   = AnalyzeGridPage(page_image, p, config, reader, recognition, &summary);
        } catch (const Error& e) {
            spdlog::warn("Page {}: skipped ({})", p, e.what());
            ++summary.pages_failed;
            continue;
        } catch (const cv::Exception& e) {
            spdlog::warn("Page {}: skipped (OpenCV: {})", p, e.what());
            ++summary.pages_failed;
            continue;
        }

        if (config.output.save_previews) {
            const std::string path = (std::filesystem::path(config.output.PreviewsDir()) /
                                      fmt::format("preview_page_{}.png", p))
                                         .string();
            try {
                SaveCounted(DrawGridPreview(page_image, sections), path, summary);
            } catch (const cv::Exception& e) {
                ++summary.image_save_failures;
                spdlog::warn("Page {}: preview not written ({})", p, e.what());
            }
        }
        if (on_page) { on_page(p, sections); }

        ++summary.pages;
        spdlog::info("Page {}: {} sections ({}/{} pages)", p, sections.size(), p - first + 1,
                     last - first + 1);
        result.sections.insert(result.sections.end(), std::make_move_iterator(sections.begin()),
                               std::make_move_iterator(sections.end()));
    }

    if (recognize) { AddRecognitionDelta(summary, before, recognition->stats()); }
    return result;
}

} // namespace ChessScribe
