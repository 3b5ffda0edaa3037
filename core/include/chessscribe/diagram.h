/// \file diagram.h
/// \brief Assembled puzzle record.

#pragma once

#include <optional>
#include <string>

namespace ChessScribe {

/// One assembled diagram. Everything except the image references is nullable:
/// a missing header or solution leaves its fields unset.
struct Diagram {
    std::optional<int> diagram_number;
    std::optional<std::string> players;
    std::optional<std::string> year;

    int image_page = 0;
    std::optional<int> header_page;
    std::optional<int> solution_page;

    std::optional<int> solution_move_number;
    std::optional<std::string> solution_move_clean;
    std::optional<std::string> solution_move_annotated;
    std::optional<std::string> solution_full_move;
    std::optional<std::string> solution_full_text;
    std::optional<std::string> turn_from_text;

    std::optional<std::string> fen;
    std::optional<std::string> turn_from_api;

    std::optional<std::string> image_path;
    double chessboard_confidence = 0.0;

    int image_global_index = 0;
    std::optional<int> header_global_index;
    std::optional<int> solution_global_index;

    bool HasHeader() const { return header_page.has_value(); }
    bool HasSolution() const { return solution_page.has_value(); }

    /// True when the image is not on the header's page (or, without header, the solution's).
    bool IsCrossPage() const;
};

} // namespace ChessScribe
