/// \file solution.h
/// \brief Parses a solution block into move, turn and full text.

#pragma once

#include "common.h"
#include "pattern.h"

#include <optional>
#include <string>

namespace ChessScribe {

/// Parsed solution block.
struct SolutionDetails {
    int move_number = 0;
    int dot_count   = 1;
    Turn turn       = Turn::White;
    std::string move_annotated; ///< First token of the move body, glyphs kept ("f3!").
    std::string move_clean;     ///< move_annotated without annotation glyphs ("f3").
    std::string full_move;      ///< Matched text, bounded for display.
    std::string full_text;      ///< The block text, byte-identical.
};

/// Default bound for SolutionDetails::full_move.
constexpr int kDefaultFullMoveMaxChars = 80;

/// Parses solution text. Returns nullopt when the pattern does not match or
/// the move body is empty.
std::optional<SolutionDetails> ParseSolution(const Pattern& pattern, const std::string& text,
                                             int full_move_max_chars = kDefaultFullMoveMaxChars);

} // namespace ChessScribe
