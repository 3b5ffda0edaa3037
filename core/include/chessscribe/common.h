/// \file common.h
/// \brief Common enumerations and types used throughout ChessScribe.

#pragma once

#include <cstdint>
#include <string>

namespace ChessScribe {

/// Kind of a page region / block.
enum class BlockKind : uint8_t {
    Text  = 0, ///< Text region carrying a string.
    Image = 1, ///< Image region carrying pixel data.
};

/// Role a block plays inside one diagram.
enum class Role : uint8_t {
    Header   = 0, ///< "27. Alekhine - Nimzowitsch, New York 1927"
    Image    = 1, ///< The chessboard picture.
    Solution = 2, ///< "8.f3! A nice set-up..."
};

/// Layout of header, image and solution inside a book.
enum class DiagramStructure : uint8_t {
    HeaderImageSolution = 0, ///< Header, then image, then solution.
    ImageHeaderSolution = 1, ///< Image, then header, then solution.
    HeaderSolutionImage = 2, ///< Header, then solution, then image.
    Flexible            = 3, ///< Any order around the first role found.
};

/// Side to move.
enum class Turn : uint8_t {
    White = 0,
    Black = 1,
};

/// Fill style of a grid bubble.
enum class FillStyle : uint8_t {
    Outlined = 0, ///< Light interior, dark ring and digit.
    Filled   = 1, ///< Dark interior, light digit.
};

std::string ToRoleString(Role role);

/// Convert DiagramStructure to its configuration name ("header_image_solution", ...).
std::string ToDiagramStructureString(DiagramStructure structure);

/// Parse DiagramStructure from its configuration name.
DiagramStructure FromDiagramStructureString(const std::string& str);

/// "white" / "black".
std::string ToTurnString(Turn turn);

/// Parse "white"/"w" or "black"/"b" (case-insensitive).
Turn FromTurnString(const std::string& str);

/// "outlined" / "filled".
std::string ToFillStyleString(FillStyle style);

} // namespace ChessScribe
