#include "chessscribe/common.h"
#include "chessscribe/error.h"

#include <algorithm>
#include <cctype>

namespace ChessScribe {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string ToRoleString(Role role) {
    switch (role) {
    case Role::Header:
        return "header";
    case Role::Image:
        return "image";
    case Role::Solution:
        return "solution";
    }
    return "header";
}

std::string ToDiagramStructureString(DiagramStructure structure) {
    switch (structure) {
    case DiagramStructure::HeaderImageSolution:
        return "header_image_solution";
    case DiagramStructure::ImageHeaderSolution:
        return "image_header_solution";
    case DiagramStructure::HeaderSolutionImage:
        return "header_solution_image";
    case DiagramStructure::Flexible:
        return "flexible";
    }
    return "header_image_solution";
}

DiagramStructure FromDiagramStructureString(const std::string& str) {
    const std::string s = ToLower(str);
    if (s == "header_image_solution") { return DiagramStructure::HeaderImageSolution; }
    if (s == "image_header_solution") { return DiagramStructure::ImageHeaderSolution; }
    if (s == "header_solution_image") { return DiagramStructure::HeaderSolutionImage; }
    if (s == "flexible") { return DiagramStructure::Flexible; }
    throw ConfigError("Invalid diagram_structure: " + str);
}

std::string ToTurnString(Turn turn) { return turn == Turn::White ? "white" : "black"; }

Turn FromTurnString(const std::string& str) {
    const std::string s = ToLower(str);
    if (s == "white" || s == "w") { return Turn::White; }
    if (s == "black" || s == "b") { return Turn::Black; }
    throw FormatError("Invalid turn string: " + str);
}

std::string ToFillStyleString(FillStyle style) {
    return style == FillStyle::Filled ? "filled" : "outlined";
}

} // namespace ChessScribe
