/// \file detail/json_utils.h
/// \brief Internal JSON-related utility functions shared across core modules.

#pragma once

#include "chessscribe/common.h"
#include "chessscribe/error.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ChessScribe::detail {

/// Parse DiagramStructure from a JSON value (accepts string or integer).
inline DiagramStructure ParseDiagramStructure(const nlohmann::json& value) {
    if (value.is_string()) { return FromDiagramStructureString(value.get<std::string>()); }
    if (value.is_number_integer()) {
        int v = value.get<int>();
        if (v >= 0 && v <= 3) { return static_cast<DiagramStructure>(v); }
    }
    throw ConfigError("Invalid diagram_structure value");
}

/// Parse DiagramStructure with a fallback for null values.
inline DiagramStructure ParseDiagramStructure(const nlohmann::json& value,
                                              DiagramStructure fallback) {
    if (value.is_null()) { return fallback; }
    return ParseDiagramStructure(value);
}

/// Stores an optional as its value or null.
template <typename T>
inline nlohmann::json OptionalToJson(const std::optional<T>& value) {
    if (!value) { return nullptr; }
    return nlohmann::json(*value);
}

} // namespace ChessScribe::detail
