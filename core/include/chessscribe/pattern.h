/// \file pattern.h
/// \brief Configurable regular-expression matchers for header and solution lines.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace ChessScribe {

/// Named role of a capture group.
enum class CaptureRole : uint8_t {
    DiagramNumber,
    Player1,
    Player2,
    Year,
    MoveNumber,
    Dots,
    MoveBody,
};

std::string ToCaptureRoleString(CaptureRole role);

/// Parse "diagram_number", "player1", ... ; throws ConfigError on unknown names.
CaptureRole FromCaptureRoleString(const std::string& str);

/// Uncompiled pattern as it appears in configuration.
struct PatternSpec {
    std::string regex;
    std::map<CaptureRole, int> groups; ///< role -> 1-based group index
};

/// Result of a successful match: the captured substring per role.
class PatternMatch {
public:
    PatternMatch() = default;
    PatternMatch(std::string matched, std::map<CaptureRole, std::string> captures)
        : matched_(std::move(matched)), captures_(std::move(captures)) {}

    /// Entire matched text.
    const std::string& matched() const { return matched_; }

    /// Captured text for a role, or an empty string when the group did not participate.
    std::string Get(CaptureRole role) const;

    bool Has(CaptureRole role) const;

private:
    std::string matched_;
    std::map<CaptureRole, std::string> captures_;
};

/// Compiled expression plus capture-role mapping.
class Pattern {
public:
    /// Compiles a spec. Throws ConfigError for an invalid expression or a role
    /// mapped to a group the expression does not have.
    static Pattern Compile(const PatternSpec& spec);

    /// Matches normalized, trimmed text (regex_search semantics).
    std::optional<PatternMatch> Match(const std::string& text) const;

    const PatternSpec& spec() const { return spec_; }

private:
    Pattern(PatternSpec spec, std::regex regex);

    PatternSpec spec_;
    std::regex regex_;
};

/// Header fields extracted from a header line.
struct HeaderInfo {
    std::optional<int> diagram_number;
    std::optional<std::string> players; ///< "White - Black"
    std::optional<std::string> year;
};

/// Default header pattern (Woodpecker-style "27. Alekhine - Nimzowitsch, New York 1927").
PatternSpec BuiltinHeaderPattern();

/// Default solution pattern ("8.f3! ..." / "22...Bxh2+!").
PatternSpec BuiltinSolutionPattern();

/// Normalizes then matches a header line.
std::optional<HeaderInfo> MatchHeader(const Pattern& pattern, const std::string& text);

/// True when the normalized text matches.
bool Matches(const Pattern& pattern, const std::string& text);

} // namespace ChessScribe
