#include "chessscribe/pattern.h"
#include "chessscribe/error.h"
#include "chessscribe/notation.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <string>

namespace ChessScribe {

namespace {

std::optional<int> ParseInt(const std::string& s) {
    if (s.empty()) { return std::nullopt; }
    int value       = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec]  = std::from_chars(s.data(), end, value);
    if (ec != std::errc() || ptr != end) { return std::nullopt; }
    return value;
}

} // namespace

std::string ToCaptureRoleString(CaptureRole role) {
    switch (role) {
    case CaptureRole::DiagramNumber:
        return "diagram_number";
    case CaptureRole::Player1:
        return "player1";
    case CaptureRole::Player2:
        return "player2";
    case CaptureRole::Year:
        return "year";
    case CaptureRole::MoveNumber:
        return "move_number";
    case CaptureRole::Dots:
        return "dots";
    case CaptureRole::MoveBody:
        return "move_body";
    }
    return "diagram_number";
}

CaptureRole FromCaptureRoleString(const std::string& str) {
    if (str == "diagram_number") { return CaptureRole::DiagramNumber; }
    if (str == "player1") { return CaptureRole::Player1; }
    if (str == "player2") { return CaptureRole::Player2; }
    if (str == "year") { return CaptureRole::Year; }
    if (str == "move_number") { return CaptureRole::MoveNumber; }
    if (str == "dots") { return CaptureRole::Dots; }
    if (str == "move_body") { return CaptureRole::MoveBody; }
    throw ConfigError("Unknown capture role: " + str);
}

std::string PatternMatch::Get(CaptureRole role) const {
    auto it = captures_.find(role);
    if (it == captures_.end()) { return {}; }
    return it->second;
}

bool PatternMatch::Has(CaptureRole role) const { return captures_.count(role) > 0; }

Pattern::Pattern(PatternSpec spec, std::regex regex)
    : spec_(std::move(spec)), regex_(std::move(regex)) {}

Pattern Pattern::Compile(const PatternSpec& spec) {
    if (spec.regex.empty()) { throw ConfigError("Pattern expression is empty"); }

    std::regex regex;
    try {
        regex = std::regex(spec.regex, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigError("Invalid pattern '" + spec.regex + "': " + e.what());
    }

    const int groups = static_cast<int>(regex.mark_count());
    for (const auto& [role, index] : spec.groups) {
        if (index < 1 || index > groups) {
            throw ConfigError("Pattern '" + spec.regex + "' has no group " +
                              std::to_string(index) + " for role " + ToCaptureRoleString(role));
        }
    }
    return Pattern(spec, std::move(regex));
}

std::optional<PatternMatch> Pattern::Match(const std::string& text) const {
    std::smatch m;
    if (!std::regex_search(text, m, regex_)) { return std::nullopt; }

    std::map<CaptureRole, std::string> captures;
    for (const auto& [role, index] : spec_.groups) {
        const auto& sub = m[static_cast<size_t>(index)];
        if (sub.matched) { captures.emplace(role, sub.str()); }
    }
    return PatternMatch(m.str(0), std::move(captures));
}

PatternSpec BuiltinHeaderPattern() {
    PatternSpec spec;
    spec.regex = R"((\d+)\.\s*([A-Z][a-z]+(?:\s+[A-Z][a-z]+)*)\s*-\s*([A-Z][a-z]+(?:\s+[A-Z][a-z]+)*),.*?(\d{4}))";
    spec.groups = {
        {CaptureRole::DiagramNumber, 1},
        {CaptureRole::Player1, 2},
        {CaptureRole::Player2, 3},
        {CaptureRole::Year, 4},
    };
    return spec;
}

PatternSpec BuiltinSolutionPattern() {
    PatternSpec spec;
    spec.regex  = R"(^\s*(\d+)(\.{1,3})\s*([a-hRNBQKO0-9][^\n]*))";
    spec.groups = {
        {CaptureRole::MoveNumber, 1},
        {CaptureRole::Dots, 2},
        {CaptureRole::MoveBody, 3},
    };
    return spec;
}

std::optional<HeaderInfo> MatchHeader(const Pattern& pattern, const std::string& text) {
    auto m = pattern.Match(NormalizeText(text));
    if (!m) { return std::nullopt; }

    HeaderInfo info;
    info.diagram_number = ParseInt(m->Get(CaptureRole::DiagramNumber));

    const std::string p1 = Trim(m->Get(CaptureRole::Player1));
    const std::string p2 = Trim(m->Get(CaptureRole::Player2));
    if (!p1.empty() && !p2.empty()) {
        info.players = p1 + " - " + p2;
    } else if (!p1.empty() || !p2.empty()) {
        info.players = p1.empty() ? p2 : p1;
    }

    const std::string year = Trim(m->Get(CaptureRole::Year));
    if (!year.empty()) { info.year = year; }

    spdlog::trace("MatchHeader: '{}' -> #{} {}", text, m->Get(CaptureRole::DiagramNumber),
                  info.players.value_or("?"));
    return info;
}

bool Matches(const Pattern& pattern, const std::string& text) {
    return pattern.Match(NormalizeText(text)).has_value();
}

} // namespace ChessScribe
