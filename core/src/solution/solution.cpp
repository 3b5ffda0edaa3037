#include "chessscribe/solution.h"
#include "chessscribe/notation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ChessScribe {

namespace {

std::string FirstToken(const std::string& body) {
    auto it = std::find_if(body.begin(), body.end(),
                           [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    return std::string(body.begin(), it);
}

} // namespace

std::optional<SolutionDetails> ParseSolution(const Pattern& pattern, const std::string& text,
                                             int full_move_max_chars) {
    const std::string normalized = NormalizeText(text);
    auto m                       = pattern.Match(normalized);
    if (!m) { return std::nullopt; }

    const std::string body = Trim(m->Get(CaptureRole::MoveBody));
    if (body.empty()) { return std::nullopt; }

    SolutionDetails details;

    const std::string number = m->Get(CaptureRole::MoveNumber);
    if (!number.empty()) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
        if (ec == std::errc() && ptr == number.data() + number.size()) {
            details.move_number = value;
        }
    }

    // "8." is a white move, "8..." (or "8..") a black one.
    if (m->Has(CaptureRole::Dots)) {
        const std::string dots = m->Get(CaptureRole::Dots);
        details.dot_count      = static_cast<int>(std::count(dots.begin(), dots.end(), '.'));
    }
    details.turn = details.dot_count == 1 ? Turn::White : Turn::Black;

    details.move_annotated = FirstToken(body);
    details.move_clean     = StripAnnotationGlyphs(details.move_annotated);
    details.full_move      = TruncateUtf8(Trim(m->matched()), full_move_max_chars);
    details.full_text      = text;

    spdlog::trace("ParseSolution: {}{} {} ({})", details.move_number, std::string(details.dot_count, '.'),
                  details.move_clean, ToTurnString(details.turn));
    return details;
}

} // namespace ChessScribe
