#include "chessscribe/notation.h"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace ChessScribe {

namespace {

// Typographic variants mapped to what the matchers expect.
const std::vector<std::pair<std::string, std::string>>& Replacements() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"–", "-"},   // en dash
        {"—", "-"},   // em dash
        {"‒", "-"},   // figure dash
        {"−", "-"},   // minus sign
        {"“", "\""},  {"”", "\""}, {"‘", "'"}, {"’", "'"},
        {"…", "..."}, // ellipsis
        {"\xC2\xA0", " "}, // no-break space
        {"♔", "K"},   {"♕", "Q"}, {"♖", "R"}, {"♗", "B"},
        {"♘", "N"},   {"♙", ""},
        {"♚", "K"},   {"♛", "Q"}, {"♜", "R"}, {"♝", "B"},
        {"♞", "N"},   {"♟", ""},
    };
    return table;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) { return; }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

} // namespace

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end   = text.size();
    while (begin < end && IsSpace(text[begin])) { ++begin; }
    while (end > begin && IsSpace(text[end - 1])) { --end; }
    return text.substr(begin, end - begin);
}

std::string NormalizeText(const std::string& text) {
    std::string out = text;
    for (const auto& [from, to] : Replacements()) { ReplaceAll(out, from, to); }
    return Trim(out);
}

const std::vector<std::string>& AnnotationGlyphs() {
    // Evaluation marks, move assessments, strategic arrows and special marks.
    static const std::vector<std::string> glyphs = {
        "!",      "?",      "±", "∓", "⩲", "⩱", "∞", "□",
        "○", "⨀", "↑", "↓", "→", "←", "↗", "↘",
        "↙", "↖", "⇆", "⇄", "⊕", "⊖", "⊗", "⊙",
        "△", "▲", "▼", "⌓", "⌚", "⊥", "⟳", "∆",
        "†", "‡",
    };
    return glyphs;
}

std::string StripAnnotationGlyphs(const std::string& move) {
    std::string out = move;
    for (const std::string& glyph : AnnotationGlyphs()) { ReplaceAll(out, glyph, ""); }
    return Trim(out);
}

std::string ToCsvSafeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (IsSpace(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) { out.push_back(' '); }
        in_space = false;
        out.push_back(c);
    }
    return out;
}

std::string TruncateUtf8(const std::string& text, int max_chars) {
    if (max_chars <= 0) { return text; }
    int count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (count == max_chars) { return text.substr(0, i); }
            ++count;
        }
    }
    return text;
}

} // namespace ChessScribe
