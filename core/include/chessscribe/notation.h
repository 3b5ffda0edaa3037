/// \file notation.h
/// \brief Text normalization and chess annotation glyph handling.

#pragma once

#include <string>
#include <vector>

namespace ChessScribe {

/// Replaces typographic variants the matchers cannot see through: dashes,
/// quotes, the ellipsis character and figurine pieces. Trims the result.
std::string NormalizeText(const std::string& text);

/// The fixed glyph removal table (UTF-8 sequences), longest entries first.
const std::vector<std::string>& AnnotationGlyphs();

/// Removes every annotation glyph from a move token. Check, mate and
/// promotion characters are kept.
std::string StripAnnotationGlyphs(const std::string& move);

/// Collapses whitespace runs (including newlines and tabs) into one space and trims.
std::string ToCsvSafeText(const std::string& text);

/// Truncates to at most max_chars code points without splitting a UTF-8 sequence.
/// max_chars <= 0 returns the text unchanged.
std::string TruncateUtf8(const std::string& text, int max_chars);

/// Trims ASCII whitespace on both ends.
std::string Trim(const std::string& text);

} // namespace ChessScribe
