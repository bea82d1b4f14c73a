#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace glyphchain::chunking {

/// Canonical form of a document: LF line endings, single spaces, no
/// leading/trailing blanks on any line, at most one empty line in a row, and
/// no surrounding blank space. normalize(normalize(x)) == normalize(x).
std::string normalize(std::string_view text);

/// Largest position <= `position` that does not fall inside a UTF-8
/// multi-byte sequence.
std::size_t snap_to_code_point(std::string_view text, std::size_t position);

/// Position just past the code point that starts at `position`.
std::size_t next_code_point(std::string_view text, std::size_t position);

/// Cut position for the window [start, end) of `text`, moved back to the
/// nearest paragraph, sentence or word break within the last `lookback`
/// bytes. Falls back to `end` when no break is found.
std::size_t find_natural_break(std::string_view text,
                               std::size_t start,
                               std::size_t end,
                               std::size_t lookback);

}  // namespace glyphchain::chunking
