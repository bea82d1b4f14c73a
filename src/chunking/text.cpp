#include <glyphchain/chunking/text.hpp>

#include <algorithm>
#include <array>

namespace glyphchain::chunking {

namespace {

bool is_blank(const char c) {
  return c == ' ' || c == '\t';
}

bool is_continuation(const char c) {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

/// One line with blank runs collapsed and both ends stripped.
void append_line(std::string_view line, std::string& out) {
  auto pending_space = false;
  auto wrote = false;
  for (const auto c : line) {
    if (is_blank(c)) {
      pending_space = wrote;
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
    wrote = true;
  }
}

}  // namespace

std::string normalize(std::string_view text) {
  auto joined = std::string{};
  joined.reserve(text.size());

  auto begin = std::size_t{0};
  while (begin <= text.size()) {
    auto end = text.find_first_of("\r\n", begin);
    if (end == std::string_view::npos) {
      append_line(text.substr(begin), joined);
      break;
    }
    append_line(text.substr(begin, end - begin), joined);
    joined.push_back('\n');
    begin = end + 1;
    if (text[end] == '\r' && begin < text.size() && text[begin] == '\n') {
      ++begin;
    }
  }

  auto out = std::string{};
  out.reserve(joined.size());
  auto newlines = std::size_t{0};
  for (const auto c : joined) {
    if (c == '\n') {
      if (++newlines > 2) {
        continue;
      }
    } else {
      newlines = 0;
    }
    out.push_back(c);
  }

  auto first = out.find_first_not_of(" \n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = out.find_last_not_of(" \n");
  return out.substr(first, last - first + 1);
}

std::size_t snap_to_code_point(std::string_view text, std::size_t position) {
  position = std::min(position, text.size());
  while (position > 0 && position < text.size() &&
         is_continuation(text[position])) {
    --position;
  }
  return position;
}

std::size_t next_code_point(std::string_view text, std::size_t position) {
  if (position >= text.size()) {
    return text.size();
  }
  ++position;
  while (position < text.size() && is_continuation(text[position])) {
    ++position;
  }
  return position;
}

std::size_t find_natural_break(std::string_view text,
                               const std::size_t start,
                               const std::size_t end,
                               const std::size_t lookback) {
  const auto length = std::min(lookback, end - start);
  const auto region_start = end - length;
  const auto region = text.substr(region_start, length);

  if (auto paragraph = region.rfind("\n\n");
      paragraph != std::string_view::npos) {
    return region_start + paragraph + 2;
  }

  static constexpr auto kSentenceEnds =
      std::array<std::string_view, 3>{". ", "? ", "! "};
  auto sentence = std::string_view::npos;
  for (const auto ending : kSentenceEnds) {
    auto found = region.rfind(ending);
    if (found != std::string_view::npos &&
        (sentence == std::string_view::npos || found > sentence)) {
      sentence = found;
    }
  }
  if (sentence != std::string_view::npos) {
    return region_start + sentence + 2;
  }

  // Word breaks in the first half of the region would leave a short chunk.
  if (auto word = region.rfind(' ');
      word != std::string_view::npos && word > length / 2) {
    return region_start + word + 1;
  }

  return end;
}

}  // namespace glyphchain::chunking
