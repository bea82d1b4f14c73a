#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/chunking/text.hpp>
#include <glyphchain/common/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace glyphchain::chunking {

namespace {

// Halving depth past which a piece is declared unsplittable.
constexpr auto kMaxSplitDepth = std::size_t{64};

glyphchain::common::error missing(const std::size_t index) {
  return glyphchain::common::error{glyphchain::common::error_code::missing_chunk,
                                   "chunk " + std::to_string(index) +
                                       " is missing"};
}

glyphchain::common::error corrupt(const std::size_t index,
                                  const std::string& detail) {
  return glyphchain::common::error{glyphchain::common::error_code::corrupt_chunk,
                                   "chunk " + std::to_string(index) + ": " +
                                       detail};
}

}  // namespace

bool fits_unit(const std::size_t payload_size, const chunk_limits& limits) {
  return glyphchain::schema::base64_encoded_size(
             payload_size + limits.envelope_overhead) <= limits.max_unit_bytes;
}

chunker::chunker(glyphchain::common::hasher_t hasher,
                 glyphchain::common::compressor_t compressor)
    : hasher_{std::move(hasher)}, compressor_{std::move(compressor)} {}

glyphchain::schema::chunk_t chunker::make_chunk(std::string_view text) const {
  auto chunk = glyphchain::schema::chunk_t{};
  chunk.payload = compressor_.compress(glyphchain::schema::make_bytes_view(text));
  chunk.hash = hasher_(glyphchain::schema::make_bytes_view(chunk.payload));
  chunk.source_span = std::string{text};
  return chunk;
}

std::vector<glyphchain::schema::chunk_t> chunker::split(
    std::string_view document,
    const chunk_limits& limits) const {
  if (limits.target_chunk_chars == 0 || limits.max_unit_bytes == 0) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::invalid_argument,
        "chunk limits must be non-zero"};
  }

  const auto text = normalize(document);
  auto chunks = std::vector<glyphchain::schema::chunk_t>{};
  auto position = std::size_t{0};
  auto windows = std::size_t{0};
  while (position < text.size()) {
    auto end = snap_to_code_point(
        text, std::min(position + limits.target_chunk_chars, text.size()));
    if (end <= position) {
      end = next_code_point(text, position);
    }
    auto cut = end;
    if (end < text.size()) {
      cut = find_natural_break(text, position, end, limits.lookback_chars);
    }
    emit_fitting(std::string_view{text}.substr(position, cut - position),
                 limits, 0, chunks);
    position = cut;
    ++windows;
  }

  const auto total = static_cast<uint32_t>(chunks.size());
  for (auto i = uint32_t{0}; i < total; ++i) {
    chunks[i].index = i;
    chunks[i].total_chunks = total;
  }
  if (chunks.size() > windows) {
    spdlog::debug("split {} windows into {} chunks after re-splitting",
                  windows, chunks.size());
  }
  return chunks;
}

void chunker::emit_fitting(
    std::string_view piece,
    const chunk_limits& limits,
    const std::size_t depth,
    std::vector<glyphchain::schema::chunk_t>& out) const {
  auto chunk = make_chunk(piece);
  if (fits_unit(chunk.payload.size(), limits)) {
    out.push_back(std::move(chunk));
    return;
  }

  auto single_code_point = next_code_point(piece, 0) >= piece.size();
  if (single_code_point || depth >= kMaxSplitDepth) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::oversized_chunk,
        "cannot fit " + std::to_string(piece.size()) + " bytes into a " +
            std::to_string(limits.max_unit_bytes) + " byte unit"};
  }

  const auto half = piece.size() / 2;
  auto middle = snap_to_code_point(piece, half);
  if (piece.size() > limits.min_chunk_chars) {
    middle = find_natural_break(piece, 0, middle,
                                std::min(limits.lookback_chars, middle));
  }
  if (middle == 0) {
    middle = next_code_point(piece, 0);
  }

  emit_fitting(piece.substr(0, middle), limits, depth + 1, out);
  emit_fitting(piece.substr(middle), limits, depth + 1, out);
}

std::string chunker::reassemble(
    const std::vector<glyphchain::schema::chunk_t>& chunks) const {
  if (chunks.empty()) {
    return {};
  }

  auto ordered = std::vector<const glyphchain::schema::chunk_t*>{};
  ordered.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    ordered.push_back(&chunk);
  }
  std::ranges::sort(ordered, [](const auto* lhs, const auto* rhs) {
    return lhs->index < rhs->index;
  });

  const auto total = std::size_t{ordered.front()->total_chunks};
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (ordered[i]->index != i) {
      throw missing(i);
    }
    if (i >= total || ordered[i]->total_chunks != total) {
      throw corrupt(i, "chunk count disagrees with the rest of the set");
    }
  }
  if (ordered.size() < total) {
    throw missing(ordered.size());
  }

  auto text = std::string{};
  for (const auto* chunk : ordered) {
    if (hasher_(glyphchain::schema::make_bytes_view(chunk->payload)) !=
        chunk->hash) {
      throw corrupt(chunk->index, "hash mismatch");
    }
    try {
      auto plain = compressor_.decompress(
          glyphchain::schema::make_bytes_view(chunk->payload));
      text.append(glyphchain::schema::make_string_view(plain));
    } catch (const glyphchain::common::error& e) {
      throw corrupt(chunk->index, e.what());
    }
  }
  return text;
}

}  // namespace glyphchain::chunking
