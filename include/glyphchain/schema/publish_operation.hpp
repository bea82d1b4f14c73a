#pragma once

#include <glyphchain/schema/chunk.hpp>
#include <glyphchain/schema/chunk_status.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/schema/publish_stage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: publish operation.
// A document being published: its chunks, the status of each chunk (same
// index), and the operation stage. Persisted until it reaches a terminal
// stage so it can be resumed after a restart.
namespace glyphchain::schema {

template <uint16_t Version>
struct publish_operation;

template <>
struct publish_operation<1> final {
  uint16_t version{1};
  operation_id_t operation_id;
  author_id_t author_id;
  std::string title;
  std::vector<chunk_t> chunks;
  std::vector<chunk_status_t> chunk_statuses;
  publish_stage_t stage{publish_stage_t::preparing};
  timestamp_milliseconds_t created_at{};
  std::string error;
};

using publish_operation_t = publish_operation<1>;

}  // namespace glyphchain::schema
