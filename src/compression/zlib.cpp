#include <glyphchain/common/error.hpp>
#include <glyphchain/compression/zlib.hpp>

#include <zlib.h>

#include <array>
#include <string>

namespace glyphchain::compression {

namespace {

constexpr auto kInflateBlock = std::size_t{16 * 1024};

glyphchain::common::error corrupt(const std::string& message) {
  return glyphchain::common::error{glyphchain::common::error_code::corrupt_chunk,
                                   message};
}

}  // namespace

glyphchain::schema::bytes_t deflate(const glyphchain::schema::bytes_view_t& input,
                                    const int level) {
  auto stream = z_stream{};
  if (deflateInit(&stream, level) != Z_OK) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::invalid_argument,
        "deflateInit failed for level " + std::to_string(level)};
  }

  auto output = glyphchain::schema::bytes_t(
      deflateBound(&stream, static_cast<uLong>(input.size())));
  stream.next_in = const_cast<Bytef*>(input.data());
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = output.data();
  stream.avail_out = static_cast<uInt>(output.size());

  auto result = ::deflate(&stream, Z_FINISH);
  auto produced = stream.total_out;
  deflateEnd(&stream);
  if (result != Z_STREAM_END) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::invalid_argument,
        "deflate did not finish: " + std::to_string(result)};
  }
  output.resize(produced);
  return output;
}

glyphchain::schema::bytes_t inflate(
    const glyphchain::schema::bytes_view_t& input) {
  auto stream = z_stream{};
  if (inflateInit(&stream) != Z_OK) {
    throw corrupt("inflateInit failed");
  }
  stream.next_in = const_cast<Bytef*>(input.data());
  stream.avail_in = static_cast<uInt>(input.size());

  auto output = glyphchain::schema::bytes_t{};
  auto block = std::array<Bytef, kInflateBlock>{};
  auto result = Z_OK;
  while (result == Z_OK) {
    stream.next_out = block.data();
    stream.avail_out = static_cast<uInt>(block.size());
    result = ::inflate(&stream, Z_NO_FLUSH);
    if (result != Z_OK && result != Z_STREAM_END) {
      break;
    }
    output.insert(std::end(output), block.data(),
                  block.data() + (block.size() - stream.avail_out));
    if (result == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      // Input exhausted before the end-of-stream marker.
      result = Z_DATA_ERROR;
    }
  }
  auto trailing = stream.avail_in;
  inflateEnd(&stream);

  if (result != Z_STREAM_END) {
    throw corrupt("inflate failed: " + std::to_string(result));
  }
  if (trailing != 0) {
    throw corrupt("trailing bytes after compressed stream");
  }
  return output;
}

glyphchain::common::compressor_t make_zlib_compressor(const int level) {
  return glyphchain::common::compressor_t{
      .compress =
          [level](const glyphchain::schema::bytes_view_t& bytes) {
            return deflate(bytes, level);
          },
      .decompress =
          [](const glyphchain::schema::bytes_view_t& bytes) {
            return inflate(bytes);
          }};
}

}  // namespace glyphchain::compression
