#include <glyphchain/schema/key/builder.hpp>

#include <iterator>

namespace glyphchain::schema::key {

builder& builder::write(const std::string_view text) {
  data.insert(std::end(data), std::begin(text), std::end(text));
  return *this;
}

builder& builder::write(const glyphchain::schema::bytes_view_t& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write(const glyphchain::schema::hash32_t& hash) {
  data.insert(std::end(data), std::begin(hash), std::end(hash));
  return *this;
}

builder& builder::write_field(const std::string_view text) {
  write(static_cast<uint32_t>(text.size()));
  return write(text);
}

}  // namespace glyphchain::schema::key
