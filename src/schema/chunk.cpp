#include <verdict/schema/chunk.hpp>

#include <fmt/format.h>

namespace verdict::schema {

std::string make_chunk_id(const std::string_view source, const uint32_t index) {
  return fmt::format("{}-{:06d}", source, index);
}

}  // namespace verdict::schema
