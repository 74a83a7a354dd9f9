#include <verdict/common/utf8.hpp>

namespace verdict::common::utf8 {

namespace {

bool is_continuation(const char c) {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

std::size_t sequence_length(const std::string_view text, const std::size_t at) {
  const auto lead = static_cast<unsigned char>(text[at]);
  auto expected = std::size_t{1};
  if ((lead & 0xE0u) == 0xC0u) {
    expected = 2;
  } else if ((lead & 0xF0u) == 0xE0u) {
    expected = 3;
  } else if ((lead & 0xF8u) == 0xF0u) {
    expected = 4;
  }
  auto actual = std::size_t{1};
  while (actual < expected && at + actual < text.size() &&
         is_continuation(text[at + actual])) {
    ++actual;
  }
  return actual == expected ? expected : 1;
}

}  // namespace

std::size_t length(const std::string_view text) {
  auto count = std::size_t{0};
  for (auto i = std::size_t{0}; i < text.size();
       i += sequence_length(text, i)) {
    ++count;
  }
  return count;
}

std::size_t byte_offset(const std::string_view text, const std::size_t count) {
  auto offset = std::size_t{0};
  for (auto seen = std::size_t{0}; seen < count && offset < text.size();
       ++seen) {
    offset += sequence_length(text, offset);
  }
  return offset;
}

std::string_view prefix(const std::string_view text, const std::size_t count) {
  return text.substr(0, byte_offset(text, count));
}

std::string_view suffix(const std::string_view text, const std::size_t count) {
  const auto total = length(text);
  if (count >= total) {
    return text;
  }
  return text.substr(byte_offset(text, total - count));
}

}  // namespace verdict::common::utf8
