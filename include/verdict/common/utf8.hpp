#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Code point aware helpers for UTF-8 text. Lengths and cut positions are
// counted in code points so accented Portuguese text is never split in the
// middle of a multi-byte sequence. Invalid sequences count one unit per byte.
namespace verdict::common::utf8 {

/// Number of code points in `text`.
std::size_t length(std::string_view text);

/// Byte offset of the code point at index `count` (or text.size()).
std::size_t byte_offset(std::string_view text, std::size_t count);

/// First `count` code points of `text`.
std::string_view prefix(std::string_view text, std::size_t count);

/// Last `count` code points of `text`.
std::string_view suffix(std::string_view text, std::size_t count);

}  // namespace verdict::common::utf8
