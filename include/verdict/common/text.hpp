#pragma once

#include <string>
#include <string_view>

namespace verdict::common {

inline constexpr auto kWhitespace = std::string_view{" \t\n\r\f\v"};

bool is_ascii_whitespace(char c);

/// Remove leading and trailing characters found in `characters`.
std::string_view trim(std::string_view input,
                      std::string_view characters = kWhitespace);
std::string_view trim_left(std::string_view input,
                           std::string_view characters = kWhitespace);

/// UTF-8 encodings of the no-break spaces that extracted text carries.
inline constexpr auto kNoBreakSpace = std::string_view{"\xC2\xA0"};
inline constexpr auto kNarrowNoBreakSpace = std::string_view{"\xE2\x80\xAF"};

/// Lower-cases ASCII and the Latin-1 capitals U+00C0..U+00DE (except the
/// multiplication sign). The byte length never changes, so offsets into the
/// result are valid offsets into the input.
std::string to_lower(std::string_view input);

/// Replace no-break spaces with ASCII spaces.
std::string normalize_spaces(std::string_view input);

/// Replace every run of whitespace, no-break spaces included, with a single
/// space.
std::string collapse_whitespace(std::string_view input);

/// Case-insensitive under to_lower().
bool contains_icase(std::string_view haystack, std::string_view needle);
bool starts_with_icase(std::string_view input, std::string_view prefix);

}  // namespace verdict::common
