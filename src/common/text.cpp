#include <verdict/common/text.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace verdict::common {

namespace {

constexpr auto kLatin1Lead = static_cast<unsigned char>(0xC3);
constexpr auto kLatin1UpperFirst = static_cast<unsigned char>(0x80);
constexpr auto kLatin1UpperLast = static_cast<unsigned char>(0x9E);
constexpr auto kMultiplicationSign = static_cast<unsigned char>(0x97);
constexpr auto kCaseOffset = static_cast<unsigned char>(0x20);

char lower_ascii(const char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_latin1_upper(const unsigned char lead, const unsigned char trail) {
  return lead == kLatin1Lead && trail >= kLatin1UpperFirst &&
         trail <= kLatin1UpperLast && trail != kMultiplicationSign;
}

}  // namespace

bool is_ascii_whitespace(const char c) {
  return kWhitespace.find(c) != std::string_view::npos;
}

std::string_view trim_left(std::string_view input,
                           const std::string_view characters) {
  const auto first = input.find_first_not_of(characters);
  if (first == std::string_view::npos) {
    return {};
  }
  input.remove_prefix(first);
  return input;
}

std::string_view trim(std::string_view input,
                      const std::string_view characters) {
  input = trim_left(input, characters);
  const auto last = input.find_last_not_of(characters);
  if (last == std::string_view::npos) {
    return {};
  }
  return input.substr(0, last + 1);
}

std::string to_lower(const std::string_view input) {
  auto out = std::string{};
  out.reserve(input.size());
  std::transform(std::begin(input), std::end(input), std::back_inserter(out),
                 lower_ascii);
  for (auto i = std::size_t{1}; i < out.size(); ++i) {
    const auto lead = static_cast<unsigned char>(out[i - 1]);
    const auto trail = static_cast<unsigned char>(out[i]);
    if (is_latin1_upper(lead, trail)) {
      out[i] = static_cast<char>(trail + kCaseOffset);
      ++i;
    }
  }
  return out;
}

std::string normalize_spaces(const std::string_view input) {
  auto out = std::string{};
  out.reserve(input.size());
  auto i = std::size_t{0};
  while (i < input.size()) {
    const auto rest = input.substr(i);
    if (rest.starts_with(kNoBreakSpace)) {
      out.push_back(' ');
      i += kNoBreakSpace.size();
    } else if (rest.starts_with(kNarrowNoBreakSpace)) {
      out.push_back(' ');
      i += kNarrowNoBreakSpace.size();
    } else {
      out.push_back(input[i]);
      ++i;
    }
  }
  return out;
}

std::string collapse_whitespace(const std::string_view input) {
  auto out = std::string{};
  out.reserve(input.size());
  auto in_run = false;
  for (const auto c : normalize_spaces(input)) {
    if (is_ascii_whitespace(c)) {
      if (!in_run) {
        out.push_back(' ');
      }
      in_run = true;
      continue;
    }
    in_run = false;
    out.push_back(c);
  }
  return out;
}

bool contains_icase(const std::string_view haystack,
                    const std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool starts_with_icase(const std::string_view input,
                       const std::string_view prefix) {
  if (prefix.size() > input.size()) {
    return false;
  }
  return to_lower(input.substr(0, prefix.size())) == to_lower(prefix);
}

}  // namespace verdict::common
