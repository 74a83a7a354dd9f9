#pragma once

#include <verdict/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: prompt style.
// Grounding workflow: encoder-decoder models get a compact prompt; decoder-only
// models get an instruction header with the grounding directive. Resolved once
// from the configured model name.
namespace verdict::schema {

enum class prompt_style_t : uint8_t { compact = 0, instruction_header = 1 };

inline constexpr auto kPromptStyleMappings =
    enum_mappings_t<prompt_style_t, 2>{
        std::pair<std::string_view, prompt_style_t>{"compact",
                                                    prompt_style_t::compact},
        std::pair<std::string_view, prompt_style_t>{
            "instruction_header", prompt_style_t::instruction_header}};

template <>
inline std::optional<prompt_style_t> try_from_string<prompt_style_t>(
    const std::string_view value) {
  return from_string(value, kPromptStyleMappings);
}

inline constexpr std::string_view to_string(const prompt_style_t value) {
  return to_string(value, kPromptStyleMappings).value_or("unknown");
}

}  // namespace verdict::schema
