#pragma once

#include <verdict/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: embedding mode.
// Retrieval workflow: asymmetric embedding models encode stored passages and
// search queries differently.
namespace verdict::schema {

enum class embedding_mode_t : uint8_t { passage = 0, query = 1 };

inline constexpr auto kEmbeddingModeMappings =
    enum_mappings_t<embedding_mode_t, 2>{
        std::pair<std::string_view, embedding_mode_t>{
            "passage", embedding_mode_t::passage},
        std::pair<std::string_view, embedding_mode_t>{
            "query", embedding_mode_t::query}};

template <>
inline std::optional<embedding_mode_t> try_from_string<embedding_mode_t>(
    const std::string_view value) {
  return from_string(value, kEmbeddingModeMappings);
}

inline constexpr std::string_view to_string(const embedding_mode_t value) {
  return to_string(value, kEmbeddingModeMappings).value_or("unknown");
}

}  // namespace verdict::schema
