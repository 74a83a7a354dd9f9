#pragma once

#include <verdict/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: embeddings backend.
// Retrieval workflow: local feature hashing or a remote model backend.
namespace verdict::schema {

enum class embeddings_backend_t : uint8_t { hashing = 0, remote = 1 };

inline constexpr auto kEmbeddingsBackendMappings =
    enum_mappings_t<embeddings_backend_t, 2>{
        std::pair<std::string_view, embeddings_backend_t>{
            "hashing", embeddings_backend_t::hashing},
        std::pair<std::string_view, embeddings_backend_t>{
            "remote", embeddings_backend_t::remote}};

template <>
inline std::optional<embeddings_backend_t>
try_from_string<embeddings_backend_t>(const std::string_view value) {
  return from_string(value, kEmbeddingsBackendMappings);
}

inline constexpr std::string_view to_string(const embeddings_backend_t value) {
  return to_string(value, kEmbeddingsBackendMappings).value_or("unknown");
}

}  // namespace verdict::schema
