#pragma once

#include <verdict/schema/retrieval_result.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: source reference.
// Answer workflow: one piece of evidence shown next to an answer. Retrieved
// passages carry metadata and distance; cited policy rules carry the rule id.
namespace verdict::schema {

template <uint16_t Version>
struct source_reference;

template <>
struct source_reference<1> final {
  std::string id;
  std::string text;
  metadata_t metadata;
  std::optional<float> distance;
};

using source_reference_t = source_reference<1>;

}  // namespace verdict::schema
