#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Schema type: chunk.
// Ingestion workflow: bounded, overlap-aware piece of a source document. The
// id is derived from source and index, so re-ingesting the same text with
// the same settings reproduces the same ids.
namespace verdict::schema {

template <uint16_t Version>
struct chunk;

template <>
struct chunk<1> final {
  std::string id;
  std::string source;
  uint32_t index{};
  std::string text;
};

using chunk_t = chunk<1>;

/// `source-NNNNNN` with the index zero padded to six digits.
std::string make_chunk_id(std::string_view source, uint32_t index);

}  // namespace verdict::schema
