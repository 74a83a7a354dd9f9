#pragma once

#include <verdict/schema/chunk.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::ingest {

/// Chunking parameters, in code points.
struct segmenter_options final {
  int32_t chunk_size{800};
  int32_t overlap{150};
};

/// Throw std::invalid_argument unless chunk_size > 0 and
/// 0 <= overlap < chunk_size.
void validate(const segmenter_options& options);

/// Split after '.', '!' or '?' when whitespace follows. No-break spaces count
/// as whitespace. Pieces are trimmed and empty pieces dropped.
std::vector<std::string> split_sentences(std::string_view text);

/// Greedy sentence packing with character overlap between consecutive
/// chunks.
///
/// A sentence that alone exceeds chunk_size while the buffer is empty is
/// truncated to chunk_size code points. Output chunks are whitespace
/// collapsed, trimmed and unique (first occurrence wins). Empty or
/// whitespace-only text yields no chunks. Options are validated first.
std::vector<std::string> segment(std::string_view text,
                                 const segmenter_options& options);

/// segment() plus stable ids and positions for one source document.
std::vector<verdict::schema::chunk_t> make_chunks(
    std::string_view source,
    std::string_view text,
    const segmenter_options& options);

}  // namespace verdict::ingest
