#pragma once

#include <verdict/embedding/embedder.hpp>

#include <cstdint>

namespace verdict::embedding {

/// Local, dependency-free embedding backend based on signed feature hashing.
///
/// Lower-cased word tokens are hashed with BLAKE3 into `dimensions` buckets
/// and the result is L2 normalised. Identical text always maps to the same
/// vector; texts without tokens map to the zero vector.
class hashing_embedder final {
 public:
  explicit hashing_embedder(uint32_t dimensions);

  std::vector<embedding_t> operator()(
      const std::vector<std::string>& texts,
      verdict::schema::embedding_mode_t mode) const;

  embedding_t embed_one(std::string_view text) const;

  uint32_t dimensions() const { return dimensions_; }

 private:
  uint32_t dimensions_;
};

}  // namespace verdict::embedding
