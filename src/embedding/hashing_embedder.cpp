#include <verdict/blake3/hash.hpp>
#include <verdict/common/text.hpp>
#include <verdict/embedding/hashing_embedder.hpp>

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace verdict::embedding {

namespace {

bool is_token_byte(const char c) {
  const auto uc = static_cast<unsigned char>(c);
  return uc >= 0x80u || std::isalnum(uc) != 0;
}

template <typename Visitor>
void for_each_token(const std::string_view text, Visitor&& visit) {
  auto i = std::size_t{0};
  while (i < text.size()) {
    while (i < text.size() && !is_token_byte(text[i])) {
      ++i;
    }
    auto start = i;
    while (i < text.size() && is_token_byte(text[i])) {
      ++i;
    }
    if (i > start) {
      visit(text.substr(start, i - start));
    }
  }
}

}  // namespace

hashing_embedder::hashing_embedder(const uint32_t dimensions)
    : dimensions_{dimensions} {
  if (dimensions_ == 0) {
    throw std::invalid_argument{"embedding dimensions must be positive"};
  }
}

std::vector<embedding_t> hashing_embedder::operator()(
    const std::vector<std::string>& texts,
    const verdict::schema::embedding_mode_t mode) const {
  static_cast<void>(mode);
  auto vectors = std::vector<embedding_t>{};
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

embedding_t hashing_embedder::embed_one(const std::string_view text) const {
  auto vector = embedding_t(dimensions_, 0.0F);
  const auto lowered = verdict::common::to_lower(text);
  for_each_token(lowered, [&](const std::string_view token) {
    const auto digest = verdict::blake3::hash(token);
    const auto bucket = (static_cast<uint32_t>(digest[0]) |
                         (static_cast<uint32_t>(digest[1]) << 8u) |
                         (static_cast<uint32_t>(digest[2]) << 16u) |
                         (static_cast<uint32_t>(digest[3]) << 24u)) %
                        dimensions_;
    vector[bucket] += (digest[4] & 1u) != 0 ? -1.0F : 1.0F;
  });

  auto norm = 0.0F;
  for (const auto value : vector) {
    norm += value * value;
  }
  if (norm > 0.0F) {
    norm = std::sqrt(norm);
    for (auto& value : vector) {
      value /= norm;
    }
  }
  return vector;
}

}  // namespace verdict::embedding
