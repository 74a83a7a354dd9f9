#include <blake3.h>
#include <verdict/blake3/hash.hpp>

namespace verdict::blake3 {

namespace {

digest_t finalize(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = digest_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

digest_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

digest_t hash(const std::span<const uint8_t>& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace verdict::blake3
