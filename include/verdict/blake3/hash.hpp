#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace verdict::blake3 {

using digest_t = std::array<uint8_t, 32>;

digest_t hash(const std::string_view& str);
digest_t hash(const std::span<const uint8_t>& bytes);

}  // namespace verdict::blake3
