#include <verdict/storage/storage.hpp>

#include <limits>

namespace verdict::storage {

bool is_valid_collection_name(const std::string_view name) {
  return !name.empty() && name.find('|') == std::string_view::npos;
}

float squared_l2(const std::vector<float>& lhs, const std::vector<float>& rhs) {
  if (lhs.size() != rhs.size()) {
    return std::numeric_limits<float>::infinity();
  }
  auto sum = 0.0F;
  for (auto i = std::size_t{0}; i < lhs.size(); ++i) {
    const auto delta = lhs[i] - rhs[i];
    sum += delta * delta;
  }
  return sum;
}

}  // namespace verdict::storage
