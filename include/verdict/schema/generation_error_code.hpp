#pragma once

#include <cstdint>
#include <string_view>

namespace verdict::schema {

enum class generation_error_code : uint32_t {
  authentication = 1,
  quota = 2,
  unavailable = 3,
  timeout = 4,
  invalid_response = 5,
};

inline constexpr std::string_view to_string(const generation_error_code code) {
  switch (code) {
    case generation_error_code::authentication:
      return "authentication";
    case generation_error_code::quota:
      return "quota";
    case generation_error_code::unavailable:
      return "unavailable";
    case generation_error_code::timeout:
      return "timeout";
    case generation_error_code::invalid_response:
      return "invalid_response";
  }
  return "unknown";
}

}  // namespace verdict::schema
