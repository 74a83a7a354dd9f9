#pragma once

#include <verdict/schema/generation_error_code.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace verdict::grounding {

struct generation_options final {
  uint32_t max_new_tokens{64};
  std::chrono::milliseconds timeout{std::chrono::seconds{60}};
};

/// Opaque text generation backend: prompt in, decoded text out.
///
/// Implementations must honour `options.timeout` and report failures by
/// throwing generation_error.
using language_model_t = std::function<std::string(
    std::string_view prompt,
    const generation_options& options)>;

class generation_error final : public std::runtime_error {
 public:
  generation_error(verdict::schema::generation_error_code code,
                   const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  verdict::schema::generation_error_code code() const { return code_; }

 private:
  verdict::schema::generation_error_code code_;
};

}  // namespace verdict::grounding
