#pragma once

#include <verdict/embedding/embedder.hpp>
#include <verdict/grounding/language_model.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace verdict::testing {

/// Language model that always answers with `reply` and counts its calls.
inline verdict::grounding::language_model_t make_scripted_model(
    std::string reply,
    std::shared_ptr<std::atomic<int>> calls = nullptr) {
  return [reply = std::move(reply), calls = std::move(calls)](
             const std::string_view,
             const verdict::grounding::generation_options&) {
    if (calls) {
      ++*calls;
    }
    return reply;
  };
}

/// Language model that decodes to its own prompt.
inline verdict::grounding::language_model_t make_echo_model() {
  return [](const std::string_view prompt,
            const verdict::grounding::generation_options&) {
    return std::string{prompt};
  };
}

/// Language model that echoes the prompt and then appends `tail`.
inline verdict::grounding::language_model_t make_continuing_model(
    std::string tail) {
  return [tail = std::move(tail)](
             const std::string_view prompt,
             const verdict::grounding::generation_options&) {
    return std::string{prompt} + tail;
  };
}

/// Language model that fails every call with `code`.
inline verdict::grounding::language_model_t make_failing_model(
    const verdict::schema::generation_error_code code) {
  return [code](const std::string_view,
                const verdict::grounding::generation_options&) -> std::string {
    throw verdict::grounding::generation_error{code, "backend failure"};
  };
}

/// Embedder mapping each text to a short vector derived from its bytes, so
/// equal texts get equal vectors and similar lengths land close together.
inline verdict::embedding::embedder_t make_deterministic_embedder(
    std::shared_ptr<std::vector<std::string>> seen = nullptr) {
  return [seen = std::move(seen)](const std::vector<std::string>& texts,
                                  const verdict::schema::embedding_mode_t) {
    auto vectors = std::vector<verdict::embedding::embedding_t>{};
    for (const auto& text : texts) {
      if (seen) {
        seen->push_back(text);
      }
      auto sum = 0.0F;
      auto vowels = 0.0F;
      for (const auto c : text) {
        sum += static_cast<float>(static_cast<unsigned char>(c));
        if (c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u') {
          vowels += 1.0F;
        }
      }
      vectors.push_back({static_cast<float>(text.size()), vowels,
                         sum / 1000.0F});
    }
    return vectors;
  };
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace verdict::testing
