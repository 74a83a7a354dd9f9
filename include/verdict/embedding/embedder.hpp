#pragma once

#include <verdict/schema/embedding_mode.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::embedding {

using embedding_t = std::vector<float>;

/// Embedding backend: one vector per input text, in input order.
using embedder_t = std::function<std::vector<embedding_t>(
    const std::vector<std::string>& texts,
    verdict::schema::embedding_mode_t mode)>;

/// Whether the model family expects "query: " / "passage: " prefixes.
bool uses_mode_prefix(std::string_view model_name);

/// Trimmed texts, prefixed with the mode when the model expects it.
std::vector<std::string> prepare_inputs(std::string_view model_name,
                                        const std::vector<std::string>& texts,
                                        verdict::schema::embedding_mode_t mode);

}  // namespace verdict::embedding
