#include <verdict/common/text.hpp>
#include <verdict/embedding/embedder.hpp>

namespace verdict::embedding {

bool uses_mode_prefix(const std::string_view model_name) {
  return verdict::common::contains_icase(model_name, "e5");
}

std::vector<std::string> prepare_inputs(
    const std::string_view model_name,
    const std::vector<std::string>& texts,
    const verdict::schema::embedding_mode_t mode) {
  const auto prefixed = uses_mode_prefix(model_name);
  const auto prefix = mode == verdict::schema::embedding_mode_t::query
                          ? std::string_view{"query: "}
                          : std::string_view{"passage: "};
  auto prepared = std::vector<std::string>{};
  prepared.reserve(texts.size());
  for (const auto& text : texts) {
    auto trimmed = std::string{verdict::common::trim(text)};
    prepared.push_back(prefixed ? std::string{prefix} + trimmed
                                : std::move(trimmed));
  }
  return prepared;
}

}  // namespace verdict::embedding
