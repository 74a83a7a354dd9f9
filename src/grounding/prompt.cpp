#include <fmt/format.h>
#include <verdict/common/text.hpp>
#include <verdict/grounding/prompt.hpp>

#include <algorithm>
#include <iterator>

namespace verdict::grounding {

verdict::schema::prompt_style_t classify_model(
    const std::string_view model_name) {
  auto compact = std::any_of(std::begin(kCompactModelFamilies),
                             std::end(kCompactModelFamilies),
                             [&](const std::string_view family) {
                               return verdict::common::contains_icase(
                                   model_name, family);
                             });
  return compact ? verdict::schema::prompt_style_t::compact
                 : verdict::schema::prompt_style_t::instruction_header;
}

std::vector<std::string> select_context(
    const std::vector<std::string>& chunks) {
  auto selected = std::vector<std::string>{};
  for (const auto& chunk : chunks) {
    if (selected.size() == kMaxContextChunks) {
      break;
    }
    auto trimmed = verdict::common::trim(chunk);
    if (!trimmed.empty()) {
      selected.emplace_back(trimmed);
    }
  }
  return selected;
}

std::string build_context(const std::vector<std::string>& chunks) {
  auto context = std::string{};
  for (const auto& chunk : select_context(chunks)) {
    if (!context.empty()) {
      context.append(kContextSeparator);
    }
    context.append(chunk);
  }
  return context;
}

std::string build_prompt(const verdict::schema::prompt_style_t style,
                         const std::string_view context,
                         const std::string_view question) {
  if (style == verdict::schema::prompt_style_t::compact) {
    return fmt::format(
        "Contexto:\n{}\n\nPergunta: {}\n"
        "Responda em 1–2 frases, usando apenas o contexto acima:",
        context, question);
  }
  return fmt::format(
      "{}\n\n### CONTEXTO\n{}\n\n### PERGUNTA\n{}\n\n### RESPOSTA\n",
      kGroundingDirective, context, question);
}

}  // namespace verdict::grounding
