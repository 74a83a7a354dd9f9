#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <verdict/grounding/grounder.hpp>
#include <verdict/grounding/prompt.hpp>
#include <verdict/grounding/sanitizer.hpp>
#include <verdict/policy/rules.hpp>

#include <stdexcept>
#include <utility>

namespace verdict::grounding {

uint32_t default_max_new_tokens(const verdict::schema::prompt_style_t style) {
  return style == verdict::schema::prompt_style_t::compact ? 64 : 96;
}

grounder::grounder(language_model_t model, grounder_options options)
    : model_{std::move(model)}, options_{std::move(options)} {
  if (!model_) {
    throw std::invalid_argument{"grounder requires a language model"};
  }
}

std::string grounder::answer(const std::vector<std::string>& context_chunks,
                             const std::string_view question) const {
  auto context = select_context(context_chunks);
  auto joined = build_context(context);
  auto prompt = build_prompt(options_.style, joined, question);

  auto decoded = std::string{};
  try {
    decoded = model_(prompt, options_.generation);
  } catch (const generation_error& ex) {
    if (context.empty()) {
      spdlog::error("Generation failed ({}) with no context to fall back on",
                    verdict::schema::to_string(ex.code()));
      throw;
    }
    spdlog::warn("Generation failed ({}): {}; using extractive fallback",
                 verdict::schema::to_string(ex.code()), ex.what());
    return fallback(context);
  }

  auto cleaned = sanitize(
      decoded, sanitize_context{.prompt = prompt, .question = question});
  if (is_unusable(cleaned)) {
    spdlog::debug("Discarding unusable generation ({} byte(s))",
                  cleaned.size());
    return fallback(context);
  }
  return cleaned;
}

std::string grounder::rationale(
    const verdict::schema::decision_outcome_t outcome,
    const std::vector<std::string>& citations) const {
  if (outcome == verdict::schema::decision_outcome_t::approved) {
    return std::string{kApprovedRationale};
  }

  auto chunks = std::vector<std::string>{};
  for (const auto& citation : citations) {
    if (auto rule = verdict::policy::find_policy_rule(citation)) {
      chunks.emplace_back(rule->text);
    }
  }
  if (chunks.empty()) {
    chunks.emplace_back(kGenericPolicyContext);
  }

  auto question = fmt::format(
      "Decisão: {}. Explique em 1–2 frases o porquê, citando os códigos das "
      "regras (ex.: POL-3, POL-4).",
      verdict::schema::to_string(outcome));
  return answer(chunks, question);
}

std::string grounder::fallback(const std::vector<std::string>& context) const {
  auto extracted =
      context.empty() ? std::string{} : first_sentence(context.front());
  if (extracted.empty() || looks_like_echo(extracted)) {
    return std::string{kNotFoundAnswer};
  }
  return extracted;
}

}  // namespace verdict::grounding
