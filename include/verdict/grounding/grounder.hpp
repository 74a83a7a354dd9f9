#pragma once

#include <verdict/grounding/language_model.hpp>
#include <verdict/schema/decision_outcome.hpp>
#include <verdict/schema/prompt_style.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::grounding {

inline constexpr auto kApprovedRationale = std::string_view{
    "Aprovado: atende às regras — trânsito em julgado comprovado, fase de "
    "execução e valor mínimo, sem impedimentos (ex.: trabalhista)."};

/// Context used when none of the cited rules resolve to a policy text.
inline constexpr auto kGenericPolicyContext =
    std::string_view{"Avaliar conforme as políticas internas aplicáveis."};

struct grounder_options final {
  verdict::schema::prompt_style_t style{
      verdict::schema::prompt_style_t::instruction_header};
  generation_options generation;
};

/// Default generation budget for a prompt style.
uint32_t default_max_new_tokens(verdict::schema::prompt_style_t style);

/// Produces short answers bounded by the supplied context.
///
/// The grounder owns no mutable state; one instance is shared by all request
/// handlers. Every answer is either a sanitized model reply or an extractive
/// fallback taken from the first context chunk, so it is never empty and
/// never contains leaked prompt instructions.
class grounder final {
 public:
  grounder(language_model_t model, grounder_options options);

  /// Answer `question` from `context_chunks`.
  ///
  /// Backend failures degrade to the extractive fallback when context is
  /// available; with no usable context the generation_error propagates.
  std::string answer(const std::vector<std::string>& context_chunks,
                     std::string_view question) const;

  /// Short justification for a decision. Approved decisions get
  /// kApprovedRationale without a model call; the others are explained from
  /// the texts of the cited rules.
  std::string rationale(verdict::schema::decision_outcome_t outcome,
                        const std::vector<std::string>& citations) const;

  const grounder_options& options() const { return options_; }

 private:
  std::string fallback(const std::vector<std::string>& context) const;

  language_model_t model_;
  grounder_options options_;
};

}  // namespace verdict::grounding
