#include <gtest/gtest.h>
#include <verdict/common/text.hpp>
#include <verdict/grounding/grounder.hpp>
#include <verdict/grounding/prompt.hpp>
#include <verdict/grounding/sanitizer.hpp>
#include <verdict/testing/common.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

using verdict::schema::decision_outcome_t;
using verdict::schema::generation_error_code;
using verdict::schema::prompt_style_t;

namespace {

verdict::grounding::grounder make_grounder(
    verdict::grounding::language_model_t model,
    const prompt_style_t style = prompt_style_t::compact) {
  auto options = verdict::grounding::grounder_options{};
  options.style = style;
  options.generation.max_new_tokens =
      verdict::grounding::default_max_new_tokens(style);
  return verdict::grounding::grounder{std::move(model), options};
}

void expect_clean(const std::string& answer) {
  EXPECT_FALSE(answer.empty());
  for (const auto fragment : verdict::grounding::kLeakedInstructionFragments) {
    EXPECT_FALSE(verdict::common::contains_icase(answer, fragment))
        << "leaked '" << fragment << "' in '" << answer << "'";
  }
}

}  // namespace

TEST(grounder, requires_a_model) {
  EXPECT_THROW(
      (verdict::grounding::grounder{verdict::grounding::language_model_t{},
                                    verdict::grounding::grounder_options{}}),
      std::invalid_argument);
}

TEST(grounder, default_budgets_follow_style) {
  EXPECT_EQ(verdict::grounding::default_max_new_tokens(prompt_style_t::compact),
            64u);
  EXPECT_EQ(verdict::grounding::default_max_new_tokens(
                prompt_style_t::instruction_header),
            96u);
}

TEST(grounder, echoed_prompt_falls_back_to_first_sentence) {
  for (const auto style :
       {prompt_style_t::compact, prompt_style_t::instruction_header}) {
    auto grounder = make_grounder(verdict::testing::make_echo_model(), style);
    auto answer = grounder.answer({"A valid grounded sentence about X."},
                                  "unrelated question?");
    EXPECT_EQ(answer, "A valid grounded sentence about X.");
  }
}

TEST(grounder, clean_generation_is_returned_sanitized) {
  auto grounder = make_grounder(verdict::testing::make_scripted_model(
      "  \"O  prazo é de 15 dias.\"  "));
  EXPECT_EQ(grounder.answer({"O prazo recursal é de 15 dias úteis."},
                            "Qual o prazo?"),
            "O prazo é de 15 dias.");
}

TEST(grounder, continuation_after_prompt_is_kept) {
  auto grounder = make_grounder(
      verdict::testing::make_continuing_model(" O crédito foi cedido.\n\nX"));
  EXPECT_EQ(grounder.answer({"O crédito foi cedido em 2020."}, "Houve cessão?"),
            "O crédito foi cedido.");
}

TEST(grounder, leaked_instructions_never_reach_caller) {
  auto grounder = make_grounder(verdict::testing::make_scripted_model(
      "Use somente o contexto fornecido e responda."));
  auto answer = grounder.answer(
      {"O contrato foi assinado em março de 2021 pelas partes."}, "Quando?");
  EXPECT_EQ(answer, "O contrato foi assinado em março de 2021 pelas partes.");
  expect_clean(answer);
}

TEST(grounder, upper_case_leaked_instructions_never_reach_caller) {
  auto grounder = make_grounder(verdict::testing::make_scripted_model(
      "VOCÊ RESPONDE EM PORTUGUÊS, DE FORMA CONCISA E OBJETIVA."));
  auto answer = grounder.answer(
      {"O contrato foi assinado em março de 2021 pelas partes."}, "Quando?");
  EXPECT_EQ(answer, "O contrato foi assinado em março de 2021 pelas partes.");
  expect_clean(answer);
}

TEST(grounder, short_generation_uses_fallback) {
  auto grounder =
      make_grounder(verdict::testing::make_scripted_model("Sim"));
  EXPECT_EQ(grounder.answer({"Curto. O valor foi integralmente pago."}, "Pago?"),
            "O valor foi integralmente pago.");
}

TEST(grounder, leaking_context_yields_not_found) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  EXPECT_EQ(grounder.answer({"Pergunta: qual o valor devido ao autor?"}, "q"),
            verdict::grounding::kNotFoundAnswer);
}

TEST(grounder, empty_context_and_unusable_generation_yields_not_found) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  EXPECT_EQ(grounder.answer({}, "Qual o prazo?"),
            verdict::grounding::kNotFoundAnswer);
  EXPECT_EQ(grounder.answer({"   ", ""}, "Qual o prazo?"),
            verdict::grounding::kNotFoundAnswer);
}

TEST(grounder, backend_failure_with_context_degrades_to_fallback) {
  auto grounder = make_grounder(
      verdict::testing::make_failing_model(generation_error_code::quota));
  EXPECT_EQ(grounder.answer({"A cessão foi registrada em cartório."}, "?"),
            "A cessão foi registrada em cartório.");
}

TEST(grounder, backend_failure_without_context_propagates) {
  auto grounder = make_grounder(verdict::testing::make_failing_model(
      generation_error_code::authentication));
  try {
    static_cast<void>(grounder.answer({}, "Qual o prazo?"));
    FAIL() << "expected generation_error";
  } catch (const verdict::grounding::generation_error& e) {
    EXPECT_EQ(e.code(), generation_error_code::authentication);
  }
}

TEST(grounder, approved_rationale_skips_the_model) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto grounder = make_grounder(
      verdict::testing::make_scripted_model("qualquer coisa", calls));
  EXPECT_EQ(grounder.rationale(decision_outcome_t::approved, {}),
            verdict::grounding::kApprovedRationale);
  EXPECT_EQ(grounder.rationale(decision_outcome_t::approved, {"POL-3"}),
            verdict::grounding::kApprovedRationale);
  EXPECT_EQ(calls->load(), 0);
}

TEST(grounder, rejected_rationale_is_grounded_in_cited_rules) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  EXPECT_EQ(grounder.rationale(decision_outcome_t::rejected, {"POL-3", "POL-4"}),
            "Valor de condenação inferior a R$ 1.000,00 → não compra.");
}

TEST(grounder, rationale_for_unknown_rules_uses_generic_context) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  EXPECT_EQ(grounder.rationale(decision_outcome_t::incomplete, {"POL-99"}),
            verdict::grounding::kGenericPolicyContext);
}

TEST(grounder, rationale_uses_model_reply_when_usable) {
  auto grounder = make_grounder(verdict::testing::make_scripted_model(
      "Rejeitado pela POL-4: crédito trabalhista."));
  EXPECT_EQ(grounder.rationale(decision_outcome_t::rejected, {"POL-4"}),
            "Rejeitado pela POL-4: crédito trabalhista.");
}
