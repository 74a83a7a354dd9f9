#include <spdlog/spdlog.h>
#include <verdict/common/text.hpp>
#include <verdict/policy/engine.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

using namespace verdict::schema;

namespace {

constexpr auto kFinalityRule = "POL-1";
constexpr auto kMinimumAwardRule = "POL-3";
constexpr auto kLaborRule = "POL-4";
constexpr auto kIncompleteRule = "POL-8";

constexpr auto kReasonLabor = "Crédito de natureza trabalhista.";
constexpr auto kReasonBelowMinimum =
    "Valor de condenação inferior a R$ 1.000,00.";
constexpr auto kReasonInvalidAward = "Valor de condenação inválido ou ausente.";
constexpr auto kReasonNotFinal = "Processo não transitado em julgado.";
constexpr auto kReasonMissingFinalityProof =
    "Falta comprovação do trânsito em julgado (documento essencial).";
constexpr auto kReasonNotExecution = "Caso não está em fase de execução.";
constexpr auto kReasonPhaseMissing = "Fase processual não informada.";

std::vector<std::string> dedupe(const std::vector<std::string>& values) {
  auto seen = std::unordered_set<std::string>{};
  auto out = std::vector<std::string>{};
  for (const auto& value : values) {
    if (seen.insert(value).second) {
      out.push_back(value);
    }
  }
  return out;
}

bool contains(const std::vector<std::string>& values,
              const std::string_view value) {
  return std::find(std::begin(values), std::end(values), value) !=
         std::end(values);
}

bool has_document(const case_input_t& input, const std::string_view name) {
  auto found = input.docs.find(std::string{name});
  return found != std::end(input.docs) && found->second;
}

}  // namespace

namespace verdict::policy {

std::optional<double> parse_award_value(const award_value_t& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    return *number;
  }
  auto text = verdict::common::trim(std::get<std::string>(value));
  if (text.starts_with('+')) {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  auto parsed = double{};
  const auto* last = text.data() + text.size();
  auto [end, error] = std::from_chars(text.data(), last, parsed);
  if (error != std::errc{} || end != last) {
    return std::nullopt;
  }
  return parsed;
}

decision_t evaluate(const case_input_t& input) {
  auto citations = std::vector<std::string>{};
  auto reasons = std::vector<std::string>{};
  auto cite = [&](const std::string_view rule, const std::string_view reason) {
    citations.emplace_back(rule);
    reasons.emplace_back(reason);
  };

  const auto natureza = verdict::common::to_lower(
      verdict::common::trim(input.natureza));
  const auto fase = verdict::common::to_lower(
      verdict::common::trim(input.fase.value_or(std::string{})));

  auto labor = std::any_of(
      std::begin(kLaborKeywords), std::end(kLaborKeywords),
      [&](const std::string_view keyword) {
        return natureza.find(keyword) != std::string::npos;
      });
  if (labor) {
    cite(kLaborRule, kReasonLabor);
  }

  if (input.valor_condenacao.has_value()) {
    auto award = parse_award_value(*input.valor_condenacao);
    if (!award.has_value()) {
      cite(kIncompleteRule, kReasonInvalidAward);
    } else if (*award < kMinimumAward) {
      cite(kMinimumAwardRule, kReasonBelowMinimum);
    }
  }

  const auto not_final = input.transitado_em_julgado.has_value() &&
                         !*input.transitado_em_julgado;
  if (not_final) {
    cite(kFinalityRule, kReasonNotFinal);
  } else if (!input.transitado_em_julgado.has_value() &&
             !has_document(input, kFinalityProofDocument)) {
    cite(kIncompleteRule, kReasonMissingFinalityProof);
  }

  if (fase.empty()) {
    cite(kIncompleteRule, kReasonPhaseMissing);
  } else if (fase.find(kExecutionPhaseKeyword) == std::string::npos) {
    cite(kFinalityRule, kReasonNotExecution);
  }

  auto result = decision_t{};
  result.citations = dedupe(citations);
  result.reasons = std::move(reasons);

  const auto& cited = result.citations;
  if (contains(cited, kLaborRule) || contains(cited, kMinimumAwardRule) ||
      not_final ||
      (contains(cited, kFinalityRule) && !contains(cited, kIncompleteRule))) {
    result.outcome = decision_outcome_t::rejected;
  } else if (contains(cited, kIncompleteRule)) {
    result.outcome = decision_outcome_t::incomplete;
  } else {
    result.outcome = decision_outcome_t::approved;
  }

  spdlog::debug("Evaluated case: outcome={} citations={}",
                to_string(result.outcome), result.citations.size());
  return result;
}

}  // namespace verdict::policy
