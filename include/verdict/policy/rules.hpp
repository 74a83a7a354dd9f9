#pragma once

#include <verdict/schema/policy_rule.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::policy {

inline constexpr auto kPolicyRules = std::array{
    verdict::schema::policy_rule_t{
        "POL-1",
        "Só compramos crédito de processos transitados em julgado e em fase "
        "de execução."},
    verdict::schema::policy_rule_t{"POL-2",
                                   "Exigir valor de condenação informado."},
    verdict::schema::policy_rule_t{
        "POL-3",
        "Valor de condenação inferior a R$ 1.000,00 → não compra."},
    verdict::schema::policy_rule_t{
        "POL-4", "Condenações na esfera trabalhista → não compra."},
    verdict::schema::policy_rule_t{
        "POL-5",
        "Óbito do autor sem habilitação no inventário → não compra."},
    verdict::schema::policy_rule_t{
        "POL-6", "Substabelecimento sem reserva de poderes → não compra."},
    verdict::schema::policy_rule_t{
        "POL-7",
        "Informar honorários contratuais, periciais e sucumbenciais quando "
        "existirem."},
    verdict::schema::policy_rule_t{
        "POL-8",
        "Se faltar documento essencial (ex.: trânsito em julgado não "
        "comprovado) → marcar como incomplete."}};

inline constexpr auto kPolicyCollection = std::string_view{"policy"};

std::optional<verdict::schema::policy_rule_t> find_policy_rule(
    std::string_view id);

/// Rules for the given citations, in citation order; unknown ids are kept
/// with empty text so callers can show what was cited. Those entries view
/// into `citations`, which must outlive the result.
std::vector<verdict::schema::policy_rule_t> policy_sources(
    const std::vector<std::string>& citations);

}  // namespace verdict::policy
