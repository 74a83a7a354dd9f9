#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

// Schema type: case input.
// Credit purchase workflow: structured description of a lawsuit whose award
// is offered for purchase. Field names follow the intake form.
namespace verdict::schema {

/// Award value as received: a number, or raw text that still has to parse.
using award_value_t = std::variant<double, std::string>;

/// Document flag that proves res judicata when the boolean is unset.
inline constexpr auto kFinalityProofDocument = "comprovante_transito";

template <uint16_t Version>
struct case_input;

template <>
struct case_input<1> final {
  std::string natureza;
  std::optional<award_value_t> valor_condenacao;
  std::optional<bool> transitado_em_julgado;
  std::optional<std::string> fase;
  std::map<std::string, bool> docs;
};

using case_input_t = case_input<1>;

}  // namespace verdict::schema
