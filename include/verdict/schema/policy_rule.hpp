#pragma once

#include <cstdint>
#include <string_view>

// Schema type: policy rule.
// Credit purchase workflow: one entry of the fixed internal policy table,
// referenced by decisions through its stable id.
namespace verdict::schema {

template <uint16_t Version>
struct policy_rule;

template <>
struct policy_rule<1> final {
  std::string_view id;
  std::string_view text;
};

using policy_rule_t = policy_rule<1>;

}  // namespace verdict::schema
