#pragma once

#include <verdict/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: decision outcome.
// Credit purchase workflow: result of evaluating a case against the policy
// table. Exactly one of approved, rejected or incomplete.
namespace verdict::schema {

enum class decision_outcome_t : uint8_t {
  approved = 0,
  rejected = 1,
  incomplete = 2
};

inline constexpr auto kDecisionOutcomeMappings =
    enum_mappings_t<decision_outcome_t, 3>{
        std::pair<std::string_view, decision_outcome_t>{
            "approved", decision_outcome_t::approved},
        std::pair<std::string_view, decision_outcome_t>{
            "rejected", decision_outcome_t::rejected},
        std::pair<std::string_view, decision_outcome_t>{
            "incomplete", decision_outcome_t::incomplete}};

template <>
inline std::optional<decision_outcome_t> try_from_string<decision_outcome_t>(
    const std::string_view value) {
  return from_string(value, kDecisionOutcomeMappings);
}

inline constexpr std::string_view to_string(const decision_outcome_t value) {
  return to_string(value, kDecisionOutcomeMappings).value_or("unknown");
}

}  // namespace verdict::schema
