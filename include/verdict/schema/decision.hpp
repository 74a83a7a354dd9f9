#pragma once

#include <verdict/schema/decision_outcome.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: decision.
// Credit purchase workflow: outcome of a case evaluation with the cited rule
// ids (unique, first-seen order), the deterministic reasons and the
// natural-language rationale.
namespace verdict::schema {

template <uint16_t Version>
struct decision;

template <>
struct decision<1> final {
  decision_outcome_t outcome{decision_outcome_t::approved};
  std::vector<std::string> citations;
  std::vector<std::string> reasons;
  std::string rationale;
};

using decision_t = decision<1>;

}  // namespace verdict::schema
