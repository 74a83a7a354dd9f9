#pragma once

#include <verdict/schema/decision.hpp>
#include <verdict/schema/source_reference.hpp>

#include <cstdint>
#include <vector>

// Schema type: verification.
// Credit purchase workflow: decision with rationale plus the texts of the
// cited rules, in citation order.
namespace verdict::schema {

template <uint16_t Version>
struct verification;

template <>
struct verification<1> final {
  decision_t decision;
  std::vector<source_reference_t> sources;
};

using verification_t = verification<1>;

}  // namespace verdict::schema
