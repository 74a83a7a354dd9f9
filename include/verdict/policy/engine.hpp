#pragma once

#include <verdict/schema/case_input.hpp>
#include <verdict/schema/decision.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace verdict::policy {

/// Substrings of `natureza` (lower-cased) that mark a labor-court award.
inline constexpr auto kLaborKeywords =
    std::array{std::string_view{"trabalh"}, std::string_view{"labor"}};

/// Substring of `fase` (lower-cased) that marks the execution phase.
inline constexpr auto kExecutionPhaseKeyword = std::string_view{"execu"};

/// Minimum award value the fund buys, in BRL.
inline constexpr auto kMinimumAward = 1000.0;

/// Numeric award value, or std::nullopt when the raw text does not parse.
std::optional<double> parse_award_value(
    const verdict::schema::award_value_t& value);

/// Deterministic evaluation of a case against the policy table.
///
/// Never throws: missing or malformed fields become POL-8 citations. The
/// returned decision has outcome, citations and reasons filled in; the
/// rationale is left empty for the grounding layer.
verdict::schema::decision_t evaluate(
    const verdict::schema::case_input_t& input);

}  // namespace verdict::policy
