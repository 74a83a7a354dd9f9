#include <verdict/policy/rules.hpp>

#include <algorithm>
#include <iterator>

namespace verdict::policy {

std::optional<verdict::schema::policy_rule_t> find_policy_rule(
    const std::string_view id) {
  auto found = std::find_if(
      std::begin(kPolicyRules), std::end(kPolicyRules),
      [&](const verdict::schema::policy_rule_t& rule) { return rule.id == id; });
  if (found == std::end(kPolicyRules)) {
    return std::nullopt;
  }
  return *found;
}

std::vector<verdict::schema::policy_rule_t> policy_sources(
    const std::vector<std::string>& citations) {
  auto sources = std::vector<verdict::schema::policy_rule_t>{};
  sources.reserve(citations.size());
  for (const auto& citation : citations) {
    auto rule = find_policy_rule(citation);
    sources.push_back(rule.value_or(
        verdict::schema::policy_rule_t{.id = citation, .text = {}}));
  }
  return sources;
}

}  // namespace verdict::policy
