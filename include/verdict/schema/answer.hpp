#pragma once

#include <verdict/schema/source_reference.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: answer.
// Answer workflow: grounded reply to a question with the passages it was
// drawn from, nearest first.
namespace verdict::schema {

template <uint16_t Version>
struct answer;

template <>
struct answer<1> final {
  std::string text;
  std::vector<source_reference_t> sources;
};

using answer_t = answer<1>;

}  // namespace verdict::schema
