#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Schema type: retrieval result.
// Retrieval workflow: parallel lists returned by a vector store query,
// ascending by distance. All four lists always have the same length.
namespace verdict::schema {

using metadata_t = std::map<std::string, std::string>;

template <uint16_t Version>
struct retrieval_result;

template <>
struct retrieval_result<1> final {
  std::vector<std::string> ids;
  std::vector<std::string> documents;
  std::vector<metadata_t> metadatas;
  std::vector<float> distances;
};

using retrieval_result_t = retrieval_result<1>;

}  // namespace verdict::schema
