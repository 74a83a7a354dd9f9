#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: ingest result.
// Retrieval workflow: documents written by one ingestion or seeding call and
// the collection size afterwards.
namespace verdict::schema {

template <uint16_t Version>
struct ingest_result;

template <>
struct ingest_result<1> final {
  std::string collection;
  uint64_t added{};
  std::vector<std::string> ids;
  uint64_t count_after{};
};

using ingest_result_t = ingest_result<1>;

}  // namespace verdict::schema
