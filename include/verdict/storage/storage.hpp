#pragma once
#include <verdict/schema/retrieval_result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::storage {

/// One document of a collection with its embedding.
struct document final {
  std::string id;
  std::string text;
  verdict::schema::metadata_t metadata;
  std::vector<float> embedding;
};

/// Outcome of a write that can be refused without damaging the store.
struct write_result final {
  bool ok{true};
  std::string error;
};

template <typename Library>
struct storage {
  /// Register a collection; existing collections are left untouched.
  void create_collection(const std::string_view& name) const;

  /// Names of all registered collections, ascending.
  std::vector<std::string> list_collections() const;

  /// Number of documents in collection (0 when it does not exist).
  uint64_t count(const std::string_view& collection) const;

  /// Insert documents; refused as a whole when any id already exists.
  write_result add(const std::string_view& collection,
                   const std::vector<document>& documents) const;

  /// Insert or replace documents in one atomic batch.
  void upsert(const std::string_view& collection,
              const std::vector<document>& documents) const;

  /// The top_k nearest documents by squared L2 distance, ascending.
  verdict::schema::retrieval_result_t query(
      const std::string_view& collection,
      const std::vector<float>& embedding,
      uint32_t top_k) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Whether name can be used as a collection name.
bool is_valid_collection_name(std::string_view name);

/// Squared euclidean distance; infinity when dimensions differ.
float squared_l2(const std::vector<float>& lhs, const std::vector<float>& rhs);

}  // namespace verdict::storage
