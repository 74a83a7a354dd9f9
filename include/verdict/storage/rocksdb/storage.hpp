#pragma once
#include <rocksdb/db.h>
#include <verdict/storage/storage.hpp>

#include <memory>
#include <mutex>
#include <string_view>

namespace verdict::storage {

namespace detail {

inline constexpr auto kCollectionPrefix = std::string_view{"COL|"};
inline constexpr auto kDocumentPrefix = std::string_view{"DOC|"};
inline constexpr auto kKeySeparator = '|';

std::string make_collection_key(std::string_view name);
std::string make_document_prefix(std::string_view collection);
std::string make_document_key(std::string_view collection, std::string_view id);

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  /// Serialises writers so the existence check in add() and its commit are
  /// one step. Held by pointer to keep the store movable.
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};

  void create_collection(const std::string_view& name) const;
  std::vector<std::string> list_collections() const;
  uint64_t count(const std::string_view& collection) const;
  write_result add(const std::string_view& collection,
                   const std::vector<document>& documents) const;
  void upsert(const std::string_view& collection,
              const std::vector<document>& documents) const;
  verdict::schema::retrieval_result_t query(const std::string_view& collection,
                                            const std::vector<float>& embedding,
                                            uint32_t top_k) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

}  // namespace verdict::storage
