#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <verdict/common/critical.hpp>
#include <verdict/storage/rocksdb/storage.hpp>
#include <verdict/store/v1/records.pb.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace verdict::storage {

namespace detail {

std::string make_collection_key(const std::string_view name) {
  auto key = std::string{kCollectionPrefix};
  key.append(name);
  return key;
}

std::string make_document_prefix(const std::string_view collection) {
  auto key = std::string{kDocumentPrefix};
  key.append(collection);
  key.push_back(kKeySeparator);
  return key;
}

std::string make_document_key(const std::string_view collection,
                              const std::string_view id) {
  auto key = make_document_prefix(collection);
  key.append(id);
  return key;
}

}  // namespace detail

namespace {

void require_database(const storage<rocksdb_storage_tag>& store) {
  if (!store.database || !store.write_mutex) {
    verdict::common::critical("RocksDB database is not initialized");
  }
}

void require_collection_name(const std::string_view name) {
  if (!is_valid_collection_name(name)) {
    throw std::invalid_argument{"invalid collection name '" +
                                std::string{name} + "'"};
  }
}

std::string encode_document(const document& value) {
  auto record = verdict::store::v1::StoredDocument{};
  record.set_id(value.id);
  record.set_text(value.text);
  for (const auto& [key, entry] : value.metadata) {
    (*record.mutable_metadata())[key] = entry;
  }
  record.mutable_embedding()->Reserve(
      static_cast<int>(value.embedding.size()));
  for (const auto component : value.embedding) {
    record.add_embedding(component);
  }
  auto encoded = std::string{};
  if (!record.SerializeToString(&encoded)) {
    verdict::common::critical("failed to serialize stored document");
  }
  return encoded;
}

std::optional<document> decode_document(const ROCKSDB_NAMESPACE::Slice& raw) {
  auto record = verdict::store::v1::StoredDocument{};
  if (!record.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
    return std::nullopt;
  }
  auto value = document{};
  value.id = record.id();
  value.text = record.text();
  for (const auto& [key, entry] : record.metadata()) {
    value.metadata.emplace(key, entry);
  }
  value.embedding.assign(record.embedding().begin(), record.embedding().end());
  return value;
}

std::string encode_collection(const std::string_view name) {
  auto record = verdict::store::v1::CollectionRecord{};
  record.set_name(std::string{name});
  auto encoded = std::string{};
  if (!record.SerializeToString(&encoded)) {
    verdict::common::critical("failed to serialize collection record");
  }
  return encoded;
}

template <typename Visitor>
void scan_prefix(ROCKSDB_NAMESPACE::DB& database,
                 const std::string& prefix,
                 Visitor&& visit) {
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(read_options)};
  iterator->Seek(prefix);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    visit(key_view, iterator->value());
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    verdict::common::critical("RocksDB iteration failed: {}",
                              iterator->status().ToString());
  }
}

void put_collection(ROCKSDB_NAMESPACE::WriteBatch& batch,
                    const std::string_view name) {
  auto status =
      batch.Put(detail::make_collection_key(name), encode_collection(name));
  if (!status.ok()) {
    verdict::common::critical("failed writing collection record '{}': {}",
                              name, status.ToString());
  }
}

void put_documents(ROCKSDB_NAMESPACE::WriteBatch& batch,
                   const std::string_view collection,
                   const std::vector<document>& documents) {
  for (const auto& value : documents) {
    auto status = batch.Put(detail::make_document_key(collection, value.id),
                            encode_document(value));
    if (!status.ok()) {
      verdict::common::critical("failed writing document record '{}': {}",
                                value.id, status.ToString());
    }
  }
}

void commit(ROCKSDB_NAMESPACE::DB& database,
            ROCKSDB_NAMESPACE::WriteBatch& batch) {
  auto status = database.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    verdict::common::critical("Failed to write batch into RocksDB: {}",
                              status.ToString());
  }
}

}  // namespace

void storage<rocksdb_storage_tag>::create_collection(
    const std::string_view& name) const {
  require_database(*this);
  require_collection_name(name);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  put_collection(batch, name);
  auto lock = std::scoped_lock{*write_mutex};
  commit(*database, batch);
}

std::vector<std::string> storage<rocksdb_storage_tag>::list_collections()
    const {
  require_database(*this);
  auto names = std::vector<std::string>{};
  scan_prefix(*database, std::string{detail::kCollectionPrefix},
              [&](const std::string_view key, const ROCKSDB_NAMESPACE::Slice&) {
                names.emplace_back(key.substr(detail::kCollectionPrefix.size()));
              });
  return names;
}

uint64_t storage<rocksdb_storage_tag>::count(
    const std::string_view& collection) const {
  require_database(*this);
  require_collection_name(collection);
  auto total = uint64_t{0};
  scan_prefix(*database, detail::make_document_prefix(collection),
              [&](const std::string_view, const ROCKSDB_NAMESPACE::Slice&) {
                ++total;
              });
  return total;
}

write_result storage<rocksdb_storage_tag>::add(
    const std::string_view& collection,
    const std::vector<document>& documents) const {
  require_database(*this);
  require_collection_name(collection);

  auto lock = std::scoped_lock{*write_mutex};
  auto seen = std::unordered_set<std::string_view>{};
  for (const auto& value : documents) {
    if (!seen.insert(value.id).second) {
      return {false, "duplicate id '" + value.id + "' in request"};
    }
    auto existing = std::string{};
    auto status =
        database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                      detail::make_document_key(collection, value.id),
                      &existing);
    if (status.ok()) {
      return {false, "id '" + value.id + "' already exists in collection '" +
                         std::string{collection} + "'"};
    }
    if (!status.IsNotFound()) {
      verdict::common::critical("Failed to get value from RocksDB: {}",
                                status.ToString());
    }
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  put_collection(batch, collection);
  put_documents(batch, collection, documents);
  commit(*database, batch);
  return {};
}

void storage<rocksdb_storage_tag>::upsert(
    const std::string_view& collection,
    const std::vector<document>& documents) const {
  require_database(*this);
  require_collection_name(collection);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  put_collection(batch, collection);
  put_documents(batch, collection, documents);
  auto lock = std::scoped_lock{*write_mutex};
  commit(*database, batch);
  spdlog::debug("Upserted {} documents into '{}'", documents.size(),
                collection);
}

verdict::schema::retrieval_result_t storage<rocksdb_storage_tag>::query(
    const std::string_view& collection,
    const std::vector<float>& embedding,
    const uint32_t top_k) const {
  require_database(*this);
  require_collection_name(collection);
  if (top_k == 0) {
    throw std::invalid_argument{"top_k must be at least 1"};
  }

  struct candidate final {
    float distance{};
    document value;
  };
  auto candidates = std::vector<candidate>{};
  scan_prefix(
      *database, detail::make_document_prefix(collection),
      [&](const std::string_view key, const ROCKSDB_NAMESPACE::Slice& raw) {
        auto decoded = decode_document(raw);
        if (!decoded) {
          spdlog::warn("Failed decoding stored document for key '{}'", key);
          return;
        }
        auto distance = squared_l2(embedding, decoded->embedding);
        if (!std::isfinite(distance)) {
          spdlog::warn("Skipping document '{}' with mismatched dimensions",
                       decoded->id);
          return;
        }
        candidates.push_back(candidate{distance, std::move(*decoded)});
      });

  auto limit = std::min<std::size_t>(top_k, candidates.size());
  std::partial_sort(std::begin(candidates), std::begin(candidates) + limit,
                    std::end(candidates),
                    [](const candidate& lhs, const candidate& rhs) {
                      if (lhs.distance != rhs.distance) {
                        return lhs.distance < rhs.distance;
                      }
                      return lhs.value.id < rhs.value.id;
                    });

  auto result = verdict::schema::retrieval_result_t{};
  for (auto i = std::size_t{0}; i < limit; ++i) {
    auto& entry = candidates[i];
    result.ids.push_back(std::move(entry.value.id));
    result.documents.push_back(std::move(entry.value.text));
    result.metadatas.push_back(std::move(entry.value.metadata));
    result.distances.push_back(entry.distance);
  }
  return result;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    verdict::common::critical("Failed to open RocksDB at {}: {}", path,
                              status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace verdict::storage
