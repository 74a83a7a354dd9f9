#pragma once

#include <verdict/embedding/embedder.hpp>
#include <verdict/grounding/grounder.hpp>
#include <verdict/ingest/segmenter.hpp>
#include <verdict/schema/answer.hpp>
#include <verdict/schema/case_input.hpp>
#include <verdict/schema/ingest_result.hpp>
#include <verdict/schema/retrieval_result.hpp>
#include <verdict/schema/verification.hpp>
#include <verdict/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::execution {

/// Source passages shown with an answer are cut to this many code points.
inline constexpr auto kSourcePreviewLength = std::size_t{240};
inline constexpr auto kSourcePreviewEllipsis = std::string_view{"..."};

struct engine_options final {
  std::string embedding_model;
  verdict::ingest::segmenter_options segmenter;
  uint32_t top_k{3};
};

/// Retrieval and decision service used by the RPC listener.
///
/// The engine owns no mutable state of its own: the store serialises writes
/// and the embedder and grounder are read-only, so one instance serves all
/// concurrent requests.
class engine final {
 public:
  engine(verdict::storage::rocksdb_storage_t& storage,
         verdict::embedding::embedder_t embedder,
         const verdict::grounding::grounder& grounder,
         engine_options options);

  void create_collection(std::string_view name) const;
  std::vector<std::string> list_collections() const;
  uint64_t count(std::string_view collection) const;

  /// Embed and insert texts under the given ids.
  ///
  /// Missing ids are generated as `collection-NNNNNN` from the current
  /// collection size. On failure, `error` contains a human-readable reason and
  /// nothing is written.
  bool add_documents(std::string_view collection,
                     const std::vector<std::string>& texts,
                     const std::vector<verdict::schema::metadata_t>& metadatas,
                     const std::vector<std::string>& ids,
                     verdict::schema::ingest_result_t& result,
                     std::string& error) const;

  /// Segment, embed and upsert one source document.
  ///
  /// Blank text writes nothing. Chunk ids are `source-NNNNNN`, so ingesting
  /// the same text twice replaces the earlier chunks.
  verdict::schema::ingest_result_t ingest(
      std::string_view collection,
      std::string_view text,
      std::string_view source,
      const std::optional<verdict::ingest::segmenter_options>& segmenter =
          std::nullopt) const;

  /// Upsert the policy table into the `policy` collection.
  verdict::schema::ingest_result_t seed_policies() const;

  /// Nearest passages to `text`; top_k of 0 selects the configured default.
  verdict::schema::retrieval_result_t query(std::string_view collection,
                                            std::string_view text,
                                            uint32_t top_k = 0) const;

  /// Retrieve, answer from the retrieved passages and list them as sources.
  verdict::schema::answer_t ask(std::string_view collection,
                                std::string_view question,
                                uint32_t top_k = 0) const;

  /// Evaluate the case, explain the decision and attach the cited rules.
  verdict::schema::verification_t verify(
      const verdict::schema::case_input_t& input) const;

  const engine_options& options() const { return options_; }

 private:
  std::vector<verdict::embedding::embedding_t> embed(
      const std::vector<std::string>& texts,
      verdict::schema::embedding_mode_t mode) const;

  verdict::storage::rocksdb_storage_t& storage_;
  verdict::embedding::embedder_t embedder_;
  const verdict::grounding::grounder& grounder_;
  engine_options options_;
};

/// `text` cut to kSourcePreviewLength code points, with an ellipsis when cut.
std::string source_preview(std::string_view text);

}  // namespace verdict::execution
