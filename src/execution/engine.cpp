#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <verdict/common/text.hpp>
#include <verdict/common/utf8.hpp>
#include <verdict/execution/engine.hpp>
#include <verdict/policy/engine.hpp>
#include <verdict/policy/rules.hpp>

#include <stdexcept>

namespace verdict::execution {

std::string source_preview(const std::string_view text) {
  if (verdict::common::utf8::length(text) <= kSourcePreviewLength) {
    return std::string{text};
  }
  auto preview =
      std::string{verdict::common::utf8::prefix(text, kSourcePreviewLength)};
  preview.append(kSourcePreviewEllipsis);
  return preview;
}

engine::engine(verdict::storage::rocksdb_storage_t& storage,
               verdict::embedding::embedder_t embedder,
               const verdict::grounding::grounder& grounder,
               engine_options options)
    : storage_{storage},
      embedder_{std::move(embedder)},
      grounder_{grounder},
      options_{std::move(options)} {
  if (!embedder_) {
    throw std::invalid_argument{"engine requires an embedder"};
  }
  if (options_.top_k == 0) {
    throw std::invalid_argument{"top_k must be at least 1"};
  }
  verdict::ingest::validate(options_.segmenter);
}

void engine::create_collection(const std::string_view name) const {
  storage_.create_collection(name);
}

std::vector<std::string> engine::list_collections() const {
  return storage_.list_collections();
}

uint64_t engine::count(const std::string_view collection) const {
  return storage_.count(collection);
}

std::vector<verdict::embedding::embedding_t> engine::embed(
    const std::vector<std::string>& texts,
    const verdict::schema::embedding_mode_t mode) const {
  auto inputs =
      verdict::embedding::prepare_inputs(options_.embedding_model, texts, mode);
  auto vectors = embedder_(inputs, mode);
  if (vectors.size() != texts.size()) {
    throw verdict::grounding::generation_error{
        verdict::schema::generation_error_code::invalid_response,
        fmt::format("embedder returned {} vectors for {} texts",
                    vectors.size(), texts.size())};
  }
  return vectors;
}

bool engine::add_documents(
    const std::string_view collection,
    const std::vector<std::string>& texts,
    const std::vector<verdict::schema::metadata_t>& metadatas,
    const std::vector<std::string>& ids,
    verdict::schema::ingest_result_t& result,
    std::string& error) const {
  if (!metadatas.empty() && metadatas.size() != texts.size()) {
    error = "metadatas must match texts in length";
    return false;
  }
  if (!ids.empty() && ids.size() != texts.size()) {
    error = "ids must match texts in length";
    return false;
  }

  auto resolved_ids = ids;
  if (resolved_ids.empty()) {
    auto base = storage_.count(collection);
    for (auto i = std::size_t{0}; i < texts.size(); ++i) {
      resolved_ids.push_back(fmt::format("{}-{:06d}", collection, base + i));
    }
  }

  auto vectors = embed(texts, verdict::schema::embedding_mode_t::passage);
  auto documents = std::vector<verdict::storage::document>{};
  documents.reserve(texts.size());
  for (auto i = std::size_t{0}; i < texts.size(); ++i) {
    documents.push_back(verdict::storage::document{
        .id = resolved_ids[i],
        .text = texts[i],
        .metadata = metadatas.empty() ? verdict::schema::metadata_t{}
                                      : metadatas[i],
        .embedding = std::move(vectors[i])});
  }

  auto written = storage_.add(collection, documents);
  if (!written.ok) {
    error = written.error;
    return false;
  }
  result.collection = std::string{collection};
  result.added = documents.size();
  result.ids = std::move(resolved_ids);
  result.count_after = storage_.count(collection);
  return true;
}

verdict::schema::ingest_result_t engine::ingest(
    const std::string_view collection,
    const std::string_view text,
    const std::string_view source,
    const std::optional<verdict::ingest::segmenter_options>& segmenter) const {
  auto result = verdict::schema::ingest_result_t{};
  result.collection = std::string{collection};
  if (verdict::common::trim(text).empty()) {
    result.count_after = storage_.count(collection);
    return result;
  }

  auto chunks = verdict::ingest::make_chunks(
      source, text, segmenter.value_or(options_.segmenter));
  auto texts = std::vector<std::string>{};
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }
  auto vectors = embed(texts, verdict::schema::embedding_mode_t::passage);

  auto documents = std::vector<verdict::storage::document>{};
  documents.reserve(chunks.size());
  for (auto i = std::size_t{0}; i < chunks.size(); ++i) {
    auto& chunk = chunks[i];
    result.ids.push_back(chunk.id);
    documents.push_back(verdict::storage::document{
        .id = std::move(chunk.id),
        .text = std::move(chunk.text),
        .metadata = {{"source", chunk.source},
                     {"i", std::to_string(chunk.index)}},
        .embedding = std::move(vectors[i])});
  }
  storage_.upsert(collection, documents);

  result.added = documents.size();
  result.count_after = storage_.count(collection);
  spdlog::info("Ingested {} chunks from '{}' into '{}'", result.added, source,
               collection);
  return result;
}

verdict::schema::ingest_result_t engine::seed_policies() const {
  auto texts = std::vector<std::string>{};
  auto result = verdict::schema::ingest_result_t{};
  result.collection = std::string{verdict::policy::kPolicyCollection};
  for (const auto& rule : verdict::policy::kPolicyRules) {
    texts.emplace_back(rule.text);
    result.ids.emplace_back(rule.id);
  }
  auto vectors = embed(texts, verdict::schema::embedding_mode_t::passage);

  auto documents = std::vector<verdict::storage::document>{};
  documents.reserve(texts.size());
  for (auto i = std::size_t{0}; i < texts.size(); ++i) {
    documents.push_back(verdict::storage::document{
        .id = result.ids[i],
        .text = texts[i],
        .metadata = {{"rule_id", result.ids[i]}},
        .embedding = std::move(vectors[i])});
  }
  storage_.upsert(verdict::policy::kPolicyCollection, documents);

  result.added = documents.size();
  result.count_after = storage_.count(verdict::policy::kPolicyCollection);
  spdlog::info("Seeded {} policy rules", result.added);
  return result;
}

verdict::schema::retrieval_result_t engine::query(
    const std::string_view collection,
    const std::string_view text,
    const uint32_t top_k) const {
  auto vectors = embed({std::string{text}},
                       verdict::schema::embedding_mode_t::query);
  return storage_.query(collection, vectors.front(),
                        top_k == 0 ? options_.top_k : top_k);
}

verdict::schema::answer_t engine::ask(const std::string_view collection,
                                      const std::string_view question,
                                      const uint32_t top_k) const {
  auto retrieved = query(collection, question, top_k);
  spdlog::debug("Retrieved {} passages from '{}'", retrieved.ids.size(),
                collection);

  auto result = verdict::schema::answer_t{};
  result.text = grounder_.answer(retrieved.documents, question);
  result.sources.reserve(retrieved.ids.size());
  for (auto i = std::size_t{0}; i < retrieved.ids.size(); ++i) {
    result.sources.push_back(verdict::schema::source_reference_t{
        .id = retrieved.ids[i],
        .text = source_preview(retrieved.documents[i]),
        .metadata = retrieved.metadatas[i],
        .distance = retrieved.distances[i]});
  }
  return result;
}

verdict::schema::verification_t engine::verify(
    const verdict::schema::case_input_t& input) const {
  auto result = verdict::schema::verification_t{};
  result.decision = verdict::policy::evaluate(input);
  result.decision.rationale = grounder_.rationale(result.decision.outcome,
                                                  result.decision.citations);
  for (const auto& rule :
       verdict::policy::policy_sources(result.decision.citations)) {
    result.sources.push_back(verdict::schema::source_reference_t{
        .id = std::string{rule.id}, .text = std::string{rule.text}});
  }
  spdlog::info("Verified case: {} ({})",
               verdict::schema::to_string(result.decision.outcome),
               fmt::join(result.decision.citations, ","));
  return result;
}

}  // namespace verdict::execution
