#include <verdict/rpc/convert.hpp>

namespace verdict::rpc {

verdict::schema::case_input_t from_message(const v1::CaseInput& message) {
  auto input = verdict::schema::case_input_t{};
  input.natureza = message.natureza();
  switch (message.valor_condenacao_case()) {
    case v1::CaseInput::kValorNumber:
      input.valor_condenacao = message.valor_number();
      break;
    case v1::CaseInput::kValorText:
      input.valor_condenacao = message.valor_text();
      break;
    case v1::CaseInput::VALOR_CONDENACAO_NOT_SET:
    default:
      break;
  }
  if (message.has_transitado_em_julgado()) {
    input.transitado_em_julgado = message.transitado_em_julgado();
  }
  if (message.has_fase()) {
    input.fase = message.fase();
  }
  for (const auto& [name, present] : message.docs()) {
    input.docs.emplace(name, present);
  }
  return input;
}

verdict::schema::metadata_t from_message(const v1::Metadata& message) {
  auto metadata = verdict::schema::metadata_t{};
  for (const auto& [key, value] : message.entries()) {
    metadata.emplace(key, value);
  }
  return metadata;
}

v1::Outcome to_message(const verdict::schema::decision_outcome_t outcome) {
  using enum verdict::schema::decision_outcome_t;
  switch (outcome) {
    case approved:
      return v1::OUTCOME_APPROVED;
    case rejected:
      return v1::OUTCOME_REJECTED;
    case incomplete:
      return v1::OUTCOME_INCOMPLETE;
  }
  return v1::OUTCOME_UNSPECIFIED;
}

void populate(const verdict::schema::decision_t& source,
              v1::Decision* destination) {
  destination->set_outcome(to_message(source.outcome));
  for (const auto& citation : source.citations) {
    destination->add_citations(citation);
  }
  for (const auto& reason : source.reasons) {
    destination->add_reasons(reason);
  }
  destination->set_rationale(source.rationale);
}

void populate(const verdict::schema::chunk_t& source, v1::Chunk* destination) {
  destination->set_id(source.id);
  destination->set_index(source.index);
  destination->set_text(source.text);
}

void populate(const verdict::schema::metadata_t& source,
              v1::Metadata* destination) {
  for (const auto& [key, value] : source) {
    (*destination->mutable_entries())[key] = value;
  }
}

void populate(const verdict::schema::source_reference_t& source,
              v1::Source* destination) {
  destination->set_id(source.id);
  destination->set_text(source.text);
  for (const auto& [key, value] : source.metadata) {
    (*destination->mutable_metadata())[key] = value;
  }
  if (source.distance) {
    destination->set_distance(*source.distance);
  }
}

void populate(const verdict::schema::ingest_result_t& source,
              v1::IngestResponse* destination) {
  destination->set_collection(source.collection);
  destination->set_added(source.added);
  for (const auto& id : source.ids) {
    destination->add_ids(id);
  }
  destination->set_count_after(source.count_after);
}

void populate(const verdict::schema::retrieval_result_t& source,
              v1::QueryResponse* destination) {
  for (const auto& id : source.ids) {
    destination->add_ids(id);
  }
  for (const auto& document : source.documents) {
    destination->add_documents(document);
  }
  for (const auto& metadata : source.metadatas) {
    populate(metadata, destination->add_metadatas());
  }
  for (const auto distance : source.distances) {
    destination->add_distances(distance);
  }
}

}  // namespace verdict::rpc
