#pragma once

#include <verdict/rpc/v1/verdict.pb.h>
#include <verdict/schema/case_input.hpp>
#include <verdict/schema/chunk.hpp>
#include <verdict/schema/decision.hpp>
#include <verdict/schema/ingest_result.hpp>
#include <verdict/schema/retrieval_result.hpp>
#include <verdict/schema/source_reference.hpp>

#include <vector>

// Conversions between wire messages and the schema types.
namespace verdict::rpc {

verdict::schema::case_input_t from_message(const v1::CaseInput& message);

verdict::schema::metadata_t from_message(const v1::Metadata& message);

v1::Outcome to_message(verdict::schema::decision_outcome_t outcome);

void populate(const verdict::schema::decision_t& source, v1::Decision* destination);
void populate(const verdict::schema::chunk_t& source, v1::Chunk* destination);
void populate(const verdict::schema::source_reference_t& source,
              v1::Source* destination);
void populate(const verdict::schema::ingest_result_t& source,
              v1::IngestResponse* destination);
void populate(const verdict::schema::retrieval_result_t& source,
              v1::QueryResponse* destination);
void populate(const verdict::schema::metadata_t& source,
              v1::Metadata* destination);

}  // namespace verdict::rpc
