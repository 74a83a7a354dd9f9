#include <gtest/gtest.h>
#include <verdict/schema/case_input.hpp>
#include <verdict/schema/chunk.hpp>
#include <verdict/schema/decision.hpp>
#include <verdict/schema/decision_outcome.hpp>
#include <verdict/schema/embedding_mode.hpp>
#include <verdict/schema/embeddings_backend.hpp>
#include <verdict/schema/generation_error_code.hpp>
#include <verdict/schema/prompt_style.hpp>
#include <verdict/schema/retrieval_result.hpp>

TEST(schema_types, defaults_are_stable) {
  auto decision = verdict::schema::decision_t{};
  EXPECT_EQ(decision.outcome, verdict::schema::decision_outcome_t::approved);
  EXPECT_TRUE(decision.citations.empty());
  EXPECT_TRUE(decision.rationale.empty());

  auto input = verdict::schema::case_input_t{};
  EXPECT_FALSE(input.valor_condenacao.has_value());
  EXPECT_FALSE(input.transitado_em_julgado.has_value());
  EXPECT_FALSE(input.fase.has_value());
  EXPECT_TRUE(input.docs.empty());

  auto retrieved = verdict::schema::retrieval_result_t{};
  EXPECT_TRUE(retrieved.ids.empty());
  EXPECT_TRUE(retrieved.distances.empty());
}

TEST(schema_types, decision_outcome_strings) {
  using verdict::schema::decision_outcome_t;
  EXPECT_EQ(verdict::schema::to_string(decision_outcome_t::approved),
            "approved");
  EXPECT_EQ(verdict::schema::to_string(decision_outcome_t::rejected),
            "rejected");
  EXPECT_EQ(verdict::schema::to_string(decision_outcome_t::incomplete),
            "incomplete");
  EXPECT_EQ(verdict::schema::try_from_string<decision_outcome_t>("incomplete"),
            decision_outcome_t::incomplete);
  EXPECT_FALSE(
      verdict::schema::try_from_string<decision_outcome_t>("Approved")
          .has_value());
}

TEST(schema_types, enum_mappings_round_trip_names) {
  using verdict::schema::embedding_mode_t;
  using verdict::schema::embeddings_backend_t;
  using verdict::schema::prompt_style_t;
  EXPECT_EQ(verdict::schema::try_from_string<embedding_mode_t>("query"),
            embedding_mode_t::query);
  EXPECT_EQ(verdict::schema::to_string(embedding_mode_t::passage), "passage");
  EXPECT_EQ(verdict::schema::try_from_string<embeddings_backend_t>("remote"),
            embeddings_backend_t::remote);
  EXPECT_EQ(verdict::schema::to_string(prompt_style_t::instruction_header),
            "instruction_header");
  EXPECT_EQ(verdict::schema::joined_names(
                verdict::schema::kEmbeddingsBackendMappings),
            "hashing|remote");
}

TEST(schema_types, generation_error_code_strings) {
  using verdict::schema::generation_error_code;
  EXPECT_EQ(verdict::schema::to_string(generation_error_code::authentication),
            "authentication");
  EXPECT_EQ(verdict::schema::to_string(generation_error_code::timeout),
            "timeout");
  EXPECT_EQ(verdict::schema::to_string(generation_error_code::invalid_response),
            "invalid_response");
}

TEST(schema_types, chunk_ids_are_zero_padded) {
  EXPECT_EQ(verdict::schema::make_chunk_id("manual", 0), "manual-000000");
  EXPECT_EQ(verdict::schema::make_chunk_id("doc.pdf", 42), "doc.pdf-000042");
  EXPECT_EQ(verdict::schema::make_chunk_id("x", 1234567), "x-1234567");
}
