#include <gtest/gtest.h>
#include <verdict/rpc/convert.hpp>
#include <verdict/rpc/status.hpp>

#include <string>
#include <variant>

using verdict::schema::generation_error_code;

TEST(rpc_convert, case_input_with_numeric_award) {
  auto message = verdict::rpc::v1::CaseInput{};
  message.set_natureza("Cível");
  message.set_valor_number(5000.5);
  message.set_transitado_em_julgado(false);
  (*message.mutable_docs())["comprovante_transito"] = true;

  auto input = verdict::rpc::from_message(message);
  EXPECT_EQ(input.natureza, "Cível");
  ASSERT_TRUE(input.valor_condenacao.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*input.valor_condenacao), 5000.5);
  ASSERT_TRUE(input.transitado_em_julgado.has_value());
  EXPECT_FALSE(*input.transitado_em_julgado);
  EXPECT_FALSE(input.fase.has_value());
  EXPECT_TRUE(input.docs.at("comprovante_transito"));
}

TEST(rpc_convert, case_input_with_text_award_and_absent_fields) {
  auto message = verdict::rpc::v1::CaseInput{};
  message.set_valor_text("abc");
  message.set_fase("conhecimento");

  auto input = verdict::rpc::from_message(message);
  ASSERT_TRUE(input.valor_condenacao.has_value());
  EXPECT_EQ(std::get<std::string>(*input.valor_condenacao), "abc");
  EXPECT_FALSE(input.transitado_em_julgado.has_value());
  EXPECT_EQ(input.fase.value_or(""), "conhecimento");

  auto empty = verdict::rpc::from_message(verdict::rpc::v1::CaseInput{});
  EXPECT_FALSE(empty.valor_condenacao.has_value());
  EXPECT_TRUE(empty.docs.empty());
}

TEST(rpc_convert, decision_message) {
  auto decision = verdict::schema::decision_t{};
  decision.outcome = verdict::schema::decision_outcome_t::incomplete;
  decision.citations = {"POL-8"};
  decision.reasons = {"Fase processual não informada."};
  decision.rationale = "Falta informar a fase.";

  auto message = verdict::rpc::v1::Decision{};
  verdict::rpc::populate(decision, &message);
  EXPECT_EQ(message.outcome(), verdict::rpc::v1::OUTCOME_INCOMPLETE);
  ASSERT_EQ(message.citations_size(), 1);
  EXPECT_EQ(message.citations(0), "POL-8");
  EXPECT_EQ(message.reasons(0), "Fase processual não informada.");
  EXPECT_EQ(message.rationale(), "Falta informar a fase.");
}

TEST(rpc_convert, source_distance_is_optional) {
  auto retrieved = verdict::schema::source_reference_t{};
  retrieved.id = "manual-000000";
  retrieved.text = "trecho";
  retrieved.metadata = {{"source", "manual"}, {"i", "0"}};
  retrieved.distance = 0.25F;

  auto message = verdict::rpc::v1::Source{};
  verdict::rpc::populate(retrieved, &message);
  EXPECT_TRUE(message.has_distance());
  EXPECT_FLOAT_EQ(message.distance(), 0.25F);
  EXPECT_EQ(message.metadata().at("source"), "manual");

  auto rule = verdict::schema::source_reference_t{};
  rule.id = "POL-4";
  auto rule_message = verdict::rpc::v1::Source{};
  verdict::rpc::populate(rule, &rule_message);
  EXPECT_FALSE(rule_message.has_distance());
}

TEST(rpc_convert, query_response_lists_stay_parallel) {
  auto result = verdict::schema::retrieval_result_t{};
  result.ids = {"a", "b"};
  result.documents = {"um", "dois"};
  result.metadatas = {{{"source", "x"}}, {}};
  result.distances = {0.5F, 1.5F};

  auto message = verdict::rpc::v1::QueryResponse{};
  verdict::rpc::populate(result, &message);
  EXPECT_EQ(message.ids_size(), 2);
  EXPECT_EQ(message.documents_size(), 2);
  EXPECT_EQ(message.metadatas_size(), 2);
  EXPECT_EQ(message.distances_size(), 2);
  EXPECT_EQ(message.metadatas(0).entries().at("source"), "x");
  EXPECT_TRUE(message.metadatas(1).entries().empty());

  auto back = verdict::rpc::from_message(message.metadatas(0));
  EXPECT_EQ(back.at("source"), "x");
}

TEST(rpc_status, generation_errors_map_to_status_codes) {
  EXPECT_EQ(verdict::rpc::to_status_code(generation_error_code::authentication),
            grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(verdict::rpc::to_status_code(generation_error_code::quota),
            grpc::StatusCode::RESOURCE_EXHAUSTED);
  EXPECT_EQ(verdict::rpc::to_status_code(generation_error_code::unavailable),
            grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(verdict::rpc::to_status_code(generation_error_code::timeout),
            grpc::StatusCode::DEADLINE_EXCEEDED);
  EXPECT_EQ(
      verdict::rpc::to_status_code(generation_error_code::invalid_response),
      grpc::StatusCode::INTERNAL);
}

TEST(rpc_status, backend_status_codes_map_to_generation_errors) {
  EXPECT_EQ(verdict::rpc::to_generation_error_code(
                grpc::StatusCode::PERMISSION_DENIED),
            generation_error_code::authentication);
  EXPECT_EQ(verdict::rpc::to_generation_error_code(
                grpc::StatusCode::RESOURCE_EXHAUSTED),
            generation_error_code::quota);
  EXPECT_EQ(verdict::rpc::to_generation_error_code(
                grpc::StatusCode::DEADLINE_EXCEEDED),
            generation_error_code::timeout);
  EXPECT_EQ(verdict::rpc::to_generation_error_code(grpc::StatusCode::DATA_LOSS),
            generation_error_code::invalid_response);
  EXPECT_EQ(verdict::rpc::to_generation_error_code(grpc::StatusCode::UNKNOWN),
            generation_error_code::unavailable);
}
