#include <gtest/gtest.h>
#include <verdict/execution/engine.hpp>
#include <verdict/policy/rules.hpp>
#include <verdict/testing/common.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

verdict::grounding::grounder make_grounder(
    verdict::grounding::language_model_t model) {
  auto options = verdict::grounding::grounder_options{};
  options.style = verdict::schema::prompt_style_t::compact;
  return verdict::grounding::grounder{std::move(model), options};
}

verdict::execution::engine_options make_options(std::string model) {
  auto options = verdict::execution::engine_options{};
  options.embedding_model = std::move(model);
  options.segmenter = verdict::ingest::segmenter_options{800, 150};
  options.top_k = 3;
  return options;
}

class engine_fixture : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = verdict::testing::make_db_path("verdict_engine_test");
    db_ = verdict::storage::make_storage<
        verdict::storage::rocksdb_storage_tag>(path_);
  }

  void TearDown() override {
    db_.database.reset();
    verdict::testing::remove_path(path_);
  }

  std::string path_;
  verdict::storage::rocksdb_storage_t db_;
};

}  // namespace

TEST_F(engine_fixture, construction_validates_dependencies) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  EXPECT_THROW(
      verdict::execution::engine(db_, nullptr, grounder, make_options("m")),
      std::invalid_argument);

  auto options = make_options("m");
  options.top_k = 0;
  EXPECT_THROW(verdict::execution::engine(
                   db_, verdict::testing::make_deterministic_embedder(),
                   grounder, options),
               std::invalid_argument);

  options = make_options("m");
  options.segmenter.overlap = options.segmenter.chunk_size;
  EXPECT_THROW(verdict::execution::engine(
                   db_, verdict::testing::make_deterministic_embedder(),
                   grounder, options),
               std::invalid_argument);
}

TEST_F(engine_fixture, ingest_writes_chunks_with_source_metadata) {
  auto seen = std::make_shared<std::vector<std::string>>();
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(seen), grounder,
      make_options("intfloat/multilingual-e5-small")};

  auto result = engine.ingest("acervo", "Primeira frase.  Segunda frase.",
                              "manual");
  EXPECT_EQ(result.collection, "acervo");
  EXPECT_EQ(result.added, 1u);
  auto ids = std::vector<std::string>{"manual-000000"};
  EXPECT_EQ(result.ids, ids);
  EXPECT_EQ(result.count_after, 1u);
  ASSERT_EQ(seen->size(), 1u);
  EXPECT_EQ(seen->front(), "passage: Primeira frase. Segunda frase.");

  auto again = engine.ingest("acervo", "Primeira frase.  Segunda frase.",
                             "manual");
  EXPECT_EQ(again.count_after, 1u);

  auto retrieved = engine.query("acervo", "frase", 5);
  ASSERT_EQ(retrieved.ids.size(), 1u);
  EXPECT_EQ(retrieved.metadatas[0].at("source"), "manual");
  EXPECT_EQ(retrieved.metadatas[0].at("i"), "0");
  EXPECT_EQ(seen->back(), "query: frase");
}

TEST_F(engine_fixture, ingest_with_custom_segmenter) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto result = engine.ingest(
      "acervo", "Frase número um aqui. Frase número dois aqui.", "doc",
      verdict::ingest::segmenter_options{25, 0});
  auto ids = std::vector<std::string>{"doc-000000", "doc-000001"};
  EXPECT_EQ(result.ids, ids);
  EXPECT_EQ(result.count_after, 2u);
}

TEST_F(engine_fixture, blank_ingest_writes_nothing) {
  auto seen = std::make_shared<std::vector<std::string>>();
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(seen), grounder,
      make_options("m")};

  auto result = engine.ingest("acervo", " \n\t ", "manual");
  EXPECT_EQ(result.added, 0u);
  EXPECT_TRUE(result.ids.empty());
  EXPECT_EQ(result.count_after, 0u);
  EXPECT_TRUE(seen->empty());
}

TEST_F(engine_fixture, seed_policies_is_idempotent) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto first = engine.seed_policies();
  EXPECT_EQ(first.collection, "policy");
  EXPECT_EQ(first.added, verdict::policy::kPolicyRules.size());
  EXPECT_EQ(first.count_after, 8u);
  EXPECT_EQ(first.ids.front(), "POL-1");
  EXPECT_EQ(first.ids.back(), "POL-8");

  auto second = engine.seed_policies();
  EXPECT_EQ(second.count_after, 8u);

  auto rule = verdict::policy::kPolicyRules[3];
  auto retrieved = engine.query("policy", rule.text, 1);
  ASSERT_EQ(retrieved.ids.size(), 1u);
  EXPECT_EQ(retrieved.ids[0], "POL-4");
  EXPECT_EQ(retrieved.metadatas[0].at("rule_id"), "POL-4");
  EXPECT_FLOAT_EQ(retrieved.distances[0], 0.0F);
}

TEST_F(engine_fixture, add_documents_generates_ids_and_refuses_conflicts) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto result = verdict::schema::ingest_result_t{};
  auto error = std::string{};
  ASSERT_TRUE(engine.add_documents("docs", {"um", "dois"}, {}, {}, result,
                                   error));
  auto ids = std::vector<std::string>{"docs-000000", "docs-000001"};
  EXPECT_EQ(result.ids, ids);
  EXPECT_EQ(result.added, 2u);
  EXPECT_EQ(result.count_after, 2u);

  auto tagged = std::vector<verdict::schema::metadata_t>(1);
  tagged.front().emplace("k", "v");
  ASSERT_TRUE(engine.add_documents("docs", {"três"}, tagged, {}, result,
                                   error));
  EXPECT_EQ(result.ids.front(), "docs-000002");

  EXPECT_FALSE(engine.add_documents("docs", {"quatro"}, {}, {"docs-000000"},
                                    result, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(engine.add_documents("docs", {"a", "b"}, tagged, {}, result,
                                    error));
  EXPECT_NE(error.find("metadatas"), std::string::npos);

  error.clear();
  EXPECT_FALSE(engine.add_documents("docs", {"a", "b"}, {}, {"x"}, result,
                                    error));
  EXPECT_NE(error.find("ids"), std::string::npos);
  EXPECT_EQ(engine.count("docs"), 3u);
}

TEST_F(engine_fixture, collections_are_created_and_listed) {
  auto grounder = make_grounder(verdict::testing::make_echo_model());
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  engine.create_collection("acervo");
  engine.create_collection("policy");
  auto expected = std::vector<std::string>{"acervo", "policy"};
  EXPECT_EQ(engine.list_collections(), expected);
  EXPECT_EQ(engine.count("acervo"), 0u);
}

TEST_F(engine_fixture, ask_answers_with_previewed_sources) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto grounder = make_grounder(
      verdict::testing::make_scripted_model("O prazo é de quinze dias.", calls));
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto long_text = std::string(300, 'x');
  engine.ingest("acervo", long_text, "longo");
  engine.ingest("acervo", "O prazo para recurso é de quinze dias.", "curto");

  auto answer = engine.ask("acervo", "Qual é o prazo?", 2);
  EXPECT_EQ(answer.text, "O prazo é de quinze dias.");
  EXPECT_EQ(calls->load(), 1);
  ASSERT_EQ(answer.sources.size(), 2u);

  auto found_preview = false;
  for (const auto& source : answer.sources) {
    EXPECT_TRUE(source.distance.has_value());
    if (source.id == "longo-000000") {
      EXPECT_EQ(source.text, std::string(240, 'x') + "...");
      found_preview = true;
    } else {
      EXPECT_EQ(source.text, "O prazo para recurso é de quinze dias.");
    }
  }
  EXPECT_TRUE(found_preview);
}

TEST_F(engine_fixture, ask_on_empty_collection_propagates_backend_errors) {
  auto grounder = make_grounder(verdict::testing::make_failing_model(
      verdict::schema::generation_error_code::unavailable));
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  EXPECT_THROW(engine.ask("vazio", "Qual é o prazo?"),
               verdict::grounding::generation_error);
}

TEST_F(engine_fixture, verify_approved_case) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto grounder = make_grounder(
      verdict::testing::make_scripted_model("não usado", calls));
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto input = verdict::schema::case_input_t{};
  input.natureza = "Cível";
  input.valor_condenacao = 50000.0;
  input.transitado_em_julgado = true;
  input.fase = "execução";

  auto result = engine.verify(input);
  EXPECT_EQ(result.decision.outcome,
            verdict::schema::decision_outcome_t::approved);
  EXPECT_EQ(result.decision.rationale,
            verdict::grounding::kApprovedRationale);
  EXPECT_TRUE(result.sources.empty());
  EXPECT_EQ(calls->load(), 0);
}

TEST_F(engine_fixture, verify_rejected_case_cites_rules) {
  auto grounder = make_grounder(verdict::testing::make_scripted_model(
      "Crédito trabalhista não é comprado conforme POL-4."));
  auto engine = verdict::execution::engine{
      db_, verdict::testing::make_deterministic_embedder(), grounder,
      make_options("m")};

  auto input = verdict::schema::case_input_t{};
  input.natureza = "Trabalhista";
  input.valor_condenacao = std::string{"800"};
  input.transitado_em_julgado = true;
  input.fase = "execução";

  auto result = engine.verify(input);
  EXPECT_EQ(result.decision.outcome,
            verdict::schema::decision_outcome_t::rejected);
  auto citations = std::vector<std::string>{"POL-4", "POL-3"};
  EXPECT_EQ(result.decision.citations, citations);
  EXPECT_EQ(result.decision.rationale,
            "Crédito trabalhista não é comprado conforme POL-4.");
  ASSERT_EQ(result.sources.size(), 2u);
  EXPECT_EQ(result.sources[0].id, "POL-4");
  EXPECT_EQ(result.sources[0].text, verdict::policy::kPolicyRules[3].text);
  EXPECT_FALSE(result.sources[0].distance.has_value());
}

TEST(engine, source_preview_counts_code_points) {
  EXPECT_EQ(verdict::execution::source_preview("curto"), "curto");
  auto accented = std::string{};
  for (auto i = 0; i < 241; ++i) {
    accented += "é";
  }
  auto preview = verdict::execution::source_preview(accented);
  EXPECT_EQ(preview.size(), 240u * 2u + 3u);
  EXPECT_TRUE(preview.ends_with("..."));
}
