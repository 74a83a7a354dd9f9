#pragma once

#include <spdlog/common.h>
#include <verdict/grounding/grounder.hpp>
#include <verdict/ingest/segmenter.hpp>
#include <verdict/schema/embeddings_backend.hpp>
#include <verdict/schema/prompt_style.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace verdict::config {

/// Environment variables with this prefix map onto the long option names,
/// e.g. VERDICT_LLM_MODEL -> --llm-model. Command line values win.
inline constexpr auto kEnvironmentPrefix = std::string_view{"VERDICT_"};

/// Process configuration, resolved once at start-up and read-only afterwards.
struct settings final {
  std::string app_name{"verdict"};
  std::string version{"0.1.0"};
  std::string grpc_address{"0.0.0.0:50051"};
  std::string db_path{"./data/verdict"};
  std::string embedding_model{"paraphrase-multilingual-MiniLM-L12-v2"};
  verdict::schema::embeddings_backend_t embeddings_backend{
      verdict::schema::embeddings_backend_t::hashing};
  uint32_t embedding_dimensions{384};
  std::string llm_model{"google/flan-t5-small"};
  std::string llm_endpoint{"localhost:50052"};
  std::chrono::milliseconds llm_timeout{std::chrono::seconds{60}};
  std::chrono::milliseconds embed_timeout{std::chrono::seconds{30}};
  // 0 selects the prompt style default.
  uint32_t max_new_tokens{0};
  verdict::ingest::segmenter_options segmenter;
  uint32_t top_k{3};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"verdict.log"};

  // Derived from llm_model when the settings are loaded.
  verdict::schema::prompt_style_t prompt_style{
      verdict::schema::prompt_style_t::compact};
};

/// Parse command line and environment.
///
/// Returns std::nullopt after writing usage to `help` when --help is given.
/// Throws std::invalid_argument for unknown options or invalid values.
std::optional<settings> load_settings(int argc,
                                      const char* const argv[],
                                      std::ostream& help);

/// Grounder configuration derived from the settings.
verdict::grounding::grounder_options make_grounder_options(
    const settings& values);

}  // namespace verdict::config
