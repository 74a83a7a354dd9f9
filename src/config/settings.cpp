#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <verdict/common/text.hpp>
#include <verdict/config/settings.hpp>
#include <verdict/grounding/prompt.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace po = boost::program_options;

namespace {

std::string option_from_environment(const po::options_description& description,
                                    const std::string& variable) {
  auto name = std::string_view{variable};
  if (!name.starts_with(verdict::config::kEnvironmentPrefix)) {
    return {};
  }
  name.remove_prefix(verdict::config::kEnvironmentPrefix.size());
  auto option = verdict::common::to_lower(name);
  std::replace(std::begin(option), std::end(option), '_', '-');
  if (option == "help" || option == "verbose" ||
      description.find_nothrow(option, false) == nullptr) {
    return {};
  }
  return option;
}

template <typename Enum, std::size_t N>
Enum parse_enum(const std::string& option,
                const std::string& value,
                const verdict::schema::enum_mappings_t<Enum, N>& mappings) {
  auto parsed = verdict::schema::from_string(value, mappings);
  if (!parsed) {
    throw std::invalid_argument{"invalid value '" + value + "' for --" +
                                option + " (expected " +
                                verdict::schema::joined_names(mappings) + ")"};
  }
  return *parsed;
}

void require_positive(const std::string& option, const int64_t value) {
  if (value <= 0) {
    throw std::invalid_argument{"--" + option + " must be positive"};
  }
}

void require_uint32(const std::string& option, const int64_t value) {
  if (value > int64_t{std::numeric_limits<uint32_t>::max()}) {
    throw std::invalid_argument{"--" + option + " is out of range"};
  }
}

}  // namespace

namespace verdict::config {

std::optional<settings> load_settings(const int argc,
                                      const char* const argv[],
                                      std::ostream& help) {
  auto values = settings{};
  auto embeddings_backend = std::string{};
  auto log_level = std::string{};
  auto llm_timeout_ms = int64_t{};
  auto embed_timeout_ms = int64_t{};
  auto top_k = int64_t{};
  auto embedding_dimensions = int64_t{};
  auto max_new_tokens = int64_t{};

  auto description = po::options_description{"Verdict"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "app-name", po::value<std::string>(&values.app_name)
                      ->default_value(values.app_name),
      "Service name reported to clients")(
      "grpc-address,g",
      po::value<std::string>(&values.grpc_address)
          ->default_value(values.grpc_address),
      "IP:Port for the gRPC service")(
      "db-path", po::value<std::string>(&values.db_path)
                     ->default_value(values.db_path),
      "Vector store directory")(
      "embedding-model",
      po::value<std::string>(&values.embedding_model)
          ->default_value(values.embedding_model),
      "Embedding model name")(
      "embeddings-backend",
      po::value<std::string>(&embeddings_backend)->default_value("hashing"),
      "Embedding backend (hashing|remote)")(
      "embedding-dimensions",
      po::value<int64_t>(&embedding_dimensions)->default_value(384),
      "Width of the local hashing embedder")(
      "llm-model",
      po::value<std::string>(&values.llm_model)
          ->default_value(values.llm_model),
      "Language model name, selects the prompt style")(
      "llm-endpoint",
      po::value<std::string>(&values.llm_endpoint)
          ->default_value(values.llm_endpoint),
      "IP:Port of the remote model backend")(
      "llm-timeout-ms",
      po::value<int64_t>(&llm_timeout_ms)->default_value(60000),
      "Deadline for one generation call")(
      "embed-timeout-ms",
      po::value<int64_t>(&embed_timeout_ms)->default_value(30000),
      "Deadline for one remote embedding call")(
      "max-new-tokens", po::value<int64_t>(&max_new_tokens)->default_value(0),
      "Generation budget (0 = prompt style default)")(
      "chunk-size",
      po::value<int32_t>(&values.segmenter.chunk_size)
          ->default_value(values.segmenter.chunk_size),
      "Default chunk size in characters")(
      "chunk-overlap",
      po::value<int32_t>(&values.segmenter.overlap)
          ->default_value(values.segmenter.overlap),
      "Default overlap between chunks in characters")(
      "top-k", po::value<int64_t>(&top_k)->default_value(3),
      "Default number of retrieved passages")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warning|error|critical|off")(
      "log-file", po::value<std::string>(&values.log_file)
                      ->default_value(values.log_file),
      "Log file path");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description,
                                    [&](const std::string& variable) {
                                      return option_from_environment(
                                          description, variable);
                                    }),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    throw std::invalid_argument{ex.what()};
  }

  if (vm.contains("help")) {
    help << description << std::endl;
    return std::nullopt;
  }

  values.embeddings_backend =
      parse_enum("embeddings-backend", embeddings_backend,
                 verdict::schema::kEmbeddingsBackendMappings);

  require_positive("embedding-dimensions", embedding_dimensions);
  require_positive("llm-timeout-ms", llm_timeout_ms);
  require_positive("embed-timeout-ms", embed_timeout_ms);
  require_positive("top-k", top_k);
  if (max_new_tokens < 0) {
    throw std::invalid_argument{"--max-new-tokens must not be negative"};
  }
  require_uint32("embedding-dimensions", embedding_dimensions);
  require_uint32("top-k", top_k);
  require_uint32("max-new-tokens", max_new_tokens);
  verdict::ingest::validate(values.segmenter);

  values.embedding_dimensions = static_cast<uint32_t>(embedding_dimensions);
  values.llm_timeout = std::chrono::milliseconds{llm_timeout_ms};
  values.embed_timeout = std::chrono::milliseconds{embed_timeout_ms};
  values.top_k = static_cast<uint32_t>(top_k);
  values.max_new_tokens = static_cast<uint32_t>(max_new_tokens);

  values.log_level = spdlog::level::from_str(log_level);
  if (values.log_level == spdlog::level::off && log_level != "off") {
    throw std::invalid_argument{"invalid value '" + log_level +
                                "' for --log-level"};
  }
  if (vm.contains("verbose")) {
    values.log_level = spdlog::level::debug;
  }

  values.prompt_style = verdict::grounding::classify_model(values.llm_model);
  return values;
}

verdict::grounding::grounder_options make_grounder_options(
    const settings& values) {
  auto options = verdict::grounding::grounder_options{};
  options.style = values.prompt_style;
  options.generation.max_new_tokens =
      values.max_new_tokens != 0
          ? values.max_new_tokens
          : verdict::grounding::default_max_new_tokens(values.prompt_style);
  options.generation.timeout = values.llm_timeout;
  return options;
}

}  // namespace verdict::config
