#include <boost/program_options.hpp>
#include <verdict/common/critical.hpp>
#include <verdict/common/text.hpp>
#include <verdict/ingest/segmenter.hpp>
#include <verdict/policy/engine.hpp>
#include <verdict/policy/rules.hpp>
#include <verdict/schema/case_input.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  verdict-cli segment [--file path] [--source name] "
               "[--chunk-size n] [--chunk-overlap n]\n"
            << "  verdict-cli evaluate --natureza text [--valor value] "
               "[--transitado true|false] [--fase text] "
               "[--doc name=true|false ...]\n\n"
            << options << std::endl;
}

std::string read_text(const po::variables_map& vm) {
  if (!vm.contains("file")) {
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
  }
  const auto& path = vm["file"].as<std::string>();
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    verdict::common::critical("failed to open input file '{}'", path);
  }
  auto buffer = std::ostringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

std::optional<bool> parse_flag(const std::string_view value) {
  auto lowered = verdict::common::to_lower(verdict::common::trim(value));
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    return false;
  }
  return std::nullopt;
}

verdict::schema::case_input_t make_case(const po::variables_map& vm) {
  auto input = verdict::schema::case_input_t{};
  input.natureza = vm["natureza"].as<std::string>();
  if (vm.contains("valor")) {
    input.valor_condenacao =
        verdict::schema::award_value_t{vm["valor"].as<std::string>()};
  }
  if (vm.contains("transitado")) {
    auto flag = parse_flag(vm["transitado"].as<std::string>());
    if (!flag) {
      verdict::common::critical("--transitado expects true or false");
    }
    input.transitado_em_julgado = *flag;
  }
  if (vm.contains("fase")) {
    input.fase = vm["fase"].as<std::string>();
  }
  if (vm.contains("doc")) {
    for (const auto& entry : vm["doc"].as<std::vector<std::string>>()) {
      auto separator = entry.find('=');
      auto name = entry.substr(0, separator);
      auto flag = separator == std::string::npos
                      ? std::optional<bool>{true}
                      : parse_flag(std::string_view{entry}.substr(separator + 1));
      if (name.empty() || !flag) {
        verdict::common::critical("--doc expects name=true|false");
      }
      input.docs[name] = *flag;
    }
  }
  return input;
}

int run_segment(const po::variables_map& vm) {
  auto options = verdict::ingest::segmenter_options{
      .chunk_size = vm["chunk-size"].as<int32_t>(),
      .overlap = vm["chunk-overlap"].as<int32_t>()};
  auto text = read_text(vm);
  try {
    auto chunks = verdict::ingest::make_chunks(vm["source"].as<std::string>(),
                                               text, options);
    for (const auto& chunk : chunks) {
      std::cout << chunk.id << '\t' << chunk.text << '\n';
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int run_evaluate(const po::variables_map& vm) {
  if (!vm.contains("natureza")) {
    verdict::common::critical("evaluate mode requires --natureza");
  }
  auto decision = verdict::policy::evaluate(make_case(vm));
  std::cout << "decision: " << verdict::schema::to_string(decision.outcome)
            << '\n';
  for (const auto& rule : verdict::policy::policy_sources(decision.citations)) {
    std::cout << "citation: " << rule.id << " - " << rule.text << '\n';
  }
  for (const auto& reason : decision.reasons) {
    std::cout << "reason: " << reason << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"verdict-cli options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "segment|evaluate")(
      "file,f", po::value<std::string>(), "input text file (default stdin)")(
      "source", po::value<std::string>()->default_value("manual"),
      "source name used in chunk ids")(
      "chunk-size", po::value<int32_t>()->default_value(800),
      "chunk size in characters")(
      "chunk-overlap", po::value<int32_t>()->default_value(150),
      "overlap between chunks in characters")(
      "natureza", po::value<std::string>(), "nature of the lawsuit")(
      "valor", po::value<std::string>(), "award value")(
      "transitado", po::value<std::string>(), "res judicata (true|false)")(
      "fase", po::value<std::string>(), "procedural phase")(
      "doc", po::value<std::vector<std::string>>()->multitoken(),
      "document flags as name=true|false");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "segment") {
    return run_segment(vm);
  }
  if (command == "evaluate") {
    return run_evaluate(vm);
  }

  std::cerr << "unknown command '" << command << "'" << std::endl;
  print_help(options);
  return 1;
}
