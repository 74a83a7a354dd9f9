#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <verdict/common/critical.hpp>
#include <verdict/config/settings.hpp>
#include <verdict/embedding/hashing_embedder.hpp>
#include <verdict/execution/engine.hpp>
#include <verdict/grounding/grounder.hpp>
#include <verdict/rpc/model_backend.hpp>
#include <verdict/rpc/server.hpp>
#include <verdict/storage/rocksdb/storage.hpp>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void install_logger(const verdict::config::settings& values) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      values.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      values.app_name, spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(values.log_level);
}

verdict::embedding::embedder_t make_embedder(
    const verdict::config::settings& values,
    const std::shared_ptr<const verdict::rpc::model_backend_client>& backend) {
  switch (values.embeddings_backend) {
    case verdict::schema::embeddings_backend_t::remote:
      return verdict::rpc::make_remote_embedder(backend);
    case verdict::schema::embeddings_backend_t::hashing:
    default:
      return verdict::embedding::hashing_embedder{values.embedding_dimensions};
  }
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto loaded = std::optional<verdict::config::settings>{};
  try {
    loaded = verdict::config::load_settings(argc, argv, std::cout);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  if (!loaded) {
    return 0;
  }
  const auto& values = *loaded;

  install_logger(values);
  spdlog::info("{} {} starting (model '{}', prompt style {})", values.app_name,
               values.version, values.llm_model,
               verdict::schema::to_string(values.prompt_style));

  auto db_path = std::filesystem::path{values.db_path};
  auto ec = std::error_code{};
  std::filesystem::create_directories(db_path, ec);
  if (ec) {
    verdict::common::critical("Failed to create {}: {}", values.db_path,
                              ec.message());
  }
  auto storage = verdict::storage::make_storage<
      verdict::storage::rocksdb_storage_tag>(values.db_path);

  auto backend = std::make_shared<const verdict::rpc::model_backend_client>(
      verdict::rpc::model_backend_options{
          .endpoint = values.llm_endpoint,
          .llm_model = values.llm_model,
          .embedding_model = values.embedding_model,
          .embed_timeout = values.embed_timeout});
  auto grounder = verdict::grounding::grounder{
      verdict::rpc::make_remote_language_model(backend),
      verdict::config::make_grounder_options(values)};
  auto engine = verdict::execution::engine{
      storage, make_embedder(values, backend), grounder,
      verdict::execution::engine_options{
          .embedding_model = values.embedding_model,
          .segmenter = values.segmenter,
          .top_k = values.top_k}};

  spdlog::info("gRPC service listening on {}", values.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = verdict::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(values.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    verdict::common::critical("Failed to start gRPC server on {}",
                              values.grpc_address);
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
