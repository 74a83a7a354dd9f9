#include <fmt/format.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <spdlog/spdlog.h>
#include <verdict/rpc/model_backend.hpp>
#include <verdict/rpc/status.hpp>

#include <stdexcept>

namespace verdict::rpc {

namespace {

[[noreturn]] void raise_status(const std::string_view method,
                               const grpc::Status& status) {
  auto code = to_generation_error_code(status.error_code());
  spdlog::warn("ModelBackend.{} failed ({}): {}", method,
               verdict::schema::to_string(code), status.error_message());
  throw verdict::grounding::generation_error{
      code, fmt::format("ModelBackend.{} failed: {}", method,
                        status.error_message())};
}

void set_deadline(grpc::ClientContext& context,
                  const std::chrono::milliseconds timeout) {
  if (timeout.count() > 0) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
  }
}

}  // namespace

model_backend_client::model_backend_client(model_backend_options options)
    : options_{std::move(options)}, connection_{[this] {
        spdlog::info("Connecting to model backend at {}", options_.endpoint);
        auto built = std::make_unique<connection>();
        built->channel = grpc::CreateChannel(
            options_.endpoint, grpc::InsecureChannelCredentials());
        built->stub = v1::ModelBackend::NewStub(built->channel);
        return built;
      }} {
  if (options_.endpoint.empty()) {
    throw std::invalid_argument{"model backend endpoint must not be empty"};
  }
}

std::string model_backend_client::generate(
    const std::string_view prompt,
    const verdict::grounding::generation_options& options) const {
  auto request = v1::GenerateRequest{};
  request.set_model(options_.llm_model);
  request.set_prompt(std::string{prompt});
  request.set_max_new_tokens(options.max_new_tokens);

  auto context = grpc::ClientContext{};
  set_deadline(context, options.timeout);
  auto response = v1::GenerateResponse{};
  auto status = connection_.get().stub->Generate(&context, request, &response);
  if (!status.ok()) {
    raise_status("Generate", status);
  }
  return response.text();
}

std::vector<verdict::embedding::embedding_t> model_backend_client::embed(
    const std::vector<std::string>& texts,
    const verdict::schema::embedding_mode_t mode) const {
  auto request = v1::EmbedRequest{};
  request.set_model(options_.embedding_model);
  for (const auto& text : texts) {
    request.add_texts(text);
  }
  request.set_mode(mode == verdict::schema::embedding_mode_t::query
                       ? v1::EMBEDDING_MODE_QUERY
                       : v1::EMBEDDING_MODE_PASSAGE);

  auto context = grpc::ClientContext{};
  set_deadline(context, options_.embed_timeout);
  auto response = v1::EmbedResponse{};
  auto status = connection_.get().stub->Embed(&context, request, &response);
  if (!status.ok()) {
    raise_status("Embed", status);
  }
  if (static_cast<std::size_t>(response.vectors_size()) != texts.size()) {
    throw verdict::grounding::generation_error{
        verdict::schema::generation_error_code::invalid_response,
        fmt::format("ModelBackend.Embed returned {} vectors for {} texts",
                    response.vectors_size(), texts.size())};
  }

  auto vectors = std::vector<verdict::embedding::embedding_t>{};
  vectors.reserve(texts.size());
  for (const auto& vector : response.vectors()) {
    vectors.emplace_back(std::begin(vector.values()), std::end(vector.values()));
  }
  return vectors;
}

verdict::grounding::language_model_t make_remote_language_model(
    std::shared_ptr<const model_backend_client> client) {
  return [client = std::move(client)](
             const std::string_view prompt,
             const verdict::grounding::generation_options& options) {
    return client->generate(prompt, options);
  };
}

verdict::embedding::embedder_t make_remote_embedder(
    std::shared_ptr<const model_backend_client> client) {
  return [client = std::move(client)](
             const std::vector<std::string>& texts,
             const verdict::schema::embedding_mode_t mode) {
    return client->embed(texts, mode);
  };
}

}  // namespace verdict::rpc
