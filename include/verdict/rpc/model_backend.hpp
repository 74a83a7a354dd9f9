#pragma once

#include <grpcpp/channel.h>
#include <verdict/common/lazy.hpp>
#include <verdict/embedding/embedder.hpp>
#include <verdict/grounding/language_model.hpp>
#include <verdict/rpc/v1/verdict.grpc.pb.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::rpc {

struct model_backend_options final {
  std::string endpoint;
  std::string llm_model;
  std::string embedding_model;
  std::chrono::milliseconds embed_timeout{std::chrono::seconds{30}};
};

/// Client for the verdict.rpc.v1.ModelBackend service.
///
/// The channel is opened on first use and shared by all callers afterwards.
/// Failures are reported as generation_error with the code mapped from the
/// call status.
class model_backend_client final {
 public:
  explicit model_backend_client(model_backend_options options);

  std::string generate(std::string_view prompt,
                       const verdict::grounding::generation_options& options) const;

  std::vector<verdict::embedding::embedding_t> embed(
      const std::vector<std::string>& texts,
      verdict::schema::embedding_mode_t mode) const;

  const model_backend_options& options() const { return options_; }

 private:
  struct connection final {
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<v1::ModelBackend::Stub> stub;
  };

  model_backend_options options_;
  verdict::common::lazy<connection> connection_;
};

/// language_model_t bound to a shared client.
verdict::grounding::language_model_t make_remote_language_model(
    std::shared_ptr<const model_backend_client> client);

/// embedder_t bound to a shared client.
verdict::embedding::embedder_t make_remote_embedder(
    std::shared_ptr<const model_backend_client> client);

}  // namespace verdict::rpc
