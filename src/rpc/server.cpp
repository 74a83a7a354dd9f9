#include <spdlog/spdlog.h>
#include <verdict/grounding/language_model.hpp>
#include <verdict/policy/engine.hpp>
#include <verdict/rpc/convert.hpp>
#include <verdict/rpc/server.hpp>
#include <verdict/rpc/status.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace verdict::rpc;

namespace {

/// Run `handler` and finish the call with the status its outcome maps to.
template <typename Handler>
grpc::ServerUnaryReactor* handle(grpc::CallbackServerContext* context,
                                 const std::string_view method,
                                 Handler&& handler) {
  auto status = grpc::Status::OK;
  try {
    status = handler();
  } catch (const std::invalid_argument& e) {
    spdlog::warn("{} rejected: {}", method, e.what());
    status = grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  } catch (const verdict::grounding::generation_error& e) {
    spdlog::error("{} backend failure ({}): {}", method,
                  verdict::schema::to_string(e.code()), e.what());
    status = grpc::Status{to_status_code(e.code()), e.what()};
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", method, e.what());
    status = grpc::Status{grpc::StatusCode::INTERNAL, e.what()};
  }
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

template <typename Message>
std::optional<int32_t> optional_overlap(const Message& request) {
  if (request.has_overlap()) {
    return request.overlap();
  }
  return std::nullopt;
}

}  // namespace

listener::listener(const verdict::execution::engine& engine)
    : execution_engine_{engine} {}

verdict::ingest::segmenter_options listener::segmenter_for(
    const int32_t chunk_size,
    const std::optional<int32_t>& overlap) const {
  auto options = execution_engine_.options().segmenter;
  if (chunk_size != 0) {
    options.chunk_size = chunk_size;
  }
  if (overlap) {
    options.overlap = *overlap;
  }
  verdict::ingest::validate(options);
  return options;
}

grpc::ServerUnaryReactor* listener::Segment(
    grpc::CallbackServerContext* context,
    const v1::SegmentRequest* request,
    v1::SegmentResponse* response) {
  return handle(context, "Segment", [&] {
    auto source =
        request->source().empty() ? std::string{"manual"} : request->source();
    auto chunks = verdict::ingest::make_chunks(
        source, request->text(),
        segmenter_for(request->chunk_size(), optional_overlap(*request)));
    for (const auto& chunk : chunks) {
      populate(chunk, response->add_chunks());
    }
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Evaluate(
    grpc::CallbackServerContext* context,
    const v1::CaseInput* request,
    v1::Decision* response) {
  return handle(context, "Evaluate", [&] {
    populate(verdict::policy::evaluate(from_message(*request)), response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Verify(grpc::CallbackServerContext* context,
                                           const v1::CaseInput* request,
                                           v1::VerifyResponse* response) {
  return handle(context, "Verify", [&] {
    auto verification = execution_engine_.verify(from_message(*request));
    populate(verification.decision, response->mutable_decision());
    for (const auto& source : verification.sources) {
      populate(source, response->add_sources());
    }
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::CreateCollection(
    grpc::CallbackServerContext* context,
    const v1::CreateCollectionRequest* request,
    v1::CreateCollectionResponse* response) {
  return handle(context, "CreateCollection", [&] {
    execution_engine_.create_collection(request->name());
    response->set_created(request->name());
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::ListCollections(
    grpc::CallbackServerContext* context,
    const v1::ListCollectionsRequest* /*request*/,
    v1::ListCollectionsResponse* response) {
  return handle(context, "ListCollections", [&] {
    for (const auto& name : execution_engine_.list_collections()) {
      response->add_collections(name);
    }
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::GetCollection(
    grpc::CallbackServerContext* context,
    const v1::GetCollectionRequest* request,
    v1::GetCollectionResponse* response) {
  return handle(context, "GetCollection", [&] {
    response->set_name(request->name());
    response->set_count(execution_engine_.count(request->name()));
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::AddDocuments(
    grpc::CallbackServerContext* context,
    const v1::AddDocumentsRequest* request,
    v1::IngestResponse* response) {
  return handle(context, "AddDocuments", [&] {
    auto texts = std::vector<std::string>{std::begin(request->texts()),
                                          std::end(request->texts())};
    auto ids = std::vector<std::string>{std::begin(request->ids()),
                                        std::end(request->ids())};
    auto metadatas = std::vector<verdict::schema::metadata_t>{};
    for (const auto& metadata : request->metadatas()) {
      metadatas.push_back(from_message(metadata));
    }
    auto result = verdict::schema::ingest_result_t{};
    auto error = std::string{};
    if (!execution_engine_.add_documents(request->collection(), texts,
                                         metadatas, ids, result, error)) {
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, error};
    }
    populate(result, response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Ingest(grpc::CallbackServerContext* context,
                                           const v1::IngestRequest* request,
                                           v1::IngestResponse* response) {
  return handle(context, "Ingest", [&] {
    auto source =
        request->source().empty() ? std::string{"manual"} : request->source();
    auto result = execution_engine_.ingest(
        request->collection(), request->text(), source,
        segmenter_for(request->chunk_size(), optional_overlap(*request)));
    populate(result, response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::SeedPolicies(
    grpc::CallbackServerContext* context,
    const v1::SeedPoliciesRequest* /*request*/,
    v1::IngestResponse* response) {
  return handle(context, "SeedPolicies", [&] {
    populate(execution_engine_.seed_policies(), response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Query(grpc::CallbackServerContext* context,
                                          const v1::QueryRequest* request,
                                          v1::QueryResponse* response) {
  return handle(context, "Query", [&] {
    populate(execution_engine_.query(request->collection(), request->text(),
                                     request->top_k()),
             response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Ask(grpc::CallbackServerContext* context,
                                        const v1::AskRequest* request,
                                        v1::AskResponse* response) {
  return handle(context, "Ask", [&] {
    auto answer = execution_engine_.ask(request->collection(),
                                        request->question(), request->top_k());
    response->set_answer(answer.text);
    for (const auto& source : answer.sources) {
      populate(source, response->add_sources());
    }
    return grpc::Status::OK;
  });
}
