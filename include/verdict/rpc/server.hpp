#pragma once

#include <verdict/execution/engine.hpp>
#include <verdict/ingest/segmenter.hpp>
#include <verdict/rpc/v1/verdict.grpc.pb.h>

namespace verdict::rpc {

/// Callback listener for the verdict.rpc.v1.Verdict service.
///
/// Quick reference:
/// - Segment/Evaluate: pure computations, no backend involved.
/// - Verify: Evaluate plus a grounded rationale and the cited rule texts.
/// - Collections/AddDocuments/Ingest/SeedPolicies: vector store writes.
/// - Query/Ask: retrieval, and retrieval plus a grounded answer.
///
/// Invalid requests finish with INVALID_ARGUMENT, backend failures with the
/// status mapped from their generation_error_code, anything else INTERNAL.
struct listener final : public v1::Verdict::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(const verdict::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Segment(
      grpc::CallbackServerContext* context,
      const v1::SegmentRequest* request,
      v1::SegmentResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Evaluate(
      grpc::CallbackServerContext* context,
      const v1::CaseInput* request,
      v1::Decision* response) override final;

  virtual grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const v1::CaseInput* request,
      v1::VerifyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CreateCollection(
      grpc::CallbackServerContext* context,
      const v1::CreateCollectionRequest* request,
      v1::CreateCollectionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListCollections(
      grpc::CallbackServerContext* context,
      const v1::ListCollectionsRequest* request,
      v1::ListCollectionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetCollection(
      grpc::CallbackServerContext* context,
      const v1::GetCollectionRequest* request,
      v1::GetCollectionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* AddDocuments(
      grpc::CallbackServerContext* context,
      const v1::AddDocumentsRequest* request,
      v1::IngestResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Ingest(
      grpc::CallbackServerContext* context,
      const v1::IngestRequest* request,
      v1::IngestResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SeedPolicies(
      grpc::CallbackServerContext* context,
      const v1::SeedPoliciesRequest* request,
      v1::IngestResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const v1::QueryRequest* request,
      v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Ask(
      grpc::CallbackServerContext* context,
      const v1::AskRequest* request,
      v1::AskResponse* response) override final;

 private:
  /// Segmenter options for a request; chunk_size 0 keeps the defaults.
  verdict::ingest::segmenter_options segmenter_for(
      int32_t chunk_size,
      const std::optional<int32_t>& overlap) const;

  const verdict::execution::engine& execution_engine_;
};

}  // namespace verdict::rpc
