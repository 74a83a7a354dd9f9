#include <verdict/rpc/status.hpp>

namespace verdict::rpc {

grpc::StatusCode to_status_code(
    const verdict::schema::generation_error_code code) {
  using enum verdict::schema::generation_error_code;
  switch (code) {
    case authentication:
      return grpc::StatusCode::UNAUTHENTICATED;
    case quota:
      return grpc::StatusCode::RESOURCE_EXHAUSTED;
    case unavailable:
      return grpc::StatusCode::UNAVAILABLE;
    case timeout:
      return grpc::StatusCode::DEADLINE_EXCEEDED;
    case invalid_response:
    default:
      return grpc::StatusCode::INTERNAL;
  }
}

verdict::schema::generation_error_code to_generation_error_code(
    const grpc::StatusCode code) {
  using enum verdict::schema::generation_error_code;
  switch (code) {
    case grpc::StatusCode::UNAUTHENTICATED:
    case grpc::StatusCode::PERMISSION_DENIED:
      return authentication;
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return quota;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return timeout;
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::INTERNAL:
    case grpc::StatusCode::DATA_LOSS:
      return invalid_response;
    default:
      return unavailable;
  }
}

}  // namespace verdict::rpc
