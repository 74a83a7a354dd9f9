#pragma once

#include <grpcpp/support/status.h>
#include <verdict/schema/generation_error_code.hpp>

namespace verdict::rpc {

/// Status returned to callers when a backend failure reaches the service.
grpc::StatusCode to_status_code(verdict::schema::generation_error_code code);

/// Backend failure kind for a status received from the model backend.
verdict::schema::generation_error_code to_generation_error_code(
    grpc::StatusCode code);

}  // namespace verdict::rpc
