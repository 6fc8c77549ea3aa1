#include "grpc_status.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace jobprobe::agent {

namespace {

std::string_view CodeName(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::CANCELLED:
      return "CANCELLED";
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case ::grpc::StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case ::grpc::StatusCode::PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return "UNAUTHENTICATED";
    case ::grpc::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case ::grpc::StatusCode::INTERNAL:
      return "INTERNAL";
    default:
      return "ERROR";
  }
}

} // namespace

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }
  throw util::TransportError(std::string(action) + " failed: " + std::string(CodeName(status.error_code())) + ": " + status.error_message());
}

} // namespace jobprobe::agent
