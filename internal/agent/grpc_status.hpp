#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

namespace jobprobe::agent {

/*
  Converts a failed agent call into TransportError. NOT_FOUND is handled by
  the caller where "absent" is a valid answer.
*/
void ThrowIfFailed(const ::grpc::Status& status, std::string_view action);

} // namespace jobprobe::agent
