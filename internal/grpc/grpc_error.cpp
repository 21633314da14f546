#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace catalog::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace catalog::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const DefaultChannelHeadRemoval*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UnsupportedFeature*>(&e)) {
    return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
  }
  if (dynamic_cast<const GraphError*>(&e) || dynamic_cast<const AggregateError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const IntegrityError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace catalog::grpc
