#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace rulegraph::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace rulegraph::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const FormulaTooComplex*>(&e) || dynamic_cast<const CircularDependency*>(&e) ||
      dynamic_cast<const ForbiddenPath*>(&e) || dynamic_cast<const EvaluationError*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const OptimisticLockConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace rulegraph::grpc
