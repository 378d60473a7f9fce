#include "rules_server.hpp"
#include "grpc_error.hpp"

namespace rulegraph::grpc {

RulesServer::RulesServer(std::shared_ptr<rulegraph::service::RulesService> svc) : service_(std::move(svc)) {
}

::grpc::Status RulesServer::EvaluateComputedFields(::grpc::ServerContext*, const rulegraph::v1::EvaluateComputedFieldsRequest* req,
                                   rulegraph::v1::EvaluateComputedFieldsResponse* resp) {
  try {
    *resp = service_->EvaluateComputedFields(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::EvaluateVariable(::grpc::ServerContext*, const rulegraph::v1::EvaluateVariableRequest* req,
                                   rulegraph::v1::EvaluateVariableResponse* resp) {
  try {
    *resp = service_->EvaluateVariable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::ValidateCondition(::grpc::ServerContext*, const rulegraph::v1::ValidateConditionRequest* req,
                                   rulegraph::v1::ValidateConditionResponse* resp) {
  try {
    *resp = service_->ValidateCondition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::ExecuteEffectsForEntity(::grpc::ServerContext*, const rulegraph::v1::ExecuteEffectsForEntityRequest* req,
                                   rulegraph::v1::ExecuteEffectsResponse* resp) {
  try {
    *resp = service_->ExecuteEffectsForEntity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::ExecuteEffectsWithDependencies(::grpc::ServerContext*, const rulegraph::v1::ExecuteEffectsWithDependenciesRequest* req,
                                   rulegraph::v1::ExecuteEffectsResponse* resp) {
  try {
    *resp = service_->ExecuteEffectsWithDependencies(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::PreviewEffect(::grpc::ServerContext*, const rulegraph::v1::PreviewEffectRequest* req,
                                   rulegraph::v1::PreviewEffectResponse* resp) {
  try {
    *resp = service_->PreviewEffect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::GetEvaluationOrder(::grpc::ServerContext*, const rulegraph::v1::GetEvaluationOrderRequest* req,
                                   rulegraph::v1::GetEvaluationOrderResponse* resp) {
  try {
    *resp = service_->GetEvaluationOrder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RulesServer::Invalidate(::grpc::ServerContext*, const rulegraph::v1::InvalidateRequest* req,
                                   rulegraph::v1::InvalidateResponse* resp) {
  try {
    *resp = service_->Invalidate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rulegraph::grpc
