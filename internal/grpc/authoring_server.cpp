#include "authoring_server.hpp"
#include "grpc_error.hpp"

namespace rulegraph::grpc {

AuthoringServer::AuthoringServer(std::shared_ptr<rulegraph::service::AuthoringService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuthoringServer::UpsertEntity(::grpc::ServerContext*, const rulegraph::v1::UpsertEntityRequest* req, rulegraph::v1::Entity* resp) {
  try {
    *resp = service_->UpsertEntity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::GetEntity(::grpc::ServerContext*, const rulegraph::v1::GetEntityRequest* req, rulegraph::v1::Entity* resp) {
  try {
    *resp = service_->GetEntity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::CreateCondition(::grpc::ServerContext*, const rulegraph::v1::Condition* req, rulegraph::v1::Condition* resp) {
  try {
    *resp = service_->CreateCondition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::UpdateCondition(::grpc::ServerContext*, const rulegraph::v1::Condition* req, rulegraph::v1::Condition* resp) {
  try {
    *resp = service_->UpdateCondition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::DeleteCondition(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteCondition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::CreateVariable(::grpc::ServerContext*, const rulegraph::v1::StateVariable* req, rulegraph::v1::StateVariable* resp) {
  try {
    *resp = service_->CreateVariable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::UpdateVariable(::grpc::ServerContext*, const rulegraph::v1::StateVariable* req, rulegraph::v1::StateVariable* resp) {
  try {
    *resp = service_->UpdateVariable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::DeleteVariable(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteVariable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::CreateEffect(::grpc::ServerContext*, const rulegraph::v1::Effect* req, rulegraph::v1::Effect* resp) {
  try {
    *resp = service_->CreateEffect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::UpdateEffect(::grpc::ServerContext*, const rulegraph::v1::Effect* req, rulegraph::v1::Effect* resp) {
  try {
    *resp = service_->UpdateEffect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuthoringServer::DeleteEffect(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteEffect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rulegraph::grpc
