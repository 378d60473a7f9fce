#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/authoring_service.hpp"
#include "rulegraph/v1/rules_service.grpc.pb.h"

namespace rulegraph::grpc {

class AuthoringServer final : public rulegraph::v1::RuleAuthoringService::Service {
 public:
  explicit AuthoringServer(std::shared_ptr<rulegraph::service::AuthoringService> svc);

  ::grpc::Status UpsertEntity(::grpc::ServerContext*, const rulegraph::v1::UpsertEntityRequest*, rulegraph::v1::Entity*) override;

  ::grpc::Status GetEntity(::grpc::ServerContext*, const rulegraph::v1::GetEntityRequest*, rulegraph::v1::Entity*) override;

  ::grpc::Status CreateCondition(::grpc::ServerContext*, const rulegraph::v1::Condition*, rulegraph::v1::Condition*) override;

  ::grpc::Status UpdateCondition(::grpc::ServerContext*, const rulegraph::v1::Condition*, rulegraph::v1::Condition*) override;

  ::grpc::Status DeleteCondition(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest*, google::protobuf::Empty*) override;

  ::grpc::Status CreateVariable(::grpc::ServerContext*, const rulegraph::v1::StateVariable*, rulegraph::v1::StateVariable*) override;

  ::grpc::Status UpdateVariable(::grpc::ServerContext*, const rulegraph::v1::StateVariable*, rulegraph::v1::StateVariable*) override;

  ::grpc::Status DeleteVariable(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest*, google::protobuf::Empty*) override;

  ::grpc::Status CreateEffect(::grpc::ServerContext*, const rulegraph::v1::Effect*, rulegraph::v1::Effect*) override;

  ::grpc::Status UpdateEffect(::grpc::ServerContext*, const rulegraph::v1::Effect*, rulegraph::v1::Effect*) override;

  ::grpc::Status DeleteEffect(::grpc::ServerContext*, const rulegraph::v1::DeleteRequest*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<rulegraph::service::AuthoringService> service_;
};

} // namespace rulegraph::grpc
