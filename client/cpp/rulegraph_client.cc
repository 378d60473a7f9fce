#include "client/cpp/rulegraph_client.h"

#include <grpcpp/client_context.h>

#include <google/protobuf/empty.pb.h>

namespace rulegraph::client {

namespace {

// Response lands in *out only on success.
template <typename Stub, typename Request, typename Response>
::grpc::Status Call(Stub* stub, ::grpc::Status (Stub::*method)(::grpc::ClientContext*, const Request&, Response*), const Request& request,
                  Response* out) {
  Response            resp;
  ::grpc::ClientContext ctx;
  auto                status = (stub->*method)(&ctx, request, &resp);
  if (status.ok() && out) {
    *out = std::move(resp);
  }
  return status;
}

rulegraph::v1::DeleteRequest MakeDelete(const std::string& id, uint64_t expected_version) {
  rulegraph::v1::DeleteRequest req;
  req.set_id(id);
  req.set_expected_version(expected_version);
  return req;
}

}  // namespace

RulegraphClient::RulegraphClient(std::shared_ptr<::grpc::Channel> channel)
    : rules_stub_(rulegraph::v1::RulesService::NewStub(channel)),
      authoring_stub_(rulegraph::v1::RuleAuthoringService::NewStub(std::move(channel))) {}

::grpc::Status RulegraphClient::EvaluateComputedFields(const rulegraph::v1::EvaluateComputedFieldsRequest& request, rulegraph::v1::EvaluateComputedFieldsResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::EvaluateComputedFields, request, out);
}

::grpc::Status RulegraphClient::EvaluateVariable(const rulegraph::v1::EvaluateVariableRequest& request, rulegraph::v1::EvaluateVariableResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::EvaluateVariable, request, out);
}

::grpc::Status RulegraphClient::ValidateCondition(const rulegraph::v1::ValidateConditionRequest& request, rulegraph::v1::ValidateConditionResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::ValidateCondition, request, out);
}

::grpc::Status RulegraphClient::ExecuteEffectsForEntity(const rulegraph::v1::ExecuteEffectsForEntityRequest& request, rulegraph::v1::ExecuteEffectsResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::ExecuteEffectsForEntity, request, out);
}

::grpc::Status RulegraphClient::ExecuteEffectsWithDependencies(const rulegraph::v1::ExecuteEffectsWithDependenciesRequest& request, rulegraph::v1::ExecuteEffectsResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::ExecuteEffectsWithDependencies, request, out);
}

::grpc::Status RulegraphClient::PreviewEffect(const rulegraph::v1::PreviewEffectRequest& request, rulegraph::v1::PreviewEffectResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::PreviewEffect, request, out);
}

::grpc::Status RulegraphClient::GetEvaluationOrder(const rulegraph::v1::GetEvaluationOrderRequest& request, rulegraph::v1::GetEvaluationOrderResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::GetEvaluationOrder, request, out);
}

::grpc::Status RulegraphClient::Invalidate(const rulegraph::v1::InvalidateRequest& request, rulegraph::v1::InvalidateResponse* out) const {
  return Call(rules_stub_.get(), &rulegraph::v1::RulesService::Stub::Invalidate, request, out);
}

::grpc::Status RulegraphClient::UpsertEntity(const rulegraph::v1::UpsertEntityRequest& request, rulegraph::v1::Entity* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::UpsertEntity, request, out);
}

::grpc::Status RulegraphClient::CreateCondition(const rulegraph::v1::Condition& condition, rulegraph::v1::Condition* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::CreateCondition, condition, out);
}

::grpc::Status RulegraphClient::UpdateCondition(const rulegraph::v1::Condition& condition, rulegraph::v1::Condition* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::UpdateCondition, condition, out);
}

::grpc::Status RulegraphClient::CreateVariable(const rulegraph::v1::StateVariable& variable, rulegraph::v1::StateVariable* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::CreateVariable, variable, out);
}

::grpc::Status RulegraphClient::UpdateVariable(const rulegraph::v1::StateVariable& variable, rulegraph::v1::StateVariable* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::UpdateVariable, variable, out);
}

::grpc::Status RulegraphClient::CreateEffect(const rulegraph::v1::Effect& effect, rulegraph::v1::Effect* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::CreateEffect, effect, out);
}

::grpc::Status RulegraphClient::UpdateEffect(const rulegraph::v1::Effect& effect, rulegraph::v1::Effect* out) const {
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::UpdateEffect, effect, out);
}

::grpc::Status RulegraphClient::GetEntity(const std::string& entity_type, const std::string& entity_id, rulegraph::v1::Entity* out) const {
  rulegraph::v1::GetEntityRequest req;
  req.set_entity_type(entity_type);
  req.set_entity_id(entity_id);
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::GetEntity, req, out);
}

::grpc::Status RulegraphClient::DeleteCondition(const std::string& id, uint64_t expected_version) const {
  google::protobuf::Empty empty;
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::DeleteCondition, MakeDelete(id, expected_version), &empty);
}

::grpc::Status RulegraphClient::DeleteVariable(const std::string& id, uint64_t expected_version) const {
  google::protobuf::Empty empty;
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::DeleteVariable, MakeDelete(id, expected_version), &empty);
}

::grpc::Status RulegraphClient::DeleteEffect(const std::string& id, uint64_t expected_version) const {
  google::protobuf::Empty empty;
  return Call(authoring_stub_.get(), &rulegraph::v1::RuleAuthoringService::Stub::DeleteEffect, MakeDelete(id, expected_version), &empty);
}

}  // namespace rulegraph::client
