#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <cstdint>
#include <memory>
#include <string>

#include "rulegraph/v1/rules_service.grpc.pb.h"

namespace rulegraph::client {

/*
  Thin blocking client over RulesService and RuleAuthoringService.

  Every call returns the RPC status; the response is written to *out
  only when the status is OK.
*/
class RulegraphClient {
 public:
  explicit RulegraphClient(std::shared_ptr<::grpc::Channel> channel);

  ::grpc::Status EvaluateComputedFields(const rulegraph::v1::EvaluateComputedFieldsRequest& request,
                                      rulegraph::v1::EvaluateComputedFieldsResponse*      out) const;

  ::grpc::Status EvaluateVariable(const rulegraph::v1::EvaluateVariableRequest& request, rulegraph::v1::EvaluateVariableResponse* out) const;

  ::grpc::Status ValidateCondition(const rulegraph::v1::ValidateConditionRequest& request,
                                 rulegraph::v1::ValidateConditionResponse*      out) const;

  ::grpc::Status ExecuteEffectsForEntity(const rulegraph::v1::ExecuteEffectsForEntityRequest& request,
                                       rulegraph::v1::ExecuteEffectsResponse*               out) const;

  ::grpc::Status ExecuteEffectsWithDependencies(const rulegraph::v1::ExecuteEffectsWithDependenciesRequest& request,
                                              rulegraph::v1::ExecuteEffectsResponse*                      out) const;

  ::grpc::Status PreviewEffect(const rulegraph::v1::PreviewEffectRequest& request, rulegraph::v1::PreviewEffectResponse* out) const;

  ::grpc::Status GetEvaluationOrder(const rulegraph::v1::GetEvaluationOrderRequest& request,
                                  rulegraph::v1::GetEvaluationOrderResponse*      out) const;

  ::grpc::Status Invalidate(const rulegraph::v1::InvalidateRequest& request, rulegraph::v1::InvalidateResponse* out) const;

  ::grpc::Status UpsertEntity(const rulegraph::v1::UpsertEntityRequest& request, rulegraph::v1::Entity* out) const;
  ::grpc::Status GetEntity(const std::string& entity_type, const std::string& entity_id, rulegraph::v1::Entity* out) const;

  ::grpc::Status CreateCondition(const rulegraph::v1::Condition& condition, rulegraph::v1::Condition* out) const;
  ::grpc::Status UpdateCondition(const rulegraph::v1::Condition& condition, rulegraph::v1::Condition* out) const;
  ::grpc::Status DeleteCondition(const std::string& id, uint64_t expected_version = 0) const;

  ::grpc::Status CreateVariable(const rulegraph::v1::StateVariable& variable, rulegraph::v1::StateVariable* out) const;
  ::grpc::Status UpdateVariable(const rulegraph::v1::StateVariable& variable, rulegraph::v1::StateVariable* out) const;
  ::grpc::Status DeleteVariable(const std::string& id, uint64_t expected_version = 0) const;

  ::grpc::Status CreateEffect(const rulegraph::v1::Effect& effect, rulegraph::v1::Effect* out) const;
  ::grpc::Status UpdateEffect(const rulegraph::v1::Effect& effect, rulegraph::v1::Effect* out) const;
  ::grpc::Status DeleteEffect(const std::string& id, uint64_t expected_version = 0) const;

 private:
  std::unique_ptr<rulegraph::v1::RulesService::Stub>         rules_stub_;
  std::unique_ptr<rulegraph::v1::RuleAuthoringService::Stub> authoring_stub_;
};

} // namespace rulegraph::client
