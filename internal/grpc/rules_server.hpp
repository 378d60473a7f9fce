#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/rules_service.hpp"
#include "rulegraph/v1/rules_service.grpc.pb.h"

namespace rulegraph::grpc {

class RulesServer final : public rulegraph::v1::RulesService::Service {
 public:
  explicit RulesServer(std::shared_ptr<rulegraph::service::RulesService> svc);

  ::grpc::Status EvaluateComputedFields(::grpc::ServerContext*, const rulegraph::v1::EvaluateComputedFieldsRequest*,
                                        rulegraph::v1::EvaluateComputedFieldsResponse*) override;

  ::grpc::Status EvaluateVariable(::grpc::ServerContext*, const rulegraph::v1::EvaluateVariableRequest*,
                                  rulegraph::v1::EvaluateVariableResponse*) override;

  ::grpc::Status ValidateCondition(::grpc::ServerContext*, const rulegraph::v1::ValidateConditionRequest*,
                                   rulegraph::v1::ValidateConditionResponse*) override;

  ::grpc::Status ExecuteEffectsForEntity(::grpc::ServerContext*, const rulegraph::v1::ExecuteEffectsForEntityRequest*,
                                         rulegraph::v1::ExecuteEffectsResponse*) override;

  ::grpc::Status ExecuteEffectsWithDependencies(::grpc::ServerContext*, const rulegraph::v1::ExecuteEffectsWithDependenciesRequest*,
                                                rulegraph::v1::ExecuteEffectsResponse*) override;

  ::grpc::Status PreviewEffect(::grpc::ServerContext*, const rulegraph::v1::PreviewEffectRequest*,
                               rulegraph::v1::PreviewEffectResponse*) override;

  ::grpc::Status GetEvaluationOrder(::grpc::ServerContext*, const rulegraph::v1::GetEvaluationOrderRequest*,
                                    rulegraph::v1::GetEvaluationOrderResponse*) override;

  ::grpc::Status Invalidate(::grpc::ServerContext*, const rulegraph::v1::InvalidateRequest*, rulegraph::v1::InvalidateResponse*) override;

 private:
  std::shared_ptr<rulegraph::service::RulesService> service_;
};

} // namespace rulegraph::grpc
