#pragma once

#include "rulegraph/v1/rules_service.pb.h"
#include "service_context.hpp"

namespace rulegraph::service {

/*
  Runtime facade: evaluation, validation, effect execution and
  invalidation. Mirrored 1:1 by the RulesService gRPC adapter.
*/
class RulesService {
 public:
  explicit RulesService(ServiceContext ctx);

  // Cached per (entity, branch) unless extra context is given.
  rulegraph::v1::EvaluateComputedFieldsResponse EvaluateComputedFields(const rulegraph::v1::EvaluateComputedFieldsRequest& req);

  rulegraph::v1::EvaluateVariableResponse EvaluateVariable(const rulegraph::v1::EvaluateVariableRequest& req);

  // Never throws for an invalid expression; problems come back in the response.
  rulegraph::v1::ValidateConditionResponse ValidateCondition(const rulegraph::v1::ValidateConditionRequest& req);

  rulegraph::v1::ExecuteEffectsResponse ExecuteEffectsForEntity(const rulegraph::v1::ExecuteEffectsForEntityRequest& req);
  rulegraph::v1::ExecuteEffectsResponse ExecuteEffectsWithDependencies(const rulegraph::v1::ExecuteEffectsWithDependenciesRequest& req);

  rulegraph::v1::PreviewEffectResponse PreviewEffect(const rulegraph::v1::PreviewEffectRequest& req);

  rulegraph::v1::GetEvaluationOrderResponse GetEvaluationOrder(const rulegraph::v1::GetEvaluationOrderRequest& req);

  rulegraph::v1::InvalidateResponse Invalidate(const rulegraph::v1::InvalidateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rulegraph::service
