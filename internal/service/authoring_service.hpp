#pragma once

#include <string>

#include "internal/db/model/condition_record.hpp"
#include "internal/db/model/effect_record.hpp"
#include "internal/db/model/variable_record.hpp"
#include "rulegraph/v1/rules_service.pb.h"
#include "service_context.hpp"

namespace rulegraph::service {

/*
  Create / update / soft-delete of rule definitions plus entity upserts.

  Definitions are validated (expression depth and shape, patch shape,
  no dependency cycle) before anything is written. Every successful
  write is followed by the matching invalidation.
*/
class AuthoringService {
 public:
  explicit AuthoringService(ServiceContext ctx);

  rulegraph::v1::Entity UpsertEntity(const rulegraph::v1::UpsertEntityRequest& req);
  rulegraph::v1::Entity GetEntity(const rulegraph::v1::GetEntityRequest& req);

  rulegraph::v1::Condition CreateCondition(const rulegraph::v1::Condition& req);
  rulegraph::v1::Condition UpdateCondition(const rulegraph::v1::Condition& req);
  void                     DeleteCondition(const rulegraph::v1::DeleteRequest& req);

  rulegraph::v1::StateVariable CreateVariable(const rulegraph::v1::StateVariable& req);
  rulegraph::v1::StateVariable UpdateVariable(const rulegraph::v1::StateVariable& req);
  void                         DeleteVariable(const rulegraph::v1::DeleteRequest& req);

  rulegraph::v1::Effect CreateEffect(const rulegraph::v1::Effect& req);
  rulegraph::v1::Effect UpdateEffect(const rulegraph::v1::Effect& req);
  void                  DeleteEffect(const rulegraph::v1::DeleteRequest& req);

 private:
  db::model::ConditionRecord LoadCondition(const std::string& id);
  db::model::VariableRecord  LoadVariable(const std::string& id);
  db::model::EffectRecord    LoadEffect(const std::string& id);

  ServiceContext ctx_;
};

} // namespace rulegraph::service
