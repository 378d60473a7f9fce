#pragma once

#include "internal/db/model/condition_record.hpp"
#include "internal/db/model/effect_execution_record.hpp"
#include "internal/db/model/effect_record.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/variable_record.hpp"
#include "rulegraph/v1/types.pb.h"

namespace rulegraph::service {

// Row <-> wire message. FromProto copies identity and definition fields;
// created_seq and deleted_at_ms stay at their defaults.

rulegraph::v1::Entity     ToProto(const db::model::EntityRecord& record);
db::model::EntityRecord   FromProto(const rulegraph::v1::Entity& entity);

rulegraph::v1::Condition   ToProto(const db::model::ConditionRecord& record);
db::model::ConditionRecord FromProto(const rulegraph::v1::Condition& condition);

rulegraph::v1::StateVariable ToProto(const db::model::VariableRecord& record);
db::model::VariableRecord    FromProto(const rulegraph::v1::StateVariable& variable);

rulegraph::v1::Effect   ToProto(const db::model::EffectRecord& record);
db::model::EffectRecord FromProto(const rulegraph::v1::Effect& effect);

rulegraph::v1::EffectExecution ToProto(const db::model::EffectExecutionRecord& record);

} // namespace rulegraph::service
