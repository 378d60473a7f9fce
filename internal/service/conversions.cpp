#include "internal/service/conversions.hpp"

namespace rulegraph::service {

rulegraph::v1::Entity ToProto(const db::model::EntityRecord& record) {
  rulegraph::v1::Entity out;
  out.set_entity_type(record.entity_type);
  out.set_id(record.id);
  out.set_campaign_id(record.campaign_id);
  out.set_parent_type(record.parent_type);
  out.set_parent_id(record.parent_id);
  *out.mutable_fields() = record.fields;
  out.set_version(record.version);
  return out;
}

db::model::EntityRecord FromProto(const rulegraph::v1::Entity& entity) {
  db::model::EntityRecord out;
  out.entity_type = entity.entity_type();
  out.id          = entity.id();
  out.campaign_id = entity.campaign_id();
  out.parent_type = entity.parent_type();
  out.parent_id   = entity.parent_id();
  out.fields      = entity.fields();
  out.version     = entity.version();
  return out;
}

rulegraph::v1::Condition ToProto(const db::model::ConditionRecord& record) {
  rulegraph::v1::Condition out;
  out.set_id(record.id);
  out.set_campaign_id(record.campaign_id);
  out.set_entity_type(record.entity_type);
  out.set_entity_id(record.entity_id);
  out.set_field(record.field);
  *out.mutable_expression() = record.expression;
  out.set_priority(record.priority);
  out.set_is_active(record.is_active);
  out.set_version(record.version);
  return out;
}

db::model::ConditionRecord FromProto(const rulegraph::v1::Condition& condition) {
  db::model::ConditionRecord out;
  out.id          = condition.id();
  out.campaign_id = condition.campaign_id();
  out.entity_type = condition.entity_type();
  out.entity_id   = condition.entity_id();
  out.field       = condition.field();
  out.expression  = condition.expression();
  out.priority    = condition.priority();
  out.is_active   = condition.is_active();
  out.version     = condition.version();
  return out;
}

rulegraph::v1::StateVariable ToProto(const db::model::VariableRecord& record) {
  rulegraph::v1::StateVariable out;
  out.set_id(record.id);
  out.set_campaign_id(record.campaign_id);
  out.set_scope(record.scope);
  out.set_scope_id(record.scope_id);
  out.set_key(record.key);
  if (record.value) *out.mutable_value() = *record.value;
  if (record.formula) *out.mutable_formula() = *record.formula;
  out.set_is_active(record.is_active);
  out.set_version(record.version);
  return out;
}

db::model::VariableRecord FromProto(const rulegraph::v1::StateVariable& variable) {
  db::model::VariableRecord out;
  out.id          = variable.id();
  out.campaign_id = variable.campaign_id();
  out.scope       = variable.scope();
  out.scope_id    = variable.scope_id();
  out.key         = variable.key();
  if (variable.has_value()) out.value = variable.value();
  if (variable.has_formula()) out.formula = variable.formula();
  out.is_active = variable.is_active();
  out.version   = variable.version();
  return out;
}

rulegraph::v1::Effect ToProto(const db::model::EffectRecord& record) {
  rulegraph::v1::Effect out;
  out.set_id(record.id);
  out.set_campaign_id(record.campaign_id);
  out.set_entity_type(record.entity_type);
  out.set_entity_id(record.entity_id);
  out.set_source_type(record.source_type);
  out.set_source_id(record.source_id);
  *out.mutable_payload() = record.payload;
  out.set_timing(record.timing);
  out.set_priority(record.priority);
  out.set_is_active(record.is_active);
  out.set_version(record.version);
  return out;
}

db::model::EffectRecord FromProto(const rulegraph::v1::Effect& effect) {
  db::model::EffectRecord out;
  out.id          = effect.id();
  out.campaign_id = effect.campaign_id();
  out.entity_type = effect.entity_type();
  out.entity_id   = effect.entity_id();
  out.source_type = effect.source_type();
  out.source_id   = effect.source_id();
  out.payload     = effect.payload();
  out.timing      = effect.timing();
  out.priority    = effect.priority();
  out.is_active   = effect.is_active();
  out.version     = effect.version();
  return out;
}

rulegraph::v1::EffectExecution ToProto(const db::model::EffectExecutionRecord& record) {
  rulegraph::v1::EffectExecution out;
  out.set_id(record.id);
  out.set_effect_id(record.effect_id);
  out.set_entity_type(record.entity_type);
  out.set_entity_id(record.entity_id);
  out.set_executed_by(record.executed_by);
  out.set_executed_at_ms(record.executed_at_ms);
  *out.mutable_context() = record.context;
  out.set_success(record.success);
  *out.mutable_patch_applied() = record.patch_applied;
  for (const auto& f : record.affected_fields) out.add_affected_fields(f);
  out.set_error(record.error);
  out.set_state(record.state);
  return out;
}

} // namespace rulegraph::service
