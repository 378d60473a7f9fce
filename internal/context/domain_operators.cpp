#include "internal/context/domain_operators.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace rulegraph::context {

using expr::DomainProperty;
using expr::Value;

namespace {

const Value* Field(const db::model::EntityRecord& entity, const std::string& name) {
  auto it = entity.fields.fields().find(name);
  if (it == entity.fields.fields().end()) return nullptr;
  return &it->second;
}

std::string StringArg(const std::vector<Value>& args, std::size_t index) {
  if (index >= args.size() || expr::IsNull(args[index])) return {};
  return expr::ToDisplayString(args[index]);
}

bool FieldEquals(const db::model::EntityRecord& entity, const std::string& name, const std::string& expected) {
  if (expected.empty()) return false;
  const Value* v = Field(entity, name);
  return v && expr::IsString(*v) && v->string_value() == expected;
}

std::vector<db::model::EntityRecord> Structures(db::Repository& repo, db::Transaction& tx, const std::string& settlement_id) {
  return repo.ListChildren(tx, "settlement", settlement_id, "structure");
}

} // namespace

RepositoryDomainResolver::RepositoryDomainResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

Value RepositoryDomainResolver::Neutral(DomainProperty property) {
  switch (property) {
    case DomainProperty::kLevel:
    case DomainProperty::kStructureCount:
      return expr::NumberValue(0);
    case DomainProperty::kHasStructureType:
    case DomainProperty::kInKingdom:
    case DomainProperty::kAtLocation:
    case DomainProperty::kIsOperational:
    case DomainProperty::kInSettlement:
      return expr::BoolValue(false);
    case DomainProperty::kVar:
    case DomainProperty::kType:
      break;
  }
  return expr::NullValue();
}

Value RepositoryDomainResolver::Resolve(const expr::DomainOperator& op, const std::vector<Value>& args, const std::string& entity_id) {
  if (entity_id.empty()) {
    RULEGRAPH_LOG_WARN("domain operator without an entity", {observability::StringField("operator", op.name)});
    return Neutral(op.property);
  }

  try {
    auto tx     = repository_->Begin();
    auto entity = repository_->GetEntity(*tx, op.ns, entity_id);
    if (!entity || entity->deleted_at_ms != 0) {
      RULEGRAPH_LOG_WARN("domain operator entity not found",
                         {observability::StringField("operator", op.name), observability::StringField("entity_id", entity_id)});
      return Neutral(op.property);
    }

    Value out = op.ns == "settlement" ? ResolveSettlement(*tx, op, args, *entity) : ResolveStructure(*tx, op, args, *entity);
    tx->Commit();
    return out;
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_WARN("domain operator lookup failed", {observability::StringField("operator", op.name),
                                                          observability::StringField("entity_id", entity_id),
                                                          observability::StringField("error", e.what())});
    return Neutral(op.property);
  }
}

Value RepositoryDomainResolver::ResolveSettlement(db::Transaction& tx, const expr::DomainOperator& op, const std::vector<Value>& args,
                                                  const db::model::EntityRecord& settlement) {
  switch (op.property) {
    case DomainProperty::kLevel: {
      const Value* v = Field(settlement, "level");
      return v && expr::IsNumber(*v) ? *v : expr::NumberValue(0);
    }
    case DomainProperty::kVar: {
      const auto name = StringArg(args, 0);
      if (name.empty()) return expr::NullValue();
      return EntityVariable(tx, settlement, name);
    }
    case DomainProperty::kHasStructureType: {
      const auto type = StringArg(args, 0);
      if (type.empty()) return expr::BoolValue(false);
      for (const auto& s : Structures(*repository_, tx, settlement.id)) {
        if (FieldEquals(s, "type", type)) return expr::BoolValue(true);
      }
      return expr::BoolValue(false);
    }
    case DomainProperty::kStructureCount: {
      const auto type = StringArg(args, 0);
      double     count = 0;
      for (const auto& s : Structures(*repository_, tx, settlement.id)) {
        if (type.empty() || FieldEquals(s, "type", type)) ++count;
      }
      return expr::NumberValue(count);
    }
    case DomainProperty::kInKingdom:
      return expr::BoolValue(FieldEquals(settlement, "kingdomId", StringArg(args, 0)));
    case DomainProperty::kAtLocation:
      return expr::BoolValue(FieldEquals(settlement, "locationId", StringArg(args, 0)));
    default:
      break;
  }
  return Neutral(op.property);
}

Value RepositoryDomainResolver::ResolveStructure(db::Transaction& tx, const expr::DomainOperator& op, const std::vector<Value>& args,
                                                 const db::model::EntityRecord& structure) {
  switch (op.property) {
    case DomainProperty::kLevel: {
      const Value* v = Field(structure, "level");
      return v && expr::IsNumber(*v) ? *v : expr::NumberValue(0);
    }
    case DomainProperty::kType: {
      const Value* v = Field(structure, "type");
      return v ? *v : expr::NullValue();
    }
    case DomainProperty::kVar: {
      const auto name = StringArg(args, 0);
      if (name.empty()) return expr::NullValue();
      return EntityVariable(tx, structure, name);
    }
    case DomainProperty::kIsOperational: {
      const Value* v = Field(structure, "operational");
      return expr::BoolValue(v && expr::IsBool(*v) && v->bool_value());
    }
    case DomainProperty::kInSettlement: {
      const auto id = StringArg(args, 0);
      if (id.empty()) return expr::BoolValue(false);
      if (FieldEquals(structure, "settlementId", id)) return expr::BoolValue(true);
      return expr::BoolValue(structure.parent_type == "settlement" && structure.parent_id == id);
    }
    default:
      break;
  }
  return Neutral(op.property);
}

Value RepositoryDomainResolver::EntityVariable(db::Transaction& tx, const db::model::EntityRecord& entity, const std::string& name) {
  if (const Value* vars = Field(entity, "variables"); vars && expr::IsStruct(*vars)) {
    auto it = vars->struct_value().fields().find(name);
    if (it != vars->struct_value().fields().end()) return it->second;
  }

  for (const auto& v : repository_->ListVariablesByScope(tx, entity.entity_type, entity.id)) {
    if (v.key == name && v.is_active && v.value) return *v.value;
  }
  return expr::NullValue();
}

} // namespace rulegraph::context
