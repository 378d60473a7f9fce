#include "internal/graph/dependency_extractor.hpp"

#include <variant>

namespace rulegraph::graph {

using google::protobuf::ListValue;
using google::protobuf::Value;

std::string DomainDependency(const std::string& ns, expr::DomainProperty property, const std::string& var_name) {
  switch (property) {
    case expr::DomainProperty::kHasStructureType:
    case expr::DomainProperty::kStructureCount:
      return "settlement.structures";
    case expr::DomainProperty::kInKingdom:
      return "settlement.kingdomId";
    case expr::DomainProperty::kAtLocation:
      return "settlement.locationId";
    case expr::DomainProperty::kInSettlement:
      return "structure.settlementId";
    case expr::DomainProperty::kIsOperational:
      return "structure.operational";
    case expr::DomainProperty::kVar:
      return ns + ".variables." + var_name;
    case expr::DomainProperty::kLevel:
    case expr::DomainProperty::kType:
      break;
  }
  return ns + "." + std::string(expr::PropertyName(property));
}

namespace {

void CollectReads(const expr::Node& node, PathSet& out) {
  if (const auto* ref = std::get_if<expr::VarRef>(&node.data)) {
    if (!ref->path.empty()) out.insert(ref->path);
    return;
  }
  if (const auto* op = std::get_if<expr::Operator>(&node.data)) {
    for (const auto& child : op->children) {
      if (child) CollectReads(*child, out);
    }
    return;
  }
  if (const auto* dom = std::get_if<expr::DomainOperator>(&node.data)) {
    std::string var_name;
    if (dom->property == expr::DomainProperty::kVar && !dom->args.empty()) {
      if (const auto* lit = std::get_if<expr::Literal>(&dom->args.front()->data); lit && expr::IsString(lit->value)) {
        var_name = lit->value.string_value();
      }
    }
    if (dom->property != expr::DomainProperty::kVar || !var_name.empty()) {
      out.insert(DomainDependency(dom->ns, dom->property, var_name));
    }
    for (const auto& arg : dom->args) {
      if (arg) CollectReads(*arg, out);
    }
    if (dom->explicit_id) CollectReads(*dom->explicit_id, out);
  }
}

void CollectJsonReads(const Value& v, PathSet& out) {
  if (v.kind_case() == Value::kListValue) {
    for (const auto& item : v.list_value().values()) CollectJsonReads(item, out);
    return;
  }
  if (v.kind_case() != Value::kStructValue) return;

  for (const auto& [key, arg] : v.struct_value().fields()) {
    if (key == "var") {
      if (arg.kind_case() == Value::kStringValue) {
        if (!arg.string_value().empty()) out.insert(arg.string_value());
      } else if (arg.kind_case() == Value::kListValue && arg.list_value().values_size() > 0 &&
                 arg.list_value().values(0).kind_case() == Value::kStringValue) {
        if (!arg.list_value().values(0).string_value().empty()) out.insert(arg.list_value().values(0).string_value());
      }
      continue;
    }

    const auto dot = key.find('.');
    if (dot != std::string::npos) {
      const auto ns   = key.substr(0, dot);
      const auto prop = expr::LookupDomainProperty(ns, key.substr(dot + 1));
      if (prop) {
        std::string var_name;
        const Value* first = nullptr;
        if (arg.kind_case() == Value::kListValue && arg.list_value().values_size() > 0) {
          first = &arg.list_value().values(0);
        } else if (arg.kind_case() == Value::kStringValue) {
          first = &arg;
        }
        if (first && first->kind_case() == Value::kStringValue) var_name = first->string_value();
        if (*prop != expr::DomainProperty::kVar || !var_name.empty()) out.insert(DomainDependency(ns, *prop, var_name));
      }
    }
    CollectJsonReads(arg, out);
  }
}

const Value* Field(const Value& op, const char* name) {
  if (op.kind_case() != Value::kStructValue) return nullptr;
  const auto& fields = op.struct_value().fields();
  auto        it     = fields.find(name);
  if (it == fields.end() || it->second.kind_case() != Value::kStringValue) return nullptr;
  return &it->second;
}

} // namespace

PathSet ExtractReads(const expr::NodePtr& node) {
  PathSet out;
  if (node) CollectReads(*node, out);
  return out;
}

PathSet ExtractReadsFromJson(const Value& expression) {
  PathSet out;
  CollectJsonReads(expression, out);
  return out;
}

PathSet ExtractWrites(const ListValue& patch) {
  PathSet out;
  for (const auto& op : patch.values()) {
    const auto* name = Field(op, "op");
    const auto* path = Field(op, "path");
    if (!name || !path || name->string_value() == "test") continue;
    out.insert(path->string_value());
  }
  return out;
}

PathSet ExtractPatchReads(const ListValue& patch) {
  PathSet out;
  for (const auto& op : patch.values()) {
    const auto* name = Field(op, "op");
    if (!name) continue;
    if (name->string_value() == "test") {
      if (const auto* path = Field(op, "path")) out.insert(path->string_value());
    } else if (name->string_value() == "copy" || name->string_value() == "move") {
      if (const auto* from = Field(op, "from")) out.insert(from->string_value());
    }
  }
  return out;
}

} // namespace rulegraph::graph
