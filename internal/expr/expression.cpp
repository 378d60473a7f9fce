#include "internal/expr/expression.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace rulegraph::expr {

namespace {

struct OperatorName {
  std::string_view name;
  OpCode           code;
};

constexpr std::array<OperatorName, 23> kOperators = {{
    {"==", OpCode::kEq},       {"!=", OpCode::kNe},    {"===", OpCode::kStrictEq}, {"!==", OpCode::kStrictNe},
    {"<", OpCode::kLt},        {"<=", OpCode::kLe},    {">", OpCode::kGt},         {">=", OpCode::kGe},
    {"and", OpCode::kAnd},     {"or", OpCode::kOr},    {"!", OpCode::kNot},        {"!!", OpCode::kNotNot},
    {"if", OpCode::kIf},       {"+", OpCode::kAdd},    {"-", OpCode::kSub},        {"*", OpCode::kMul},
    {"/", OpCode::kDiv},       {"%", OpCode::kMod},    {"min", OpCode::kMin},      {"max", OpCode::kMax},
    {"in", OpCode::kIn},       {"cat", OpCode::kCat},  {"array", OpCode::kArray},
}};

struct DomainName {
  std::string_view ns;
  std::string_view property;
  DomainProperty   code;
};

constexpr std::array<DomainName, 11> kDomainOperators = {{
    {"settlement", "level", DomainProperty::kLevel},
    {"settlement", "var", DomainProperty::kVar},
    {"settlement", "hasStructureType", DomainProperty::kHasStructureType},
    {"settlement", "structureCount", DomainProperty::kStructureCount},
    {"settlement", "inKingdom", DomainProperty::kInKingdom},
    {"settlement", "atLocation", DomainProperty::kAtLocation},
    {"structure", "level", DomainProperty::kLevel},
    {"structure", "type", DomainProperty::kType},
    {"structure", "var", DomainProperty::kVar},
    {"structure", "isOperational", DomainProperty::kIsOperational},
    {"structure", "inSettlement", DomainProperty::kInSettlement},
}};

bool IsDomainNamespace(std::string_view ns) {
  return ns == "settlement" || ns == "structure";
}

std::vector<const Value*> Arguments(const Value& raw) {
  std::vector<const Value*> args;
  if (IsList(raw)) {
    for (const auto& item : raw.list_value().values()) {
      args.push_back(&item);
    }
  } else {
    args.push_back(&raw);
  }
  return args;
}

class Parser {
 public:
  explicit Parser(std::size_t max_depth) : max_depth_(max_depth) {
  }

  NodePtr ParseNode(const Value& json, std::size_t depth) {
    switch (json.kind_case()) {
      case Value::kStructValue:
        return ParseObject(json.struct_value(), depth + 1);
      case Value::kListValue:
        return ParseList(json, depth);
      default:
        return MakeLiteral(json);
    }
  }

 private:
  NodePtr ParseList(const Value& json, std::size_t depth) {
    const auto& values     = json.list_value().values();
    const bool  all_scalar = std::all_of(values.begin(), values.end(), [](const Value& v) { return !IsStruct(v) && !IsList(v); });
    if (all_scalar) {
      return MakeLiteral(json);
    }

    Operator op{OpCode::kArray, "array", {}};
    for (const auto& item : values) {
      op.children.push_back(ParseNode(item, depth));
    }
    return std::make_shared<const Node>(Node{std::move(op)});
  }

  NodePtr ParseObject(const Struct& object, std::size_t depth) {
    if (depth > max_depth_) {
      throw util::FormulaTooComplex("expression depth exceeds maximum of " + std::to_string(max_depth_));
    }
    if (object.fields_size() != 1) {
      throw util::EvaluationError("expression object must have exactly one operator key, got " + std::to_string(object.fields_size()));
    }

    const auto& [key, raw] = *object.fields().begin();

    if (key == "var") {
      return ParseVar(raw);
    }

    const auto dot = key.find('.');
    if (dot != std::string::npos && IsDomainNamespace(std::string_view(key).substr(0, dot))) {
      return ParseDomain(key, key.substr(0, dot), key.substr(dot + 1), raw, depth);
    }

    auto code = LookupOperator(key);
    if (!code) {
      throw util::EvaluationError("unknown operator: " + key);
    }

    Operator op{*code, key, {}};
    for (const Value* arg : Arguments(raw)) {
      op.children.push_back(ParseNode(*arg, depth));
    }
    return std::make_shared<const Node>(Node{std::move(op)});
  }

  static NodePtr ParseVar(const Value& raw) {
    VarRef ref;
    const Value* path = &raw;
    if (IsList(raw)) {
      const auto& values = raw.list_value().values();
      if (values.empty()) {
        return std::make_shared<const Node>(Node{std::move(ref)});
      }
      path = &values.Get(0);
      if (values.size() > 1) {
        ref.default_value = values.Get(1);
      }
    }

    if (IsString(*path)) {
      ref.path = path->string_value();
    } else if (IsNumber(*path)) {
      ref.path = ToDisplayString(*path);
    } else if (!IsNull(*path)) {
      throw util::EvaluationError("var path must be a string");
    }
    return std::make_shared<const Node>(Node{std::move(ref)});
  }

  NodePtr ParseDomain(const std::string& key, const std::string& ns, const std::string& property, const Value& raw, std::size_t depth) {
    auto code = LookupDomainProperty(ns, property);
    if (!code) {
      throw util::EvaluationError("unknown domain operator: " + key);
    }

    DomainOperator op{ns, *code, key, {}, nullptr};

    std::vector<const Value*> args;
    if (!IsNull(raw)) {
      args = Arguments(raw);
    }

    const auto arity = DomainArity(*code);
    if (args.size() > arity + 1) {
      throw util::EvaluationError(key + " takes at most " + std::to_string(arity + 1) + " arguments");
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
      auto node = ParseNode(*args[i], depth);
      if (i < arity) {
        op.args.push_back(std::move(node));
      } else {
        op.explicit_id = std::move(node);
      }
    }
    return std::make_shared<const Node>(Node{std::move(op)});
  }

  std::size_t max_depth_;
};

} // namespace

NodePtr MakeLiteral(Value value) {
  return std::make_shared<const Node>(Node{Literal{std::move(value)}});
}

NodePtr Parse(const Value& json, std::size_t max_depth) {
  Parser parser(max_depth);
  return parser.ParseNode(json, 0);
}

std::size_t Depth(const Value& json) {
  std::size_t deepest = 0;
  if (IsStruct(json)) {
    for (const auto& [_, child] : json.struct_value().fields()) {
      deepest = std::max(deepest, Depth(child));
    }
    return deepest + 1;
  }
  if (IsList(json)) {
    for (const auto& child : json.list_value().values()) {
      deepest = std::max(deepest, Depth(child));
    }
  }
  return deepest;
}

void ValidateExpression(const Value& json, std::size_t max_depth) {
  if (!IsStruct(json) || json.struct_value().fields_size() == 0) {
    throw util::EvaluationError("expression must be a non-empty object");
  }
  (void)Parse(json, max_depth);
}

std::optional<OpCode> LookupOperator(std::string_view name) {
  for (const auto& entry : kOperators) {
    if (entry.name == name) {
      return entry.code;
    }
  }
  return std::nullopt;
}

std::optional<DomainProperty> LookupDomainProperty(std::string_view ns, std::string_view property) {
  for (const auto& entry : kDomainOperators) {
    if (entry.ns == ns && entry.property == property) {
      return entry.code;
    }
  }
  return std::nullopt;
}

std::size_t DomainArity(DomainProperty property) {
  switch (property) {
    case DomainProperty::kLevel:
    case DomainProperty::kType:
    case DomainProperty::kIsOperational:
      return 0;
    case DomainProperty::kVar:
    case DomainProperty::kHasStructureType:
    case DomainProperty::kStructureCount:
    case DomainProperty::kInKingdom:
    case DomainProperty::kAtLocation:
    case DomainProperty::kInSettlement:
      return 1;
  }
  return 0;
}

std::string_view PropertyName(DomainProperty property) {
  for (const auto& entry : kDomainOperators) {
    if (entry.code == property) {
      return entry.property;
    }
  }
  return "";
}

} // namespace rulegraph::expr
