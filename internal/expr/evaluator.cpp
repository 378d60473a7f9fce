#include "internal/expr/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"

namespace rulegraph::expr {

namespace {

using util::EvaluationError;

// ------------------------------------------------------------
// Operand helpers
// ------------------------------------------------------------

std::string KindName(const Value& v) {
  switch (v.kind_case()) {
    case Value::kNumberValue:
      return "number";
    case Value::kStringValue:
      return "string";
    case Value::kBoolValue:
      return "bool";
    case Value::kListValue:
      return "array";
    case Value::kStructValue:
      return "object";
    default:
      return "null";
  }
}

// <0, 0, >0. Null sorts below every defined value.
int Compare(const Value& a, const Value& b, const std::string& op) {
  const bool a_null = IsNull(a);
  const bool b_null = IsNull(b);
  if (a_null || b_null) {
    if (a_null && b_null) return 0;
    return a_null ? -1 : 1;
  }

  if (IsNumber(a) && IsNumber(b)) {
    if (a.number_value() < b.number_value()) return -1;
    return a.number_value() > b.number_value() ? 1 : 0;
  }
  if (IsString(a) && IsString(b)) {
    return a.string_value().compare(b.string_value());
  }
  if (IsBool(a) && IsBool(b)) {
    return static_cast<int>(a.bool_value()) - static_cast<int>(b.bool_value());
  }

  throw EvaluationError("operator " + op + " cannot compare " + KindName(a) + " with " + KindName(b));
}

std::optional<double> LooseNumber(const Value& v) {
  if (IsNumber(v)) return v.number_value();
  if (IsBool(v)) return v.bool_value() ? 1.0 : 0.0;
  if (IsString(v)) return ParseNumber(v.string_value());
  return std::nullopt;
}

bool LooseEquals(const Value& a, const Value& b) {
  if (IsNull(a) || IsNull(b)) {
    return IsNull(a) && IsNull(b);
  }
  if (a.kind_case() == b.kind_case()) {
    return DeepEquals(a, b);
  }
  auto x = LooseNumber(a);
  auto y = LooseNumber(b);
  return x && y && *x == *y;
}

double RequireNumber(const Value& v, const std::string& op) {
  if (!IsNumber(v)) {
    throw EvaluationError("operator " + op + " expects numbers, got " + KindName(v));
  }
  return v.number_value();
}

void RequireArity(const Operator& op, std::size_t min, std::size_t max) {
  const auto n = op.children.size();
  if (n < min || n > max) {
    throw EvaluationError("operator " + op.name + " received " + std::to_string(n) + " arguments");
  }
}

// ------------------------------------------------------------
// Core evaluator
// ------------------------------------------------------------

class CoreEvaluator {
 public:
  explicit CoreEvaluator(const Struct& context) : context_(context) {
  }

  Value Eval(const Node& node) {
    if (const auto* literal = std::get_if<Literal>(&node.data)) {
      return literal->value;
    }
    if (const auto* ref = std::get_if<VarRef>(&node.data)) {
      return EvalVar(*ref);
    }
    if (const auto* op = std::get_if<Operator>(&node.data)) {
      return EvalOperator(*op);
    }
    const auto& domain = std::get<DomainOperator>(node.data);
    throw EvaluationError("unresolved domain operator: " + domain.name);
  }

 private:
  Value EvalVar(const VarRef& ref) {
    if (ref.path.empty()) {
      return StructValue(context_);
    }
    const Value* found = Lookup(context_, ref.path);
    if (found == nullptr || IsNull(*found)) {
      return ref.default_value ? *ref.default_value : NullValue();
    }
    return *found;
  }

  std::vector<Value> EvalAll(const Operator& op) {
    std::vector<Value> out;
    out.reserve(op.children.size());
    for (const auto& child : op.children) {
      out.push_back(Eval(*child));
    }
    return out;
  }

  Value EvalOperator(const Operator& op) {
    switch (op.code) {
      case OpCode::kEq:
      case OpCode::kNe: {
        RequireArity(op, 2, 2);
        const bool eq = LooseEquals(Eval(*op.children[0]), Eval(*op.children[1]));
        return BoolValue(op.code == OpCode::kEq ? eq : !eq);
      }
      case OpCode::kStrictEq:
      case OpCode::kStrictNe: {
        RequireArity(op, 2, 2);
        const bool eq = DeepEquals(Eval(*op.children[0]), Eval(*op.children[1]));
        return BoolValue(op.code == OpCode::kStrictEq ? eq : !eq);
      }
      case OpCode::kLt:
      case OpCode::kLe:
      case OpCode::kGt:
      case OpCode::kGe:
        return EvalOrdering(op);
      case OpCode::kAnd: {
        RequireArity(op, 1, op.children.size());
        Value last;
        for (const auto& child : op.children) {
          last = Eval(*child);
          if (!Truthy(last)) return last;
        }
        return last;
      }
      case OpCode::kOr: {
        RequireArity(op, 1, op.children.size());
        Value last;
        for (const auto& child : op.children) {
          last = Eval(*child);
          if (Truthy(last)) return last;
        }
        return last;
      }
      case OpCode::kNot:
        RequireArity(op, 1, 1);
        return BoolValue(!Truthy(Eval(*op.children[0])));
      case OpCode::kNotNot:
        RequireArity(op, 1, 1);
        return BoolValue(Truthy(Eval(*op.children[0])));
      case OpCode::kIf:
        return EvalIf(op);
      case OpCode::kAdd:
      case OpCode::kSub:
      case OpCode::kMul:
      case OpCode::kDiv:
      case OpCode::kMod:
      case OpCode::kMin:
      case OpCode::kMax:
        return EvalArithmetic(op);
      case OpCode::kIn:
        return EvalIn(op);
      case OpCode::kCat: {
        std::string out;
        for (const auto& v : EvalAll(op)) {
          out += ToDisplayString(v);
        }
        return StringValue(out);
      }
      case OpCode::kArray:
        return ListValue(EvalAll(op));
    }
    throw EvaluationError("unsupported operator: " + op.name);
  }

  Value EvalOrdering(const Operator& op) {
    const bool chain = op.code == OpCode::kLt || op.code == OpCode::kLe;
    RequireArity(op, 2, chain ? 3 : 2);

    auto values = EvalAll(op);
    auto holds  = [&](const Value& a, const Value& b) {
      const int c = Compare(a, b, op.name);
      switch (op.code) {
        case OpCode::kLt:
          return c < 0;
        case OpCode::kLe:
          return c <= 0;
        case OpCode::kGt:
          return c > 0;
        default:
          return c >= 0;
      }
    };

    bool result = holds(values[0], values[1]);
    if (values.size() == 3) {
      result = result && holds(values[1], values[2]);
    }
    return BoolValue(result);
  }

  Value EvalIf(const Operator& op) {
    const auto n = op.children.size();
    std::size_t i = 0;
    for (; i + 1 < n; i += 2) {
      if (Truthy(Eval(*op.children[i]))) {
        return Eval(*op.children[i + 1]);
      }
    }
    if (i < n) {
      return Eval(*op.children[i]);
    }
    return NullValue();
  }

  Value EvalArithmetic(const Operator& op) {
    auto values = EvalAll(op);
    for (const auto& v : values) {
      if (IsNull(v)) return NullValue();
    }

    switch (op.code) {
      case OpCode::kAdd: {
        double sum = 0;
        for (const auto& v : values) sum += RequireNumber(v, op.name);
        return NumberValue(sum);
      }
      case OpCode::kSub: {
        RequireArity(op, 1, 2);
        if (values.size() == 1) return NumberValue(-RequireNumber(values[0], op.name));
        return NumberValue(RequireNumber(values[0], op.name) - RequireNumber(values[1], op.name));
      }
      case OpCode::kMul: {
        RequireArity(op, 1, values.size());
        double product = 1;
        for (const auto& v : values) product *= RequireNumber(v, op.name);
        return NumberValue(product);
      }
      case OpCode::kDiv:
      case OpCode::kMod: {
        RequireArity(op, 2, 2);
        const double lhs = RequireNumber(values[0], op.name);
        const double rhs = RequireNumber(values[1], op.name);
        if (rhs == 0.0) return NullValue();
        return NumberValue(op.code == OpCode::kDiv ? lhs / rhs : std::fmod(lhs, rhs));
      }
      default: {
        if (values.empty()) return NullValue();
        double best = RequireNumber(values[0], op.name);
        for (std::size_t i = 1; i < values.size(); ++i) {
          const double n = RequireNumber(values[i], op.name);
          best           = op.code == OpCode::kMin ? std::min(best, n) : std::max(best, n);
        }
        return NumberValue(best);
      }
    }
  }

  Value EvalIn(const Operator& op) {
    RequireArity(op, 2, 2);
    const Value needle   = Eval(*op.children[0]);
    const Value haystack = Eval(*op.children[1]);

    if (IsNull(haystack)) {
      return BoolValue(false);
    }
    if (IsList(haystack)) {
      for (const auto& item : haystack.list_value().values()) {
        if (DeepEquals(item, needle)) return BoolValue(true);
      }
      return BoolValue(false);
    }
    if (IsString(haystack)) {
      if (!IsString(needle)) {
        throw EvaluationError("operator in expects a string needle for a string haystack");
      }
      return BoolValue(haystack.string_value().find(needle.string_value()) != std::string::npos);
    }
    throw EvaluationError("operator in expects an array or string, got " + KindName(haystack));
  }

  const Struct& context_;
};

// ------------------------------------------------------------
// Domain operator pre-pass
// ------------------------------------------------------------

class DomainPass {
 public:
  DomainPass(const Struct& context, DomainResolver& resolver, std::vector<TraceStep>* trace)
      : context_(context), resolver_(resolver), trace_(trace) {
  }

  NodePtr Rewrite(const NodePtr& node) {
    if (auto* op = std::get_if<Operator>(&node->data)) {
      Operator copy{op->code, op->name, {}};
      bool     changed = false;
      for (const auto& child : op->children) {
        auto rewritten = Rewrite(child);
        changed        = changed || rewritten != child;
        copy.children.push_back(std::move(rewritten));
      }
      if (!changed) return node;
      return std::make_shared<const Node>(Node{std::move(copy)});
    }

    if (auto* domain = std::get_if<DomainOperator>(&node->data)) {
      return MakeLiteral(ResolveOne(*domain));
    }

    return node;
  }

 private:
  Value EvalArg(const NodePtr& arg) {
    auto resolved = Rewrite(arg);
    auto result   = EvaluateCore(*resolved, context_);
    if (!result) {
      throw EvaluationError(result.message);
    }
    return result.value;
  }

  Value ResolveOne(const DomainOperator& domain) {
    std::vector<Value> args;
    for (const auto& arg : domain.args) {
      args.push_back(EvalArg(arg));
    }

    std::string entity_id;
    if (domain.explicit_id) {
      entity_id = ToDisplayString(EvalArg(domain.explicit_id));
    } else if (const Value* own = Lookup(context_, domain.ns + ".id"); own && IsString(*own)) {
      entity_id = own->string_value();
    }

    Value value = resolver_.Resolve(domain, args, entity_id);

    if (trace_) {
      TraceStep step;
      step.description = "Resolve " + domain.name + (entity_id.empty() ? "" : " for " + entity_id);
      step.input       = ListValue(args);
      step.output      = value;
      trace_->push_back(std::move(step));
    }
    return value;
  }

  const Struct&           context_;
  DomainResolver&         resolver_;
  std::vector<TraceStep>* trace_;
};

bool ContainsDomainOperator(const Node& node) {
  if (std::holds_alternative<DomainOperator>(node.data)) {
    return true;
  }
  if (const auto* op = std::get_if<Operator>(&node.data)) {
    for (const auto& child : op->children) {
      if (ContainsDomainOperator(*child)) return true;
    }
  }
  return false;
}

} // namespace

NodePtr ResolveDomainOperators(const NodePtr& root, const Struct& context, DomainResolver& resolver, std::vector<TraceStep>* trace) {
  DomainPass pass(context, resolver, trace);
  return pass.Rewrite(root);
}

EvalResult EvaluateCore(const Node& node, const Struct& context) {
  try {
    CoreEvaluator evaluator(context);
    return EvalResult::Ok(evaluator.Eval(node));
  } catch (const util::EvaluationError& e) {
    return EvalResult::Err(EvalCode::EvaluationError, e.what());
  }
}

// ------------------------------------------------------------
// Evaluator
// ------------------------------------------------------------

Evaluator::Evaluator(std::size_t max_depth, std::shared_ptr<DomainResolver> resolver)
    : max_depth_(max_depth == 0 ? kDefaultMaxDepth : max_depth), resolver_(std::move(resolver)) {
}

EvalResult Evaluator::Evaluate(const Value& expression, const Struct& context) const {
  NodePtr root;
  try {
    root = Parse(expression, max_depth_);
  } catch (const util::FormulaTooComplex& e) {
    return EvalResult::Err(EvalCode::FormulaTooComplex, e.what());
  } catch (const util::EvaluationError& e) {
    return EvalResult::Err(EvalCode::EvaluationError, e.what());
  }
  return Run(root, context, nullptr);
}

EvalResult Evaluator::Evaluate(const NodePtr& expression, const Struct& context) const {
  return Run(expression, context, nullptr);
}

EvalResult Evaluator::EvaluateWithTrace(const Value& expression, const Struct& context, std::vector<TraceStep>& trace) const {
  TraceStep validate;
  validate.description = "Validate expression";
  validate.input       = expression;

  NodePtr root;
  try {
    root = Parse(expression, max_depth_);
  } catch (const util::FormulaTooComplex& e) {
    validate.output = StringValue(e.what());
    validate.passed = false;
    trace.push_back(std::move(validate));
    return EvalResult::Err(EvalCode::FormulaTooComplex, e.what());
  } catch (const util::EvaluationError& e) {
    validate.output = StringValue(e.what());
    validate.passed = false;
    trace.push_back(std::move(validate));
    return EvalResult::Err(EvalCode::EvaluationError, e.what());
  }
  validate.output = BoolValue(true);
  trace.push_back(std::move(validate));

  auto result = Run(root, context, &trace);

  TraceStep evaluate;
  evaluate.description = "Evaluate expression";
  evaluate.input       = expression;
  evaluate.output      = result ? result.value : StringValue(result.message);
  evaluate.passed      = static_cast<bool>(result);
  trace.push_back(std::move(evaluate));
  return result;
}

EvalResult Evaluator::Run(const NodePtr& expression, const Struct& context, std::vector<TraceStep>* trace) const {
  if (!expression) {
    return EvalResult::Err(EvalCode::EvaluationError, "empty expression");
  }

  NodePtr resolved = expression;
  if (ContainsDomainOperator(*expression)) {
    if (!resolver_) {
      return EvalResult::Err(EvalCode::EvaluationError, "domain operators require a resolver");
    }
    try {
      resolved = ResolveDomainOperators(expression, context, *resolver_, trace);
    } catch (const util::EvaluationError& e) {
      return EvalResult::Err(EvalCode::EvaluationError, e.what());
    } catch (const std::exception& e) {
      return EvalResult::Err(EvalCode::EvaluationError, std::string("domain operator failed: ") + e.what());
    }
  }
  return EvaluateCore(*resolved, context);
}

} // namespace rulegraph::expr
