#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/expr/expression.hpp"
#include "internal/expr/value.hpp"

namespace rulegraph::expr {

/*
  Expression evaluation.

  Two passes:
    1. ResolveDomainOperators replaces every DomainOperator subtree with
       a Literal, depth-first, using a DomainResolver (which may hit the
       store).
    2. EvaluateCore walks the now fully-resolved tree synchronously.

  Evaluation never throws; failures come back as an EvalResult code.

  Null semantics: null sorts below every defined value, null == null,
  arithmetic with a null operand yields null, and division / modulo by
  zero yields null. Ordering a number against a string (or any other
  mixed pair) is an EvaluationError.
*/

enum class EvalCode {
  OK = 0,
  FormulaTooComplex,
  EvaluationError,
};

struct EvalResult {
  EvalCode    code = EvalCode::OK;
  std::string message;
  Value       value;

  static EvalResult Ok(Value v) {
    EvalResult r;
    r.value = std::move(v);
    return r;
  }

  static EvalResult Err(EvalCode c, std::string msg) {
    EvalResult r;
    r.code    = c;
    r.message = std::move(msg);
    r.value   = NullValue();
    return r;
  }

  explicit operator bool() const {
    return code == EvalCode::OK;
  }
};

struct TraceStep {
  std::string description;
  Value       input;
  Value       output;
  bool        passed = true;
};

class DomainResolver {
 public:
  virtual ~DomainResolver() = default;

  // args are already evaluated. entity_id is the explicit id when given,
  // otherwise the context entity's id (empty when the context has none).
  virtual Value Resolve(const DomainOperator& op, const std::vector<Value>& args, const std::string& entity_id) = 0;
};

// Pass 1. Throws util::EvaluationError when an argument fails to evaluate.
NodePtr ResolveDomainOperators(const NodePtr& root, const Struct& context, DomainResolver& resolver, std::vector<TraceStep>* trace = nullptr);

// Pass 2. A remaining DomainOperator is reported as an EvaluationError.
EvalResult EvaluateCore(const Node& node, const Struct& context);

class Evaluator {
 public:
  explicit Evaluator(std::size_t max_depth = kDefaultMaxDepth, std::shared_ptr<DomainResolver> resolver = nullptr);

  EvalResult Evaluate(const Value& expression, const Struct& context) const;
  EvalResult Evaluate(const NodePtr& expression, const Struct& context) const;

  EvalResult EvaluateWithTrace(const Value& expression, const Struct& context, std::vector<TraceStep>& trace) const;

  std::size_t MaxDepth() const {
    return max_depth_;
  }

 private:
  EvalResult Run(const NodePtr& expression, const Struct& context, std::vector<TraceStep>* trace) const;

  std::size_t                     max_depth_;
  std::shared_ptr<DomainResolver> resolver_;
};

} // namespace rulegraph::expr
