#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/expr/value.hpp"

namespace rulegraph::expr {

/*
  Expression tree.

  A closed tagged union parsed once from a JSON-logic document and
  never mutated afterwards:

    Literal         scalar / null / list of literals
    VarRef          {"var": "a.b"} or {"var": ["a.b", default]}
    Operator        {"<op>": [args...]} for a fixed operator set
    DomainOperator  {"settlement.<p>": [args..., explicitId?]}

  Every JSON object level counts one towards the depth limit; arrays
  do not. Parse throws util::FormulaTooComplex when the limit is
  exceeded and util::EvaluationError for malformed or unknown nodes.
*/

inline constexpr std::size_t kDefaultMaxDepth = 10;

enum class OpCode : std::uint8_t {
  kEq,
  kNe,
  kStrictEq,
  kStrictNe,
  kLt,
  kLe,
  kGt,
  kGe,
  kAnd,
  kOr,
  kNot,
  kNotNot,
  kIf,
  kAdd,
  kSub,
  kMul,
  kDiv,
  kMod,
  kMin,
  kMax,
  kIn,
  kCat,
  kArray,
};

enum class DomainProperty : std::uint8_t {
  kLevel,
  kVar,
  kHasStructureType,
  kStructureCount,
  kInKingdom,
  kAtLocation,
  kType,
  kIsOperational,
  kInSettlement,
};

struct Node;
using NodePtr = std::shared_ptr<const Node>;

struct Literal {
  Value value;
};

struct VarRef {
  std::string          path;
  std::optional<Value> default_value;
};

struct Operator {
  OpCode               code;
  std::string          name;
  std::vector<NodePtr> children;
};

struct DomainOperator {
  std::string          ns;       // "settlement" | "structure"
  DomainProperty       property;
  std::string          name;     // full operator name, e.g. "settlement.level"
  std::vector<NodePtr> args;     // positional arguments, explicit id excluded
  NodePtr              explicit_id;
};

struct Node {
  std::variant<Literal, VarRef, Operator, DomainOperator> data;
};

NodePtr MakeLiteral(Value value);

// Parses a JSON-logic document.
NodePtr Parse(const Value& json, std::size_t max_depth = kDefaultMaxDepth);

// Object-nesting depth of a raw JSON document (arrays are transparent).
std::size_t Depth(const Value& json);

// Authoring-time check: top level must be a non-empty object, depth within
// the limit, and every node well-formed. Throws like Parse.
void ValidateExpression(const Value& json, std::size_t max_depth = kDefaultMaxDepth);

std::optional<OpCode>         LookupOperator(std::string_view name);
std::optional<DomainProperty> LookupDomainProperty(std::string_view ns, std::string_view property);

// Number of positional arguments before the optional explicit entity id.
std::size_t DomainArity(DomainProperty property);

std::string_view PropertyName(DomainProperty property);

} // namespace rulegraph::expr
