#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/expr/evaluator.hpp"

namespace rulegraph::context {

/*
  Assembles the evaluation context of one entity:

    {
      "<entityType>": { ...entity fields, "id": <id> },
      "<variable key>": <value>,      world scope, then entity scope
      "<derived key>": <value>,       formulas evaluated in this context
      ...extra context                applied last
    }

  Derived variables are resolved on demand, dependencies first. A
  failing or cyclic formula yields null and a warning.

  Scope "world" builds a context with world variables only.
*/
class ContextBuilder {
 public:
  ContextBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<const expr::Evaluator> evaluator);

  // Throws util::EntityNotFound for a missing entity; store errors propagate.
  expr::Struct Build(const std::string& entity_type, const std::string& entity_id, const expr::Struct* extra_context = nullptr) const;

  // Never throws for a missing entity or an unavailable store; the
  // result then only holds what could be loaded plus the extra context.
  expr::Struct BuildPartial(const std::string& entity_type, const std::string& entity_id,
                            const expr::Struct* extra_context = nullptr) const;

 private:
  expr::Struct Assemble(const std::string& entity_type, const std::string& entity_id, const expr::Struct* extra_context,
                        bool partial) const;

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const expr::Evaluator> evaluator_;
};

} // namespace rulegraph::context
