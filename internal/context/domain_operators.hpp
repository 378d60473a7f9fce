#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/expr/evaluator.hpp"

namespace rulegraph::context {

/*
  Resolves settlement.* / structure.* operators against the store.

  Lookups degrade instead of failing: a missing entity (or a store
  error) resolves to the property's neutral value (0, false or null)
  and is logged.

    settlement.level                 fields.level, 0
    settlement.var(name)             fields.variables[name], else the stored variable
    settlement.hasStructureType(t)   a live structure child of type t exists
    settlement.structureCount(t?)    live structure children (of type t)
    settlement.inKingdom(id)         fields.kingdomId == id
    settlement.atLocation(id)        fields.locationId == id

    structure.level / type / var(name)
    structure.isOperational          fields.operational, false
    structure.inSettlement(id)       fields.settlementId (or the parent) == id
*/
class RepositoryDomainResolver final : public expr::DomainResolver {
 public:
  explicit RepositoryDomainResolver(std::shared_ptr<db::Repository> repository);

  expr::Value Resolve(const expr::DomainOperator& op, const std::vector<expr::Value>& args, const std::string& entity_id) override;

 private:
  expr::Value ResolveSettlement(db::Transaction& tx, const expr::DomainOperator& op, const std::vector<expr::Value>& args,
                                const db::model::EntityRecord& settlement);
  expr::Value ResolveStructure(db::Transaction& tx, const expr::DomainOperator& op, const std::vector<expr::Value>& args,
                               const db::model::EntityRecord& structure);

  // fields.variables[name], falling back to a plain stored variable of the entity's scope.
  expr::Value EntityVariable(db::Transaction& tx, const db::model::EntityRecord& entity, const std::string& name);

  static expr::Value Neutral(expr::DomainProperty property);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace rulegraph::context
