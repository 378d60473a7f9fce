#include "internal/context/context_builder.hpp"

#include <exception>
#include <map>
#include <set>
#include <vector>

#include "internal/graph/dependency_extractor.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace rulegraph::context {

using db::model::VariableRecord;
using expr::Struct;
using expr::Value;

namespace {

// Evaluates derived variables into ctx, memoized, dependencies first.
class DerivedResolver {
 public:
  DerivedResolver(const expr::Evaluator& evaluator, const std::map<std::string, VariableRecord>& derived, Struct& ctx)
      : evaluator_(evaluator), derived_(derived), ctx_(ctx) {
  }

  void ResolveAll() {
    for (const auto& [key, _] : derived_) Resolve(key);
  }

 private:
  void Resolve(const std::string& key) {
    if (done_.contains(key)) return;
    if (visiting_.contains(key)) {
      // Every variable on the stack from key upwards is part of the cycle.
      bool on_cycle = false;
      for (const auto& k : stack_) {
        on_cycle = on_cycle || k == key;
        if (on_cycle) cyclic_.insert(k);
      }
      RULEGRAPH_LOG_WARN("derived variable cycle", {observability::StringField("key", key)});
      return;
    }

    const auto& var = derived_.at(key);
    visiting_.insert(key);
    stack_.push_back(key);

    for (const auto& path : graph::ExtractReadsFromJson(*var.formula)) {
      const auto segs = expr::SplitPath(path);
      if (!segs.empty() && derived_.contains(segs.front())) Resolve(segs.front());
    }

    Value value = expr::NullValue();
    if (!cyclic_.contains(key)) {
      auto result = evaluator_.Evaluate(*var.formula, ctx_);
      if (result) {
        value = std::move(result.value);
      } else {
        RULEGRAPH_LOG_WARN("derived variable evaluation failed",
                           {observability::StringField("key", key), observability::StringField("variable_id", var.id),
                            observability::StringField("error", result.message)});
      }
    }

    stack_.pop_back();
    visiting_.erase(key);
    done_.insert(key);
    (*ctx_.mutable_fields())[key] = std::move(value);
  }

  const expr::Evaluator&                       evaluator_;
  const std::map<std::string, VariableRecord>& derived_;
  Struct&                                      ctx_;
  std::set<std::string>                        visiting_;
  std::set<std::string>                        done_;
  std::set<std::string>                        cyclic_;
  std::vector<std::string>                     stack_;
};

} // namespace

ContextBuilder::ContextBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<const expr::Evaluator> evaluator)
    : repository_(std::move(repository)), evaluator_(std::move(evaluator)) {
}

Struct ContextBuilder::Build(const std::string& entity_type, const std::string& entity_id, const Struct* extra_context) const {
  return Assemble(entity_type, entity_id, extra_context, false);
}

Struct ContextBuilder::BuildPartial(const std::string& entity_type, const std::string& entity_id, const Struct* extra_context) const {
  return Assemble(entity_type, entity_id, extra_context, true);
}

Struct ContextBuilder::Assemble(const std::string& entity_type, const std::string& entity_id, const Struct* extra_context,
                                bool partial) const {
  observability::SpanScope span("rulegraph.context.build");
  span.SetAttribute("rulegraph.entity_type", entity_type);

  Struct                                ctx;
  std::map<std::string, VariableRecord> derived;
  const bool                            world = entity_type == graph::kWorldScope;

  try {
    auto tx = repository_->Begin();

    if (!world) {
      auto entity = repository_->GetEntity(*tx, entity_type, entity_id);
      if (!entity || entity->deleted_at_ms != 0) {
        if (!partial) throw util::EntityNotFound(entity_type + " not found: " + entity_id);
        RULEGRAPH_LOG_WARN("context entity not found; building partial context",
                           {observability::StringField("entity_type", entity_type), observability::StringField("entity_id", entity_id)});
      } else {
        Struct own = entity->fields;
        (*own.mutable_fields())["id"] = expr::StringValue(entity->id);
        (*ctx.mutable_fields())[entity_type] = expr::StructValue(own);
      }
    }

    // World first so entity-scoped values overwrite.
    std::map<std::string, VariableRecord> vars;
    for (const auto& v : repository_->ListVariablesByScope(*tx, graph::kWorldScope, "")) {
      if (v.is_active) vars[v.key] = v;
    }
    if (!world) {
      for (const auto& v : repository_->ListVariablesByScope(*tx, entity_type, entity_id)) {
        if (v.is_active) vars[v.key] = v;
      }
    }
    tx->Commit();

    for (auto& [key, v] : vars) {
      if (v.IsDerived()) {
        derived.emplace(key, std::move(v));
      } else {
        (*ctx.mutable_fields())[key] = v.value ? *v.value : expr::NullValue();
      }
    }
  } catch (const util::EntityNotFound&) {
    throw;
  } catch (const std::exception& e) {
    if (!partial) throw;
    RULEGRAPH_LOG_WARN("context store lookup failed; building partial context",
                       {observability::StringField("entity_type", entity_type), observability::StringField("entity_id", entity_id),
                        observability::StringField("error", e.what())});
  }

  DerivedResolver(*evaluator_, derived, ctx).ResolveAll();

  if (extra_context) {
    for (const auto& [key, value] : extra_context->fields()) (*ctx.mutable_fields())[key] = value;
  }
  return ctx;
}

} // namespace rulegraph::context
