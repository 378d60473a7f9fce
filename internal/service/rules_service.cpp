#include "rules_service.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <unordered_map>

#include "conversions.hpp"
#include "observe_rpc.hpp"
#include "internal/cache/cache_keys.hpp"
#include "internal/cache/cache_service.hpp"
#include "internal/cache/invalidation_coordinator.hpp"
#include "internal/context/context_builder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/effects/effect_engine.hpp"
#include "internal/expr/evaluator.hpp"
#include "internal/expr/expression.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/graph/dependency_graph_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rulegraph::service {

using namespace rulegraph::v1;
using db::model::ConditionRecord;

namespace {

std::string Branch(const std::string& branch_id) {
  return branch_id.empty() ? std::string(cache::kDefaultBranch) : branch_id;
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

ExecuteEffectsResponse ToResponse(const effects::BatchResult& batch) {
  ExecuteEffectsResponse out;
  out.set_total(batch.total);
  out.set_succeeded(batch.succeeded);
  out.set_failed(batch.failed);
  for (const auto& e : batch.executions) *out.add_executions() = ToProto(e);
  for (const auto& id : batch.execution_order) out.add_execution_order(id);
  return out;
}

// Dependencies first; priority / creation order when the graph is unavailable.
std::vector<ConditionRecord> OrderConditions(std::vector<ConditionRecord> conditions, graph::DependencyGraphService& graphs,
                                             const std::string& campaign_id, const std::string& branch_id) {
  std::sort(conditions.begin(), conditions.end(), [](const ConditionRecord& a, const ConditionRecord& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.created_seq < b.created_seq;
  });
  if (conditions.size() < 2) return conditions;

  std::shared_ptr<const graph::DependencyGraph> g;
  try {
    g = graphs.GetGraph(campaign_id, branch_id);
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_WARN("computed fields without dependency graph", {observability::StringField("error", e.what())});
    return conditions;
  }

  std::vector<graph::DependencyGraph::NodeIndex>                   nodes;
  std::unordered_map<graph::DependencyGraph::NodeIndex, std::size_t> position;
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    if (auto idx = g->Find(graph::ConditionNodeKey(conditions[i].id))) {
      nodes.push_back(*idx);
      position[*idx] = i;
    }
  }

  auto topo = g->TopologicalOrder(nodes);
  if (topo.HasCycle()) {
    RULEGRAPH_LOG_WARN("conditions on a dependency cycle; evaluated last", {observability::StringField("campaign_id", campaign_id)});
  }

  std::vector<ConditionRecord> ordered;
  std::vector<bool>            taken(conditions.size(), false);
  for (const auto* list : {&topo.order, &topo.unordered}) {
    for (auto idx : *list) {
      auto it = position.find(idx);
      if (it == position.end() || taken[it->second]) continue;
      ordered.push_back(conditions[it->second]);
      taken[it->second] = true;
    }
  }
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    if (!taken[i]) ordered.push_back(conditions[i]);
  }
  return ordered;
}

} // namespace

RulesService::RulesService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EvaluateComputedFieldsResponse RulesService::EvaluateComputedFields(const EvaluateComputedFieldsRequest& req) {
  return ObserveRpc("rulegraph.rules.EvaluateComputedFields", [&] {
    EvaluateComputedFieldsResponse resp;
    const auto branch    = Branch(req.branch_id());
    const bool has_extra = req.has_extra_context() && req.extra_context().fields_size() > 0;
    const auto key       = cache::ComputedFieldsKey(req.entity_type(), req.entity_id(), branch);

    if (!has_extra) {
      if (auto hit = ctx_.cache->GetStruct(key)) {
        *resp.mutable_fields() = std::move(*hit);
        resp.set_cache_hit(true);
        return resp;
      }
    }

    const auto started_at = std::chrono::steady_clock::now();

    std::vector<ConditionRecord> conditions;
    std::string                  campaign_id;
    {
      auto tx     = ctx_.repository->Begin();
      auto entity = ctx_.repository->GetEntity(*tx, req.entity_type(), req.entity_id());
      if (!entity) throw util::EntityNotFound(req.entity_type() + " not found: " + req.entity_id());
      campaign_id = entity->campaign_id;
      for (auto& c : ctx_.repository->ListConditionsForEntity(*tx, campaign_id, req.entity_type(), req.entity_id())) {
        if (c.is_active) conditions.push_back(std::move(c));
      }
      tx->Commit();
    }

    auto ctx = ctx_.contexts->BuildPartial(req.entity_type(), req.entity_id(), has_extra ? &req.extra_context() : nullptr);

    struct Winner {
      bool     set      = false;
      int32_t  priority = 0;
      uint64_t seq      = 0;
    };
    std::map<std::string, Winner> winners;
    auto&                         fields = *resp.mutable_fields()->mutable_fields();

    for (const auto& c : OrderConditions(std::move(conditions), *ctx_.graphs, campaign_id, branch)) {
      const auto field  = c.field.empty() ? c.id : c.field;
      auto       result = ctx_.evaluator->Evaluate(c.expression, ctx);
      if (!result) {
        RULEGRAPH_LOG_WARN("condition evaluation failed", {observability::StringField("condition_id", c.id),
                                                           observability::StringField("error", result.message)});
        if (fields.find(field) == fields.end()) fields[field] = expr::NullValue();
        continue;
      }

      auto& w = winners[field];
      if (w.set && (c.priority < w.priority || (c.priority == w.priority && c.created_seq >= w.seq))) continue;
      w = {true, c.priority, c.created_seq};
      fields[field] = result.value;

      // Later conditions may read this one's result as <type>.<field>.
      auto& own = (*ctx.mutable_fields())[req.entity_type()];
      (*own.mutable_struct_value()->mutable_fields())[field] = std::move(result.value);
    }

    observability::Metrics::Instance().ObserveEvaluationMs("computed_fields", ElapsedMs(started_at));
    if (!has_extra) ctx_.cache->SetStruct(key, resp.fields(), ctx_.settings.computed_fields_ttl);
    return resp;
  });
}

EvaluateVariableResponse RulesService::EvaluateVariable(const EvaluateVariableRequest& req) {
  return ObserveRpc("rulegraph.rules.EvaluateVariable", [&] {
    EvaluateVariableResponse resp;

    std::optional<db::model::VariableRecord> var;
    {
      auto tx = ctx_.repository->Begin();
      var     = ctx_.repository->GetVariable(*tx, req.variable_id());
      tx->Commit();
    }
    if (!var || var->deleted_at_ms != 0) throw util::NotFound("variable not found: " + req.variable_id());

    if (!var->IsDerived()) {
      *resp.mutable_value() = var->value ? *var->value : expr::NullValue();
      resp.set_success(true);
      return resp;
    }

    const bool has_extra = req.has_extra_context() && req.extra_context().fields_size() > 0;
    const bool cacheable = !has_extra && !req.include_trace() && var->scope != graph::kWorldScope;
    const auto key       = cache::DerivedVariableKey(var->scope, var->scope_id, var->key, cache::kDefaultBranch);
    if (cacheable) {
      if (auto hit = ctx_.cache->GetValue(key)) {
        *resp.mutable_value() = std::move(*hit);
        resp.set_success(true);
        return resp;
      }
    }

    const auto started_at = std::chrono::steady_clock::now();
    auto ctx = ctx_.contexts->BuildPartial(var->scope, var->scope_id, has_extra ? &req.extra_context() : nullptr);

    std::vector<expr::TraceStep> trace;
    auto                         result = ctx_.evaluator->EvaluateWithTrace(*var->formula, ctx, trace);
    observability::Metrics::Instance().ObserveEvaluationMs("variable", ElapsedMs(started_at));

    *resp.mutable_value() = result.value;
    resp.set_success(static_cast<bool>(result));
    resp.set_error(result.message);

    if (req.include_trace()) {
      expr::TraceStep build;
      build.description = "Build context for " + var->scope + (var->scope_id.empty() ? "" : ":" + var->scope_id);
      build.output      = expr::NumberValue(ctx.fields_size());
      trace.insert(trace.begin() + std::min<std::size_t>(1, trace.size()), std::move(build));

      int step = 0;
      for (const auto& t : trace) {
        auto* out = resp.add_trace();
        out->set_step(++step);
        out->set_description(t.description);
        *out->mutable_input()  = t.input;
        *out->mutable_output() = t.output;
        out->set_passed(t.passed);
      }
    }

    if (cacheable && result) ctx_.cache->SetValue(key, result.value, ctx_.settings.derived_variable_ttl);
    return resp;
  });
}

ValidateConditionResponse RulesService::ValidateCondition(const ValidateConditionRequest& req) {
  return ObserveRpc("rulegraph.rules.ValidateCondition", [&] {
    ValidateConditionResponse resp;
    resp.set_valid(true);

    try {
      expr::ValidateExpression(req.expression(), ctx_.settings.max_depth);
    } catch (const util::FormulaTooComplex& e) {
      resp.set_valid(false);
      resp.add_errors(e.what());
      return resp;
    } catch (const util::EvaluationError& e) {
      resp.set_valid(false);
      resp.add_errors(e.what());
      return resp;
    }

    if (req.campaign_id().empty()) return resp;

    ConditionRecord candidate;
    if (!req.condition_id().empty()) {
      auto tx       = ctx_.repository->Begin();
      auto existing = ctx_.repository->GetCondition(*tx, req.condition_id());
      tx->Commit();
      if (existing) candidate = *existing;
      candidate.id = req.condition_id();
    } else {
      candidate.id = util::NewId();
    }
    candidate.campaign_id = req.campaign_id();
    if (!req.entity_type().empty()) {
      candidate.entity_type = req.entity_type();
      candidate.entity_id   = req.entity_id();
    }
    if (candidate.field.empty()) candidate.field = candidate.id;
    candidate.expression    = req.expression();
    candidate.is_active     = true;
    candidate.deleted_at_ms = 0;

    try {
      ctx_.graphs->ValidateCandidate(req.campaign_id(), candidate);
    } catch (const util::CircularDependency& e) {
      resp.set_valid(false);
      resp.add_errors(e.what());
      for (const auto& k : e.path()) resp.add_cycle_path(k);
    }
    return resp;
  });
}

ExecuteEffectsResponse RulesService::ExecuteEffectsForEntity(const ExecuteEffectsForEntityRequest& req) {
  return ObserveRpc("rulegraph.rules.ExecuteEffectsForEntity", [&] {
    return ToResponse(
        ctx_.effects->ExecuteEffectsForEntity(req.entity_type(), req.entity_id(), req.timing(), req.actor(), Branch(req.branch_id())));
  });
}

ExecuteEffectsResponse RulesService::ExecuteEffectsWithDependencies(const ExecuteEffectsWithDependenciesRequest& req) {
  return ObserveRpc("rulegraph.rules.ExecuteEffectsWithDependencies", [&] {
    std::vector<std::string> ids(req.effect_ids().begin(), req.effect_ids().end());
    return ToResponse(ctx_.effects->ExecuteEffectsWithDependencies(ids, req.actor(), Branch(req.branch_id())));
  });
}

PreviewEffectResponse RulesService::PreviewEffect(const PreviewEffectRequest& req) {
  return ObserveRpc("rulegraph.rules.PreviewEffect", [&] {
    auto preview = ctx_.effects->PreviewEffect(req.effect_id());

    PreviewEffectResponse resp;
    resp.set_valid(preview.valid);
    for (const auto& e : preview.errors) resp.add_errors(e);
    *resp.mutable_before() = preview.before;
    *resp.mutable_after()  = preview.after;
    for (const auto& f : preview.changed_fields) resp.add_changed_fields(f);
    return resp;
  });
}

GetEvaluationOrderResponse RulesService::GetEvaluationOrder(const GetEvaluationOrderRequest& req) {
  return ObserveRpc("rulegraph.rules.GetEvaluationOrder", [&] {
    auto g    = ctx_.graphs->GetGraph(req.campaign_id(), Branch(req.branch_id()));
    auto topo = g->TopologicalOrder();

    GetEvaluationOrderResponse resp;
    resp.set_has_cycle(topo.HasCycle());
    if (!topo.HasCycle()) {
      for (auto idx : topo.order) resp.add_node_keys(g->Node(idx).key);
    }
    return resp;
  });
}

InvalidateResponse RulesService::Invalidate(const InvalidateRequest& req) {
  return ObserveRpc("rulegraph.rules.Invalidate", [&] {
    const auto branch = Branch(req.branch_id());

    cache::InvalidationScope scope;
    switch (req.scope_case()) {
      case InvalidateRequest::kEntity: {
        const auto& e = req.entity();
        scope = cache::EntityChanged{req.campaign_id(), branch, e.entity_type(), e.entity_id(),
                                     {e.changed_fields().begin(), e.changed_fields().end()}, e.parent_type(), e.parent_id()};
        break;
      }
      case InvalidateRequest::kVariable: {
        const auto& v = req.variable();
        scope         = cache::VariableChanged{req.campaign_id(), branch, v.scope(), v.scope_id(), v.key()};
        break;
      }
      case InvalidateRequest::kCondition: {
        const auto& c = req.condition();
        scope = cache::ConditionDefinitionChanged{req.campaign_id(), branch, c.condition_id(), c.entity_type(), c.entity_id()};
        break;
      }
      default:
        throw util::InvalidArgument("invalidation scope is required");
    }

    auto report = ctx_.invalidation->Invalidate(scope);

    InvalidateResponse resp;
    resp.set_keys_deleted(report.keys_deleted);
    return resp;
  });
}

} // namespace rulegraph::service
