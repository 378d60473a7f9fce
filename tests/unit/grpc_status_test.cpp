#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/expr/value.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/authoring_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/rules_server.hpp"
#include "internal/util/errors.hpp"

namespace {

using rulegraph::grpc::ToStatus;

void TestErrorMapping() {
  using namespace rulegraph::util;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(EntityNotFound("settlement not found: s9")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(FormulaTooComplex("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(EvaluationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(CircularDependency("x", {"a", "b"})).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(ForbiddenPath("x", "/id")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(OptimisticLockConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  auto status = ToStatus(EntityNotFound("settlement not found: s9"));
  assert(status.error_message() == "settlement not found: s9");
}

void TestMissingEntityReturnsNotFound() {
  auto                        app = rulegraph::factory::Build(rulegraph::runtime::config::RuntimeConfig{});
  rulegraph::grpc::RulesServer server(app.rules);

  rulegraph::v1::EvaluateComputedFieldsRequest req;
  req.set_entity_type("settlement");
  req.set_entity_id("missing");
  rulegraph::v1::EvaluateComputedFieldsResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = server.EvaluateComputedFields(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAuthoringErrorsMapToStatus() {
  auto                            app = rulegraph::factory::Build(rulegraph::runtime::config::RuntimeConfig{});
  rulegraph::grpc::AuthoringServer server(app.authoring);

  rulegraph::v1::Condition condition;
  condition.set_id("c-1");
  condition.set_campaign_id("c1");
  condition.set_entity_type("settlement");
  condition.set_field("big");
  *condition.mutable_expression() = rulegraph::expr::ParseJsonValue(R"({">": [{"var": "settlement.level"}, 3]})");

  rulegraph::v1::Condition created;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateCondition(&grpc_ctx, &condition, &created).ok());
    assert(created.version() == 1);
  }

  // unknown operator
  rulegraph::v1::Condition bad = condition;
  bad.set_id("c-2");
  *bad.mutable_expression() = rulegraph::expr::ParseJsonValue(R"({"explode": [1]})");
  {
    rulegraph::v1::Condition out;
    ::grpc::ServerContext    grpc_ctx;
    assert(server.CreateCondition(&grpc_ctx, &bad, &out).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  // stale version
  rulegraph::v1::Condition stale = created;
  stale.set_version(7);
  stale.set_is_active(true);
  {
    rulegraph::v1::Condition out;
    ::grpc::ServerContext    grpc_ctx;
    assert(server.UpdateCondition(&grpc_ctx, &stale, &out).error_code() == ::grpc::StatusCode::ABORTED);
  }

  rulegraph::v1::GetEntityRequest get;
  get.set_entity_type("settlement");
  get.set_entity_id("nowhere");
  {
    rulegraph::v1::Entity out;
    ::grpc::ServerContext grpc_ctx;
    assert(server.GetEntity(&grpc_ctx, &get, &out).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
}

} // namespace

int main() {
  TestErrorMapping();
  TestMissingEntityReturnsNotFound();
  TestAuthoringErrorsMapToStatus();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
