#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_service.hpp"
#include "internal/cache/invalidation_coordinator.hpp"
#include "internal/cache/memory_cache.hpp"
#include "internal/context/context_builder.hpp"
#include "internal/context/domain_operators.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/effects/effect_engine.hpp"
#include "internal/effects/path_whitelist.hpp"
#include "internal/expr/evaluator.hpp"
#include "internal/graph/dependency_graph_service.hpp"
#include "internal/grpc/authoring_server.hpp"
#include "internal/grpc/rules_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/authoring_service.hpp"
#include "internal/service/rules_service.hpp"
#if RULEGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RULEGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/schema.hpp"
#endif

namespace rulegraph::factory {

namespace {

constexpr std::uint32_t kDefaultTtlSeconds = 300;

#if RULEGRAPH_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const rulegraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RULEGRAPH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    RULEGRAPH_LOG_INFO("using sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RULEGRAPH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    RULEGRAPH_LOG_INFO("using postgres store", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RULEGRAPH_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::chrono::seconds Ttl(std::uint32_t configured) {
  return std::chrono::seconds(configured == 0 ? kDefaultTtlSeconds : configured);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const rulegraph::runtime::config::RuntimeConfig& config) {
  Application app;
  auto&       ctx = app.context;

  ctx.settings.computed_fields_ttl  = Ttl(config.cache().computed_fields_ttl_seconds());
  ctx.settings.derived_variable_ttl = Ttl(config.cache().derived_variable_ttl_seconds());
  ctx.settings.max_depth            = config.evaluation().max_depth() == 0 ? expr::kDefaultMaxDepth : config.evaluation().max_depth();

  // ------------------------------------------------------------------
  // Store and cache
  // ------------------------------------------------------------------
  ctx.repository = BuildRepository(config);
  ctx.cache      = std::make_shared<cache::CacheService>(std::make_shared<cache::MemoryCache>(), config.cache().disabled());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto resolver    = std::make_shared<context::RepositoryDomainResolver>(ctx.repository);
  ctx.evaluator    = std::make_shared<expr::Evaluator>(ctx.settings.max_depth, resolver);
  ctx.graphs       = std::make_shared<graph::DependencyGraphService>(ctx.repository);
  ctx.invalidation = std::make_shared<cache::InvalidationCoordinator>(ctx.graphs, ctx.cache);
  ctx.contexts     = std::make_shared<context::ContextBuilder>(ctx.repository, ctx.evaluator);
  ctx.effects      = std::make_shared<effects::EffectEngine>(ctx.repository, ctx.graphs, ctx.invalidation,
                                                             effects::PathWhitelist(config.effects()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.rules     = std::make_shared<service::RulesService>(ctx);
  app.authoring = std::make_shared<service::AuthoringService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_shared<grpc::RulesServer>(app.rules));
  app.grpc_services.push_back(std::make_shared<grpc::AuthoringServer>(app.authoring));

  return app;
}

} // namespace rulegraph::factory
