#include "pg_pool.hpp"

namespace rulegraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_entity",
               "SELECT entity_type,id,campaign_id,parent_type,parent_id,fields::text,version,updated_at_ms,deleted_at_ms "
               "FROM entities WHERE entity_type=$1 AND id=$2 AND deleted_at_ms=0");

  conn.prepare("get_variable",
               "SELECT seq,id,campaign_id,scope,scope_id,key,value::text,formula::text,is_active,version,deleted_at_ms "
               "FROM state_variables WHERE id=$1 AND deleted_at_ms=0");

  conn.prepare("get_condition",
               "SELECT seq,id,campaign_id,entity_type,entity_id,field,expression::text,priority,is_active,version,deleted_at_ms "
               "FROM conditions WHERE id=$1 AND deleted_at_ms=0");

  conn.prepare("get_effect",
               "SELECT seq,id,campaign_id,entity_type,entity_id,source_type,source_id,payload::text,timing,priority,is_active,version,deleted_at_ms "
               "FROM effects WHERE id=$1 AND deleted_at_ms=0");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace rulegraph::db::postgres
