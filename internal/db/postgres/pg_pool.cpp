#include "pg_pool.hpp"

namespace mirrorguard::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_entity",
               "INSERT INTO mirror_entities(entity_name,vp_id,parent_vp_id,body) "
               "VALUES($1,$2,$3,$4) "
               "ON CONFLICT(entity_name,vp_id) DO UPDATE SET "
               "parent_vp_id=EXCLUDED.parent_vp_id, body=EXCLUDED.body");

  conn.prepare("delete_entity", "DELETE FROM mirror_entities WHERE entity_name=$1 AND vp_id=$2");

  conn.prepare("get_entity",
               "SELECT entity_name,vp_id,parent_vp_id,body,modified,modified_gmt "
               "FROM mirror_entities WHERE entity_name=$1 AND vp_id=$2");

  conn.prepare("list_entities",
               "SELECT entity_name,vp_id,parent_vp_id,body,modified,modified_gmt "
               "FROM mirror_entities WHERE entity_name=$1 ORDER BY vp_id");

  conn.prepare("touch_post",
               "UPDATE mirror_entities SET modified=$2, modified_gmt=$3 "
               "WHERE entity_name='post' AND vp_id=$1");
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

} // namespace mirrorguard::db::postgres
