#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace mirrorguard::db::postgres {

namespace {

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) {
    return std::nullopt;
  }
  return std::string(f.c_str());
}

model::EntityRow ReadRow(const pqxx::row& row) {
  model::EntityRow r;
  r.entity_name  = row[0].c_str();
  r.vp_id        = row[1].c_str();
  r.parent_vp_id = OptionalText(row[2]);
  r.body         = row[3].c_str();
  r.modified     = OptionalText(row[4]);
  r.modified_gmt = OptionalText(row[5]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Bootstrap(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  tx.exec(sql::CREATE_MIRROR_ENTITIES);
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertEntity(Transaction& t, const model::EntityRow& r) {
  try {
    TX(t).Work().exec_prepared("upsert_entity", r.entity_name, r.vp_id, r.parent_vp_id, r.body);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  try {
    TX(t).Work().exec_prepared("delete_entity", entity_name, vp_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRow> PgRepository::GetEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  auto res = TX(t).Work().exec_prepared("get_entity", entity_name, vp_id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

std::vector<model::EntityRow> PgRepository::ListEntities(Transaction& t, const std::string& entity_name) {
  auto res = TX(t).Work().exec_prepared("list_entities", entity_name);

  std::vector<model::EntityRow> rows;
  rows.reserve(res.size());
  for (const auto& row : res) {
    rows.push_back(ReadRow(row));
  }
  return rows;
}

Result PgRepository::TouchPost(Transaction& t, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_post", vp_id, modified, modified_gmt);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "post " + vp_id + " is not mirrored");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace mirrorguard::db::postgres
