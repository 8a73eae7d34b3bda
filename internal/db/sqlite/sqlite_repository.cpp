#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace mirrorguard::db::sqlite {

using mirrorguard::db::ErrorCode;
using mirrorguard::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColText(st, col);
}

model::EntityRow ReadRow(sqlite3_stmt* st) {
  model::EntityRow r;
  r.entity_name  = ColText(st, 0);
  r.vp_id        = ColText(st, 1);
  r.parent_vp_id = ColOptionalText(st, 2);
  r.body         = ColText(st, 3);
  r.modified     = ColOptionalText(st, 4);
  r.modified_gmt = ColOptionalText(st, 5);
  return r;
}

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::Bootstrap(SqliteDB& db) {
  db.Exec(sql::CREATE_MIRROR_ENTITIES);
  db.Exec("SELECT entity_name,vp_id,parent_vp_id,body,modified,modified_gmt FROM mirror_entities LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::UpsertEntity(Transaction& t, const model::EntityRow& r) {
  auto*     db = TX(t).Handle();
  Statement stmt;
  if (sqlite3_prepare_v2(db, sql::UPSERT_ENTITY, -1, &stmt.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, r.entity_name);
  BindText(stmt.st, 2, r.vp_id);
  BindOptionalText(stmt.st, 3, r.parent_vp_id);
  BindText(stmt.st, 4, r.body);

  return Translate(db, sqlite3_step(stmt.st));
}

Result SqliteRepository::DeleteEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  auto*     db = TX(t).Handle();
  Statement stmt;
  if (sqlite3_prepare_v2(db, sql::DELETE_ENTITY, -1, &stmt.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, entity_name);
  BindText(stmt.st, 2, vp_id);

  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::EntityRow> SqliteRepository::GetEntity(Transaction& t, const std::string& entity_name, const std::string& vp_id) {
  auto*     db = TX(t).Handle();
  Statement stmt;
  if (sqlite3_prepare_v2(db, sql::SELECT_ENTITY, -1, &stmt.st, nullptr) != SQLITE_OK) {
    return std::nullopt;
  }

  BindText(stmt.st, 1, entity_name);
  BindText(stmt.st, 2, vp_id);

  if (sqlite3_step(stmt.st) != SQLITE_ROW) {
    return std::nullopt;
  }
  return ReadRow(stmt.st);
}

std::vector<model::EntityRow> SqliteRepository::ListEntities(Transaction& t, const std::string& entity_name) {
  auto*                         db = TX(t).Handle();
  std::vector<model::EntityRow> rows;
  Statement                     stmt;
  if (sqlite3_prepare_v2(db, sql::LIST_ENTITIES, -1, &stmt.st, nullptr) != SQLITE_OK) {
    return rows;
  }

  BindText(stmt.st, 1, entity_name);
  while (sqlite3_step(stmt.st) == SQLITE_ROW) {
    rows.push_back(ReadRow(stmt.st));
  }
  return rows;
}

Result SqliteRepository::TouchPost(Transaction& t, const std::string& vp_id, const std::string& modified, const std::string& modified_gmt) {
  auto*     db = TX(t).Handle();
  Statement stmt;
  if (sqlite3_prepare_v2(db, sql::TOUCH_POST, -1, &stmt.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, modified);
  BindText(stmt.st, 2, modified_gmt);
  BindText(stmt.st, 3, vp_id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (result && TX(t).Database().Changes() == 0) {
    return Result::Err(ErrorCode::NotFound, "post " + vp_id + " is not mirrored");
  }
  return result;
}

} // namespace mirrorguard::db::sqlite
