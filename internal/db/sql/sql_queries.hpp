#pragma once

namespace mirrorguard::db::sql {

/*
  Canonical SQL for the mirror.

  Written in the SQLite/Postgres common subset; the Postgres
  backend prepares the same text with $n placeholders.
*/

static constexpr const char* CREATE_MIRROR_ENTITIES =
    "CREATE TABLE IF NOT EXISTS mirror_entities ("
    " entity_name TEXT NOT NULL,"
    " vp_id TEXT NOT NULL,"
    " parent_vp_id TEXT,"
    " body TEXT NOT NULL,"
    " modified TEXT,"
    " modified_gmt TEXT,"
    " PRIMARY KEY (entity_name, vp_id));";

static constexpr const char* UPSERT_ENTITY =
    "INSERT INTO mirror_entities(entity_name,vp_id,parent_vp_id,body)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(entity_name,vp_id) DO UPDATE SET"
    " parent_vp_id=excluded.parent_vp_id,"
    " body=excluded.body;";

static constexpr const char* DELETE_ENTITY =
    "DELETE FROM mirror_entities WHERE entity_name=? AND vp_id=?;";

static constexpr const char* SELECT_ENTITY =
    "SELECT entity_name,vp_id,parent_vp_id,body,modified,modified_gmt"
    " FROM mirror_entities WHERE entity_name=? AND vp_id=?;";

static constexpr const char* LIST_ENTITIES =
    "SELECT entity_name,vp_id,parent_vp_id,body,modified,modified_gmt"
    " FROM mirror_entities WHERE entity_name=? ORDER BY vp_id;";

static constexpr const char* TOUCH_POST =
    "UPDATE mirror_entities SET modified=?, modified_gmt=?"
    " WHERE entity_name='post' AND vp_id=?;";

} // namespace mirrorguard::db::sql
