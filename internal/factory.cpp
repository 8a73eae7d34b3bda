#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/revert/reference_lookup.hpp"
#include "internal/sync/mirror_synchronization_process.hpp"
#include "internal/util/errors.hpp"
#if MIRRORGUARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MIRRORGUARD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace mirrorguard::factory {

namespace {

constexpr std::size_t kDefaultPgConnections = 16;

db::MirrorRepositoryPtr BuildMirror(const mirrorguard::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MIRRORGUARD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::Bootstrap(*sqlite_db);
    MIRRORGUARD_LOG_INFO("using sqlite mirror", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MIRRORGUARD_DB_POSTGRES
    const auto& pg = database.postgres();
    db::postgres::PgRepository::Bootstrap(pg.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? kDefaultPgConnections : pg.max_connections());
    MIRRORGUARD_LOG_INFO("using postgres mirror");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigError("postgres backend requested but not enabled at build time");
#endif
  }

  MIRRORGUARD_LOG_WARN("no database configured, using in-memory mirror");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<const schema::DbSchemaInfo> BuildSchema(const mirrorguard::runtime::config::RuntimeConfig& config) {
  if (config.schema().path().empty()) {
    throw util::ConfigError("schema.path is required");
  }
  return std::make_shared<const schema::DbSchemaInfo>(schema::DbSchemaInfo::LoadFromYaml(config.schema().path()));
}

} // namespace

Application Build(const mirrorguard::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // File store
  // ------------------------------------------------------------------
  app.schema   = BuildSchema(config);
  app.storages = storage::StorageFactory::Build(config.storage());

  for (const auto& name : app.schema->GetAllEntityNames()) {
    if (!app.storages->HasStorage(name)) {
      throw util::ConfigError("no storage configured for entity " + name);
    }
  }

  // ------------------------------------------------------------------
  // Version control
  // ------------------------------------------------------------------
  const auto& repo = config.repository();
  app.repository   = std::make_shared<vcs::git::GitRepository>(repo.work_tree());
  app.committer    = std::make_shared<vcs::Committer>(app.repository, repo.author_name(), repo.author_email());

  // ------------------------------------------------------------------
  // Relational mirror
  // ------------------------------------------------------------------
  app.mirror          = BuildMirror(config);
  app.synchronization = std::make_shared<sync::MirrorSynchronizationProcess>(app.storages, app.schema, app.mirror);

  // ------------------------------------------------------------------
  // Revert engine
  // ------------------------------------------------------------------
  auto lookup  = std::make_shared<const revert::ScanningReferenceLookup>(app.schema, app.storages);
  app.checker  = std::make_shared<const revert::ReferenceChecker>(app.schema, app.storages, std::move(lookup));
  app.clock    = std::make_shared<const util::SystemClock>();
  app.reverter = std::make_shared<revert::Reverter>(app.repository, app.committer, app.checker, app.synchronization, app.mirror, app.clock,
                                                    config.database().gmt_offset_minutes());

  return app;
}

} // namespace mirrorguard::factory
