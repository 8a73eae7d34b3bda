#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/mirror_repository.hpp"
#include "internal/revert/reference_checker.hpp"
#include "internal/revert/reverter.hpp"
#include "internal/schema/db_schema_info.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/sync/synchronization_process.hpp"
#include "internal/util/time.hpp"
#include "internal/vcs/committer.hpp"
#include "internal/vcs/git/git_repository.hpp"

namespace mirrorguard::factory {

/*
  Application

  Owns every long-lived component of one mirrorguard process.
*/
struct Application {
  std::shared_ptr<const schema::DbSchemaInfo>     schema;
  std::shared_ptr<storage::StorageFactory>        storages;
  db::MirrorRepositoryPtr                         mirror;
  std::shared_ptr<vcs::git::GitRepository>        repository;
  std::shared_ptr<vcs::Committer>                 committer;
  sync::SynchronizationProcessPtr                 synchronization;
  std::shared_ptr<const revert::ReferenceChecker> checker;
  std::shared_ptr<const util::Clock>              clock;
  std::shared_ptr<revert::Reverter>               reverter;
};

/*
  Build

  Composition root. The only place that knows the concrete mirror
  backend and version-control implementation.
*/
Application Build(const mirrorguard::runtime::config::RuntimeConfig& config);

} // namespace mirrorguard::factory
