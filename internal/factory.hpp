#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/archive/archive_store.hpp"
#include "internal/backup/backup_manager.hpp"
#include "internal/checksum/checksum_service.hpp"
#include "internal/core/deployment_engine.hpp"
#include "internal/core/ports.hpp"
#include "internal/core/transaction_ledger.hpp"
#include "internal/db/api/repository.hpp"

namespace deploy::factory {

/*
  Runtime

  Owns all long-lived components. The record store handle is shared by
  the ledger and the backup manager; nothing is global.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<checksum::ChecksumService> checksums;
  std::shared_ptr<archive::ArchiveStore>     archive;
  std::shared_ptr<backup::BackupManager>     backups;
  std::shared_ptr<core::TransactionLedger>   ledger;
  std::shared_ptr<core::DeploymentEngine>    engine;
};

/*
  BuildRepository

  sqlite when database.sqlite is set (schema bootstrapped), memory otherwise.
  The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const deploy::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root: initializes logging, then wires the components.
  validator defaults to core::BasicFileValidator.
*/
Runtime BuildRuntime(const deploy::runtime::config::RuntimeConfig& config, std::shared_ptr<core::Validator> validator = nullptr);

} // namespace deploy::factory
