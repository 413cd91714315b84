#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/core/file_executors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;

using deploy::core::DeploymentStatus;
using deploy::model::FileStatus;
using deploy::model::OperationStatus;
using deploy::model::OperationType;
using deploy::model::TransactionStatus;

void Write(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string Read(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

struct Workspace {
  fs::path root;
  fs::path incoming;
  fs::path project;

  deploy::runtime::config::RuntimeConfig config;
  deploy::factory::Runtime               runtime;
};

Workspace MakeWorkspace(const std::string& name) {
  Workspace w;
  w.root     = fs::temp_directory_path() / "file_deploy_engine_tests" / (name + "-" + deploy::util::NewId());
  w.incoming = w.root / "incoming";
  w.project  = w.root / "p";
  fs::create_directories(w.incoming);
  fs::create_directories(w.project);

  w.config = deploy::config::ConfigLoader::Defaults();
  w.config.mutable_backup()->set_location((w.root / "backups").string());
  w.runtime = deploy::factory::BuildRuntime(w.config);
  return w;
}

// delegates to the real deployer, then fails on the nth call before any copy
class FailingDeployer final : public deploy::core::FileDeployer {
 public:
  FailingDeployer(std::shared_ptr<deploy::core::FileDeployer> inner, int fail_on_call) : inner_(std::move(inner)), fail_on_call_(fail_on_call) {
  }

  bool Deploy(const fs::path& source, const fs::path& destination) override {
    if (++calls_ == fail_on_call_) {
      throw deploy::util::DeploymentIOError("simulated copy failure for " + destination.string());
    }
    return inner_->Deploy(source, destination);
  }

 private:
  std::shared_ptr<deploy::core::FileDeployer> inner_;
  int                                         fail_on_call_;
  int                                         calls_ = 0;
};

// forwards to an in-memory store until fail is set, then every lookup
// of a transaction raises a store error
class FlakyRepository final : public deploy::db::Repository {
 public:
  std::unique_ptr<deploy::db::Transaction> Begin() override { return inner_.Begin(); }

  deploy::db::Result InsertTransaction(deploy::db::Transaction& tx, const deploy::db::model::TransactionRecord& r) override {
    return inner_.InsertTransaction(tx, r);
  }
  std::optional<deploy::db::model::TransactionRecord> GetTransaction(deploy::db::Transaction& tx, const std::string& id) override {
    if (fail) throw deploy::util::StoreError("record store unavailable");
    return inner_.GetTransaction(tx, id);
  }
  deploy::db::Result UpdateTransactionStatus(deploy::db::Transaction& tx, const std::string& id, TransactionStatus status) override {
    return inner_.UpdateTransactionStatus(tx, id, status);
  }
  deploy::db::Result SetTransactionBackup(deploy::db::Transaction& tx, const std::string& id, const std::string& backup_id) override {
    return inner_.SetTransactionBackup(tx, id, backup_id);
  }
  std::vector<deploy::db::model::TransactionRecord> ListTransactions(deploy::db::Transaction& tx, const deploy::db::TransactionFilter& f) override {
    return inner_.ListTransactions(tx, f);
  }

  deploy::db::Result InsertFile(deploy::db::Transaction& tx, deploy::db::model::FileRecord& r) override { return inner_.InsertFile(tx, r); }
  std::optional<deploy::db::model::FileRecord> GetFile(deploy::db::Transaction& tx, const std::string& id) override {
    return inner_.GetFile(tx, id);
  }
  std::vector<deploy::db::model::FileRecord> ListFiles(deploy::db::Transaction& tx, const std::string& id) override {
    return inner_.ListFiles(tx, id);
  }
  deploy::db::Result UpdateFileStatus(deploy::db::Transaction& tx, const std::string& id, FileStatus status) override {
    return inner_.UpdateFileStatus(tx, id, status);
  }
  deploy::db::Result UpdateFileValidation(deploy::db::Transaction& tx, const std::string& id, deploy::model::ValidationStatus status) override {
    return inner_.UpdateFileValidation(tx, id, status);
  }
  deploy::db::Result InsertValidationResult(deploy::db::Transaction& tx, const deploy::db::model::ValidationResultRecord& r) override {
    return inner_.InsertValidationResult(tx, r);
  }
  std::vector<deploy::db::model::ValidationResultRecord> ListValidationResults(deploy::db::Transaction& tx, const std::string& id) override {
    return inner_.ListValidationResults(tx, id);
  }

  deploy::db::Result InsertOperation(deploy::db::Transaction& tx, deploy::db::model::OperationRecord& r) override {
    return inner_.InsertOperation(tx, r);
  }
  deploy::db::Result CompleteOperation(deploy::db::Transaction& tx, const std::string& id, OperationStatus status,
                                       const std::optional<std::string>& error) override {
    return inner_.CompleteOperation(tx, id, status, error);
  }
  std::vector<deploy::db::model::OperationRecord> ListOperations(deploy::db::Transaction& tx, const std::string& id) override {
    return inner_.ListOperations(tx, id);
  }

  deploy::db::Result InsertBackup(deploy::db::Transaction& tx, const deploy::db::model::BackupRecord& r) override { return inner_.InsertBackup(tx, r); }
  std::optional<deploy::db::model::BackupRecord> GetBackup(deploy::db::Transaction& tx, const std::string& id) override {
    return inner_.GetBackup(tx, id);
  }
  deploy::db::Result MarkBackupVerified(deploy::db::Transaction& tx, const std::string& id) override { return inner_.MarkBackupVerified(tx, id); }
  deploy::db::Result DeleteBackup(deploy::db::Transaction& tx, const std::string& id) override { return inner_.DeleteBackup(tx, id); }
  std::vector<deploy::db::model::BackupRecord> ListBackups(deploy::db::Transaction& tx, const deploy::db::BackupFilter& f) override {
    return inner_.ListBackups(tx, f);
  }

  bool fail = false;

 private:
  deploy::db::memory::MemoryRepository inner_;
};

// takes the store down, then fails the copy
class StoreOutageDeployer final : public deploy::core::FileDeployer {
 public:
  explicit StoreOutageDeployer(std::shared_ptr<FlakyRepository> repository) : repository_(std::move(repository)) {
  }

  bool Deploy(const fs::path&, const fs::path& destination) override {
    repository_->fail = true;
    throw deploy::util::DeploymentIOError("simulated copy failure for " + destination.string());
  }

 private:
  std::shared_ptr<FlakyRepository> repository_;
};

void TestDeployIntoEmptyProject() {
  auto w = MakeWorkspace("empty");
  Write(w.incoming / "a.txt", "alpha\n");
  Write(w.incoming / "b.txt", "beta\n");

  auto result = w.runtime.engine->DeployFiles({w.incoming / "a.txt", w.incoming / "b.txt"}, {w.project / "a.txt", w.project / "b.txt"},
                                              w.project, "alice", std::string("first release"));

  assert(result.status == DeploymentStatus::kCompleted);
  assert(!result.error_message);
  assert(w.runtime.ledger->GetStatus(result.transaction_id) == TransactionStatus::kCompleted);

  const auto& checksums = *w.runtime.checksums;
  assert(checksums.FileChecksum(w.project / "a.txt") == checksums.FileChecksum(w.incoming / "a.txt"));
  assert(checksums.FileChecksum(w.project / "b.txt") == checksums.FileChecksum(w.incoming / "b.txt"));

  // nothing existed before, so nothing was archived
  assert(w.runtime.archive->Generations(w.project / "a.txt").empty());
  assert(w.runtime.archive->Generations(w.project / "b.txt").empty());

  // the empty project directory still got a backup
  assert(result.backup_id.has_value());
  auto report = w.runtime.engine->GetDeploymentStatus(result.transaction_id);
  assert(report.backup.has_value());
  assert(report.backup->id == *result.backup_id);
  assert(report.transaction.backup_id == result.backup_id);
  assert(report.files.size() == 2);
  for (const auto& file : report.files) {
    assert(file.file.status == FileStatus::kDeployed);
    assert(file.file.checksum.has_value());
    assert(file.operations.size() == 1);
    assert(file.operations[0].type == OperationType::kDeploy);
    assert(file.operations[0].status == OperationStatus::kCompleted);
  }

  fs::remove_all(w.root);
}

void TestRedeployOverExistingAndRollback() {
  auto w = MakeWorkspace("existing");
  Write(w.project / "a.txt", "original alpha\n");
  Write(w.incoming / "a.txt", "new alpha\n");
  Write(w.incoming / "b.txt", "beta\n");

  auto result = w.runtime.engine->DeployFiles({w.incoming / "a.txt", w.incoming / "b.txt"}, {w.project / "a.txt", w.project / "b.txt"},
                                              w.project, "alice");
  assert(result.status == DeploymentStatus::kCompleted);

  assert(w.runtime.archive->Generations(w.project / "a.txt").size() == 1);
  assert(w.runtime.archive->Generations(w.project / "b.txt").empty());
  assert(Read(w.project / "a.txt") == "new alpha\n");

  // the pre-deployment backup holds the original content
  assert(result.backup_id.has_value());
  assert(w.runtime.backups->GetFileFromBackup(*result.backup_id, "a.txt") == std::string("original alpha\n"));

  assert(w.runtime.engine->RollbackDeployment(result.transaction_id));
  assert(Read(w.project / "a.txt") == "original alpha\n");
  assert(!fs::exists(w.project / "b.txt"));
  assert(w.runtime.archive->Generations(w.project / "a.txt").empty());
  assert(w.runtime.ledger->GetStatus(result.transaction_id) == TransactionStatus::kRolledBack);

  // one-shot
  bool raised = false;
  try {
    w.runtime.engine->RollbackDeployment(result.transaction_id);
  } catch (const deploy::util::InvalidState&) {
    raised = true;
  }
  assert(raised);

  fs::remove_all(w.root);
}

void TestFailureMidwayRestoresProject() {
  auto w = MakeWorkspace("midway");
  Write(w.project / "a.txt", "original alpha\n");
  Write(w.incoming / "a.txt", "new alpha\n");
  Write(w.incoming / "b.txt", "beta\n");

  auto deployer = std::make_shared<FailingDeployer>(std::make_shared<deploy::core::CopyingFileDeployer>(w.runtime.archive, w.runtime.checksums), 2);
  deploy::core::DeploymentOptions options;
  options.auto_backup = false;

  deploy::core::DeploymentEngine engine(w.runtime.ledger, w.runtime.backups, w.runtime.checksums,
                                        std::make_shared<deploy::core::BasicFileValidator>(), deployer,
                                        std::make_shared<deploy::core::ArchiveFileRestorer>(w.runtime.archive), options);

  auto result = engine.DeployFiles({w.incoming / "a.txt", w.incoming / "b.txt"}, {w.project / "a.txt", w.project / "b.txt"}, w.project, "alice");

  assert(result.status == DeploymentStatus::kFailed);
  assert(result.error_message.has_value());
  assert(result.error_message->find("simulated copy failure") != std::string::npos);
  assert(!result.backup_id);
  assert(w.runtime.ledger->GetStatus(result.transaction_id) == TransactionStatus::kFailed);

  assert(Read(w.project / "a.txt") == "original alpha\n");
  assert(!fs::exists(w.project / "b.txt"));
  assert(w.runtime.archive->Generations(w.project / "a.txt").empty());

  auto ops = w.runtime.ledger->GetOperations(result.transaction_id);
  assert(ops.size() == 3);
  assert(ops[1].status == OperationStatus::kFailed);
  assert(ops[2].type == OperationType::kRollback && ops[2].status == OperationStatus::kCompleted);

  fs::remove_all(w.root);
}

void TestValidationFailureChangesNothing() {
  auto w = MakeWorkspace("invalid");
  Write(w.project / "a.txt", "original alpha\n");
  Write(w.incoming / "a.txt", "new alpha\n");

  auto result = w.runtime.engine->DeployFiles({w.incoming / "a.txt", w.incoming / "missing.txt"}, {w.project / "a.txt", w.project / "m.txt"},
                                              w.project, "alice");

  assert(result.status == DeploymentStatus::kValidationFailed);
  assert(!result.backup_id);
  assert(result.validation_details.size() == 2);
  assert(result.validation_details[1].status == deploy::model::ValidationStatus::kFail);
  assert(result.validation_details[1].results.size() == 1);
  assert(result.validation_details[1].results[0].rule == "file-exists");
  assert(w.runtime.ledger->GetStatus(result.transaction_id) == TransactionStatus::kInitialized);

  assert(Read(w.project / "a.txt") == "original alpha\n");
  assert(!fs::exists(w.project / "m.txt"));
  assert(w.runtime.archive->Generations(w.project / "a.txt").empty());
  assert(w.runtime.backups->ListBackups().empty());

  fs::remove_all(w.root);
}

void TestRejectsMalformedRequests() {
  auto w = MakeWorkspace("malformed");

  auto rejects = [&](const std::vector<fs::path>& sources, const std::vector<fs::path>& destinations) {
    try {
      w.runtime.engine->DeployFiles(sources, destinations, w.project, "alice");
    } catch (const deploy::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  assert(rejects({}, {}));
  assert(rejects({w.incoming / "a.txt"}, {}));
  assert(rejects({w.incoming / "a.txt", w.incoming / "b.txt"}, {w.project / "a.txt"}));

  // nothing was recorded
  assert(w.runtime.engine->ListDeployments().empty());

  fs::remove_all(w.root);
}

void TestListDeployments() {
  auto w     = MakeWorkspace("listing");
  auto other = w.root / "other";
  fs::create_directories(other);
  Write(w.incoming / "a.txt", "alpha\n");

  auto first  = w.runtime.engine->DeployFiles({w.incoming / "a.txt"}, {w.project / "a.txt"}, w.project, "alice");
  auto second = w.runtime.engine->DeployFiles({w.incoming / "a.txt"}, {other / "a.txt"}, other, "bob");
  assert(first.status == DeploymentStatus::kCompleted);
  assert(second.status == DeploymentStatus::kCompleted);

  auto all = w.runtime.engine->ListDeployments();
  assert(all.size() == 2);

  auto mine = w.runtime.engine->ListDeployments(w.project.string());
  assert(mine.size() == 1);
  assert(mine[0].transaction.id == first.transaction_id);
  assert(mine[0].file_count == 1);
  assert(mine[0].success_count == 1);

  auto bobs = w.runtime.engine->ListDeployments(std::nullopt, std::string("bob"));
  assert(bobs.size() == 1);
  assert(bobs[0].transaction.id == second.transaction_id);

  assert(w.runtime.engine->ListDeployments(std::nullopt, std::nullopt, 1).size() == 1);

  bool raised = false;
  try {
    w.runtime.engine->GetDeploymentStatus("no-such-transaction");
  } catch (const deploy::util::NotFound&) {
    raised = true;
  }
  assert(raised);

  fs::remove_all(w.root);
}

void TestEmptyUserFallsBackToConfiguredDefault() {
  auto w = MakeWorkspace("default_user");
  Write(w.incoming / "a.txt", "alpha\n");

  auto result = w.runtime.engine->DeployFiles({w.incoming / "a.txt"}, {w.project / "a.txt"}, w.project, "");
  assert(result.status == DeploymentStatus::kCompleted);

  const auto expected = w.config.deployment().default_user();
  assert(!expected.empty());
  assert(w.runtime.ledger->GetTransaction(result.transaction_id).user_id == expected);
  assert(w.runtime.backups->GetBackup(*result.backup_id)->user_id == expected);

  fs::remove_all(w.root);
}

void TestRejectedCopyRestoresPreviousVersion() {
  auto w = MakeWorkspace("rejected_copy");
  Write(w.project / "a.txt", "orig\n");
  Write(w.incoming / "a.txt", "v1\n");

  deploy::core::CopyingFileDeployer deployer(w.runtime.archive, w.runtime.checksums);
  deploy::core::ArchiveFileRestorer restorer(w.runtime.archive);

  auto& ledger = *w.runtime.ledger;
  auto  id     = ledger.CreateTransaction("alice", w.project.string());
  ledger.AddFile(id, w.incoming / "a.txt", w.project / "a.txt", w.runtime.checksums->FileChecksum(w.incoming / "a.txt"));
  deploy::core::BasicFileValidator validator;
  assert(ledger.Validate(id, validator));

  // the source changes between registration and execution
  Write(w.incoming / "a.txt", "v2-tampered\n");

  bool raised = false;
  try {
    ledger.Execute(id, std::nullopt, deployer, restorer);
  } catch (const deploy::util::ChecksumMismatch&) {
    raised = true;
  }
  assert(raised);
  assert(ledger.GetStatus(id) == TransactionStatus::kFailed);
  assert(Read(w.project / "a.txt") == "orig\n");
  assert(w.runtime.archive->Generations(w.project / "a.txt").empty());

  // nothing is left to undo
  assert(ledger.Rollback(id, restorer));
  assert(ledger.GetStatus(id) == TransactionStatus::kRolledBack);
  assert(Read(w.project / "a.txt") == "orig\n");

  fs::remove_all(w.root);
}

void TestStoreOutageDuringFailureIsReported() {
  auto w          = MakeWorkspace("store_outage");
  auto repository = std::make_shared<FlakyRepository>();
  auto ledger     = std::make_shared<deploy::core::TransactionLedger>(repository, w.runtime.checksums);
  Write(w.incoming / "a.txt", "alpha\n");

  deploy::core::DeploymentOptions options;
  options.auto_backup = false;
  deploy::core::DeploymentEngine engine(ledger, w.runtime.backups, w.runtime.checksums, std::make_shared<deploy::core::BasicFileValidator>(),
                                        std::make_shared<StoreOutageDeployer>(repository),
                                        std::make_shared<deploy::core::ArchiveFileRestorer>(w.runtime.archive), options);

  auto result = engine.DeployFiles({w.incoming / "a.txt"}, {w.project / "a.txt"}, w.project, "alice");
  assert(result.status == DeploymentStatus::kFailed);
  assert(result.error_message.has_value());
  assert(!fs::exists(w.project / "a.txt"));

  fs::remove_all(w.root);
}

} // namespace

int main() {
  TestDeployIntoEmptyProject();
  TestRedeployOverExistingAndRollback();
  TestFailureMidwayRestoresProject();
  TestValidationFailureChangesNothing();
  TestRejectsMalformedRequests();
  TestListDeployments();
  TestEmptyUserFallsBackToConfiguredDefault();
  TestRejectedCopyRestoresPreviousVersion();
  TestStoreOutageDuringFailureIsReported();

  std::cout << "file_deploy_integration_deployment: pass\n";
  return 0;
}
