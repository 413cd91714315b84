#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/archive/archive_store.hpp"
#include "internal/checksum/checksum_service.hpp"
#include "internal/core/file_executors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;

using deploy::model::ValidationStatus;

fs::path MakeDir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "file_deploy_executor_tests" / (name + "-" + deploy::util::NewId());
  fs::create_directories(dir);
  return dir;
}

void Write(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string Read(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

struct Executors {
  std::shared_ptr<deploy::archive::ArchiveStore>     archive   = std::make_shared<deploy::archive::ArchiveStore>();
  std::shared_ptr<deploy::checksum::ChecksumService> checksums = std::make_shared<deploy::checksum::ChecksumService>();
  deploy::core::CopyingFileDeployer                  deployer{archive, checksums};
  deploy::core::ArchiveFileRestorer                  restorer{archive};
};

void TestDeployNewFileCreatesParents() {
  Executors  e;
  auto       dir  = MakeDir("new");
  const auto dest = dir / "project" / "nested" / "deep" / "app.py";
  Write(dir / "app.py", "print('v1')\n");

  assert(e.deployer.Deploy(dir / "app.py", dest));
  assert(Read(dest) == "print('v1')\n");
  // nothing to keep for a brand new file
  assert(e.archive->Generations(dest).empty());

  assert(e.restorer.Restore(dest));
  assert(!fs::exists(dest));
  fs::remove_all(dir);
}

void TestDeployOverwriteKeepsPreviousVersion() {
  Executors  e;
  auto       dir  = MakeDir("overwrite");
  const auto dest = dir / "config.yaml";
  Write(dest, "old: true\n");
  Write(dir / "incoming.yaml", "new: true\n");

  assert(e.deployer.Deploy(dir / "incoming.yaml", dest));
  assert(Read(dest) == "new: true\n");
  assert(e.archive->Generations(dest).size() == 1);

  assert(e.restorer.Restore(dest));
  assert(Read(dest) == "old: true\n");
  assert(e.archive->Generations(dest).empty());
  fs::remove_all(dir);
}

void TestDeployMissingSourceIsIOError() {
  Executors e;
  auto      dir = MakeDir("nosource");

  bool raised = false;
  try {
    e.deployer.Deploy(dir / "absent.txt", dir / "out.txt");
  } catch (const deploy::util::DeploymentIOError&) {
    raised = true;
  }
  assert(raised);
  assert(!fs::exists(dir / "out.txt"));
  fs::remove_all(dir);
}

void TestFailedCopyLeavesExistingDestination() {
  Executors  e;
  auto       dir  = MakeDir("failedcopy");
  const auto dest = dir / "settings.ini";
  Write(dest, "[old]\n");

  bool raised = false;
  try {
    e.deployer.Deploy(dir / "absent.ini", dest);
  } catch (const deploy::util::DeploymentIOError&) {
    raised = true;
  }
  assert(raised);
  assert(Read(dest) == "[old]\n");
  // the generation taken before the copy was consumed by the undo
  assert(e.archive->Generations(dest).empty());
  fs::remove_all(dir);
}

void TestRestoreFailureIsReported() {
  Executors  e;
  auto       dir  = MakeDir("restorefail");
  const auto dest = dir / "occupied";

  // a non-empty directory where a new file used to be cannot be removed
  fs::create_directories(dest);
  Write(dest / "inner.txt", "x");

  assert(!e.restorer.Restore(dest));
  assert(fs::exists(dest / "inner.txt"));
  fs::remove_all(dir);
}

void TestBasicValidator() {
  deploy::core::BasicFileValidator validator;
  auto                             dir = MakeDir("validator");

  Write(dir / "ok.txt", "content");
  auto ok = validator.Validate(dir / "ok.txt");
  assert(ok.status == ValidationStatus::kPass);
  assert(ok.errors.empty() && ok.warnings.empty());

  Write(dir / "empty.txt", "");
  auto empty = validator.Validate(dir / "empty.txt");
  assert(empty.status == ValidationStatus::kWarning);
  assert(empty.warnings.size() == 1);
  assert(empty.warnings[0].rule == "non-empty");

  auto missing = validator.Validate(dir / "missing.txt");
  assert(missing.status == ValidationStatus::kFail);
  assert(missing.errors.size() == 1);
  assert(missing.errors[0].rule == "file-exists");

  fs::create_directories(dir / "subdir");
  auto directory = validator.Validate(dir / "subdir");
  assert(directory.status == ValidationStatus::kFail);
  assert(directory.errors[0].rule == "regular-file");

  fs::remove_all(dir);
}

} // namespace

int main() {
  TestDeployNewFileCreatesParents();
  TestDeployOverwriteKeepsPreviousVersion();
  TestDeployMissingSourceIsIOError();
  TestFailedCopyLeavesExistingDestination();
  TestRestoreFailureIsReported();
  TestBasicValidator();

  std::cout << "file_deploy_unit_file_executors: pass\n";
  return 0;
}
