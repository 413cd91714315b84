#include "file_executors.hpp"

#include <fstream>

#include "internal/archive/archive_store.hpp"
#include "internal/checksum/checksum_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace deploy::core {

namespace fs = std::filesystem;

using observability::StringField;

CopyingFileDeployer::CopyingFileDeployer(std::shared_ptr<archive::ArchiveStore> archive, std::shared_ptr<checksum::ChecksumService> checksums)
    : archive_(std::move(archive)), checksums_(std::move(checksums)) {
}

bool CopyingFileDeployer::Deploy(const fs::path& source, const fs::path& destination) {
  try {
    if (destination.has_parent_path()) {
      fs::create_directories(destination.parent_path());
    }
    archive_->Archive(destination);
  } catch (const fs::filesystem_error& ex) {
    throw util::DeploymentIOError("deploy " + source.string() + " -> " + destination.string() + ": " + ex.what());
  }

  // from here on the previous version is archived; undo before reporting
  auto undo = [&](const std::string& error) {
    try {
      archive_->Restore(destination);
    } catch (const util::DeploymentIOError& ex) {
      DEPLOY_LOG_ERROR("undo of failed deploy failed", {StringField("destination", destination.string()), StringField("cause", error),
                                                        StringField("error", ex.what())});
    }
  };

  try {
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
  } catch (const fs::filesystem_error& ex) {
    const std::string error = "deploy " + source.string() + " -> " + destination.string() + ": " + ex.what();
    undo(error);
    throw util::DeploymentIOError(error);
  }

  const auto expected = checksums_->FileChecksum(source);
  if (!checksums_->Verify(destination, expected)) {
    const std::string error = "checksum mismatch for " + destination.string() + ": expected " + expected;
    undo(error);
    throw util::ChecksumMismatch(error);
  }

  DEPLOY_LOG_DEBUG("file deployed", {StringField("source", source.string()), StringField("destination", destination.string())});
  return true;
}

ArchiveFileRestorer::ArchiveFileRestorer(std::shared_ptr<archive::ArchiveStore> archive) : archive_(std::move(archive)) {
}

bool ArchiveFileRestorer::Restore(const fs::path& destination) {
  try {
    archive_->Restore(destination);
    return true;
  } catch (const util::DeploymentIOError& ex) {
    DEPLOY_LOG_ERROR("file restore failed", {StringField("destination", destination.string()), StringField("error", ex.what())});
  } catch (const fs::filesystem_error& ex) {
    DEPLOY_LOG_ERROR("file restore failed", {StringField("destination", destination.string()), StringField("error", ex.what())});
  }
  return false;
}

ValidationReport BasicFileValidator::Validate(const fs::path& path) {
  ValidationReport report;

  auto fail = [&](std::string message, std::string rule) {
    report.status = deploy::model::ValidationStatus::kFail;
    report.errors.push_back({0, std::move(message), std::move(rule)});
    return report;
  };

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return fail("file does not exist: " + path.string(), "file-exists");
  }
  if (!fs::is_regular_file(path, ec)) {
    return fail("not a regular file: " + path.string(), "regular-file");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail("file is not readable: " + path.string(), "readable");
  }

  if (fs::file_size(path, ec) == 0 && !ec) {
    report.status = deploy::model::ValidationStatus::kWarning;
    report.warnings.push_back({0, "file is empty", "non-empty"});
  }
  return report;
}

} // namespace deploy::core
