#pragma once

#include <memory>

#include "internal/core/ports.hpp"

namespace deploy::archive {
class ArchiveStore;
}
namespace deploy::checksum {
class ChecksumService;
}

namespace deploy::core {

// create parent dirs, archive the previous version, copy, verify checksum
class CopyingFileDeployer final : public FileDeployer {
 public:
  CopyingFileDeployer(std::shared_ptr<archive::ArchiveStore> archive, std::shared_ptr<checksum::ChecksumService> checksums);

  // Throws util::ChecksumMismatch or util::DeploymentIOError.
  bool Deploy(const std::filesystem::path& source, const std::filesystem::path& destination) override;

 private:
  std::shared_ptr<archive::ArchiveStore>     archive_;
  std::shared_ptr<checksum::ChecksumService> checksums_;
};

// Restores the most recent archived generation, or removes a new file.
class ArchiveFileRestorer final : public FileRestorer {
 public:
  explicit ArchiveFileRestorer(std::shared_ptr<archive::ArchiveStore> archive);

  // I/O failures are logged and reported as false.
  bool Restore(const std::filesystem::path& destination) override;

 private:
  std::shared_ptr<archive::ArchiveStore> archive_;
};

/*
  Default validator.

  FAIL    missing, not a regular file, or unreadable
  WARNING empty file
  PASS    otherwise
*/
class BasicFileValidator final : public Validator {
 public:
  ValidationReport Validate(const std::filesystem::path& path) override;
};

} // namespace deploy::core
