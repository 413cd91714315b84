#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace deploy::checksum {

/*
  Content hashing (SHA-256, lowercase hex).

  Tree checksum:
    files are sorted by their generic relative path and a single digest
    is fed, per file, the relative path bytes followed by the content.
    The result does not depend on directory iteration order.
*/
class ChecksumService {
 public:
  static constexpr std::size_t kChunkSize = 4096;

  // Throws util::DeploymentIOError if the file cannot be read.
  std::string FileChecksum(const std::filesystem::path& path) const;

  // excluded holds relative paths (generic form) left out of the digest.
  std::string TreeChecksum(const std::filesystem::path& root, const std::set<std::string>& excluded = {}) const;

  bool Verify(const std::filesystem::path& path, const std::string& expected) const;
};

} // namespace deploy::checksum
