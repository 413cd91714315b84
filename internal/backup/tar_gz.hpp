#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace deploy::backup {

/*
  Gzip-compressed tar codec for backup artifacts, on libarchive.

  Only regular files and directories are written or extracted. Every
  entry of an archive written here lives under root_name/.
*/

// Throws util::DeploymentIOError on any write failure.
void CreateTarGz(const std::filesystem::path& archive, const std::filesystem::path& source_dir, const std::string& root_name);

// Extracts into dest (created if missing). Rejects absolute names and ".."
// components with util::DeploymentIOError, as well as corrupt headers.
void ExtractTarGz(const std::filesystem::path& archive, const std::filesystem::path& dest);

// Content of the regular file named entry (full name, root included).
std::optional<std::string> ReadTarGzEntry(const std::filesystem::path& archive, const std::string& entry);

} // namespace deploy::backup
