#include "backup_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <sstream>

#include "deploy/v1.hpp"
#include "internal/backup/tar_gz.hpp"
#include "internal/checksum/checksum_service.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace deploy::backup {

namespace fs = std::filesystem;

using deploy::model::BackupType;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kArchiveSuffix = ".tar.gz";

constexpr std::array<const char*, 8> kConfigPatterns = {
    "*.config", "*.ini", "*.yaml", "*.yml", "*.json", "*.xml", "*.conf", "config*.*",
};

/*
  Temporary directory removed on scope exit.
*/
class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::string& tag) : path_(fs::temp_directory_path() / ("file-deploy-" + tag + "-" + util::NewId())) {
    fs::create_directories(path_);
  }

  ~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      DEPLOY_LOG_WARN("temporary directory cleanup failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    }
  }

  ScopedTempDir(const ScopedTempDir&)            = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const fs::path& Path() const {
    return path_;
  }

 private:
  fs::path path_;
};

bool IsHidden(const fs::path& p) {
  const auto name = p.filename().string();
  return !name.empty() && name.front() == '.';
}

bool IsArchivePath(const fs::path& p) {
  return p.filename().string().ends_with(kArchiveSuffix);
}

// Artifact name without the compression suffix; it is also the tar root.
std::string ArtifactName(const fs::path& artifact) {
  auto name = artifact.filename().string();
  if (name.ends_with(kArchiveSuffix)) name.resize(name.size() - std::char_traits<char>::length(kArchiveSuffix));
  return name;
}

std::string ProjectName(const fs::path& project_path) {
  auto normal = project_path.lexically_normal();
  auto name   = normal.filename().string();
  if (name.empty()) name = normal.parent_path().filename().string();
  return name.empty() ? "project" : name;
}

uint64_t ArtifactSize(const fs::path& artifact) {
  if (fs::is_regular_file(artifact)) return static_cast<uint64_t>(fs::file_size(artifact));

  uint64_t total = 0;
  for (const auto& entry : fs::recursive_directory_iterator(artifact)) {
    if (entry.is_regular_file()) total += static_cast<uint64_t>(entry.file_size());
  }
  return total;
}

// rename when possible, copy+remove across filesystems
void MoveTree(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return;

  fs::copy(from, to, fs::copy_options::recursive);
  fs::remove_all(from);
}

bool IsSafeRelative(const fs::path& rel) {
  if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return false;
  for (const auto& part : rel) {
    if (part == "..") return false;
  }
  return true;
}

void WriteMetadata(const fs::path& path, const deploy::v1::BackupMetadata& metadata) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  auto status = google::protobuf::util::MessageToJsonString(metadata, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize backup metadata: " + std::string(status.message()));
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << json;
  if (!out) throw util::DeploymentIOError("write " + path.string());
}

} // namespace

BackupManager::BackupManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<checksum::ChecksumService> checksums,
                             deploy::runtime::config::BackupConfig config)
    : repository_(std::move(repository)), checksums_(std::move(checksums)), config_(std::move(config)) {
}

bool BackupManager::MatchesConfigPattern(const std::string& filename) {
  for (const std::string pattern : kConfigPatterns) {
    // split on '*': first piece is a prefix, last a suffix, middle pieces in order
    std::vector<std::string> pieces;
    std::size_t              start = 0;
    while (true) {
      auto star = pattern.find('*', start);
      pieces.push_back(pattern.substr(start, star == std::string::npos ? std::string::npos : star - start));
      if (star == std::string::npos) break;
      start = star + 1;
    }

    if (pieces.size() == 1) {
      if (filename == pieces.front()) return true;
      continue;
    }

    const auto& head = pieces.front();
    const auto& tail = pieces.back();
    if (filename.size() < head.size() + tail.size()) continue;
    if (!filename.starts_with(head) || !filename.ends_with(tail)) continue;

    std::size_t pos   = head.size();
    std::size_t limit = filename.size() - tail.size();
    bool        ok    = true;
    for (std::size_t i = 1; i + 1 < pieces.size(); ++i) {
      auto found = filename.find(pieces[i], pos);
      if (found == std::string::npos || found + pieces[i].size() > limit) {
        ok = false;
        break;
      }
      pos = found + pieces[i].size();
    }
    if (ok) return true;
  }
  return false;
}

std::vector<SelectedFile> BackupManager::SelectFiles(const fs::path& project_path, BackupType type,
                                                     const std::optional<std::vector<fs::path>>& files) const {
  std::vector<SelectedFile> out;

  if (files) {
    for (const auto& f : *files) {
      const auto abs = f.is_absolute() ? f : project_path / f;
      if (!fs::is_regular_file(abs)) {
        DEPLOY_LOG_WARN("backup file list entry skipped", {StringField("path", abs.string())});
        continue;
      }
      auto rel = abs.lexically_relative(project_path);
      if (!IsSafeRelative(rel)) rel = abs.filename();
      out.push_back({abs, rel});
    }
    return out;
  }

  std::error_code ec;
  const auto      location = fs::weakly_canonical(config_.location(), ec);

  for (auto it = fs::recursive_directory_iterator(project_path); it != fs::recursive_directory_iterator(); ++it) {
    const auto& entry = *it;

    if (entry.is_directory()) {
      const auto name = entry.path().filename().string();
      if (IsHidden(entry.path()) || name == config_.excluded_directory() ||
          (!location.empty() && fs::weakly_canonical(entry.path(), ec) == location)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() || IsHidden(entry.path())) continue;

    const auto name     = entry.path().filename().string();
    bool       selected = false;
    switch (type) {
      case BackupType::kFull:
        selected = true;
        break;
      case BackupType::kConfig:
        selected = MatchesConfigPattern(name);
        break;
      case BackupType::kPartial:
        selected = std::any_of(config_.partial_extensions().begin(), config_.partial_extensions().end(),
                               [&](const std::string& ext) { return name.ends_with(ext); });
        break;
    }
    if (selected) out.push_back({entry.path(), entry.path().lexically_relative(project_path)});
  }

  std::sort(out.begin(), out.end(), [](const SelectedFile& a, const SelectedFile& b) { return a.relative < b.relative; });
  return out;
}

BackupResult BackupManager::CreateBackup(const fs::path& project_path, BackupType type, const std::string& user_id,
                                         const std::optional<std::string>& description, const std::optional<std::vector<fs::path>>& files) {
  if (!fs::is_directory(project_path)) {
    throw util::InvalidArgument("project path is not a directory: " + project_path.string());
  }

  const auto now  = util::Now();
  const auto id   = util::NewId();
  const auto name = ProjectName(project_path) + "_" + util::ToCompactStamp(now) + "_" + std::string(deploy::model::ToString(type)) + "_" +
                    id.substr(0, 8);

  const fs::path location(config_.location());
  fs::create_directories(location);

  ScopedTempDir staging("staging");
  const auto    tree = staging.Path() / name;
  fs::create_directories(tree);

  const auto selected = SelectFiles(project_path, type, files);
  for (const auto& file : selected) {
    const auto target = tree / file.relative;
    fs::create_directories(target.parent_path());
    fs::copy_file(file.source, target, fs::copy_options::overwrite_existing);
  }

  const auto checksum = checksums_->TreeChecksum(tree, {kMetadataFile});

  deploy::v1::BackupMetadata metadata;
  metadata.set_backup_id(id);
  metadata.set_project_name(ProjectName(project_path));
  metadata.set_project_path(project_path.string());
  metadata.set_backup_type(std::string(deploy::model::ToString(type)));
  metadata.set_timestamp(util::ToIso8601(now));
  metadata.set_file_count(selected.size());
  metadata.set_user_id(user_id);
  metadata.set_description(description.value_or(""));
  metadata.set_size(ArtifactSize(tree));
  metadata.set_checksum(checksum);
  WriteMetadata(tree / kMetadataFile, metadata);

  fs::path artifact;
  if (config_.compression()) {
    artifact = location / (name + kArchiveSuffix);
    CreateTarGz(artifact, tree, name);
  } else {
    artifact = location / name;
    MoveTree(tree, artifact);
  }

  db::model::BackupRecord record;
  record.id           = id;
  record.timestamp    = metadata.timestamp();
  record.project_path = project_path.string();
  record.backup_path  = artifact.string();
  record.type         = type;
  record.size_bytes   = ArtifactSize(artifact);
  record.file_count   = selected.size();
  record.user_id      = user_id;
  record.verified     = false;
  record.checksum     = checksum;

  {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertBackup(*tx, record), "insert backup");
    tx->Commit();
  }

  DEPLOY_LOG_INFO("backup created", {StringField("backup_id", id), StringField("path", artifact.string()),
                                     StringField("type", deploy::model::ToString(type)), IntField("file_count", static_cast<int64_t>(selected.size()))});

  BackupResult result;
  result.id         = id;
  result.path       = artifact;
  result.timestamp  = record.timestamp;
  result.size_bytes = record.size_bytes;
  result.file_count = record.file_count;
  result.checksum   = checksum;
  return result;
}

db::model::BackupRecord BackupManager::LoadRecord(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBackup(*tx, id);
  tx->Commit();
  if (!record) throw util::NotFound("backup " + id);
  return *record;
}

bool BackupManager::VerifyBackup(const std::string& id) {
  const auto     record = LoadRecord(id);
  const fs::path artifact(record.backup_path);

  if (!fs::exists(artifact)) {
    DEPLOY_LOG_WARN("backup artifact missing", {StringField("backup_id", id), StringField("path", artifact.string())});
    return false;
  }

  std::string actual;
  try {
    if (IsArchivePath(artifact)) {
      ScopedTempDir extract("verify");
      ExtractTarGz(artifact, extract.Path());
      actual = checksums_->TreeChecksum(extract.Path() / ArtifactName(artifact), {kMetadataFile});
    } else {
      actual = checksums_->TreeChecksum(artifact, {kMetadataFile});
    }
  } catch (const util::DeploymentIOError& ex) {
    DEPLOY_LOG_WARN("backup artifact unreadable", {StringField("backup_id", id), StringField("error", ex.what())});
    return false;
  } catch (const fs::filesystem_error& ex) {
    DEPLOY_LOG_WARN("backup artifact unreadable", {StringField("backup_id", id), StringField("error", ex.what())});
    return false;
  }

  if (actual != record.checksum) {
    DEPLOY_LOG_WARN("backup checksum mismatch", {StringField("backup_id", id), StringField("expected", record.checksum), StringField("actual", actual)});
    return false;
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->MarkBackupVerified(*tx, id), "mark backup verified");
  tx->Commit();

  DEPLOY_LOG_INFO("backup verified", {StringField("backup_id", id)});
  return true;
}

bool BackupManager::RestoreFromBackup(const std::string& id, const std::optional<fs::path>& restore_path) {
  if (!VerifyBackup(id)) {
    throw util::VerificationError("backup " + id + " failed verification");
  }

  const auto     record = LoadRecord(id);
  const fs::path artifact(record.backup_path);
  const fs::path target = restore_path.value_or(fs::path(record.project_path));

  auto copy_tree = [&](const fs::path& root) {
    uint64_t restored = 0;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
      if (!entry.is_regular_file()) continue;
      const auto rel = entry.path().lexically_relative(root);
      if (rel == kMetadataFile) continue;
      const auto dest = target / rel;
      fs::create_directories(dest.parent_path());
      fs::copy_file(entry.path(), dest, fs::copy_options::overwrite_existing);
      ++restored;
    }
    return restored;
  };

  uint64_t restored = 0;
  if (IsArchivePath(artifact)) {
    ScopedTempDir extract("restore");
    ExtractTarGz(artifact, extract.Path());
    restored = copy_tree(extract.Path() / ArtifactName(artifact));
  } else {
    restored = copy_tree(artifact);
  }

  DEPLOY_LOG_INFO("backup restored",
                  {StringField("backup_id", id), StringField("target", target.string()), IntField("files", static_cast<int64_t>(restored))});
  return true;
}

void BackupManager::DeleteBackup(const std::string& id) {
  const auto     record = LoadRecord(id);
  const fs::path artifact(record.backup_path);

  std::error_code ec;
  fs::remove_all(artifact, ec);
  if (ec) throw util::DeploymentIOError("delete backup artifact " + artifact.string() + ": " + ec.message());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteBackup(*tx, id), "delete backup");
  tx->Commit();

  DEPLOY_LOG_INFO("backup deleted", {StringField("backup_id", id), StringField("path", artifact.string())});
}

std::optional<std::string> BackupManager::GetFileFromBackup(const std::string& id, const std::string& relative_path) {
  const auto     record = LoadRecord(id);
  const fs::path artifact(record.backup_path);
  const auto     rel = fs::path(relative_path).lexically_normal();

  if (!IsSafeRelative(rel) || !fs::exists(artifact)) return std::nullopt;

  if (IsArchivePath(artifact)) {
    return ReadTarGzEntry(artifact, ArtifactName(artifact) + "/" + rel.generic_string());
  }

  const auto path = artifact / rel;
  if (!fs::is_regular_file(path)) return std::nullopt;

  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::DeploymentIOError("cannot read " + path.string());
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

std::optional<db::model::BackupRecord> BackupManager::GetBackup(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBackup(*tx, id);
  tx->Commit();
  return record;
}

std::vector<db::model::BackupRecord> BackupManager::ListBackups(const std::optional<std::string>& project_path, std::size_t limit) {
  db::BackupFilter filter;
  filter.project_path = project_path;
  filter.limit        = limit;

  auto tx      = repository_->Begin();
  auto backups = repository_->ListBackups(*tx, filter);
  tx->Commit();
  return backups;
}

} // namespace deploy::backup
