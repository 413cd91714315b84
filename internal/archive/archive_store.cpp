#include "archive_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace deploy::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kStampWidth = 20;
constexpr std::size_t kSeqWidth   = 4;
constexpr int         kMaxSeq     = 9999;

std::string MakeTag(const std::string& stamp, int seq) {
  char buf[kSeqWidth + 1];
  std::snprintf(buf, sizeof(buf), "%04d", seq);
  return stamp + "." + buf;
}

} // namespace

ArchiveStore::ArchiveStore(std::string archive_dir_name) : archive_dir_name_(std::move(archive_dir_name)) {
}

bool ArchiveStore::IsTag(const std::string& tag) {
  if (tag.size() != kStampWidth + 1 + kSeqWidth || tag[kStampWidth] != '.') return false;
  for (std::size_t i = 0; i < tag.size(); ++i) {
    if (i == kStampWidth) continue;
    if (!std::isdigit(static_cast<unsigned char>(tag[i]))) return false;
  }
  return true;
}

fs::path ArchiveStore::ArchiveDir(const fs::path& destination) const {
  return destination.parent_path() / archive_dir_name_;
}

std::vector<fs::path> ArchiveStore::Generations(const fs::path& destination) const {
  std::vector<fs::path> out;

  const auto dir = ArchiveDir(destination);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  const auto prefix = destination.filename().string() + ".";
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (!name.starts_with(prefix)) continue;
    if (!IsTag(name.substr(prefix.size()))) continue;
    out.push_back(entry.path());
  }

  // same prefix and fixed-width tags: name order is tag order
  std::sort(out.begin(), out.end());
  return out;
}

std::string ArchiveStore::NextTag(const fs::path& destination) const {
  const auto stamp     = util::ToMicrosStamp(util::Now());
  auto       candidate = MakeTag(stamp, 0);

  const auto existing = Generations(destination);
  if (existing.empty()) return candidate;

  const auto prefix_len = destination.filename().string().size() + 1;
  const auto latest     = existing.back().filename().string().substr(prefix_len);
  if (candidate > latest) return candidate;

  // same microsecond (or a clock step back): bump the sequence
  const int seq = std::stoi(latest.substr(kStampWidth + 1));
  if (seq >= kMaxSeq) {
    throw util::DeploymentIOError("archive sequence exhausted for " + destination.string());
  }
  return MakeTag(latest.substr(0, kStampWidth), seq + 1);
}

std::optional<fs::path> ArchiveStore::Archive(const fs::path& destination) {
  std::error_code ec;
  if (!fs::exists(destination, ec)) return std::nullopt;

  const auto dir = ArchiveDir(destination);
  fs::create_directories(dir, ec);
  if (ec) throw util::DeploymentIOError("create archive dir " + dir.string() + ": " + ec.message());

  const auto target = dir / (destination.filename().string() + "." + NextTag(destination));
  fs::copy_file(destination, target, fs::copy_options::overwrite_existing, ec);
  if (ec) throw util::DeploymentIOError("archive " + destination.string() + ": " + ec.message());

  DEPLOY_LOG_INFO("archived previous version",
                  {observability::StringField("destination", destination.string()), observability::StringField("archive", target.string())});
  return target;
}

void ArchiveStore::Restore(const fs::path& destination) {
  std::error_code ec;
  const auto      generations = Generations(destination);

  if (generations.empty()) {
    // nothing was there before the deployment
    fs::remove(destination, ec);
    if (ec) throw util::DeploymentIOError("remove " + destination.string() + ": " + ec.message());
    DEPLOY_LOG_INFO("removed newly deployed file", {observability::StringField("destination", destination.string())});
    return;
  }

  const auto& latest = generations.back();
  fs::copy_file(latest, destination, fs::copy_options::overwrite_existing, ec);
  if (ec) throw util::DeploymentIOError("restore " + destination.string() + ": " + ec.message());

  fs::remove(latest, ec);
  if (ec) throw util::DeploymentIOError("consume archive " + latest.string() + ": " + ec.message());

  DEPLOY_LOG_INFO("restored previous version",
                  {observability::StringField("destination", destination.string()), observability::StringField("archive", latest.string())});
}

} // namespace deploy::archive
