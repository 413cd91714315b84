#include "tar_gz.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <vector>

#include "internal/util/errors.hpp"

namespace deploy::backup {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunk = 65536;

struct WriteDeleter {
  void operator()(archive* a) const { archive_write_free(a); }
};

struct ReadDeleter {
  void operator()(archive* a) const { archive_read_free(a); }
};

struct EntryDeleter {
  void operator()(archive_entry* e) const { archive_entry_free(e); }
};

/*
  RAII wrappers for the libarchive handles.
*/
class Writer {
 public:
  explicit Writer(const fs::path& path) : path_(path.string()), handle_(archive_write_new()), a_(handle_.get()) {
    if (!a_) throw util::DeploymentIOError("archive_write_new");
    if (archive_write_add_filter_gzip(a_) < ARCHIVE_WARN) Fail("gzip filter");
    if (archive_write_set_format_pax_restricted(a_) != ARCHIVE_OK) Fail("tar format");
    if (archive_write_open_filename(a_, path_.c_str()) != ARCHIVE_OK) Fail("open");
  }

  void Header(archive_entry* entry) {
    if (archive_write_header(a_, entry) != ARCHIVE_OK) Fail("write header");
  }

  void Data(const char* data, std::size_t size) {
    if (size == 0) return;
    if (archive_write_data(a_, data, size) != static_cast<la_ssize_t>(size)) Fail("write data");
  }

  // Closing flushes the gzip trailer; errors must surface here.
  void Close() {
    if (archive_write_close(a_) != ARCHIVE_OK) Fail("close");
  }

 private:
  [[noreturn]] void Fail(const char* what) {
    const char* err = archive_error_string(a_);
    throw util::DeploymentIOError(std::string("archive ") + what + " " + path_ + ": " + (err ? err : "unknown error"));
  }

  std::string                             path_;
  std::unique_ptr<archive, WriteDeleter> handle_;
  archive*                                a_;
};

class Reader {
 public:
  explicit Reader(const fs::path& path) : path_(path.string()), handle_(archive_read_new()), a_(handle_.get()) {
    if (!a_) throw util::DeploymentIOError("archive_read_new");
    if (archive_read_support_filter_gzip(a_) < ARCHIVE_WARN) Fail("gzip filter");
    if (archive_read_support_format_tar(a_) != ARCHIVE_OK) Fail("tar format");
    if (archive_read_open_filename(a_, path_.c_str(), kChunk) != ARCHIVE_OK) Fail("open");
  }

  // nullptr at end of archive.
  archive_entry* Next() {
    archive_entry* entry = nullptr;
    int            rc    = archive_read_next_header(a_, &entry);
    if (rc == ARCHIVE_EOF) return nullptr;
    if (rc < ARCHIVE_WARN) Fail("read header");
    return entry;
  }

  void Data(const std::function<void(const char*, std::size_t)>& out) {
    std::array<char, kChunk> buf{};
    while (true) {
      la_ssize_t n = archive_read_data(a_, buf.data(), buf.size());
      if (n < 0) Fail("read data");
      if (n == 0) return;
      out(buf.data(), static_cast<std::size_t>(n));
    }
  }

  void Skip() {
    if (archive_read_data_skip(a_) < ARCHIVE_WARN) Fail("skip data");
  }

 private:
  [[noreturn]] void Fail(const char* what) {
    const char* err = archive_error_string(a_);
    throw util::DeploymentIOError(std::string("archive ") + what + " " + path_ + ": " + (err ? err : "unknown error"));
  }

  std::string                            path_;
  std::unique_ptr<archive, ReadDeleter> handle_;
  archive*                               a_;
};

bool IsSafeName(const std::string& name) {
  if (name.empty() || name.front() == '/') return false;
  fs::path p(name);
  if (p.is_absolute() || p.has_root_name()) return false;
  for (const auto& part : p) {
    if (part == "..") return false;
  }
  return true;
}

} // namespace

void CreateTarGz(const fs::path& archive, const fs::path& source_dir, const std::string& root_name) {
  std::vector<fs::directory_entry> entries;
  for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
    if (entry.is_directory() || entry.is_regular_file()) entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.path().generic_string() < b.path().generic_string(); });

  const auto mtime =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

  Writer                                       out(archive);
  std::unique_ptr<archive_entry, EntryDeleter> e(archive_entry_new());
  if (!e) throw util::DeploymentIOError("archive_entry_new");

  auto set_dir = [&](const std::string& name) {
    archive_entry_clear(e.get());
    archive_entry_set_pathname(e.get(), name.c_str());
    archive_entry_set_filetype(e.get(), AE_IFDIR);
    archive_entry_set_perm(e.get(), 0755);
    archive_entry_set_size(e.get(), 0);
    archive_entry_set_mtime(e.get(), mtime, 0);
    out.Header(e.get());
  };

  set_dir(root_name + "/");

  for (const auto& entry : entries) {
    const auto name = root_name + "/" + fs::relative(entry.path(), source_dir).generic_string();

    if (entry.is_directory()) {
      set_dir(name + "/");
      continue;
    }

    const auto size = static_cast<int64_t>(entry.file_size());
    archive_entry_clear(e.get());
    archive_entry_set_pathname(e.get(), name.c_str());
    archive_entry_set_filetype(e.get(), AE_IFREG);
    archive_entry_set_perm(e.get(), 0644);
    archive_entry_set_size(e.get(), size);
    archive_entry_set_mtime(e.get(), mtime, 0);
    out.Header(e.get());

    std::ifstream in(entry.path(), std::ios::binary);
    if (!in) throw util::DeploymentIOError("cannot read " + entry.path().string());

    std::array<char, kChunk> buf{};
    int64_t                  written = 0;
    while (in) {
      in.read(buf.data(), buf.size());
      auto n = static_cast<std::size_t>(in.gcount());
      if (n == 0) break;
      out.Data(buf.data(), n);
      written += static_cast<int64_t>(n);
    }
    if (written != size) throw util::DeploymentIOError("file changed while archiving: " + entry.path().string());
  }

  out.Close();
}

void ExtractTarGz(const fs::path& archive, const fs::path& dest) {
  fs::create_directories(dest);

  Reader in(archive);
  while (auto* entry = in.Next()) {
    const std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
    if (!IsSafeName(name)) throw util::DeploymentIOError("unsafe archive entry: " + name);

    const auto target = dest / fs::path(name).relative_path();
    const auto type   = archive_entry_filetype(entry);

    if (type == AE_IFDIR) {
      fs::create_directories(target);
      in.Skip();
      continue;
    }
    if (type != AE_IFREG) {
      in.Skip();
      continue;
    }

    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw util::DeploymentIOError("cannot write " + target.string());
    in.Data([&](const char* data, std::size_t n) { out.write(data, static_cast<std::streamsize>(n)); });
    if (!out) throw util::DeploymentIOError("write failed " + target.string());
  }
}

std::optional<std::string> ReadTarGzEntry(const fs::path& archive, const std::string& entry) {
  Reader in(archive);
  while (auto* e = in.Next()) {
    const char* name = archive_entry_pathname(e);
    if (archive_entry_filetype(e) != AE_IFREG || !name || entry != name) {
      in.Skip();
      continue;
    }
    std::string content;
    in.Data([&](const char* data, std::size_t n) { content.append(data, n); });
    return content;
  }
  return std::nullopt;
}

} // namespace deploy::backup
