#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/archive/archive_store.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;

fs::path MakeDir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "file_deploy_archive_tests" / (name + "-" + deploy::util::NewId());
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

void TestArchiveMissingFileIsNoop() {
  deploy::archive::ArchiveStore store;
  auto                          dir = MakeDir("missing");

  assert(!store.Archive(dir / "nothing.txt").has_value());
  assert(!fs::exists(store.ArchiveDir(dir / "nothing.txt")));
  fs::remove_all(dir);
}

void TestRestoreWithoutArchiveDeletes() {
  deploy::archive::ArchiveStore store;
  auto                          dir = MakeDir("fresh");

  Write(dir / "new.txt", "created by deployment");
  store.Restore(dir / "new.txt");
  assert(!fs::exists(dir / "new.txt"));
  fs::remove_all(dir);
}

void TestRestoreConsumesNewestGeneration() {
  deploy::archive::ArchiveStore store;
  auto                          dir  = MakeDir("generations");
  const auto                    file = dir / "a.txt";

  Write(file, "v1");
  auto first = store.Archive(file);
  Write(file, "v2");
  auto second = store.Archive(file);
  Write(file, "v3");

  assert(first && second);
  // same-microsecond archives still sort strictly
  assert(first->filename().string() < second->filename().string());
  assert(store.Generations(file).size() == 2);

  store.Restore(file);
  assert(Read(file) == "v2");
  assert(store.Generations(file).size() == 1);

  store.Restore(file);
  assert(Read(file) == "v1");
  assert(store.Generations(file).empty());

  // one-shot: nothing left, so the file goes away
  store.Restore(file);
  assert(!fs::exists(file));
  fs::remove_all(dir);
}

void TestOnlyExactNamesCount() {
  deploy::archive::ArchiveStore store(".old");
  auto                          dir  = MakeDir("names");
  const auto                    file = dir / "a.txt";

  Write(file, "current");
  auto archived = store.Archive(file);
  assert(archived && archived->parent_path().filename() == ".old");

  const auto tag = archived->filename().string().substr(std::string("a.txt.").size());
  assert(deploy::archive::ArchiveStore::IsTag(tag));

  // look-alikes must be ignored
  Write(dir / ".old" / ("a.txt.bak"), "junk");
  Write(dir / ".old" / ("b.txt." + tag), "other file");
  Write(dir / ".old" / ("xa.txt." + tag), "other file");
  assert(store.Generations(file).size() == 1);

  assert(!deploy::archive::ArchiveStore::IsTag("20250101000000000000"));
  assert(!deploy::archive::ArchiveStore::IsTag("2025010100000000000x.0001"));
  fs::remove_all(dir);
}

} // namespace

int main() {
  TestArchiveMissingFileIsNoop();
  TestRestoreWithoutArchiveDeletes();
  TestRestoreConsumesNewestGeneration();
  TestOnlyExactNamesCount();

  std::cout << "file_deploy_unit_archive_store: pass\n";
  return 0;
}
