#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/checksum/checksum_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;

fs::path MakeDir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "file_deploy_checksum_tests" / (name + "-" + deploy::util::NewId());
  fs::create_directories(dir);
  return dir;
}

void Write(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

void TestKnownDigest() {
  deploy::checksum::ChecksumService checksums;
  auto                              dir = MakeDir("known");

  Write(dir / "abc.txt", "abc");
  assert(checksums.FileChecksum(dir / "abc.txt") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  Write(dir / "empty.txt", "");
  assert(checksums.FileChecksum(dir / "empty.txt") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  assert(checksums.Verify(dir / "abc.txt", checksums.FileChecksum(dir / "abc.txt")));
  assert(!checksums.Verify(dir / "abc.txt", checksums.FileChecksum(dir / "empty.txt")));
  fs::remove_all(dir);
}

void TestLargeFileSpansChunks() {
  deploy::checksum::ChecksumService checksums;
  auto                              dir = MakeDir("large");

  std::string big(3 * deploy::checksum::ChecksumService::kChunkSize + 17, 'x');
  Write(dir / "a.bin", big);
  Write(dir / "b.bin", big);
  assert(checksums.FileChecksum(dir / "a.bin") == checksums.FileChecksum(dir / "b.bin"));

  big.back() = 'y';
  Write(dir / "b.bin", big);
  assert(checksums.FileChecksum(dir / "a.bin") != checksums.FileChecksum(dir / "b.bin"));
  fs::remove_all(dir);
}

void TestTreeChecksumIgnoresCreationOrder() {
  deploy::checksum::ChecksumService checksums;
  auto                              first  = MakeDir("order1");
  auto                              second = MakeDir("order2");

  Write(first / "a.txt", "alpha");
  Write(first / "sub/b.txt", "beta");
  Write(first / "z/y/c.txt", "gamma");

  Write(second / "z/y/c.txt", "gamma");
  Write(second / "a.txt", "alpha");
  Write(second / "sub/b.txt", "beta");

  assert(checksums.TreeChecksum(first) == checksums.TreeChecksum(second));

  // same bytes under a different path is a different tree
  fs::rename(second / "sub/b.txt", second / "sub/b2.txt");
  assert(checksums.TreeChecksum(first) != checksums.TreeChecksum(second));

  fs::remove_all(first);
  fs::remove_all(second);
}

void TestTreeChecksumExclusions() {
  deploy::checksum::ChecksumService checksums;
  auto                              dir = MakeDir("exclude");

  Write(dir / "a.txt", "alpha");
  const auto before = checksums.TreeChecksum(dir);

  Write(dir / "metadata.json", "{}");
  assert(checksums.TreeChecksum(dir) != before);
  assert(checksums.TreeChecksum(dir, {"metadata.json"}) == before);
  fs::remove_all(dir);
}

void TestMissingFileThrows() {
  deploy::checksum::ChecksumService checksums;
  bool                              threw = false;
  try {
    (void)checksums.FileChecksum("/nonexistent/file-deploy/none.txt");
  } catch (const deploy::util::DeploymentIOError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKnownDigest();
  TestLargeFileSpansChunks();
  TestTreeChecksumIgnoresCreationOrder();
  TestTreeChecksumExclusions();
  TestMissingFileThrows();

  std::cout << "file_deploy_unit_checksum_service: pass\n";
  return 0;
}
