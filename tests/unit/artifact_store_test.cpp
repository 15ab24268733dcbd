#include "internal/storage/artifact_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "tests/common/fixtures.hpp"

namespace {

namespace fs = std::filesystem;

using shipx::storage::ArtifactStore;
using shipx::util::ErrorCode;

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestFileNames() {
  assert(ArtifactStore::LabelFileName(101) == "101_label.pdf");
  assert(ArtifactStore::PrintoutFileName(101) == "101_printout.pdf");
}

void TestDirectoryIsCreatedOnFirstWrite() {
  const auto    root = shipx::testing::FreshDir("shipx_artifact_store", "create") / "nested" / "tmp";
  ArtifactStore store(root);
  assert(!fs::exists(root));

  fs::path   written;
  const auto result = store.Write("101_label.pdf", std::string("%PDF\0bytes", 10), &written);
  assert(result.ok());
  assert(written == root / "101_label.pdf");
  assert(fs::exists(written));
  assert(ReadFile(written) == std::string("%PDF\0bytes", 10));
  assert(!fs::exists(root / "101_label.pdf.tmp"));
}

void TestExistingFileIsReplaced() {
  const auto    root = shipx::testing::FreshDir("shipx_artifact_store", "replace");
  ArtifactStore store(root);

  fs::path written;
  assert(store.Write("doc.pdf", "first version", &written).ok());
  assert(store.Write("doc.pdf", "second", &written).ok());
  assert(ReadFile(written) == "second");
}

void TestInvalidNamesAreRejected() {
  const auto    root = shipx::testing::FreshDir("shipx_artifact_store", "invalid");
  ArtifactStore store(root);

  fs::path written;
  assert(store.Write("", "x", &written).code == ErrorCode::kIOError);
  assert(store.Write("../escape.pdf", "x", &written).code == ErrorCode::kIOError);
  assert(store.Write("a\\b.pdf", "x", &written).code == ErrorCode::kIOError);
  assert(store.Write("..", "x", &written).code == ErrorCode::kIOError);
  assert(written.empty());
  assert(!fs::exists(root));
}

void TestUnwritableRootIsIOError() {
  const auto base = shipx::testing::FreshDir("shipx_artifact_store", "blocked");
  fs::create_directories(base);
  {
    std::ofstream blocker(base / "file");
    blocker << "not a directory";
  }

  ArtifactStore store(base / "file" / "out");
  fs::path      written;
  const auto    result = store.Write("101_label.pdf", "x", &written);
  assert(result.code == ErrorCode::kIOError);
  assert(!result.message.empty());
}

} // namespace

int main() {
  TestFileNames();
  TestDirectoryIsCreatedOnFirstWrite();
  TestExistingFileIsReplaced();
  TestInvalidNamesAreRejected();
  TestUnwritableRootIsIOError();

  std::cout << "shipx_unit_artifact_store: pass\n";
  return 0;
}
