#include "internal/storage/object/arrow_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "tests/support/temp_dir.hpp"

namespace {

using recsync::storage::ArrowObjectStore;
using recsync::storage::PartReceipt;
using recsync::testing::TempDir;
using recsync::util::UploadErrorKind;

std::shared_ptr<arrow::Buffer> Buffer(const std::string& data) {
  return arrow::Buffer::FromString(data);
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

ArrowObjectStore LocalStore(const TempDir& dir) {
  return ArrowObjectStore(std::make_shared<arrow::fs::LocalFileSystem>(), dir.path().string() + "/");
}

void TestPutObjectWritesUnderRoot() {
  TempDir dir("arrow_put");
  auto    store = LocalStore(dir);

  const auto receipt = store.PutObject("raw-chunks/rec-1/part-0001.mp4", Buffer("hello"), {{"recording-id", "rec-1"}});
  assert(receipt.size_bytes == 5);
  assert(receipt.etag == recsync::util::Sha256Hex("hello"));
  assert(ReadFile(dir.path() / "raw-chunks/rec-1/part-0001.mp4") == "hello");

  // same key twice replaces
  store.PutObject("raw-chunks/rec-1/part-0001.mp4", Buffer("bye"), {});
  assert(ReadFile(dir.path() / "raw-chunks/rec-1/part-0001.mp4") == "bye");
}

void TestInvalidKeysAreRejected() {
  TempDir dir("arrow_keys");
  auto    store = LocalStore(dir);

  for (const std::string key : {"", "/abs", "a/../b"}) {
    bool threw = false;
    try {
      store.PutObject(key, Buffer("x"), {});
    } catch (const recsync::util::StoreRejected&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestMultipartAssemblesInOrder() {
  TempDir dir("arrow_multipart");
  auto    store = LocalStore(dir);

  const auto upload_id = store.CreateMultipartUpload("big/object.mp4", {});
  assert(store.OpenSessionCount() == 1);

  std::vector<PartReceipt> parts;
  parts.push_back(store.UploadPart("big/object.mp4", upload_id, 1, Buffer("aaaa")));
  parts.push_back(store.UploadPart("big/object.mp4", upload_id, 2, Buffer("bbbb")));
  parts.push_back(store.UploadPart("big/object.mp4", upload_id, 3, Buffer("cc")));
  assert(parts[1].size_bytes == 4);

  const auto receipt = store.CompleteMultipartUpload("big/object.mp4", upload_id, parts);
  assert(receipt.size_bytes == 10);
  assert(receipt.etag.size() > 2 && receipt.etag.substr(receipt.etag.size() - 2) == "-3");
  assert(ReadFile(dir.path() / "big/object.mp4") == "aaaabbbbcc");
  assert(store.OpenSessionCount() == 0);
  assert(!std::filesystem::exists(dir.path() / ".multipart" / upload_id));
}

void TestCompleteRejectsGapsAndForeignKeys() {
  TempDir dir("arrow_order");
  auto    store = LocalStore(dir);

  const auto upload_id = store.CreateMultipartUpload("k", {});
  auto       first     = store.UploadPart("k", upload_id, 1, Buffer("1"));
  auto       third     = store.UploadPart("k", upload_id, 3, Buffer("3"));

  bool threw = false;
  try {
    store.CompleteMultipartUpload("k", upload_id, {first, third});
  } catch (const recsync::util::StoreRejected& e) {
    threw = std::string(e.what()).find("InvalidPartOrder") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    store.UploadPart("other", upload_id, 2, Buffer("2"));
  } catch (const recsync::util::StoreRejected&) {
    threw = true;
  }
  assert(threw);
  assert(store.OpenSessionCount() == 1);
}

void TestAbortRemovesStaging() {
  TempDir dir("arrow_abort");
  auto    store = LocalStore(dir);

  const auto upload_id = store.CreateMultipartUpload("k", {});
  store.UploadPart("k", upload_id, 1, Buffer("partial"));
  assert(std::filesystem::exists(dir.path() / ".multipart" / upload_id));

  store.AbortMultipartUpload("k", upload_id);
  assert(store.OpenSessionCount() == 0);
  assert(!std::filesystem::exists(dir.path() / ".multipart" / upload_id));
  assert(!std::filesystem::exists(dir.path() / "k"));

  bool threw = false;
  try {
    store.UploadPart("k", upload_id, 2, Buffer("late"));
  } catch (const recsync::util::StoreRejected& e) {
    threw = std::string(e.what()).find("NoSuchUpload") != std::string::npos;
  }
  assert(threw);
}

void TestStaleStagingIsSweptByNextInstance() {
  TempDir     dir("arrow_stale");
  std::string stale_id;
  {
    auto crashed = LocalStore(dir);
    stale_id     = crashed.CreateMultipartUpload("big/object.mp4", {});
    crashed.UploadPart("big/object.mp4", stale_id, 1, Buffer("aaaa"));
    crashed.UploadPart("big/object.mp4", stale_id, 2, Buffer("bbbb"));
    // process dies before complete or abort
  }
  assert(std::filesystem::exists(dir.path() / ".multipart" / stale_id / "part-00002"));

  auto       store   = LocalStore(dir);
  const auto live_id = store.CreateMultipartUpload("other.mp4", {});
  auto       part    = store.UploadPart("other.mp4", live_id, 1, Buffer("live"));

  assert(store.AbortStaleUploads() == 1);
  assert(!std::filesystem::exists(dir.path() / ".multipart" / stale_id));
  assert(std::filesystem::exists(dir.path() / ".multipart" / live_id));
  assert(!std::filesystem::exists(dir.path() / "big/object.mp4"));

  store.CompleteMultipartUpload("other.mp4", live_id, {part});
  assert(ReadFile(dir.path() / "other.mp4") == "live");
  assert(store.AbortStaleUploads() == 0);
}

void TestSweepWithoutStagingIsNoop() {
  TempDir dir("arrow_stale_empty");
  auto    store = LocalStore(dir);
  assert(store.AbortStaleUploads() == 0);
}

void TestFailedCompleteLeavesNoObject() {
  TempDir dir("arrow_partial");
  auto    store = LocalStore(dir);

  const auto upload_id = store.CreateMultipartUpload("big/object.mp4", {});
  auto       first     = store.UploadPart("big/object.mp4", upload_id, 1, Buffer("aaaa"));
  auto       second    = store.UploadPart("big/object.mp4", upload_id, 2, Buffer("bbbb"));
  second.size_bytes    = 3;

  bool threw = false;
  try {
    store.CompleteMultipartUpload("big/object.mp4", upload_id, {first, second});
  } catch (const recsync::util::StoreRejected& e) {
    threw = std::string(e.what()).find("InvalidPart") != std::string::npos;
  }
  assert(threw);

  // part 1 was already copied when part 2 failed its size check
  assert(!std::filesystem::exists(dir.path() / "big/object.mp4"));
  assert(store.OpenSessionCount() == 1);

  store.AbortMultipartUpload("big/object.mp4", upload_id);
  assert(!std::filesystem::exists(dir.path() / ".multipart" / upload_id));
}

void TestStatusClassification() {
  using recsync::storage::common::ClassifyStatus;

  assert(ClassifyStatus(arrow::Status::IOError("AWS Error ACCESS_DENIED during PutObject")) == UploadErrorKind::kAuthorizationExpired);
  assert(ClassifyStatus(arrow::Status::IOError("ExpiredToken: the provided token has expired")) == UploadErrorKind::kAuthorizationExpired);
  assert(ClassifyStatus(arrow::Status::Invalid("bad key")) == UploadErrorKind::kStoreRejected);
  assert(ClassifyStatus(arrow::Status::IOError("AWS Error NoSuchBucket")) == UploadErrorKind::kStoreRejected);
  assert(ClassifyStatus(arrow::Status::IOError("connection reset by peer")) == UploadErrorKind::kNetworkFailure);
}

void TestResolveLocalRoot() {
  TempDir                                      dir("arrow_resolve");
  recsync::runtime::config::ObjectStoreConfig config;
  config.set_root(dir.path().string());

  assert(!recsync::storage::common::UsesS3(config));
  auto resolved = recsync::storage::common::ResolveFileSystem(config, {});
  assert(resolved.ok());
  assert(resolved->first->type_name() == "local");
  assert(resolved->second == dir.path().lexically_normal().string());

  config.set_root("s3://bucket/prefix");
  assert(recsync::storage::common::UsesS3(config));

  config.set_root("");
  assert(!recsync::storage::common::ResolveFileSystem(config, {}).ok());
}

} // namespace

int main() {
  TestPutObjectWritesUnderRoot();
  TestInvalidKeysAreRejected();
  TestMultipartAssemblesInOrder();
  TestCompleteRejectsGapsAndForeignKeys();
  TestAbortRemovesStaging();
  TestStaleStagingIsSweptByNextInstance();
  TestSweepWithoutStagingIsNoop();
  TestFailedCompleteLeavesNoObject();
  TestStatusClassification();
  TestResolveLocalRoot();

  std::cout << "recsync_unit_arrow_object_store: pass\n";
  return 0;
}
