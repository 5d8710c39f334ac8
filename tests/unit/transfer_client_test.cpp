#include "internal/transfer/transfer_client.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "tests/support/fake_object_store.hpp"
#include "tests/support/temp_dir.hpp"

namespace {

using recsync::testing::FakeObjectStore;
using recsync::testing::TempDir;
using recsync::transfer::TransferClient;
using recsync::transfer::TransferMetadata;
using recsync::transfer::TransferOptions;
using recsync::util::UploadErrorKind;

constexpr uint64_t kMiB = 1024 * 1024;

// Small thresholds keep the files tiny; the code path is the same as 32 MiB / 8 MiB.
TransferOptions SmallOptions() {
  TransferOptions options;
  options.multipart_threshold_bytes = 64 * 1024;
  options.part_size_bytes           = 16 * 1024;
  return options;
}

std::string Pattern(size_t size) {
  std::string data(size, '\0');
  for (size_t i = 0; i < size; ++i) data[i] = static_cast<char>('a' + (i * 7) % 26);
  return data;
}

std::filesystem::path WriteFile(const TempDir& dir, const std::string& name, const std::string& data) {
  const auto    path = dir.path() / name;
  std::ofstream out(path, std::ios::binary);
  out << data;
  return path;
}

TransferMetadata Metadata(const std::string& data) {
  TransferMetadata metadata;
  metadata.checksum_sha256  = recsync::util::Sha256Hex(data);
  metadata.recording_id     = "rec-1";
  metadata.chunk_index      = 0;
  metadata.duration_seconds = 5.0;
  return metadata;
}

template <typename Error, typename Fn>
Error ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e;
  }
  assert(false && "expected exception");
  std::abort();
}

void TestSmallFileIsSingleShot() {
  TempDir         dir("transfer_single");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());

  const auto data    = Pattern(10 * 1024);
  const auto path    = WriteFile(dir, "chunk.mp4", data);
  const auto receipt = client.Transfer(store, path.string(), "raw-chunks/rec-1/part-0001.mp4", Metadata(data));

  assert(!receipt.multipart);
  assert(receipt.part_count == 1);
  assert(receipt.remote_key == "raw-chunks/rec-1/part-0001.mp4");
  assert(!receipt.integrity_tag.empty());
  assert(receipt.size_bytes == static_cast<int64_t>(data.size()));
  assert(store.PutCalls() == 1);
  assert(store.CreateCalls() == 0);

  const auto object = store.Object("raw-chunks/rec-1/part-0001.mp4");
  assert(object.data == data);
  assert(object.metadata.at("checksum-sha256") == recsync::util::Sha256Hex(data));
  assert(object.metadata.at("recording-id") == "rec-1");
  assert(object.metadata.at("chunk-index") == "0");
  assert(object.metadata.at("duration-seconds") == "5.00");
}

void TestDefaultThresholdsSplitSixtyMegabytes() {
  TempDir         dir("transfer_multipart_default");
  FakeObjectStore store;
  TransferClient  client(TransferOptions{});

  const auto data = Pattern(60 * kMiB);
  const auto path = WriteFile(dir, "big.mp4", data);

  const auto receipt = client.Transfer(store, path.string(), "raw-chunks/rec-1/part-0002.mp4", Metadata(data));
  assert(receipt.multipart);
  assert(receipt.part_count == 8);
  assert(store.PartCalls() == 8);
  assert(store.OpenSessions() == 0);
  assert(store.Object("raw-chunks/rec-1/part-0002.mp4").data == data);
}

void TestTenMegabytesStaySingleShotByDefault() {
  TempDir         dir("transfer_single_default");
  FakeObjectStore store;
  TransferClient  client(TransferOptions{});

  const auto data    = Pattern(10 * kMiB);
  const auto path    = WriteFile(dir, "ten.mp4", data);
  const auto receipt = client.Transfer(store, path.string(), "k", Metadata(data));
  assert(!receipt.multipart);
  assert(store.PutCalls() == 1);
}

void TestLargeFileIsMultipart() {
  TempDir         dir("transfer_multipart");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());

  const auto data    = Pattern(100 * 1024);
  const auto path    = WriteFile(dir, "chunk.mp4", data);
  const auto receipt = client.Transfer(store, path.string(), "key", Metadata(data));

  assert(receipt.multipart);
  assert(receipt.part_count == 7);
  assert(receipt.integrity_tag.find("-7") != std::string::npos);
  assert(store.CreateCalls() == 1);
  assert(store.PartCalls() == 7);
  assert(store.CompleteCalls() == 1);
  assert(store.AbortCalls() == 0);
  assert(store.OpenSessions() == 0);
  assert(store.Object("key").data == data);
}

void TestPartFailureAbortsSession() {
  TempDir         dir("transfer_part_failure");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());
  store.FailNext("UploadPart#2", 1, UploadErrorKind::kNetworkFailure);

  const auto data  = Pattern(100 * 1024);
  const auto path  = WriteFile(dir, "chunk.mp4", data);
  const auto error = ExpectThrow<recsync::util::UploadError>([&] { client.Transfer(store, path.string(), "key", Metadata(data)); });

  assert(error.kind() == UploadErrorKind::kNetworkFailure);
  assert(error.IsRetryable());
  assert(store.AbortCalls() == 1);
  assert(store.OpenSessions() == 0);
  assert(!store.HasObject("key"));
}

void TestAbortFailureKeepsOriginalError() {
  TempDir         dir("transfer_abort_failure");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());
  store.FailNext("CompleteMultipartUpload", 1, UploadErrorKind::kStoreRejected);
  store.FailNext("AbortMultipartUpload", 1, UploadErrorKind::kNetworkFailure);

  const auto data  = Pattern(80 * 1024);
  const auto path  = WriteFile(dir, "chunk.mp4", data);
  const auto error = ExpectThrow<recsync::util::UploadError>([&] { client.Transfer(store, path.string(), "key", Metadata(data)); });

  assert(error.kind() == UploadErrorKind::kStoreRejected);
  assert(!error.IsRetryable());
}

void TestChecksumMismatchIsIntegrityError() {
  TempDir         dir("transfer_checksum");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());

  const auto data     = Pattern(100 * 1024);
  const auto path     = WriteFile(dir, "chunk.mp4", data);
  auto       metadata = Metadata(data);
  metadata.checksum_sha256 = std::string(64, '0');

  const auto error = ExpectThrow<recsync::util::IntegrityMismatch>([&] { client.Transfer(store, path.string(), "key", metadata); });
  assert(error.kind() == UploadErrorKind::kIntegrityMismatch);
  assert(store.AbortCalls() == 1);
  assert(store.OpenSessions() == 0);
  assert(!store.HasObject("key"));

  const auto small = Pattern(1024);
  const auto small_path = WriteFile(dir, "small.mp4", small);
  ExpectThrow<recsync::util::IntegrityMismatch>([&] { client.Transfer(store, small_path.string(), "small", metadata); });
  assert(!store.HasObject("small"));
}

void TestSizeReportedByStoreIsVerified() {
  TempDir         dir("transfer_size");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());
  store.MisreportSizes(true);

  const auto data = Pattern(1024);
  const auto path = WriteFile(dir, "chunk.mp4", data);
  ExpectThrow<recsync::util::IntegrityMismatch>([&] { client.Transfer(store, path.string(), "key", Metadata(data)); });
}

void TestMissingSourceIsNotRetryable() {
  TempDir         dir("transfer_missing");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());

  const auto error = ExpectThrow<recsync::util::SourceFileMissing>(
      [&] { client.Transfer(store, (dir.path() / "gone.mp4").string(), "key", TransferMetadata{}); });
  assert(!error.IsRetryable());
  assert(store.TransferCalls() == 0);
}

void TestUnclassifiedStoreErrorIsNetworkFailure() {
  TempDir         dir("transfer_unclassified");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());
  store.FailNext("PutObject", 1, std::nullopt);

  const auto data = Pattern(1024);
  const auto path = WriteFile(dir, "chunk.mp4", data);
  ExpectThrow<recsync::util::NetworkFailure>([&] { client.Transfer(store, path.string(), "key", Metadata(data)); });
}

void TestAuthorizationErrorPropagates() {
  TempDir         dir("transfer_auth");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());
  store.FailNext("PutObject", 1, UploadErrorKind::kAuthorizationExpired);

  const auto data = Pattern(1024);
  const auto path = WriteFile(dir, "chunk.mp4", data);
  ExpectThrow<recsync::util::AuthorizationExpired>([&] { client.Transfer(store, path.string(), "key", Metadata(data)); });
}

void TestExpiredDeadlineIsNetworkFailure() {
  TempDir         dir("transfer_deadline");
  FakeObjectStore store;
  TransferClient  client(SmallOptions());

  const auto data     = Pattern(100 * 1024);
  const auto path     = WriteFile(dir, "chunk.mp4", data);
  const auto deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

  const auto error = ExpectThrow<recsync::util::NetworkFailure>(
      [&] { client.Transfer(store, path.string(), "key", Metadata(data), deadline); });
  assert(std::string(error.what()).find("timed out") != std::string::npos);
  assert(store.OpenSessions() == 0);
}

} // namespace

int main() {
  TestSmallFileIsSingleShot();
  TestTenMegabytesStaySingleShotByDefault();
  TestDefaultThresholdsSplitSixtyMegabytes();
  TestLargeFileIsMultipart();
  TestPartFailureAbortsSession();
  TestAbortFailureKeepsOriginalError();
  TestChecksumMismatchIsIntegrityError();
  TestSizeReportedByStoreIsVerified();
  TestMissingSourceIsNotRetryable();
  TestUnclassifiedStoreErrorIsNetworkFailure();
  TestAuthorizationErrorPropagates();
  TestExpiredDeadlineIsNetworkFailure();

  std::cout << "recsync_unit_transfer_client: pass\n";
  return 0;
}
