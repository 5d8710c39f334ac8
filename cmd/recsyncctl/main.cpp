#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "recsync/uploader/v1.hpp"

using namespace recsync::uploader::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  recsyncctl <addr> submit <recording_id> <index> <file> [duration_seconds]\n"
            << "  recsyncctl <addr> list\n"
            << "  recsyncctl <addr> manifest <recording_id>\n"
            << "  recsyncctl <addr> resubmit <recording_id> [index]\n"
            << "  recsyncctl <addr> cancel <recording_id> <index>\n"
            << "  recsyncctl <addr> pause\n"
            << "  recsyncctl <addr> resume\n"
            << "  recsyncctl <addr> stats\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static uint32_t ParseIndex(const std::string& value) {
  try {
    size_t pos    = 0;
    auto   parsed = std::stoul(value, &pos);
    if (pos == value.size()) return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
  }
  std::cerr << "invalid chunk index: " << value << "\n";
  std::exit(1);
}

static void PrintSummary(const RecordingSummary& s) {
  std::cout << s.recording_id() << " status=" << s.overall_status() << " chunks=" << s.chunks_total() << " completed=" << s.chunks_completed()
            << " pending=" << s.chunks_pending() << " uploading=" << s.chunks_uploading() << " failed=" << s.chunks_failed()
            << " cancelled=" << s.chunks_cancelled() << " progress=" << s.progress() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = UploadAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    std::ifstream in(argv[5], std::ios::binary);
    if (!in) {
      std::cerr << "cannot read " << argv[5] << "\n";
      return 1;
    }

    SubmitChunkRequest req;
    req.set_recording_id(argv[3]);
    req.set_index(ParseIndex(argv[4]));
    req.set_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
    req.set_duration_seconds(argc >= 7 ? std::stod(argv[6]) : 0.0);

    SubmitChunkResponse resp;

    auto status = stub->SubmitChunk(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "path=" << resp.file_path() << "\n";
    std::cout << "size_bytes=" << resp.size_bytes() << "\n";
    std::cout << "checksum=" << resp.checksum() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListRecordingsRequest  req;
    ListRecordingsResponse resp;

    auto status = stub->ListRecordings(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    for (const auto& summary : resp.recordings()) PrintSummary(summary);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "manifest") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetManifestRequest req;
    req.set_recording_id(argv[3]);

    GetManifestResponse resp;

    auto status = stub->GetManifest(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace             = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto        printed = google::protobuf::util::MessageToJsonString(resp.manifest(), &json, options);
    if (!printed.ok()) {
      std::cerr << printed.message() << "\n";
      return 2;
    }

    PrintSummary(resp.summary());
    std::cout << json;
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resubmit") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ResubmitChunkRequest req;
    req.set_recording_id(argv[3]);
    if (argc >= 5) req.set_index(ParseIndex(argv[4]));

    ResubmitChunkResponse resp;

    auto status = stub->ResubmitChunk(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "resubmitted=" << resp.resubmitted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    CancelChunkRequest req;
    req.set_recording_id(argv[3]);
    req.set_index(ParseIndex(argv[4]));

    CancelChunkResponse resp;

    auto status = stub->CancelChunk(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause") {
    PauseUploadsRequest  req;
    PauseUploadsResponse resp;

    auto status = stub->PauseUploads(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "paused\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resume") {
    ResumeUploadsRequest  req;
    ResumeUploadsResponse resp;

    auto status = stub->ResumeUploads(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "resumed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->Stats(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "running=" << resp.running() << "\n";
    std::cout << "paused=" << resp.paused() << "\n";
    std::cout << "in_flight=" << resp.in_flight() << "\n";
    std::cout << "peak_in_flight=" << resp.peak_in_flight() << "\n";
    std::cout << "attempts=" << resp.attempts() << "\n";
    std::cout << "completed=" << resp.completed() << "\n";
    std::cout << "failed=" << resp.failed() << "\n";
    std::cout << "retried=" << resp.retried() << "\n";
    std::cout << "recordings=" << resp.recordings() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
