#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "vigil/pipeline/v1.hpp"

using namespace vigil::pipeline::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vigilctl <addr> ingest <file.ndjson.gz> <ingest_token>\n"
            << "  vigilctl <addr> state-get <callback_token> <source> <entity> <key>...\n"
            << "  vigilctl <addr> state-set <callback_token> <source> <entity> <key>=<json>...\n"
            << "  vigilctl <addr> findings <callback_token> <findings.json>\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

// Spool files are named <batch_id>.ndjson.gz.
static std::string BatchIdFromPath(const std::string& path) {
  auto name = std::filesystem::path(path).filename().string();
  constexpr std::string_view kExt = ".ndjson.gz";
  if (name.size() > kExt.size() && name.compare(name.size() - kExt.size(), kExt.size(), kExt) == 0) {
    name.resize(name.size() - kExt.size());
  }
  return name;
}

static void Authorize(grpc::ClientContext* ctx, const std::string& token) {
  if (!token.empty()) {
    ctx->AddMetadata("authorization", "Bearer " + token);
  }
}

static std::string ToJson(const google::protobuf::Message& msg) {
  std::string                               out;
  google::protobuf::util::JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;
  auto status = google::protobuf::util::MessageToJsonString(msg, &out, opts);
  if (!status.ok()) {
    return "<unprintable>";
  }
  return out;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ingest_stub   = IngestService::NewStub(channel);
  auto callback_stub = CallbackService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc != 5) {
      Usage();
      return 1;
    }

    IngestRequest req;
    req.set_batch_id(BatchIdFromPath(argv[3]));
    if (!ReadFile(argv[3], req.mutable_payload())) return 1;
    Authorize(&ctx, argv[4]);

    IngestResponse resp;

    auto status = ingest_stub->Ingest(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "storage_key=" << resp.storage_key() << " records=" << resp.record_count()
              << (resp.duplicate() ? " duplicate" : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "state-get") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    BatchGetPlayerStatesRequest req;
    req.set_source_id(argv[4]);
    req.set_entity_id(argv[5]);
    for (int i = 6; i < argc; ++i) req.add_keys(argv[i]);
    Authorize(&ctx, argv[3]);

    BatchGetPlayerStatesResponse resp;

    auto status = callback_stub->BatchGetPlayerStates(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "state-set") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    BatchSetPlayerStatesRequest req;
    req.set_source_id(argv[4]);
    req.set_entity_id(argv[5]);
    for (int i = 6; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "expected <key>=<json>, got '" << arg << "'\n";
        return 1;
      }
      google::protobuf::Value value;
      auto parsed = google::protobuf::util::JsonStringToMessage(arg.substr(eq + 1), &value);
      if (!parsed.ok()) {
        std::cerr << "invalid JSON for '" << arg.substr(0, eq) << "': " << parsed.message() << "\n";
        return 1;
      }
      (*req.mutable_values())[arg.substr(0, eq)] = value;
    }
    Authorize(&ctx, argv[3]);

    BatchSetPlayerStatesResponse resp;

    auto status = callback_stub->BatchSetPlayerStates(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "written=" << resp.written() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "findings") {
    if (argc != 5) {
      Usage();
      return 1;
    }

    std::string json;
    if (!ReadFile(argv[4], &json)) return 1;

    SubmitFindingsRequest req;
    auto parsed = google::protobuf::util::JsonStringToMessage(json, &req);
    if (!parsed.ok()) {
      std::cerr << "invalid findings file: " << parsed.message() << "\n";
      return 1;
    }
    Authorize(&ctx, argv[3]);

    SubmitFindingsResponse resp;

    auto status = callback_stub->SubmitFindings(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "accepted=" << resp.accepted() << " duplicates=" << resp.duplicates() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
