#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "client/cpp/hub_client.h"
#include "client/cpp/parallel_uploader.h"
#include "datahub/v1.hpp"

using namespace datahub::v1;
using datahub::client::HubClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  hubctl <addr> upload <path> <name> <description> [--filename f] [--tags a,b] [--threads n] [--retries n]\n"
            << "                                              [--part-timeout seconds] [--complete-timeout seconds]\n"
            << "  hubctl <addr> status <upload_id>\n"
            << "  hubctl <addr> abort <upload_id>\n"
            << "  hubctl <addr> get <name>\n"
            << "  hubctl <addr> list [name_filter] [limit]\n"
            << "  hubctl <addr> files <dataset_id> [version]\n"
            << "  hubctl <addr> edit <dataset_id> [--name n] [--description d] [--tags a,b]\n"
            << "  hubctl <addr> download <dataset_id> <dir> [version]\n"
            << "\n"
            << "Uploads use one thread per core unless --threads is given. A part attempt that\n"
            << "outlives --part-timeout (default 300s) is retried.\n"
            << "The bearer token is read from DATAHUB_TOKEN.\n";
}

static std::vector<std::string> SplitTags(const std::string& value) {
  std::vector<std::string> tags;
  std::stringstream        in(value);
  std::string              tag;
  while (std::getline(in, tag, ',')) {
    if (!tag.empty()) tags.push_back(tag);
  }
  return tags;
}

// --key value pairs after the positional arguments.
static std::map<std::string, std::string> ParseFlags(int argc, char** argv, int first) {
  std::map<std::string, std::string> flags;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
      std::cerr << "unexpected argument: " << arg << "\n";
      std::exit(1);
    }
    flags[arg.substr(2)] = argv[++i];
  }
  return flags;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.message() << "\n";
    std::exit(2);
  }
  std::cout << json;
}

static int Fail(const arrow::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  const char* token = std::getenv("DATAHUB_TOKEN");

  grpc::ChannelArguments args;
  args.SetMaxSendMessageSize(std::numeric_limits<int>::max());
  args.SetMaxReceiveMessageSize(std::numeric_limits<int>::max());
  auto client = std::make_shared<HubClient>(grpc::CreateCustomChannel(addr, grpc::InsecureChannelCredentials(), args),
                                            token ? token : "");

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 6) {
      Usage();
      return 1;
    }
    auto flags = ParseFlags(argc, argv, 6);

    datahub::client::UploadOptions options;
    if (flags.count("threads")) options.threads = static_cast<uint32_t>(std::stoul(flags["threads"]));
    if (flags.count("retries")) options.retries = static_cast<uint32_t>(std::stoul(flags["retries"]));
    if (flags.count("part-timeout")) options.part_timeout = std::chrono::seconds(std::stoul(flags["part-timeout"]));
    if (flags.count("complete-timeout")) options.complete_timeout = std::chrono::seconds(std::stoul(flags["complete-timeout"]));
    options.on_progress = [](uint32_t received, uint32_t total) { std::cerr << "\rparts " << received << "/" << total << std::flush; };

    datahub::client::UploadFileRequest request;
    request.path         = argv[3];
    request.dataset_name = argv[4];
    request.description  = argv[5];
    request.filename     = flags.count("filename") ? flags["filename"] : std::filesystem::path(request.path).filename().string();
    if (flags.count("tags")) request.tags = SplitTags(flags["tags"]);

    datahub::client::ParallelUploader uploader(client, options);
    auto                              outcome = uploader.Upload(request);
    std::cerr << "\n";
    if (!outcome.ok()) {
      if (auto missing = datahub::client::MissingPartsOf(outcome.status())) {
        std::cerr << "upload_id=" << missing->upload_id() << " missing_parts=" << datahub::client::FormatPartList(missing->missing_parts())
                  << "\nrun the same upload again to resume\n";
      }
      return Fail(outcome.status());
    }

    if (!outcome->upload_id.empty()) {
      std::cout << "upload_id=" << outcome->upload_id << " resumed=" << outcome->resumed << " parts_sent=" << outcome->parts_sent << "\n";
    }
    std::cout << "dataset_id=" << outcome->dataset.id() << " version=" << outcome->version_id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    auto session = client->DescribeUpload(argv[3]);
    if (!session.ok()) return Fail(session.status());

    PrintJson(*session);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort") {
    if (argc < 4) return 1;

    auto status = client->AbortUpload(argv[3]);
    if (!status.ok()) return Fail(status);

    std::cout << "aborted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetDatasetRequest req;
    req.set_name(argv[3]);

    auto dataset = client->GetDataset(req);
    if (!dataset.ok()) return Fail(dataset.status());

    PrintJson(*dataset);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListDatasetsRequest req;
    if (argc >= 4) req.set_name_filter(argv[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    auto resp = client->ListDatasets(req);
    if (!resp.ok()) return Fail(resp.status());

    for (const auto& dataset : resp->datasets()) {
      const auto latest = dataset.versions_size() > 0 ? dataset.versions(dataset.versions_size() - 1).version_id() : 0;
      std::cout << dataset.id() << "  " << dataset.name() << "  v" << latest << "  downloads=" << dataset.downloads() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "files") {
    if (argc < 4) return 1;

    ListFilesRequest req;
    req.set_dataset_id(argv[3]);
    if (argc >= 5) req.set_version_id(static_cast<uint32_t>(std::stoul(argv[4])));

    auto resp = client->ListFiles(req);
    if (!resp.ok()) return Fail(resp.status());

    for (const auto& file : resp->files()) {
      std::cout << file.name() << "  " << file.size() << "  " << file.checksum() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "edit") {
    if (argc < 4) return 1;
    auto flags = ParseFlags(argc, argv, 4);

    EditDatasetRequest req;
    req.set_dataset_id(argv[3]);
    if (flags.count("name")) req.set_name(flags["name"]);
    if (flags.count("description")) req.set_description(flags["description"]);
    if (flags.count("tags")) {
      req.set_replace_tags(true);
      for (const auto& tag : SplitTags(flags["tags"])) req.add_tags(tag);
    }

    auto dataset = client->EditDataset(req);
    if (!dataset.ok()) return Fail(dataset.status());

    PrintJson(*dataset);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "download") {
    if (argc < 5) return 1;

    const uint32_t version = argc >= 6 ? static_cast<uint32_t>(std::stoul(argv[5])) : 0;
    auto           plan    = client->GetDownloadPlan(argv[3], version);
    if (!plan.ok()) return Fail(plan.status());

    const std::filesystem::path dir = argv[4];
    std::error_code             ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      std::cerr << "cannot create " << dir << ": " << ec.message() << "\n";
      return 2;
    }

    for (const auto& entry : plan->entries()) {
      const auto target = (dir / entry.filename()).string();
      auto       status = client->DownloadFile(entry.object_key(), target, entry.checksum());
      if (!status.ok()) return Fail(status);
      std::cout << target << "  " << entry.size() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
