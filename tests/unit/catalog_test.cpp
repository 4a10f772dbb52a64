#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "hub_test_fixture.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using datahub::checksum::Md5Hex;
using datahub::service::CatalogService;
using datahub::testing::Hub;
using datahub::testing::MakeHub;
using datahub::testing::ManualClock;
using datahub::testing::SendAllParts;
using datahub::testing::StartFor;
using datahub::testing::TempDir;
using datahub::testing::Throws;

datahub::ingest::CompleteResult Ingest(Hub& hub, const std::string& uid, const std::string& name, const std::string& content,
                                       const std::string& filename) {
  auto started = hub.sessions->StartOrResume(StartFor(uid, name, content, filename));
  SendAllParts(*hub.sessions, uid, started.view, content);
  return hub.sessions->Complete(uid, started.view.session.upload_id);
}

struct Catalog {
  ManualClock                     clock;
  Hub                             hub;
  std::shared_ptr<CatalogService> service;
  std::string                     climate_id;

  Catalog() {
    hub     = MakeHub(std::make_shared<datahub::db::memory::MemoryRepository>(), TempDir("catalog"), clock);
    service = std::make_shared<CatalogService>(datahub::service::ServiceContext{hub.sessions, hub.versions, hub.store, hub.repo});

    climate_id = Ingest(hub, "alice", "climate", "temperatures", "temps.csv").dataset.dataset.id;
    clock.Advance(std::chrono::seconds(1));
    Ingest(hub, "alice", "climate", "rainfall data", "rain.csv");
    clock.Advance(std::chrono::seconds(1));
    Ingest(hub, "bob", "traffic", "cars per hour", "cars.csv");
    clock.Advance(std::chrono::seconds(1));
    Ingest(hub, "bob", "climate-eu", "eu temperatures", "eu.csv");
  }
};

void TestGetDataset() {
  Catalog c;

  datahub::v1::GetDatasetRequest by_name;
  by_name.set_name("climate");
  auto dataset = c.service->GetDataset(by_name).dataset();
  assert(dataset.id() == c.climate_id);
  assert(dataset.uid() == "alice");
  assert(dataset.versions_size() == 2);
  assert(dataset.versions(1).version_id() == 2);

  datahub::v1::GetDatasetRequest by_id;
  by_id.set_dataset_id(c.climate_id);
  assert(c.service->GetDataset(by_id).dataset().name() == "climate");

  datahub::v1::GetDatasetRequest missing;
  missing.set_name("nothing-here");
  assert(Throws<datahub::util::NotFound>([&] { c.service->GetDataset(missing); }));

  assert(Throws<datahub::util::ValidationError>([&] { c.service->GetDataset(datahub::v1::GetDatasetRequest{}); }));
}

void TestListDatasets() {
  Catalog c;

  datahub::v1::ListDatasetsRequest all;
  auto listed = c.service->ListDatasets(all);
  assert(listed.datasets_size() == 3);
  assert(listed.datasets(0).name() == "climate");
  assert(listed.datasets(2).name() == "climate-eu");

  datahub::v1::ListDatasetsRequest filtered;
  filtered.set_name_filter("climate");
  assert(c.service->ListDatasets(filtered).datasets_size() == 2);

  filtered.set_limit(1);
  assert(c.service->ListDatasets(filtered).datasets_size() == 1);
}

void TestListFilesPerVersion() {
  Catalog c;

  datahub::v1::ListFilesRequest v1;
  v1.set_dataset_id(c.climate_id);
  v1.set_version_id(1);
  auto first = c.service->ListFiles(v1);
  assert(first.files_size() == 1);
  assert(first.files(0).name() == "temps.csv");
  assert(first.files(0).checksum() == Md5Hex(std::string("temperatures")));

  datahub::v1::ListFilesRequest v2 = v1;
  v2.set_version_id(2);
  std::set<std::string> names;
  for (const auto& f : c.service->ListFiles(v2).files()) names.insert(f.name());
  assert(names == (std::set<std::string>{"temps.csv", "rain.csv"}));

  datahub::v1::ListFilesRequest unknown;
  unknown.set_dataset_id("no-such-dataset");
  assert(Throws<datahub::util::NotFound>([&] { c.service->ListFiles(unknown); }));
}

void TestEditDataset() {
  Catalog c;

  datahub::v1::EditDatasetRequest edit;
  edit.set_dataset_id(c.climate_id);
  edit.set_name("climate-us");
  edit.add_tags("weather");
  edit.add_tags("us");
  edit.set_replace_tags(true);

  auto edited = c.service->EditDataset("alice", edit).dataset();
  assert(edited.name() == "climate-us");
  assert(edited.description() == "test dataset");
  assert(edited.tags_size() == 2);

  // empty fields leave values alone, tags only change on replace_tags
  datahub::v1::EditDatasetRequest describe;
  describe.set_dataset_id(c.climate_id);
  describe.set_description("hourly readings");
  edited = c.service->EditDataset("alice", describe).dataset();
  assert(edited.name() == "climate-us");
  assert(edited.description() == "hourly readings");
  assert(edited.tags_size() == 2);

  datahub::v1::EditDatasetRequest clear_tags;
  clear_tags.set_dataset_id(c.climate_id);
  clear_tags.set_replace_tags(true);
  assert(c.service->EditDataset("alice", clear_tags).dataset().tags_size() == 0);

  assert(Throws<datahub::util::PermissionDenied>([&] { c.service->EditDataset("bob", describe); }));

  datahub::v1::EditDatasetRequest clash;
  clash.set_dataset_id(c.climate_id);
  clash.set_name("traffic");
  assert(Throws<datahub::util::DatasetAlreadyExistsError>([&] { c.service->EditDataset("alice", clash); }));

  clash.set_name("no spaces");
  assert(Throws<datahub::util::ValidationError>([&] { c.service->EditDataset("alice", clash); }));

  datahub::v1::GetDatasetRequest old_name;
  old_name.set_name("climate");
  assert(Throws<datahub::util::NotFound>([&] { c.service->GetDataset(old_name); }));
}

void TestDownloadPlanAndStream() {
  Catalog c;

  datahub::v1::GetDownloadPlanRequest latest;
  latest.set_dataset_id(c.climate_id);
  auto plan = c.service->GetDownloadPlan(latest).plan();
  assert(plan.entries_size() == 2);
  for (const auto& entry : plan.entries()) assert(entry.version_id() == 2);

  datahub::v1::GetDownloadPlanRequest first = latest;
  first.set_version_id(1);
  auto first_plan = c.service->GetDownloadPlan(first).plan();
  assert(first_plan.entries_size() == 1);
  const auto entry = first_plan.entries(0);
  assert(entry.filename() == "temps.csv");
  assert(entry.size() == std::string("temperatures").size());

  datahub::v1::GetDatasetRequest by_id;
  by_id.set_dataset_id(c.climate_id);
  assert(c.service->GetDataset(by_id).dataset().downloads() == 2);

  datahub::v1::GetDownloadPlanRequest missing_version = latest;
  missing_version.set_version_id(9);
  assert(Throws<datahub::util::NotFound>([&] { c.service->GetDownloadPlan(missing_version); }));

  datahub::v1::DownloadFileRequest download;
  download.set_object_key(entry.object_key());
  auto file = c.service->OpenDownload(download);
  assert(file->Read(file->GetSize().ValueOrDie()).ValueOrDie()->ToString() == "temperatures");

  for (const std::string key : {std::string("nonsense"), c.climate_id + "/" + Md5Hex(std::string("x")) + "_1",
                                c.climate_id + "/" + entry.checksum() + "_999"}) {
    download.set_object_key(key);
    assert(Throws<datahub::util::NotFound>([&] { c.service->OpenDownload(download); }));
  }
}

} // namespace

int main() {
  TestGetDataset();
  TestListDatasets();
  TestListFilesPerVersion();
  TestEditDataset();
  TestDownloadPlanAndStream();

  std::cout << "dataset_hub_unit_catalog: pass\n";
  return 0;
}
