#include "internal/manifest/manifest_builder.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/manifest/manifest_codec.hpp"
#include "internal/model/task_key.hpp"
#include "test_support.hpp"

namespace {

using namespace swarm::v1;
using swarm::manifest::ManifestBuilder;
using swarm::manifest::ManifestStore;
using swarm::model::MakeKey;
using swarm::testing::FakeIdentityProvider;
using swarm::testing::FakeObjectStore;
using swarm::testing::TempDir;

struct Fixture {
  explicit Fixture(const std::string& name)
      : dir(name),
        manifest(std::make_shared<ManifestStore>(ManifestStore::Options{dir / "manifest.json", 1})),
        provider(std::make_shared<FakeIdentityProvider>()),
        credentials(std::make_shared<swarm::credential::CredentialCoordinator>(provider, "default")),
        store(std::make_shared<FakeObjectStore>()) {
  }

  ManifestBuilder Builder() const {
    return ManifestBuilder(manifest, credentials, store, dir / "out");
  }

  TempDir                                                   dir;
  std::shared_ptr<ManifestStore>                            manifest;
  std::shared_ptr<FakeIdentityProvider>                     provider;
  std::shared_ptr<swarm::credential::CredentialCoordinator> credentials;
  std::shared_ptr<FakeObjectStore>                          store;
};

void TestGenerateAddsOnePendingTaskPerObject() {
  Fixture f("builder_basic");
  f.store->AddObject("photos", "2024/img-1.jpg", 100);
  f.store->AddObject("photos", "2024/img-2.jpg", 250);
  f.store->AddListing("photos", "2024/", 0);
  f.store->AddListing("photos", "placeholder", 0);
  f.store->AddObject("logs", "app.log", 5);

  const auto result = f.Builder().Generate({"photos", "logs"});

  assert(result.added == 3);
  assert(result.bytes == 355);
  assert(result.skipped_entries == 2);
  assert(result.inaccessible_buckets.empty());

  const auto task = f.manifest->Get(MakeKey("photos", "2024/img-2.jpg"));
  assert(task);
  assert(task->status() == TASK_STATUS_PENDING);
  assert(task->attempts() == 0);
  assert(task->size_bytes() == 250);
  assert(task->destination() == (std::filesystem::path(f.dir / "out") / "photos" / "2024" / "img-2.jpg").string());
  assert(!f.manifest->Get(MakeKey("photos", "2024/")));

  // Persisted at the end of the pass.
  assert(swarm::manifest::ReadManifestFile(f.dir / "manifest.json").tasks_size() == 3);
}

void TestInaccessibleBucketIsSkipped() {
  Fixture f("builder_denied");
  f.store->AddObject("open", "a", 1);
  f.store->AddObject("secret", "b", 1);
  f.store->DenyBucket("secret");

  const auto result = f.Builder().Generate({"secret", "missing", "open"});

  assert(result.added == 1);
  assert(result.inaccessible_buckets.size() == 2);
  assert(result.inaccessible_buckets[0] == "secret");
  assert(result.inaccessible_buckets[1] == "missing");
}

void TestRegenerationKeepsProgress() {
  Fixture f("builder_merge");
  f.store->AddObject("b", "old", 10);
  f.Builder().Generate({"b"});

  f.manifest->Update(MakeKey("b", "old"), TASK_STATUS_IN_PROGRESS, 1);
  f.manifest->Update(MakeKey("b", "old"), TASK_STATUS_COMPLETED, 1);

  f.store->AddObject("b", "new", 20);
  const auto result = f.Builder().Generate({"b"});

  assert(result.added == 1);
  assert(result.existing == 1);
  assert(f.manifest->Get(MakeKey("b", "old"))->status() == TASK_STATUS_COMPLETED);
  assert(f.manifest->Get(MakeKey("b", "new"))->status() == TASK_STATUS_PENDING);
}

void TestUnsafeKeysAreExcluded() {
  Fixture f("builder_unsafe");
  f.store->AddObject("b", "../../etc/passwd", 10);
  f.store->AddObject("b", "ok/../fine.txt", 10);

  const auto result = f.Builder().Generate({"b"});

  assert(result.added == 1);
  assert(result.skipped_entries == 1);
  assert(f.manifest->Get(MakeKey("b", "ok/../fine.txt")));
}

} // namespace

int main() {
  TestGenerateAddsOnePendingTaskPerObject();
  TestInaccessibleBucketIsSkipped();
  TestRegenerationKeepsProgress();
  TestUnsafeKeysAreExcluded();

  std::cout << "swarm_unit_manifest_builder: pass\n";
  return 0;
}
