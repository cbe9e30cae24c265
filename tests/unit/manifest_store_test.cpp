#include "internal/manifest/manifest_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/manifest/manifest_codec.hpp"
#include "internal/model/task_key.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using swarm::manifest::ManifestStore;
using swarm::model::MakeKey;
using swarm::testing::TempDir;
using namespace swarm::v1;

swarm::v1::Task MakeTask(const std::string& bucket, const std::string& key, uint64_t size) {
  swarm::v1::Task task;
  *task.mutable_key() = MakeKey(bucket, key);
  task.set_size_bytes(size);
  task.set_destination("/out/" + bucket + "/" + key);
  return task;
}

ManifestStore::Options OptionsFor(const std::string& path, uint32_t flush_every = 1) {
  ManifestStore::Options options;
  options.path                    = path;
  options.flush_every_transitions = flush_every;
  return options;
}

std::string ReadFile(const std::string& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestOpenMissingStartsEmpty() {
  TempDir       dir("manifest_empty");
  ManifestStore store(OptionsFor(dir / "manifest.json"));
  store.Open();
  assert(store.Size() == 0);
  assert(!std::filesystem::exists(dir / "manifest.json"));
}

void TestRoundTripPreservesStatusesAndAttempts() {
  TempDir    dir("manifest_roundtrip");
  const auto path = dir / "manifest.json";

  {
    ManifestStore store(OptionsFor(path));
    store.Open();
    assert(store.AddTask(MakeTask("b", "a.bin", 10)));
    assert(store.AddTask(MakeTask("b", "b.bin", 20)));
    assert(store.AddTask(MakeTask("b", "c.bin", 30)));
    assert(store.AddTask(MakeTask("b", "d.bin", 40)));

    store.Update(MakeKey("b", "a.bin"), TASK_STATUS_IN_PROGRESS, 1);
    store.Update(MakeKey("b", "a.bin"), TASK_STATUS_COMPLETED, 1);
    store.Update(MakeKey("b", "b.bin"), TASK_STATUS_IN_PROGRESS, 1);
    store.Update(MakeKey("b", "b.bin"), TASK_STATUS_IN_PROGRESS, 2);
    store.Update(MakeKey("b", "c.bin"), TASK_STATUS_IN_PROGRESS, 1);
    store.Update(MakeKey("b", "c.bin"), TASK_STATUS_FAILED, 1, ERROR_CATEGORY_ACCESS_DENIED, "AccessDenied");
    store.Persist();
  }

  ManifestStore reloaded(OptionsFor(path));
  reloaded.Open();
  assert(reloaded.Size() == 4);

  const auto a = reloaded.Get(MakeKey("b", "a.bin"));
  const auto b = reloaded.Get(MakeKey("b", "b.bin"));
  const auto c = reloaded.Get(MakeKey("b", "c.bin"));
  const auto d = reloaded.Get(MakeKey("b", "d.bin"));
  assert(a && a->status() == TASK_STATUS_COMPLETED && a->attempts() == 1);
  assert(b && b->status() == TASK_STATUS_IN_PROGRESS && b->attempts() == 2);
  assert(c && c->status() == TASK_STATUS_FAILED && c->attempts() == 1);
  assert(c->last_error() == ERROR_CATEGORY_ACCESS_DENIED);
  assert(c->last_error_message() == "AccessDenied");
  assert(d && d->status() == TASK_STATUS_PENDING && d->attempts() == 0);
  assert(d->destination() == "/out/b/d.bin");

  // Insertion order is the stable query order.
  const auto all = reloaded.Query({TASK_STATUS_PENDING, TASK_STATUS_IN_PROGRESS, TASK_STATUS_COMPLETED, TASK_STATUS_FAILED});
  assert(all.size() == 4);
  assert(all[0].key().object() == "a.bin");
  assert(all[3].key().object() == "d.bin");

  const auto stats = reloaded.Stats();
  assert(stats.pending == 1 && stats.in_progress == 1 && stats.completed == 1 && stats.failed == 1);
  assert(stats.total_bytes == 100);
  assert(stats.completed_bytes == 10);
}

void TestTruncatedManifestIsDetected() {
  TempDir    dir("manifest_truncated");
  const auto path = dir / "manifest.json";
  {
    ManifestStore store(OptionsFor(path));
    store.AddTask(MakeTask("b", "one", 1));
    store.AddTask(MakeTask("b", "two", 2));
    store.Persist();
  }

  const auto full       = ReadFile(path);
  const auto last_brace = full.rfind('}');
  assert(last_brace != std::string::npos);

  for (size_t length = 1; length < last_brace; ++length) {
    WriteFile(path, full.substr(0, length));
    ManifestStore store(OptionsFor(path));
    assert(Throws<swarm::util::ManifestCorruptError>([&] { store.Open(); }));
  }
}

void TestCountMismatchAndVersionAreDetected() {
  TempDir    dir("manifest_header");
  const auto path = dir / "manifest.json";

  Manifest manifest;
  manifest.set_format_version(swarm::manifest::kManifestFormatVersion);
  manifest.set_task_count(3);
  *manifest.add_tasks() = MakeTask("b", "only", 1);
  WriteFile(path, swarm::manifest::EncodeManifest(manifest));
  {
    ManifestStore store(OptionsFor(path));
    assert(Throws<swarm::util::ManifestCorruptError>([&] { store.Open(); }));
  }

  manifest.set_task_count(1);
  manifest.set_format_version(99);
  WriteFile(path, swarm::manifest::EncodeManifest(manifest));
  {
    ManifestStore store(OptionsFor(path));
    assert(Throws<swarm::util::ManifestCorruptError>([&] { store.Open(); }));
  }

  WriteFile(path, "not json at all");
  ManifestStore store(OptionsFor(path));
  assert(Throws<swarm::util::ManifestCorruptError>([&] { store.Open(); }));
}

void TestPersistLeavesNoTempFile() {
  TempDir    dir("manifest_atomic");
  const auto path = (std::filesystem::path(dir / "nested") / "manifest.json").string();

  ManifestStore store(OptionsFor(path));
  store.AddTask(MakeTask("b", "x", 5));
  store.Persist();

  assert(std::filesystem::exists(path));
  assert(!std::filesystem::exists(path + ".tmp"));
  assert(swarm::manifest::ReadManifestFile(path).tasks_size() == 1);
}

void TestAddTaskKeepsExistingProgress() {
  TempDir       dir("manifest_merge");
  ManifestStore store(OptionsFor(dir / "manifest.json"));

  assert(store.AddTask(MakeTask("b", "x", 5)));
  store.Update(MakeKey("b", "x"), TASK_STATUS_IN_PROGRESS, 1);
  store.Update(MakeKey("b", "x"), TASK_STATUS_COMPLETED, 1);

  assert(!store.AddTask(MakeTask("b", "x", 500)));
  const auto task = store.Get(MakeKey("b", "x"));
  assert(task->status() == TASK_STATUS_COMPLETED);
  assert(task->size_bytes() == 5);
  assert(store.Size() == 1);
}

void TestIllegalTransitionsAreRejected() {
  TempDir       dir("manifest_transitions");
  ManifestStore store(OptionsFor(dir / "manifest.json"));
  store.AddTask(MakeTask("b", "x", 5));

  assert(Throws<swarm::util::InvalidState>([&] { store.Update(MakeKey("b", "x"), TASK_STATUS_COMPLETED, 1); }));
  assert(Throws<swarm::util::NotFound>([&] { store.Update(MakeKey("b", "missing"), TASK_STATUS_IN_PROGRESS, 1); }));

  store.Update(MakeKey("b", "x"), TASK_STATUS_IN_PROGRESS, 1);
  store.Update(MakeKey("b", "x"), TASK_STATUS_COMPLETED, 1);
  assert(Throws<swarm::util::InvalidState>([&] { store.Update(MakeKey("b", "x"), TASK_STATUS_IN_PROGRESS, 2); }));
  assert(Throws<swarm::util::InvalidState>([&] {
    store.Requeue(MakeKey("b", "x"), swarm::runtime::config::REQUEUE_POLICY_RESET_ATTEMPTS);
  }));
  assert(Throws<swarm::util::InvalidState>([&] { store.Recover(MakeKey("b", "x")); }));
}

void TestRequeuePolicies() {
  TempDir       dir("manifest_requeue");
  ManifestStore store(OptionsFor(dir / "manifest.json"));

  for (const char* name : {"reset", "keep"}) {
    store.AddTask(MakeTask("b", name, 1));
    store.Update(MakeKey("b", name), TASK_STATUS_IN_PROGRESS, 1);
    store.Update(MakeKey("b", name), TASK_STATUS_IN_PROGRESS, 2);
    store.Update(MakeKey("b", name), TASK_STATUS_FAILED, 2, ERROR_CATEGORY_TRANSIENT, "timeout");
  }

  store.Requeue(MakeKey("b", "reset"), swarm::runtime::config::REQUEUE_POLICY_RESET_ATTEMPTS);
  store.Requeue(MakeKey("b", "keep"), swarm::runtime::config::REQUEUE_POLICY_PRESERVE_ATTEMPTS);

  const auto reset = store.Get(MakeKey("b", "reset"));
  const auto keep  = store.Get(MakeKey("b", "keep"));
  assert(reset->status() == TASK_STATUS_PENDING && reset->attempts() == 0);
  assert(keep->status() == TASK_STATUS_PENDING && keep->attempts() == 2);
  assert(store.Query({TASK_STATUS_FAILED}).empty());
}

void TestRecoverReturnsInProgressToPending() {
  TempDir       dir("manifest_recover");
  ManifestStore store(OptionsFor(dir / "manifest.json"));
  store.AddTask(MakeTask("b", "x", 1));
  store.Update(MakeKey("b", "x"), TASK_STATUS_IN_PROGRESS, 1);

  store.Recover(MakeKey("b", "x"));
  const auto task = store.Get(MakeKey("b", "x"));
  assert(task->status() == TASK_STATUS_PENDING);
  assert(task->attempts() == 1);
}

void TestTerminalTransitionsPersistInBatches() {
  TempDir    dir("manifest_batches");
  const auto path = dir / "manifest.json";

  ManifestStore store(OptionsFor(path, 2));
  for (const char* name : {"a", "b", "c"}) {
    store.AddTask(MakeTask("b", name, 1));
    store.Update(MakeKey("b", name), TASK_STATUS_IN_PROGRESS, 1);
  }
  assert(!std::filesystem::exists(path));

  store.Update(MakeKey("b", "a"), TASK_STATUS_COMPLETED, 1);
  assert(!std::filesystem::exists(path));

  store.Update(MakeKey("b", "b"), TASK_STATUS_FAILED, 1, ERROR_CATEGORY_NOT_FOUND, "gone");
  assert(std::filesystem::exists(path));
  assert(swarm::manifest::ReadManifestFile(path).tasks(1).status() == TASK_STATUS_FAILED);

  store.Update(MakeKey("b", "c"), TASK_STATUS_COMPLETED, 1);
  assert(swarm::manifest::ReadManifestFile(path).tasks(2).status() == TASK_STATUS_IN_PROGRESS);

  store.Flush();
  assert(swarm::manifest::ReadManifestFile(path).tasks(2).status() == TASK_STATUS_COMPLETED);
}

void TestLoadReplacesInMemoryState() {
  TempDir    dir("manifest_load");
  const auto path = dir / "manifest.json";

  ManifestStore store(OptionsFor(path));
  store.AddTask(MakeTask("b", "x", 1));
  store.Persist();
  store.AddTask(MakeTask("b", "y", 1));
  assert(store.Size() == 2);

  const auto manifest = store.Load();
  assert(manifest.tasks_size() == 1);
  assert(store.Size() == 1);
  assert(!store.Get(MakeKey("b", "y")));
}

} // namespace

int main() {
  TestOpenMissingStartsEmpty();
  TestRoundTripPreservesStatusesAndAttempts();
  TestTruncatedManifestIsDetected();
  TestCountMismatchAndVersionAreDetected();
  TestPersistLeavesNoTempFile();
  TestAddTaskKeepsExistingProgress();
  TestIllegalTransitionsAreRejected();
  TestRequeuePolicies();
  TestRecoverReturnsInProgressToPending();
  TestTerminalTransitionsPersistInBatches();
  TestLoadReplacesInMemoryState();

  std::cout << "swarm_unit_manifest_store: pass\n";
  return 0;
}
