#include "internal/watch/inotify_watcher.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/sanitize/capability_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/watch/path_filter.hpp"
#include "tests/support/test_files.hpp"

namespace {

namespace fs = std::filesystem;

using aegis::testing::TempDir;
using aegis::watch::InotifyWatcher;

struct Seen {
  std::mutex            mutex;
  std::vector<fs::path> paths;
  std::vector<fs::path> roots;

  bool Has(const fs::path& path) {
    std::lock_guard lock(mutex);
    return std::find(paths.begin(), paths.end(), path) != paths.end();
  }

  InotifyWatcher::Sink Sink() {
    return [this](const fs::path& path, const fs::path& root) {
      std::lock_guard lock(mutex);
      paths.push_back(path);
      roots.push_back(root);
    };
  }
};

std::shared_ptr<aegis::watch::PathFilter> Filter(const fs::path& backup_root) {
  return std::make_shared<aegis::watch::PathFilter>(backup_root, aegis::sanitize::CapabilityRegistry::WithBuiltins());
}

void TestWrittenFileReachesSink() {
  TempDir dir("watch_write");
  const auto root = dir.path() / "Pictures";
  fs::create_directories(root / "existing");

  Seen           seen;
  InotifyWatcher watcher({root, true}, Filter(dir.path() / "aegis-data"), seen.Sink());
  watcher.Start();
  assert(watcher.WatchCount() == 2);

  aegis::testing::WriteFile(root / "a.jpg", aegis::testing::MinimalJpeg(true));
  aegis::testing::WriteFile(root / "existing" / "b.png", aegis::testing::MinimalPng(true));
  assert(aegis::testing::WaitFor([&] { return seen.Has(root / "a.jpg") && seen.Has(root / "existing" / "b.png"); }));

  {
    std::lock_guard lock(seen.mutex);
    for (const auto& r : seen.roots) assert(r == root);
  }
  watcher.Stop();
}

void TestNonCandidatesIgnored() {
  TempDir dir("watch_ignore");
  const auto root = dir.path();

  Seen           seen;
  InotifyWatcher watcher({root, true}, Filter(dir.path() / "aegis-data"), seen.Sink());
  watcher.Start();

  aegis::testing::WriteFile(root / "anim.gif", "GIF89a");
  aegis::testing::WriteFile(root / "notes.txt", "text");
  aegis::testing::WriteFile(root / "marker.jpg", aegis::testing::MinimalJpeg(false));
  assert(aegis::testing::WaitFor([&] { return seen.Has(root / "marker.jpg"); }));

  assert(!seen.Has(root / "anim.gif"));
  assert(!seen.Has(root / "notes.txt"));
  watcher.Stop();
}

void TestNewDirectoryIsWatched() {
  TempDir dir("watch_newdir");
  const auto root = dir.path();

  Seen           seen;
  InotifyWatcher watcher({root, true}, Filter(dir.path() / "aegis-data"), seen.Sink());
  watcher.Start();
  const auto before = watcher.WatchCount();

  fs::create_directories(root / "trip");
  assert(aegis::testing::WaitFor([&] { return watcher.WatchCount() > before; }));

  aegis::testing::WriteFile(root / "trip" / "beach.webp", aegis::testing::WebpWithExif());
  assert(aegis::testing::WaitFor([&] { return seen.Has(root / "trip" / "beach.webp"); }));
  watcher.Stop();
}

void TestMovedInTreeOffersExistingFiles() {
  TempDir dir("watch_movein");
  const auto root    = dir.path() / "Pictures";
  const auto staging = dir.path() / "staging";
  fs::create_directories(root);
  aegis::testing::WriteFile(staging / "album" / "old.jpg", aegis::testing::MinimalJpeg(true));

  Seen           seen;
  InotifyWatcher watcher({root, true}, Filter(dir.path() / "aegis-data"), seen.Sink());
  watcher.Start();

  fs::rename(staging / "album", root / "album");
  assert(aegis::testing::WaitFor([&] { return seen.Has(root / "album" / "old.jpg"); }));
  watcher.Stop();
}

void TestBackupAreaNotWatched() {
  TempDir dir("watch_backup");
  const auto root        = dir.path();
  const auto backup_root = root / "aegis-data";
  fs::create_directories(backup_root / "backups");

  Seen           seen;
  InotifyWatcher watcher({root, true}, Filter(backup_root), seen.Sink());
  watcher.Start();
  assert(watcher.WatchCount() == 1);

  aegis::testing::WriteFile(backup_root / "backups" / "a.jpg", aegis::testing::MinimalJpeg(true));
  aegis::testing::WriteFile(root / "marker.jpg", aegis::testing::MinimalJpeg(false));
  assert(aegis::testing::WaitFor([&] { return seen.Has(root / "marker.jpg"); }));
  assert(!seen.Has(backup_root / "backups" / "a.jpg"));
  watcher.Stop();
}

void TestMissingFolderThrows() {
  TempDir dir("watch_missing");
  Seen           seen;
  InotifyWatcher watcher({dir.path() / "nope", true}, Filter(dir.path() / "aegis-data"), seen.Sink());
  bool           threw = false;
  try {
    watcher.Start();
  } catch (const aegis::util::IOError&) {
    threw = true;
  }
  assert(threw);
  // Stop on a never-started watcher is a no-op
  watcher.Stop();
}

} // namespace

int main() {
  TestWrittenFileReachesSink();
  TestNonCandidatesIgnored();
  TestNewDirectoryIsWatched();
  TestMovedInTreeOffersExistingFiles();
  TestBackupAreaNotWatched();
  TestMissingFolderThrows();

  std::cout << "aegis_unit_inotify_watcher: pass\n";
  return 0;
}
