#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "internal/model/file_task.hpp"

namespace aegis::watch {

class PathFilter;

/*
  Recursive inotify listener for one monitored folder, on its own thread.

  Watches IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY on every
  directory of the tree; new or moved-in directories are added on the fly
  and the files already inside them offered. Accepted paths go to `sink`
  (normally Debouncer::Touch); the read loop never hashes or blocks on the
  pipeline. `on_overflow` runs when the kernel queue overflowed and events
  were lost.
*/
class InotifyWatcher {
 public:
  using Sink = std::function<void(const std::filesystem::path& path, const std::filesystem::path& root)>;

  InotifyWatcher(model::MonitoredFolder folder, std::shared_ptr<PathFilter> filter, Sink sink, std::function<void()> on_overflow = {});
  ~InotifyWatcher();

  InotifyWatcher(const InotifyWatcher&)            = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  // Throws util::IOError when the folder cannot be watched.
  void Start();
  void Stop();

  std::size_t WatchCount() const;

  const model::MonitoredFolder& Folder() const {
    return folder_;
  }

 private:
  void Loop();
  void AddTree(const std::filesystem::path& dir, bool offer_files);
  void AddWatch(const std::filesystem::path& dir);
  void HandleEvents(const char* buffer, std::size_t length);

  model::MonitoredFolder      folder_;
  std::shared_ptr<PathFilter> filter_;
  Sink                        sink_;
  std::function<void()>       on_overflow_;

  int inotify_fd_ = -1;
  int wake_fd_[2] = {-1, -1};

  mutable std::mutex                             watches_mutex_;
  std::unordered_map<int, std::filesystem::path> watches_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace aegis::watch
