#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace aegis::watch {

/*
  Collapses bursts of filesystem events per path.

  Touch() (re)arms a per-path deadline `quiet` into the future; a single
  dispatcher thread fires the callback once per path when its deadline
  passes without another Touch(). The callback runs on the dispatcher
  thread, never on the caller's.
*/
class Debouncer {
 public:
  using Clock    = std::chrono::steady_clock;
  using Callback = std::function<void(const std::filesystem::path& path, const std::filesystem::path& root)>;

  Debouncer(std::chrono::milliseconds quiet, Callback callback);
  ~Debouncer();

  void Touch(const std::filesystem::path& path, const std::filesystem::path& root);

  void Start();

  // Pending paths are dropped.
  void Stop();

  std::size_t Pending() const;

 private:
  struct Entry {
    Clock::time_point     deadline;
    std::filesystem::path root;
  };

  void Loop();

  std::chrono::milliseconds quiet_;
  Callback                  callback_;

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::map<std::filesystem::path, Entry> pending_;
  bool                                   running_ = false;
  std::thread                            thread_;
};

} // namespace aegis::watch
