#include "internal/watch/debouncer.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "tests/support/test_files.hpp"

namespace {

using namespace std::chrono_literals;

struct Recorder {
  std::mutex                 mutex;
  std::map<std::string, int> calls;
  std::map<std::string, std::string> roots;

  void operator()(const std::filesystem::path& path, const std::filesystem::path& root) {
    std::lock_guard lock(mutex);
    ++calls[path.string()];
    roots[path.string()] = root.string();
  }

  int Count(const std::string& path) {
    std::lock_guard lock(mutex);
    return calls.count(path) ? calls[path] : 0;
  }

  std::size_t Distinct() {
    std::lock_guard lock(mutex);
    return calls.size();
  }
};

void TestBurstCollapsesToOneDispatch() {
  Recorder                 recorder;
  aegis::watch::Debouncer debouncer(100ms, [&](const auto& path, const auto& root) { recorder(path, root); });
  debouncer.Start();

  for (int i = 0; i < 10; ++i) {
    debouncer.Touch("/in/a.jpg", "/in");
    std::this_thread::sleep_for(20ms);
  }
  // still inside the quiet period of the last touch
  assert(recorder.Count("/in/a.jpg") == 0);

  assert(aegis::testing::WaitFor([&] { return recorder.Count("/in/a.jpg") == 1; }));
  std::this_thread::sleep_for(250ms);
  assert(recorder.Count("/in/a.jpg") == 1);
  assert(recorder.roots["/in/a.jpg"] == "/in");
  debouncer.Stop();
}

void TestPathsAreDebouncedIndependently() {
  Recorder                 recorder;
  aegis::watch::Debouncer debouncer(50ms, [&](const auto& path, const auto& root) { recorder(path, root); });
  debouncer.Start();

  for (int i = 0; i < 20; ++i) {
    debouncer.Touch("/in/" + std::to_string(i) + ".png", "/in");
  }
  assert(aegis::testing::WaitFor([&] { return recorder.Distinct() == 20; }));
  for (int i = 0; i < 20; ++i) {
    assert(recorder.Count("/in/" + std::to_string(i) + ".png") == 1);
  }
  assert(debouncer.Pending() == 0);
}

void TestStopDropsPending() {
  Recorder recorder;
  {
    aegis::watch::Debouncer debouncer(10s, [&](const auto& path, const auto& root) { recorder(path, root); });
    debouncer.Start();
    debouncer.Touch("/in/late.webp", "/in");
    assert(debouncer.Pending() == 1);
    debouncer.Stop();
    assert(debouncer.Pending() == 0);
  }
  assert(recorder.Distinct() == 0);
}

void TestThrowingCallbackDoesNotKillDispatcher() {
  std::atomic<int>         calls{0};
  aegis::watch::Debouncer debouncer(20ms, [&](const auto& path, const auto&) {
    ++calls;
    if (path == "/in/bad.jpg") throw std::runtime_error("boom");
  });
  debouncer.Start();
  debouncer.Touch("/in/bad.jpg", "/in");
  assert(aegis::testing::WaitFor([&] { return calls.load() == 1; }));
  debouncer.Touch("/in/good.jpg", "/in");
  assert(aegis::testing::WaitFor([&] { return calls.load() == 2; }));
}

} // namespace

int main() {
  TestBurstCollapsesToOneDispatch();
  TestPathsAreDebouncedIndependently();
  TestStopDropsPending();
  TestThrowingCallbackDoesNotKillDispatcher();

  std::cout << "aegis_unit_debouncer: pass\n";
  return 0;
}
