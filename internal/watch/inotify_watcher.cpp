#include "internal/watch/inotify_watcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/watch/path_filter.hpp"

namespace aegis::watch {

namespace fs = std::filesystem;
using observability::PathField;
using observability::StringField;

namespace {

constexpr std::uint32_t kFileMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY;
constexpr std::uint32_t kDirMask  = kFileMask | IN_DELETE_SELF | IN_MOVE_SELF;

} // namespace

InotifyWatcher::InotifyWatcher(model::MonitoredFolder folder, std::shared_ptr<PathFilter> filter, Sink sink, std::function<void()> on_overflow)
    : folder_(std::move(folder)), filter_(std::move(filter)), sink_(std::move(sink)), on_overflow_(std::move(on_overflow)) {
}

InotifyWatcher::~InotifyWatcher() {
  Stop();
}

void InotifyWatcher::Start() {
  if (running_) return;

  std::error_code ec;
  if (!fs::is_directory(folder_.path, ec)) {
    throw util::IOError("watch: not a directory: " + folder_.path.string());
  }

  inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    throw util::IOError(std::string("inotify_init1: ") + std::strerror(errno));
  }
  if (::pipe(wake_fd_) != 0) {
    int err = errno;
    ::close(inotify_fd_);
    inotify_fd_ = -1;
    throw util::IOError(std::string("pipe: ") + std::strerror(err));
  }

  AddTree(folder_.path, false);

  running_ = true;
  thread_  = std::thread(&InotifyWatcher::Loop, this);
  AEGIS_LOG_INFO("watching folder", {PathField("path", folder_.path), observability::IntField("dirs", static_cast<std::int64_t>(WatchCount()))});
}

void InotifyWatcher::Stop() {
  if (running_.exchange(false)) {
    char byte = 1;
    if (::write(wake_fd_[1], &byte, 1) < 0) {
      AEGIS_LOG_WARN("watch wake failed", {StringField("error", std::strerror(errno))});
    }
  }
  if (thread_.joinable()) thread_.join();

  for (int* fd : {&inotify_fd_, &wake_fd_[0], &wake_fd_[1]}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }

  std::lock_guard lock(watches_mutex_);
  watches_.clear();
}

std::size_t InotifyWatcher::WatchCount() const {
  std::lock_guard lock(watches_mutex_);
  return watches_.size();
}

void InotifyWatcher::AddWatch(const fs::path& dir) {
  int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kDirMask);
  if (wd < 0) {
    AEGIS_LOG_WARN("inotify_add_watch failed", {PathField("path", dir), StringField("error", std::strerror(errno))});
    return;
  }
  std::lock_guard lock(watches_mutex_);
  watches_[wd] = dir;
}

void InotifyWatcher::AddTree(const fs::path& dir, bool offer_files) {
  if (filter_->IsExcludedDirectory(dir)) return;
  AddWatch(dir);

  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
      if (filter_->IsExcludedDirectory(it->path())) {
        it.disable_recursion_pending();
        continue;
      }
      AddWatch(it->path());
    } else if (offer_files && it->is_regular_file(type_ec) && filter_->Accepts(it->path())) {
      sink_(it->path(), folder_.path);
    }
  }
}

void InotifyWatcher::HandleEvents(const char* buffer, std::size_t length) {
  std::size_t offset = 0;
  while (offset + sizeof(inotify_event) <= length) {
    const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
    offset += sizeof(inotify_event) + event->len;

    if (event->mask & IN_Q_OVERFLOW) {
      AEGIS_LOG_WARN("inotify queue overflow", {PathField("folder", folder_.path)});
      if (on_overflow_) on_overflow_();
      continue;
    }

    fs::path dir;
    {
      std::lock_guard lock(watches_mutex_);
      auto            it = watches_.find(event->wd);
      if (it == watches_.end()) continue;
      dir = it->second;
      if (event->mask & IN_IGNORED) {
        watches_.erase(it);
        continue;
      }
    }

    if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
      ::inotify_rm_watch(inotify_fd_, event->wd);
      continue;
    }
    if (event->len == 0) continue;

    const auto path = dir / event->name;
    if (event->mask & IN_ISDIR) {
      if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
        AddTree(path, true);
      }
      continue;
    }

    if (filter_->Accepts(path)) {
      sink_(path, folder_.path);
    }
  }
}

void InotifyWatcher::Loop() {
  alignas(inotify_event) char buffer[64 * 1024];

  pollfd fds[2];
  fds[0] = {inotify_fd_, POLLIN, 0};
  fds[1] = {wake_fd_[0], POLLIN, 0};

  while (running_) {
    int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      AEGIS_LOG_ERROR("watch poll failed", {PathField("folder", folder_.path), StringField("error", std::strerror(errno))});
      break;
    }
    if (fds[1].revents & POLLIN) break;
    if (!(fds[0].revents & POLLIN)) continue;

    while (true) {
      ssize_t n = ::read(inotify_fd_, buffer, sizeof(buffer));
      if (n <= 0) break;
      try {
        HandleEvents(buffer, static_cast<std::size_t>(n));
      } catch (const std::exception& e) {
        AEGIS_LOG_ERROR("watch event failed", {PathField("folder", folder_.path), StringField("error", e.what())});
      }
    }
  }
}

} // namespace aegis::watch
