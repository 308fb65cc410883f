#include "inotify_watcher.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "event_coalescer.hpp"
#include "file_probe.hpp"

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_DELETE |
                                IN_MOVED_FROM | IN_MOVED_TO |
                                IN_DELETE_SELF | IN_MOVE_SELF |
                                IN_ONLYDIR | IN_EXCL_UNLINK;

} // namespace

std::shared_ptr<InotifyDirectoryWatcher> InotifyDirectoryWatcher::create(asio::io_context& io,
                                                                         std::filesystem::path directory,
                                                                         std::shared_ptr<Logger> logger) {
  return std::shared_ptr<InotifyDirectoryWatcher>(
    new InotifyDirectoryWatcher(io, std::move(directory), std::move(logger)));
}

InotifyDirectoryWatcher::InotifyDirectoryWatcher(asio::io_context& io,
                                                 std::filesystem::path directory,
                                                 std::shared_ptr<Logger> logger)
  : BasicDirectoryWatcher(std::move(directory)),
    io_(io),
    descriptor_(io),
    logger_(std::move(logger)) {}

std::error_code InotifyDirectoryWatcher::start() {
  if(started_.exchange(true)) return {};

  int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(fd < 0) {
    return std::error_code(errno, std::system_category());
  }
  if(::inotify_add_watch(fd, directory().c_str(), kWatchMask) < 0) {
    std::error_code ec(errno, std::system_category());
    ::close(fd);
    return ec;
  }

  std::error_code ec;
  descriptor_.assign(fd, ec);
  if(ec) {
    ::close(fd);
    return ec;
  }

  auto listing = list_directory(directory(), ec);
  if(ec) {
    std::error_code ignored;
    descriptor_.close(ignored);
    return ec;
  }
  {
    std::lock_guard lg(known_mutex_);
    known_.clear();
    known_.insert(listing.begin(), listing.end());
  }

  log_debug(logger_.get(), "watching {} ({} entries)", directory().string(), listing.size());
  do_read();
  return {};
}

std::vector<std::string> InotifyDirectoryWatcher::known_files() const {
  std::lock_guard lg(known_mutex_);
  return std::vector<std::string>(known_.begin(), known_.end());
}

void InotifyDirectoryWatcher::stop() {
  if(stopped_.exchange(true)) return;
  log_debug(logger_.get(), "stopped watching {}", directory().string());
  // the descriptor belongs to the io_context thread
  asio::post(io_, [self = shared_from_this()]() {
    std::error_code ec;
    self->descriptor_.close(ec);
  });
}

void InotifyDirectoryWatcher::do_read() {
  auto self = shared_from_this();
  descriptor_.async_read_some(asio::buffer(buffer_, sizeof(buffer_)),
    [this, self](std::error_code ec, std::size_t bytes) {
      if(stopped_) return;
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_warn(logger_.get(), "inotify read on {} failed: {}", directory().string(), ec.message());
        }
        return;
      }
      handle_events(bytes);
      if(!stopped_) do_read();
    });
}

void InotifyDirectoryWatcher::handle_events(std::size_t bytes) {
  EventCoalescer events;
  bool overflow = false;
  bool directory_gone = false;

  std::size_t offset = 0;
  while(offset + sizeof(struct inotify_event) <= bytes) {
    const auto* ev = reinterpret_cast<const struct inotify_event*>(buffer_ + offset);
    offset += sizeof(struct inotify_event) + ev->len;

    if(ev->mask & IN_Q_OVERFLOW) {
      overflow = true;
      continue;
    }
    if(ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
      directory_gone = true;
      continue;
    }
    if(ev->len == 0) continue;

    std::string name(ev->name, ::strnlen(ev->name, ev->len));
    const bool is_dir = (ev->mask & IN_ISDIR) != 0;

    std::lock_guard lg(known_mutex_);
    if(ev->mask & IN_CREATE) {
      known_.insert(name);
      if(is_dir) {
        events.record(name, WatchEvent::Add);
      } else {
        awaiting_close_.insert(name);
      }
    }
    if(ev->mask & IN_MOVED_TO) {
      known_.insert(name);
      awaiting_close_.erase(name);
      events.record(name, WatchEvent::Add);
    }
    if(ev->mask & IN_CLOSE_WRITE) {
      if(awaiting_close_.erase(name) > 0) {
        events.record(name, WatchEvent::Add);
      } else {
        events.record(name, WatchEvent::Change);
      }
    }
    if(ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
      known_.erase(name);
      awaiting_close_.erase(name);
      events.record(name, WatchEvent::Delete);
    }
  }

  {
    // created entries that will never see a close-after-write
    std::lock_guard lg(known_mutex_);
    for(auto it = awaiting_close_.begin(); it != awaiting_close_.end();) {
      std::error_code ec;
      auto status = std::filesystem::symlink_status(directory() / *it, ec);
      if(ec || status.type() == std::filesystem::file_type::not_found) {
        it = awaiting_close_.erase(it);
      } else if(status.type() != std::filesystem::file_type::regular) {
        events.record(*it, WatchEvent::Add);
        it = awaiting_close_.erase(it);
      } else {
        ++it;
      }
    }
  }

  publish(WatchEvent::Add, events.collect(WatchEvent::Add));
  publish(WatchEvent::Change, events.collect(WatchEvent::Change));
  publish(WatchEvent::Delete, events.collect(WatchEvent::Delete));

  if(overflow && !stopped_) {
    log_warn(logger_.get(), "inotify queue overflow on {}, rescanning", directory().string());
    resync();
  }
  if(directory_gone && !stopped_) {
    log_warn(logger_.get(), "watched directory {} was removed or moved", directory().string());
    stop();
  }
}

void InotifyDirectoryWatcher::resync() {
  std::error_code ec;
  auto listing = list_directory(directory(), ec);
  if(ec) {
    log_warn(logger_.get(), "rescan of {} failed: {}", directory().string(), ec.message());
    return;
  }

  std::vector<std::string> vanished;
  {
    std::lock_guard lg(known_mutex_);
    std::set<std::string> current(listing.begin(), listing.end());
    for(const auto& name : known_) {
      if(!current.count(name)) vanished.push_back(name);
    }
    known_ = std::move(current);
    awaiting_close_.clear();
  }

  publish(WatchEvent::Change, listing);
  publish(WatchEvent::Delete, vanished);
}
