#pragma once

#include <asio.hpp>

#include <sys/inotify.h>

#include <atomic>
#include <climits>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "directory_watcher.hpp"
#include "log.hpp"

// A created regular file is reported as added on close-after-write; other created entries immediately.
class InotifyDirectoryWatcher
  : public BasicDirectoryWatcher,
    public std::enable_shared_from_this<InotifyDirectoryWatcher> {
public:
  static std::shared_ptr<InotifyDirectoryWatcher> create(asio::io_context& io,
                                                         std::filesystem::path directory,
                                                         std::shared_ptr<Logger> logger = nullptr);

  InotifyDirectoryWatcher(const InotifyDirectoryWatcher&) = delete;
  InotifyDirectoryWatcher& operator=(const InotifyDirectoryWatcher&) = delete;

  std::error_code start();

  std::vector<std::string> known_files() const override;

  void stop() override;
  bool stopped() const override { return stopped_.load(); }

  void resync();

private:
  InotifyDirectoryWatcher(asio::io_context& io,
                          std::filesystem::path directory,
                          std::shared_ptr<Logger> logger);

  void do_read();
  void handle_events(std::size_t bytes);

  static constexpr std::size_t kBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

  asio::io_context& io_;
  asio::posix::stream_descriptor descriptor_;
  alignas(struct inotify_event) char buffer_[kBufferSize];
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  mutable std::mutex known_mutex_;
  std::set<std::string> known_;
  // created regular files not yet closed by their writer
  std::set<std::string> awaiting_close_;
};
