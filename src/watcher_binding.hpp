#pragma once

#include <memory>
#include <mutex>

#include "directory_watcher.hpp"

// detach() stops the watcher only when owned.
class WatcherBinding {
public:
  struct Handlers {
    DirectoryWatcher::BatchHandler on_add;
    DirectoryWatcher::BatchHandler on_change;
    DirectoryWatcher::BatchHandler on_delete;
  };

  WatcherBinding() = default;
  ~WatcherBinding();

  WatcherBinding(const WatcherBinding&) = delete;
  WatcherBinding& operator=(const WatcherBinding&) = delete;

  void bind(std::shared_ptr<DirectoryWatcher> watcher, bool owned);
  void attach(Handlers handlers);
  void detach();

  bool bound() const;
  bool attached() const;
  bool owns_watcher() const;
  std::shared_ptr<DirectoryWatcher> watcher() const;

private:
  mutable std::mutex m_;
  std::shared_ptr<DirectoryWatcher> watcher_;
  bool owned_ = false;
  bool attached_ = false;
  DirectoryWatcher::SubscriptionId add_id_ = 0;
  DirectoryWatcher::SubscriptionId change_id_ = 0;
  DirectoryWatcher::SubscriptionId delete_id_ = 0;
};
