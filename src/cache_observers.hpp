#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cache_error.hpp"
#include "cached_content.hpp"
#include "log.hpp"

enum class CacheEvent {
  Added,        // filename, content
  Updated,      // filename, content
  Deleted,      // filename, prior content
  Error,        // fault
  FilesAdded,   // filenames of one batch
  FilesChanged,
  FilesDeleted
};

const char* cache_event_name(CacheEvent event);

struct CacheNotification {
  CacheEvent event = CacheEvent::Added;
  std::string filename;
  CachedContent content;
  std::vector<std::string> filenames;
  std::optional<CacheFault> fault;
};

using ListenerHandle = std::size_t;

class CacheObservers {
public:
  using Handler = std::function<void(const CacheNotification&)>;

  explicit CacheObservers(std::shared_ptr<Logger> logger = nullptr);

  ListenerHandle subscribe(CacheEvent event, Handler handler);
  void unsubscribe(ListenerHandle handle);
  std::size_t size() const;

  void publish(const CacheNotification& notification) const;

private:
  struct Subscription {
    CacheEvent event;
    Handler handler;
  };

  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<ListenerHandle, Subscription> subscriptions_;
  ListenerHandle next_handle_ = 1;
};
