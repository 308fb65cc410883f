#include "cache_observers.hpp"

#include <exception>
#include <utility>

const char* cache_event_name(CacheEvent event) {
  switch(event) {
    case CacheEvent::Added: return "added";
    case CacheEvent::Updated: return "updated";
    case CacheEvent::Deleted: return "deleted";
    case CacheEvent::Error: return "error";
    case CacheEvent::FilesAdded: return "files added";
    case CacheEvent::FilesChanged: return "files changed";
    case CacheEvent::FilesDeleted: return "files deleted";
  }
  return "unknown";
}

CacheObservers::CacheObservers(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

ListenerHandle CacheObservers::subscribe(CacheEvent event, Handler handler) {
  if(!handler) return 0;
  std::lock_guard lg(m_);
  auto handle = next_handle_++;
  subscriptions_.emplace(handle, Subscription{event, std::move(handler)});
  return handle;
}

void CacheObservers::unsubscribe(ListenerHandle handle) {
  std::lock_guard lg(m_);
  subscriptions_.erase(handle);
}

std::size_t CacheObservers::size() const {
  std::lock_guard lg(m_);
  return subscriptions_.size();
}

void CacheObservers::publish(const CacheNotification& notification) const {
  std::vector<Handler> targets;
  {
    std::lock_guard lg(m_);
    for(const auto& kv : subscriptions_) {
      if(kv.second.event == notification.event) targets.push_back(kv.second.handler);
    }
  }
  for(auto& handler : targets) {
    try {
      handler(notification);
    } catch(const std::exception& e) {
      log_error(logger_.get(), "'{}' listener threw: {}",
                cache_event_name(notification.event), e.what());
    }
  }
}
