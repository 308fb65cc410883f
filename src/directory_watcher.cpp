#include "directory_watcher.hpp"

#include <utility>

const char* watch_event_name(WatchEvent event) {
  switch(event) {
    case WatchEvent::Add: return "add";
    case WatchEvent::Change: return "change";
    case WatchEvent::Delete: return "delete";
  }
  return "unknown";
}

BasicDirectoryWatcher::BasicDirectoryWatcher(std::filesystem::path directory)
  : directory_(std::move(directory)) {}

DirectoryWatcher::SubscriptionId BasicDirectoryWatcher::subscribe(WatchEvent event,
                                                                  BatchHandler handler) {
  if(!handler) return 0;
  std::lock_guard lg(subscriptions_mutex_);
  auto id = next_subscription_id_++;
  subscriptions_.emplace(id, Subscription{event, std::move(handler)});
  return id;
}

void BasicDirectoryWatcher::unsubscribe(SubscriptionId id) {
  std::lock_guard lg(subscriptions_mutex_);
  subscriptions_.erase(id);
}

std::size_t BasicDirectoryWatcher::subscription_count() const {
  std::lock_guard lg(subscriptions_mutex_);
  return subscriptions_.size();
}

void BasicDirectoryWatcher::publish(WatchEvent event,
                                    const std::vector<std::string>& filenames) const {
  if(filenames.empty()) return;
  std::vector<BatchHandler> targets;
  {
    std::lock_guard lg(subscriptions_mutex_);
    for(const auto& kv : subscriptions_) {
      if(kv.second.event == event) targets.push_back(kv.second.handler);
    }
  }
  for(auto& handler : targets) {
    handler(filenames);
  }
}
