#include "event_coalescer.hpp"

void EventCoalescer::record(const std::string& name, WatchEvent event) {
  auto it = net_.find(name);
  if(it == net_.end()) {
    order_.push_back(name);
    net_.emplace(name, event);
    return;
  }
  auto& current = it->second;
  if(!current) {
    current = event;
    return;
  }
  switch(*current) {
    case WatchEvent::Add:
      if(event == WatchEvent::Delete) current.reset();
      break;
    case WatchEvent::Change:
      if(event == WatchEvent::Delete) current = WatchEvent::Delete;
      break;
    case WatchEvent::Delete:
      // removed then recreated: the cache may still hold the old entry
      if(event != WatchEvent::Delete) current = WatchEvent::Change;
      break;
  }
}

std::vector<std::string> EventCoalescer::collect(WatchEvent event) const {
  std::vector<std::string> out;
  for(const auto& name : order_) {
    const auto& value = net_.at(name);
    if(value && *value == event) out.push_back(name);
  }
  return out;
}
