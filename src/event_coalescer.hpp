#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "directory_watcher.hpp"

// Reduces the events of one inotify queue read to a single net event per name.
class EventCoalescer {
public:
  void record(const std::string& name, WatchEvent event);

  std::vector<std::string> collect(WatchEvent event) const;

private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::optional<WatchEvent>> net_;
};
