#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

enum class WatchEvent { Add, Change, Delete };

const char* watch_event_name(WatchEvent event);

class DirectoryWatcher {
public:
  using BatchHandler = std::function<void(const std::vector<std::string>& filenames)>;
  using SubscriptionId = std::size_t;

  virtual ~DirectoryWatcher() = default;

  virtual const std::filesystem::path& directory() const = 0;
  virtual std::vector<std::string> known_files() const = 0;

  virtual SubscriptionId subscribe(WatchEvent event, BatchHandler handler) = 0;
  virtual void unsubscribe(SubscriptionId id) = 0;

  virtual void stop() = 0;
  virtual bool stopped() const = 0;
};

class BasicDirectoryWatcher : public DirectoryWatcher {
public:
  explicit BasicDirectoryWatcher(std::filesystem::path directory);

  const std::filesystem::path& directory() const override { return directory_; }

  SubscriptionId subscribe(WatchEvent event, BatchHandler handler) override;
  void unsubscribe(SubscriptionId id) override;

  std::size_t subscription_count() const;

protected:
  void publish(WatchEvent event, const std::vector<std::string>& filenames) const;

private:
  struct Subscription {
    WatchEvent event;
    BatchHandler handler;
  };

  std::filesystem::path directory_;
  mutable std::mutex subscriptions_mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId next_subscription_id_ = 1;
};
