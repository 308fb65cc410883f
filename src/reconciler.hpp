#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "cache_observers.hpp"
#include "content_store.hpp"
#include "directory_watcher.hpp"
#include "file_probe.hpp"
#include "log.hpp"
#include "name_filter.hpp"

// Store mutations happen only on the io_context thread.
class Reconciler : public std::enable_shared_from_this<Reconciler> {
public:
  enum class Phase { Deferring, Live, Frozen };

  using BatchReady = std::function<void(std::vector<ProbeResult> results)>;
  using ListingReady = std::function<void(std::error_code ec, std::vector<std::string> filenames)>;

  Reconciler(asio::io_context& io,
             std::filesystem::path directory,
             NameFilter filter,
             std::shared_ptr<ContentStore> store,
             std::shared_ptr<CacheObservers> observers,
             std::shared_ptr<Logger> logger,
             std::size_t io_threads);
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  void list(ListingReady ready);

  // `ready` runs whatever the phase; appliers check it themselves.
  void read_batch(const std::vector<std::string>& filenames, BatchReady ready);

  void post_batch(WatchEvent event, std::vector<std::string> filenames);

  void handle_batch(WatchEvent event, std::vector<std::string> filenames);
  void apply_initial(const std::vector<ProbeResult>& results);
  void go_live();

  void freeze();
  Phase phase() const { return phase_.load(); }
  bool frozen() const { return phase() == Phase::Frozen; }

  std::size_t in_flight() const { return in_flight_.load(); }

private:
  struct PendingBatch {
    WatchEvent event;
    std::vector<std::string> filenames;
  };

  void apply_added(const std::vector<ProbeResult>& results);
  void apply_changed(const std::vector<ProbeResult>& results);
  void apply_deleted(const std::vector<std::string>& filenames);
  void report_fault(const CacheFault& fault);

  void notify(CacheEvent event, const std::string& filename, const CachedContent& content);
  void notify_batch(CacheEvent event, std::vector<std::string> filenames);

  asio::io_context& io_;
  asio::thread_pool pool_;
  const std::filesystem::path directory_;
  const NameFilter filter_;
  std::shared_ptr<ContentStore> store_;
  std::shared_ptr<CacheObservers> observers_;
  std::shared_ptr<Logger> logger_;

  std::atomic<Phase> phase_{Phase::Deferring};
  std::atomic<std::size_t> in_flight_{0};
  mutable std::mutex deferred_mutex_;
  std::deque<PendingBatch> deferred_;
};
