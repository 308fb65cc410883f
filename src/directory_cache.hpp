#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "cache_error.hpp"
#include "cache_observers.hpp"
#include "cached_content.hpp"
#include "content_store.hpp"
#include "directory_watcher.hpp"
#include "log.hpp"
#include "name_filter.hpp"
#include "snapshot_view.hpp"
#include "watcher_binding.hpp"

class Reconciler;
struct ProbeResult;

// Callbacks run on the io_context passed to create().
class DirectoryCache : public std::enable_shared_from_this<DirectoryCache> {
public:
  enum class State { Uninitialized, Initializing, Ready, Failed, Stopped };

  struct Options {
    std::filesystem::path directory;
    NameFilter filter;
    // never stopped by the cache; null means an owned inotify watcher
    std::shared_ptr<DirectoryWatcher> watcher;
    bool json_parsing = true;
    std::string json_suffix = ".json";
    std::size_t io_threads = 4;
  };

  using InitHandler = std::function<void(std::error_code ec)>;

  static std::shared_ptr<DirectoryCache> create(asio::io_context& io,
                                                Options options,
                                                std::shared_ptr<Logger> logger = nullptr);
  ~DirectoryCache();

  DirectoryCache(const DirectoryCache&) = delete;
  DirectoryCache& operator=(const DirectoryCache&) = delete;

  void init(InitHandler handler);

  // Reads still in flight are discarded.
  void stop();

  std::optional<CachedContent> get_file(const std::string& filename) const;
  SnapshotView::Filenames get_filenames();

  void enable_json_parsing();
  void disable_json_parsing();
  bool json_parsing_enabled() const;

  ListenerHandle on_added(std::function<void(const std::string&, const CachedContent&)> handler);
  ListenerHandle on_updated(std::function<void(const std::string&, const CachedContent&)> handler);
  ListenerHandle on_deleted(std::function<void(const std::string&, const CachedContent& prior)> handler);
  ListenerHandle on_error(std::function<void(const CacheFault&)> handler);
  ListenerHandle on_files_added(std::function<void(const std::vector<std::string>&)> handler);
  ListenerHandle on_files_changed(std::function<void(const std::vector<std::string>&)> handler);
  ListenerHandle on_files_deleted(std::function<void(const std::vector<std::string>&)> handler);
  ListenerHandle subscribe(CacheEvent event, CacheObservers::Handler handler);
  void remove_listener(ListenerHandle handle);

  State state() const { return state_.load(); }
  bool ready() const { return state() == State::Ready; }
  uint64_t mutation_count() const;
  std::size_t size() const;
  std::size_t snapshot_rebuilds() const;
  std::size_t reads_in_flight() const;
  const std::filesystem::path& directory() const { return options_.directory; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<DirectoryWatcher> watcher() const { return binding_.watcher(); }

private:
  DirectoryCache(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void start_init();
  void attach_watcher();
  void read_initial(std::vector<std::string> filenames);
  void finish_initial(std::vector<ProbeResult> results);
  void fail_init(std::error_code ec, const std::string& detail);
  void complete_init(std::error_code ec);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ContentStore> store_;
  std::shared_ptr<CacheObservers> observers_;
  std::shared_ptr<Reconciler> reconciler_;
  SnapshotView snapshot_;
  WatcherBinding binding_;

  std::atomic<State> state_{State::Uninitialized};
  std::mutex init_mutex_;
  InitHandler init_handler_;
};

const char* cache_state_name(DirectoryCache::State state);
