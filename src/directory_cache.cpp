#include "directory_cache.hpp"

#include <stdexcept>
#include <utility>

#include "file_probe.hpp"
#include "inotify_watcher.hpp"
#include "reconciler.hpp"

const char* cache_state_name(DirectoryCache::State state) {
  switch(state) {
    case DirectoryCache::State::Uninitialized: return "uninitialized";
    case DirectoryCache::State::Initializing: return "initializing";
    case DirectoryCache::State::Ready: return "ready";
    case DirectoryCache::State::Failed: return "failed";
    case DirectoryCache::State::Stopped: return "stopped";
  }
  return "unknown";
}

std::shared_ptr<DirectoryCache> DirectoryCache::create(asio::io_context& io,
                                                       Options options,
                                                       std::shared_ptr<Logger> logger) {
  if(options.directory.empty()) {
    throw std::invalid_argument("DirectoryCache requires a directory");
  }
  return std::shared_ptr<DirectoryCache>(
    new DirectoryCache(io, std::move(options), std::move(logger)));
}

DirectoryCache::DirectoryCache(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("dircache")),
    store_(std::make_shared<ContentStore>(options_.json_suffix, options_.json_parsing)),
    observers_(std::make_shared<CacheObservers>(logger_)) {
  reconciler_ = std::make_shared<Reconciler>(io_,
                                             options_.directory,
                                             options_.filter,
                                             store_,
                                             observers_,
                                             logger_,
                                             options_.io_threads);
}

DirectoryCache::~DirectoryCache() {
  reconciler_->freeze();
  binding_.detach();
}

void DirectoryCache::init(InitHandler handler) {
  State expected = State::Uninitialized;
  if(!state_.compare_exchange_strong(expected, State::Initializing)) {
    auto ec = expected == State::Stopped
      ? make_error_code(CacheErrc::stopped)
      : make_error_code(CacheErrc::already_initialized);
    if(handler) {
      asio::post(io_, [handler = std::move(handler), ec]() { handler(ec); });
    }
    return;
  }

  {
    std::lock_guard lg(init_mutex_);
    init_handler_ = std::move(handler);
  }
  log_debug(logger_.get(), "creating directory cache for [{}]", options_.directory.string());
  asio::post(io_, [self = shared_from_this()]() { self->start_init(); });
}

void DirectoryCache::start_init() {
  if(state() == State::Stopped) {
    complete_init(make_error_code(CacheErrc::stopped));
    return;
  }

  if(options_.watcher) {
    if(options_.watcher->stopped()) {
      fail_init(make_error_code(CacheErrc::watcher_failed), "injected watcher already stopped");
      return;
    }
    binding_.bind(options_.watcher, false);
    attach_watcher();
    read_initial(options_.watcher->known_files());
    return;
  }

  auto watcher = InotifyDirectoryWatcher::create(io_, options_.directory, logger_);
  if(auto ec = watcher->start()) {
    fail_init(ec, "watch " + options_.directory.string());
    return;
  }
  binding_.bind(watcher, true);
  // batches arriving before the initial read completes are deferred
  attach_watcher();

  std::weak_ptr<DirectoryCache> weak = weak_from_this();
  reconciler_->list([weak](std::error_code ec, std::vector<std::string> filenames) {
    auto self = weak.lock();
    if(!self) return;
    if(self->state() == State::Stopped) {
      self->complete_init(make_error_code(CacheErrc::stopped));
      return;
    }
    if(ec) {
      self->fail_init(ec, "list " + self->options_.directory.string());
      return;
    }
    self->read_initial(std::move(filenames));
  });
}

void DirectoryCache::attach_watcher() {
  std::weak_ptr<Reconciler> weak = reconciler_;
  auto route = [weak](WatchEvent event) {
    return [weak, event](const std::vector<std::string>& filenames) {
      if(auto reconciler = weak.lock()) {
        reconciler->post_batch(event, filenames);
      }
    };
  };
  binding_.attach(WatcherBinding::Handlers{route(WatchEvent::Add),
                                           route(WatchEvent::Change),
                                           route(WatchEvent::Delete)});
}

void DirectoryCache::read_initial(std::vector<std::string> filenames) {
  log_debug(logger_.get(), "reading {} initial entries", filenames.size());
  std::weak_ptr<DirectoryCache> weak = weak_from_this();
  reconciler_->read_batch(filenames, [weak](std::vector<ProbeResult> results) {
    if(auto self = weak.lock()) {
      self->finish_initial(std::move(results));
    }
  });
}

void DirectoryCache::finish_initial(std::vector<ProbeResult> results) {
  if(state() == State::Stopped) {
    complete_init(make_error_code(CacheErrc::stopped));
    return;
  }
  for(const auto& result : results) {
    if(!result.ok()) {
      fail_init(result.fault->code, result.fault->describe());
      return;
    }
  }

  reconciler_->apply_initial(results);
  State expected = State::Initializing;
  if(!state_.compare_exchange_strong(expected, State::Ready)) {
    complete_init(make_error_code(CacheErrc::stopped));
    return;
  }
  log_debug(logger_.get(), "cache for [{}] initialized with {} entries",
            options_.directory.string(), store_->size());
  reconciler_->go_live();
  complete_init({});
}

void DirectoryCache::fail_init(std::error_code ec, const std::string& detail) {
  log_error(logger_.get(), "initializing cache for [{}] failed: {} ({})",
            options_.directory.string(), ec.message(), detail);
  State expected = State::Initializing;
  state_.compare_exchange_strong(expected, State::Failed);
  reconciler_->freeze();
  binding_.detach();
  complete_init(ec);
}

void DirectoryCache::complete_init(std::error_code ec) {
  InitHandler handler;
  {
    std::lock_guard lg(init_mutex_);
    handler = std::move(init_handler_);
    init_handler_ = nullptr;
  }
  if(handler) handler(ec);
}

void DirectoryCache::stop() {
  State current = state();
  do {
    if(current == State::Stopped || current == State::Failed) return;
  } while(!state_.compare_exchange_weak(current, State::Stopped));

  reconciler_->freeze();
  binding_.detach();
  log_debug(logger_.get(), "stopped cache for [{}] ({} entries frozen)",
            options_.directory.string(), store_->size());
}

std::optional<CachedContent> DirectoryCache::get_file(const std::string& filename) const {
  return store_->get(filename);
}

SnapshotView::Filenames DirectoryCache::get_filenames() {
  return snapshot_.filenames(*store_);
}

void DirectoryCache::enable_json_parsing() {
  store_->set_json_parsing(true);
}

void DirectoryCache::disable_json_parsing() {
  store_->set_json_parsing(false);
}

bool DirectoryCache::json_parsing_enabled() const {
  return store_->json_parsing();
}

ListenerHandle DirectoryCache::on_added(std::function<void(const std::string&, const CachedContent&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::Added, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filename, n.content);
  });
}

ListenerHandle DirectoryCache::on_updated(std::function<void(const std::string&, const CachedContent&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::Updated, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filename, n.content);
  });
}

ListenerHandle DirectoryCache::on_deleted(std::function<void(const std::string&, const CachedContent&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::Deleted, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filename, n.content);
  });
}

ListenerHandle DirectoryCache::on_error(std::function<void(const CacheFault&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::Error, [handler = std::move(handler)](const CacheNotification& n) {
    if(n.fault) handler(*n.fault);
  });
}

ListenerHandle DirectoryCache::on_files_added(std::function<void(const std::vector<std::string>&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::FilesAdded, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filenames);
  });
}

ListenerHandle DirectoryCache::on_files_changed(std::function<void(const std::vector<std::string>&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::FilesChanged, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filenames);
  });
}

ListenerHandle DirectoryCache::on_files_deleted(std::function<void(const std::vector<std::string>&)> handler) {
  if(!handler) return 0;
  return subscribe(CacheEvent::FilesDeleted, [handler = std::move(handler)](const CacheNotification& n) {
    handler(n.filenames);
  });
}

ListenerHandle DirectoryCache::subscribe(CacheEvent event, CacheObservers::Handler handler) {
  if(!handler) return 0;
  return observers_->subscribe(event, std::move(handler));
}

void DirectoryCache::remove_listener(ListenerHandle handle) {
  observers_->unsubscribe(handle);
}

uint64_t DirectoryCache::mutation_count() const {
  return store_->mutation_count();
}

std::size_t DirectoryCache::size() const {
  return store_->size();
}

std::size_t DirectoryCache::snapshot_rebuilds() const {
  return snapshot_.rebuild_count();
}

std::size_t DirectoryCache::reads_in_flight() const {
  return reconciler_->in_flight();
}
