#include "reconciler.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/ranges.h>

namespace {

struct BatchState {
  std::vector<ProbeResult> results;
  std::size_t remaining = 0;
  Reconciler::BatchReady ready;
};

} // namespace

Reconciler::Reconciler(asio::io_context& io,
                       std::filesystem::path directory,
                       NameFilter filter,
                       std::shared_ptr<ContentStore> store,
                       std::shared_ptr<CacheObservers> observers,
                       std::shared_ptr<Logger> logger,
                       std::size_t io_threads)
  : io_(io),
    pool_(std::max<std::size_t>(1, io_threads)),
    directory_(std::move(directory)),
    filter_(std::move(filter)),
    store_(std::move(store)),
    observers_(std::move(observers)),
    logger_(std::move(logger)) {}

Reconciler::~Reconciler() {
  // queued work would only be discarded; running reads are waited for
  pool_.stop();
  pool_.join();
}

void Reconciler::list(ListingReady ready) {
  auto& io = io_;
  auto directory = directory_;
  std::weak_ptr<Reconciler> weak = weak_from_this();
  asio::post(pool_, [&io, directory, weak, ready = std::move(ready)]() mutable {
    std::error_code ec;
    auto names = list_directory(directory, ec);
    asio::post(io, [weak, ec, names = std::move(names), ready = std::move(ready)]() mutable {
      if(weak.expired()) return;
      ready(ec, std::move(names));
    });
  });
}

void Reconciler::read_batch(const std::vector<std::string>& filenames, BatchReady ready) {
  std::vector<std::string> kept;
  kept.reserve(filenames.size());
  for(const auto& name : filenames) {
    if(filter_.keep(name)) {
      kept.push_back(name);
    } else {
      log_debug(logger_.get(), "filtered out {}", name);
    }
  }

  if(kept.empty()) {
    std::weak_ptr<Reconciler> weak = weak_from_this();
    asio::post(io_, [weak, ready = std::move(ready)]() {
      if(weak.expired()) return;
      ready({});
    });
    return;
  }

  auto state = std::make_shared<BatchState>();
  state->results.resize(kept.size());
  state->remaining = kept.size();
  state->ready = std::move(ready);

  auto& io = io_;
  std::weak_ptr<Reconciler> weak = weak_from_this();
  for(std::size_t i = 0; i < kept.size(); ++i) {
    // the JSON policy is sampled when the read is dispatched
    auto request = make_probe_request(directory_, kept[i], store_->wants_json(kept[i]));
    ++in_flight_;
    asio::post(pool_, [&io, weak, state, i, request = std::move(request)]() {
      auto result = probe_and_read(request);
      asio::post(io, [weak, state, i, result = std::move(result)]() mutable {
        auto self = weak.lock();
        if(!self) return;
        --self->in_flight_;
        state->results[i] = std::move(result);
        if(--state->remaining > 0) return;
        auto ready = std::move(state->ready);
        ready(std::move(state->results));
      });
    });
  }
}

void Reconciler::post_batch(WatchEvent event, std::vector<std::string> filenames) {
  if(filenames.empty() || frozen()) return;
  std::weak_ptr<Reconciler> weak = weak_from_this();
  asio::post(io_, [weak, event, filenames = std::move(filenames)]() mutable {
    if(auto self = weak.lock()) {
      self->handle_batch(event, std::move(filenames));
    }
  });
}

void Reconciler::handle_batch(WatchEvent event, std::vector<std::string> filenames) {
  switch(phase()) {
    case Phase::Frozen:
      return;
    case Phase::Deferring: {
      log_debug(logger_.get(), "deferring {}: [{}]", watch_event_name(event), fmt::join(filenames, ", "));
      std::lock_guard lg(deferred_mutex_);
      deferred_.push_back(PendingBatch{event, std::move(filenames)});
      return;
    }
    case Phase::Live:
      break;
  }

  log_debug(logger_.get(), "{}: [{}]", watch_event_name(event), fmt::join(filenames, ", "));
  switch(event) {
    case WatchEvent::Add:
      read_batch(filenames, [this](std::vector<ProbeResult> results) {
        apply_added(results);
      });
      break;
    case WatchEvent::Change:
      read_batch(filenames, [this](std::vector<ProbeResult> results) {
        apply_changed(results);
      });
      break;
    case WatchEvent::Delete:
      apply_deleted(filenames);
      break;
  }
}

void Reconciler::apply_initial(const std::vector<ProbeResult>& results) {
  std::vector<std::string> added;
  added.reserve(results.size());
  for(const auto& result : results) {
    if(!result.ok()) continue;
    log_debug(logger_.get(), "adding {}", result.filename);
    if(store_->put(result.filename, result.content)) {
      added.push_back(result.filename);
    }
  }
  notify_batch(CacheEvent::FilesAdded, std::move(added));
}

void Reconciler::go_live() {
  Phase expected = Phase::Deferring;
  if(!phase_.compare_exchange_strong(expected, Phase::Live)) return;

  std::deque<PendingBatch> pending;
  {
    std::lock_guard lg(deferred_mutex_);
    pending.swap(deferred_);
  }
  if(!pending.empty()) {
    log_debug(logger_.get(), "replaying {} deferred batch(es)", pending.size());
  }
  for(auto& batch : pending) {
    handle_batch(batch.event, std::move(batch.filenames));
  }
}

void Reconciler::freeze() {
  phase_.store(Phase::Frozen);
  std::lock_guard lg(deferred_mutex_);
  deferred_.clear();
}

void Reconciler::apply_added(const std::vector<ProbeResult>& results) {
  if(frozen()) {
    log_debug(logger_.get(), "discarding {} late result(s) after stop", results.size());
    return;
  }
  std::vector<std::string> added;
  std::vector<std::string> updated;
  for(const auto& result : results) {
    if(!result.ok()) {
      report_fault(*result.fault);
      continue;
    }
    if(store_->put(result.filename, result.content)) {
      log_debug(logger_.get(), "adding {}", result.filename);
      added.push_back(result.filename);
      notify(CacheEvent::Added, result.filename, result.content);
    } else {
      log_debug(logger_.get(), "updating {} (reported as added, already cached)", result.filename);
      updated.push_back(result.filename);
      notify(CacheEvent::Updated, result.filename, result.content);
    }
  }
  notify_batch(CacheEvent::FilesAdded, std::move(added));
  notify_batch(CacheEvent::FilesChanged, std::move(updated));
}

void Reconciler::apply_changed(const std::vector<ProbeResult>& results) {
  if(frozen()) {
    log_debug(logger_.get(), "discarding {} late result(s) after stop", results.size());
    return;
  }
  std::vector<std::string> added;
  std::vector<std::string> updated;
  for(const auto& result : results) {
    if(!result.ok()) {
      report_fault(*result.fault);
      continue;
    }
    if(store_->replace(result.filename, result.content)) {
      log_debug(logger_.get(), "updating {}", result.filename);
      updated.push_back(result.filename);
      notify(CacheEvent::Updated, result.filename, result.content);
    } else {
      // the add for this name was never seen
      store_->put(result.filename, result.content);
      log_debug(logger_.get(), "adding {} (reported as changed, not cached)", result.filename);
      added.push_back(result.filename);
      notify(CacheEvent::Added, result.filename, result.content);
    }
  }
  notify_batch(CacheEvent::FilesChanged, std::move(updated));
  notify_batch(CacheEvent::FilesAdded, std::move(added));
}

void Reconciler::apply_deleted(const std::vector<std::string>& filenames) {
  std::vector<std::string> removed;
  for(const auto& name : filenames) {
    auto prior = store_->erase(name);
    if(!prior) {
      log_debug(logger_.get(), "ignoring deletion of {} (not cached)", name);
      continue;
    }
    log_debug(logger_.get(), "deleting {}", name);
    removed.push_back(name);
    notify(CacheEvent::Deleted, name, *prior);
  }
  notify_batch(CacheEvent::FilesDeleted, std::move(removed));
}

void Reconciler::report_fault(const CacheFault& fault) {
  log_warn(logger_.get(), "unable to cache {}", fault.describe());
  CacheNotification notification;
  notification.event = CacheEvent::Error;
  notification.filename = fault.filename;
  notification.fault = fault;
  observers_->publish(notification);
}

void Reconciler::notify(CacheEvent event, const std::string& filename, const CachedContent& content) {
  CacheNotification notification;
  notification.event = event;
  notification.filename = filename;
  notification.content = content;
  observers_->publish(notification);
}

void Reconciler::notify_batch(CacheEvent event, std::vector<std::string> filenames) {
  if(filenames.empty()) return;
  CacheNotification notification;
  notification.event = event;
  notification.filenames = std::move(filenames);
  observers_->publish(notification);
}
