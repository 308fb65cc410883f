#include "watcher_binding.hpp"

#include <initializer_list>
#include <utility>

WatcherBinding::~WatcherBinding() {
  detach();
}

void WatcherBinding::bind(std::shared_ptr<DirectoryWatcher> watcher, bool owned) {
  std::lock_guard lg(m_);
  watcher_ = std::move(watcher);
  owned_ = owned;
}

void WatcherBinding::attach(Handlers handlers) {
  std::lock_guard lg(m_);
  if(!watcher_ || attached_) return;
  add_id_ = watcher_->subscribe(WatchEvent::Add, std::move(handlers.on_add));
  change_id_ = watcher_->subscribe(WatchEvent::Change, std::move(handlers.on_change));
  delete_id_ = watcher_->subscribe(WatchEvent::Delete, std::move(handlers.on_delete));
  attached_ = true;
}

void WatcherBinding::detach() {
  std::shared_ptr<DirectoryWatcher> watcher;
  bool owned = false;
  {
    std::lock_guard lg(m_);
    if(!watcher_) return;
    if(attached_) {
      for(auto id : {add_id_, change_id_, delete_id_}) {
        if(id != 0) watcher_->unsubscribe(id);
      }
      add_id_ = change_id_ = delete_id_ = 0;
      attached_ = false;
    }
    watcher = std::move(watcher_);
    owned = owned_;
    owned_ = false;
  }
  if(owned) watcher->stop();
}

bool WatcherBinding::bound() const {
  std::lock_guard lg(m_);
  return watcher_ != nullptr;
}

bool WatcherBinding::attached() const {
  std::lock_guard lg(m_);
  return attached_;
}

bool WatcherBinding::owns_watcher() const {
  std::lock_guard lg(m_);
  return owned_;
}

std::shared_ptr<DirectoryWatcher> WatcherBinding::watcher() const {
  std::lock_guard lg(m_);
  return watcher_;
}
