#include "snapshot_view.hpp"

#include <algorithm>

#include "content_store.hpp"

SnapshotView::SnapshotView()
  : cached_(std::make_shared<const std::vector<std::string>>()) {}

SnapshotView::Filenames SnapshotView::filenames(const ContentStore& store) {
  std::lock_guard lg(m_);
  if(store.mutation_count() == last_seen_mutation_count_) {
    return cached_;
  }
  uint64_t version = 0;
  auto keys = store.keys(version);
  std::sort(keys.begin(), keys.end());
  cached_ = std::make_shared<const std::vector<std::string>>(std::move(keys));
  last_seen_mutation_count_ = version;
  ++rebuilds_;
  return cached_;
}

std::size_t SnapshotView::rebuild_count() const {
  std::lock_guard lg(m_);
  return rebuilds_;
}
