#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ContentStore;

class SnapshotView {
public:
  using Filenames = std::shared_ptr<const std::vector<std::string>>;

  SnapshotView();

  Filenames filenames(const ContentStore& store);

  std::size_t rebuild_count() const;

private:
  mutable std::mutex m_;
  Filenames cached_;
  uint64_t last_seen_mutation_count_ = 0;
  std::size_t rebuilds_ = 0;
};
