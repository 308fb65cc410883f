#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cached_content.hpp"

// The mutation counter moves only when the key set changes.
class ContentStore {
public:
  explicit ContentStore(std::string json_suffix = ".json", bool json_parsing = true);

  // true when the name is new
  bool put(const std::string& filename, CachedContent content);

  bool replace(const std::string& filename, CachedContent content);

  std::optional<CachedContent> erase(const std::string& filename);

  std::optional<CachedContent> get(const std::string& filename) const;
  bool contains(const std::string& filename) const;
  std::size_t size() const;

  uint64_t mutation_count() const;
  std::vector<std::string> keys(uint64_t& version) const;

  void set_json_parsing(bool enabled);
  bool json_parsing() const;
  const std::string& json_suffix() const { return json_suffix_; }
  bool wants_json(const std::string& filename) const;

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, CachedContent> entries_;
  uint64_t mutation_count_ = 0;

  const std::string json_suffix_;
  std::atomic<bool> json_parsing_;
};

bool has_suffix_ci(const std::string& name, const std::string& suffix);
