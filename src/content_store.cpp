#include "content_store.hpp"

#include <cctype>
#include <utility>

bool has_suffix_ci(const std::string& name, const std::string& suffix) {
  if(suffix.empty() || name.size() < suffix.size()) return false;
  auto offset = name.size() - suffix.size();
  for(std::size_t i = 0; i < suffix.size(); ++i) {
    auto a = std::tolower(static_cast<unsigned char>(name[offset + i]));
    auto b = std::tolower(static_cast<unsigned char>(suffix[i]));
    if(a != b) return false;
  }
  return true;
}

ContentStore::ContentStore(std::string json_suffix, bool json_parsing)
  : json_suffix_(std::move(json_suffix)), json_parsing_(json_parsing) {}

bool ContentStore::put(const std::string& filename, CachedContent content) {
  std::lock_guard lg(m_);
  bool inserted = entries_.insert_or_assign(filename, std::move(content)).second;
  if(inserted) ++mutation_count_;
  return inserted;
}

bool ContentStore::replace(const std::string& filename, CachedContent content) {
  std::lock_guard lg(m_);
  auto it = entries_.find(filename);
  if(it == entries_.end()) return false;
  it->second = std::move(content);
  return true;
}

std::optional<CachedContent> ContentStore::erase(const std::string& filename) {
  std::lock_guard lg(m_);
  auto it = entries_.find(filename);
  if(it == entries_.end()) return std::nullopt;
  CachedContent prior = std::move(it->second);
  entries_.erase(it);
  ++mutation_count_;
  return prior;
}

std::optional<CachedContent> ContentStore::get(const std::string& filename) const {
  std::lock_guard lg(m_);
  auto it = entries_.find(filename);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

bool ContentStore::contains(const std::string& filename) const {
  std::lock_guard lg(m_);
  return entries_.count(filename) > 0;
}

std::size_t ContentStore::size() const {
  std::lock_guard lg(m_);
  return entries_.size();
}

uint64_t ContentStore::mutation_count() const {
  std::lock_guard lg(m_);
  return mutation_count_;
}

std::vector<std::string> ContentStore::keys(uint64_t& version) const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& kv : entries_) out.push_back(kv.first);
  version = mutation_count_;
  return out;
}

void ContentStore::set_json_parsing(bool enabled) {
  json_parsing_.store(enabled);
}

bool ContentStore::json_parsing() const {
  return json_parsing_.load();
}

bool ContentStore::wants_json(const std::string& filename) const {
  return json_parsing() && has_suffix_ci(filename, json_suffix_);
}
