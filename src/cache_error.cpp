#include "cache_error.hpp"

namespace {

class CacheCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "dircache"; }

  std::string message(int value) const override {
    switch(static_cast<CacheErrc>(value)) {
      case CacheErrc::json_decode_failed: return "malformed JSON content";
      case CacheErrc::watcher_failed: return "directory watcher unavailable";
      case CacheErrc::already_initialized: return "cache already initialized";
      case CacheErrc::stopped: return "cache stopped";
    }
    return "unknown dircache error";
  }
};

} // namespace

const std::error_category& cache_category() noexcept {
  static const CacheCategory category;
  return category;
}

std::error_code make_error_code(CacheErrc e) noexcept {
  return {static_cast<int>(e), cache_category()};
}

std::string CacheFault::describe() const {
  std::string out;
  if(!filename.empty()) {
    out += filename;
    out += ": ";
  }
  out += code ? code.message() : std::string("no error");
  if(!detail.empty()) {
    out += " (";
    out += detail;
    out += ")";
  }
  return out;
}
