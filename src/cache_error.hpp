#pragma once

#include <string>
#include <system_error>

enum class CacheErrc {
  json_decode_failed = 1,
  watcher_failed,
  already_initialized,
  stopped
};

const std::error_category& cache_category() noexcept;

std::error_code make_error_code(CacheErrc e) noexcept;

namespace std {
template<>
struct is_error_code_enum<CacheErrc> : true_type {};
} // namespace std

// Empty filename means the fault concerns the whole cache.
struct CacheFault {
  std::string filename;
  std::error_code code;
  std::string detail;

  std::string describe() const;
};
