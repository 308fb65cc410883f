#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "cache_error.hpp"
#include "cached_content.hpp"

enum class EntryKind { Regular, Directory, Other, Missing };

struct ProbeRequest {
  std::string filename;
  std::filesystem::path path;
  bool decode_json = false;
};

struct ProbeResult {
  std::string filename;
  CachedContent content;           // NoContent unless a regular file was read
  std::optional<CacheFault> fault; // set when the entry could not be resolved

  bool ok() const { return !fault.has_value(); }
};

ProbeRequest make_probe_request(const std::filesystem::path& directory,
                                const std::string& filename,
                                bool decode_json);

// Follows symlinks.
EntryKind probe_entry(const std::filesystem::path& path, std::error_code& ec);

std::string read_entry(const std::filesystem::path& path, std::error_code& ec);

std::optional<nlohmann::json> decode_json(const std::string& raw, std::string& error);

ProbeResult probe_and_read(const ProbeRequest& request);

std::vector<std::string> list_directory(const std::filesystem::path& directory,
                                        std::error_code& ec);
