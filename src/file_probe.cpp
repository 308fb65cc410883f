#include "file_probe.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>

namespace {

ProbeResult failed(const ProbeRequest& request, std::error_code code, std::string detail) {
  ProbeResult result;
  result.filename = request.filename;
  result.fault = CacheFault{request.filename, code, std::move(detail)};
  return result;
}

bool is_absence(const std::error_code& ec) {
  return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

ProbeRequest make_probe_request(const std::filesystem::path& directory,
                                const std::string& filename,
                                bool decode_json) {
  ProbeRequest request;
  request.filename = filename;
  request.path = directory / filename;
  request.decode_json = decode_json;
  return request;
}

EntryKind probe_entry(const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  auto status = std::filesystem::status(path, ec);
  if(ec) {
    if(is_absence(ec)) ec.clear();
    return EntryKind::Missing;
  }
  switch(status.type()) {
    case std::filesystem::file_type::regular: return EntryKind::Regular;
    case std::filesystem::file_type::directory: return EntryKind::Directory;
    case std::filesystem::file_type::not_found: return EntryKind::Missing;
    default: break;
  }
  return EntryKind::Other;
}

std::string read_entry(const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    return {};
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return {};
  }
  return data;
}

std::optional<nlohmann::json> decode_json(const std::string& raw, std::string& error) {
  try {
    return nlohmann::json::parse(raw);
  } catch(const nlohmann::json::parse_error& e) {
    error = e.what();
    return std::nullopt;
  }
}

ProbeResult probe_and_read(const ProbeRequest& request) {
  std::error_code ec;
  auto kind = probe_entry(request.path, ec);
  if(ec) {
    return failed(request, ec, "probe " + request.path.string());
  }

  ProbeResult result;
  result.filename = request.filename;
  if(kind != EntryKind::Regular) {
    return result;
  }

  auto raw = read_entry(request.path, ec);
  if(ec) {
    // gone between the probe and the read
    if(is_absence(ec)) return result;
    return failed(request, ec, "read " + request.path.string());
  }

  if(!request.decode_json) {
    result.content = CachedContent(std::in_place_type<std::string>, std::move(raw));
    return result;
  }

  std::string error;
  auto decoded = decode_json(raw, error);
  if(!decoded) {
    return failed(request, make_error_code(CacheErrc::json_decode_failed), error);
  }
  result.content = CachedContent(std::in_place_type<nlohmann::json>, std::move(*decoded));
  return result;
}

std::vector<std::string> list_directory(const std::filesystem::path& directory,
                                        std::error_code& ec) {
  ec.clear();
  std::vector<std::string> names;
  std::filesystem::directory_iterator it(directory, ec);
  if(ec) return {};
  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if(ec) return {};
  std::sort(names.begin(), names.end());
  return names;
}
