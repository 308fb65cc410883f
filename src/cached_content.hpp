#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <variant>

// Directory entry with no readable file content.
struct NoContent {
  bool operator==(const NoContent&) const { return true; }
  bool operator!=(const NoContent&) const { return false; }
};

using CachedContent = std::variant<NoContent, std::string, nlohmann::json>;

inline bool has_content(const CachedContent& content) {
  return !std::holds_alternative<NoContent>(content);
}

inline const std::string* as_text(const CachedContent& content) {
  return std::get_if<std::string>(&content);
}

inline const nlohmann::json* as_json(const CachedContent& content) {
  return std::get_if<nlohmann::json>(&content);
}

std::size_t content_size(const CachedContent& content);

std::string describe_content(const CachedContent& content, std::size_t max_chars = 80);
