#include "cached_content.hpp"

#include <algorithm>

std::size_t content_size(const CachedContent& content) {
  if(const auto* text = as_text(content)) return text->size();
  if(const auto* json = as_json(content)) return json->dump().size();
  return 0;
}

std::string describe_content(const CachedContent& content, std::size_t max_chars) {
  if(!has_content(content)) return "<no content>";

  std::string rendered;
  if(const auto* json = as_json(content)) {
    rendered = json->dump();
  } else if(const auto* text = as_text(content)) {
    rendered = *text;
    std::replace(rendered.begin(), rendered.end(), '\n', ' ');
  }
  if(max_chars > 3 && rendered.size() > max_chars) {
    rendered.resize(max_chars - 3);
    rendered += "...";
  }
  return rendered;
}
