#include "name_filter.hpp"

#include <utility>

NameFilter::NameFilter()
  : keep_([](const std::string&){ return true; }) {}

NameFilter NameFilter::all() {
  return NameFilter();
}

NameFilter NameFilter::matching(const std::string& pattern) {
  auto compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
  NameFilter filter;
  filter.kind_ = Kind::Pattern;
  filter.pattern_ = pattern;
  filter.keep_ = [compiled](const std::string& filename) {
    return std::regex_search(filename, *compiled);
  };
  return filter;
}

NameFilter NameFilter::excluding(Predicate predicate) {
  NameFilter filter;
  if(!predicate) return filter;
  filter.kind_ = Kind::Predicate;
  filter.keep_ = [predicate = std::move(predicate)](const std::string& filename) {
    return !predicate(filename);
  };
  return filter;
}

bool NameFilter::keep(const std::string& filename) const {
  return keep_(filename);
}
