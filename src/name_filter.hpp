#pragma once

#include <functional>
#include <memory>
#include <regex>
#include <string>

// matching() keeps names the pattern matches; excluding() drops names the predicate accepts.
class NameFilter {
public:
  using Predicate = std::function<bool(const std::string& filename)>;

  enum class Kind { All, Pattern, Predicate };

  NameFilter();

  static NameFilter all();
  // Throws std::regex_error for an invalid ECMAScript pattern.
  static NameFilter matching(const std::string& pattern);
  static NameFilter excluding(Predicate predicate);

  bool keep(const std::string& filename) const;

  Kind kind() const { return kind_; }
  const std::string& pattern() const { return pattern_; }

private:
  Kind kind_ = Kind::All;
  std::string pattern_;
  std::function<bool(const std::string&)> keep_;
};
