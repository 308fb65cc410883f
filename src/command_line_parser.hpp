#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "dircache",
                             nlohmann::json argv_spec = nlohmann::json::array({
                               {{"index",0},{"key","directory"}},
                               {{"index",1},{"key","filter"}}
                             }));

  bool parse(const std::vector<std::string>& args,
             SettingsManager& settings,
             std::string& error) const;

  void parse(int argc, char* argv[], SettingsManager& settings) const;

  void usage(const SettingsManager& settings) const;

  const std::string& process_name() const { return process_name_; }

private:
  struct Positional {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<Positional> build_positionals(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<Positional> positionals_;
};
