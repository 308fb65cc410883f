#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    positionals_(build_positionals(argv_spec)) {}

std::vector<CommandLineParser::Positional> CommandLineParser::build_positionals(const nlohmann::json& spec) {
  std::vector<Positional> result;
  for(const auto& entry : spec) {
    Positional out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const Positional& a, const Positional& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      auto resolved = settings.resolve_key(name);
      if(!resolved) {
        error = "Unknown option " + token;
        return false;
      }

      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        // a bare boolean flag means true; an explicit literal may follow
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::parse_bool(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option " + token;
          return false;
        }
        value = args[++i];
      }

      std::string reason;
      if(!settings.set_from_string(*resolved, value, reason)) {
        error = "Invalid value for option " + token + ": " + reason;
        return false;
      }
      continue;
    }

    if(positional_index >= positionals_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& positional = positionals_[positional_index++];
    std::string reason;
    if(!settings.set_from_string(positional.key, token, reason)) {
      error = "Invalid value for " + positional.key + " '" + token + "': " + reason;
      return false;
    }
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string error;
  if(!parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage(settings);
    std::exit(1);
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - mirror a directory's files in memory and report changes", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& positional : positionals_) {
    cmd += " [" + positional.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : settings.specs()) {
    std::string hint;
    std::string default_str;
    switch(spec.type) {
      case SettingsManager::Type::Bool:
        hint = "[true|false]";
        default_str = spec.default_value.get<bool>() ? "true" : "false";
        break;
      case SettingsManager::Type::Int:
        hint = "<int>";
        default_str = spec.default_value.dump();
        break;
      case SettingsManager::Type::String:
        hint = "<string>";
        default_str = spec.default_value.get<std::string>();
        break;
    }
    std::ostringstream aliases;
    if(!spec.aliases.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << spec.aliases[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{:<14} {:<12} {}{} (default: {})",
              spec.key, hint, spec.description, aliases.str(), default_str);
  }
  print_out(nullptr, "");
}
