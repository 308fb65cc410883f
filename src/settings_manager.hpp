#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","directory"},     {"aliases", {"d","dir"}},        {"type","string"}, {"default","."},     {"description","Directory to mirror"}, {"persistent", true}},
  {{"key","filter"},        {"aliases", {"f","pattern"}},    {"type","string"}, {"default",""},      {"description","Only cache names matching this regular expression"}, {"persistent", true}},
  {{"key","json_parsing"},  {"aliases", {"json","j"}},       {"type","bool"},   {"default",true},    {"description","Decode files ending in json_suffix"}, {"persistent", true}},
  {{"key","json_suffix"},   {"aliases", {"suffix"}},         {"type","string"}, {"default",".json"}, {"description","Suffix (case-insensitive) of files decoded as JSON"}, {"persistent", true}},
  {{"key","io_threads"},    {"aliases", {"threads","t"}},    {"type","int"},    {"default",4},       {"description","Worker threads for probes and reads"}, {"persistent", true}},
  {{"key","print_content"}, {"aliases", {"content","c"}},    {"type","bool"},   {"default",false},   {"description","Print content with each notification"}, {"persistent", true}},
  {{"key","verbose"},       {"aliases", {"v"}},              {"type","bool"},   {"default",false},   {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},          {"aliases", {"h"}},              {"type","bool"},   {"default",false},   {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},          {"aliases", {"persist"}},        {"type","bool"},   {"default",false},   {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Spec {
    std::string key;
    std::vector<std::string> aliases; // lower-case
    Type type = Type::String;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!settings_.contains(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  const std::vector<Spec>& specs() const { return specs_; }
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::optional<bool> parse_bool(const std::string& value);

private:
  static std::vector<Spec> build_specs(const nlohmann::json& specification);
  const Spec* find_spec(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const Spec& spec, const nlohmann::json& value, std::string& error);

  std::vector<Spec> specs_;
  nlohmann::json settings_;
  std::filesystem::path settings_path_override_;
};
