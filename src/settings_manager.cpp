#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"

namespace {

SettingsManager::Type parse_type(const std::string& name) {
  if(name == "bool") return SettingsManager::Type::Bool;
  if(name == "int") return SettingsManager::Type::Int;
  if(name == "string") return SettingsManager::Type::String;
  throw std::runtime_error("unsupported setting type '" + name + "'");
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_specs(specification)),
    settings_(nlohmann::json::object()) {
  for(const auto& spec : specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

std::vector<SettingsManager::Spec> SettingsManager::build_specs(const nlohmann::json& specification) {
  std::vector<Spec> result;
  for(const auto& entry : specification) {
    Spec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = parse_type(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

const SettingsManager::Spec* SettingsManager::find_spec(const std::string& token) const {
  auto lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(to_lower(spec.key) == lowered) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == Type::Bool;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::store(const Spec& spec, const nlohmann::json& value, std::string& error) {
  switch(spec.type) {
    case Type::Bool:
      if(value.is_boolean()) {
        settings_[spec.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        settings_[spec.key] = value.get<int>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case Type::Int:
      if(value.is_number_integer()) {
        settings_[spec.key] = value.get<int>();
        return true;
      }
      error = "expected integer";
      return false;
    case Type::String:
      if(value.is_string()) {
        settings_[spec.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  auto clean = trim_copy(value);
  switch(spec->type) {
    case Type::Bool: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*spec, *parsed, error);
    }
    case Type::Int:
      try {
        std::size_t consumed = 0;
        int parsed = std::stoi(clean, &consumed);
        if(consumed != clean.size()) {
          error = "expected integer";
          return false;
        }
        return store(*spec, parsed, error);
      } catch(const std::exception& e) {
        error = e.what();
        return false;
      }
    case Type::String:
      return store(*spec, clean, error);
  }
  error = "unsupported type";
  return false;
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "dircache.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}
