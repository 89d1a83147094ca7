#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "sanitizer.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","directory"},            {"aliases", {"dir","d"}},            {"type","string"}, {"default",""},        {"description","Target directory to process"}, {"persistent", false}},
  {{"key","dry_run"},              {"aliases", {"dry","n"}},            {"type","bool"},   {"default",false},     {"description","Simulate changes without renaming files"}, {"persistent", false}},
  {{"key","recursive"},            {"aliases", {"r"}},                  {"type","bool"},   {"default",false},     {"description","Process files in subdirectories"}, {"persistent", true}},
  {{"key","file_types"},           {"aliases", {"types","t"}},          {"type","list"},   {"default",nlohmann::json::array()}, {"description","Only process these extensions, e.g. jpg,png,txt"}, {"persistent", true}},
  {{"key","replacement"},          {"aliases", {"rep"}},                {"type","string"}, {"default","_"},       {"description","Replacement for spaces and invalid characters"}, {"persistent", true}},
  {{"key","illegal_chars"},        {"aliases", {"illegal"}},            {"type","string"}, {"default","<>:\"/\\|?*!"}, {"description","Characters always replaced"}, {"persistent", true}},
  {{"key","reserved_names"},       {"aliases", {"reserved"}},           {"type","list"},   {"default",SanitizationPolicy::default_reserved_names()}, {"description","Base names that get the replacement prefixed"}, {"persistent", true}},
  {{"key","normalize_unicode"},    {"aliases", {"nfkc"}},               {"type","bool"},   {"default",true},      {"description","Apply NFKC normalization before sanitizing"}, {"persistent", true}},
  {{"key","collapse_replacement"}, {"aliases", {"collapse"}},           {"type","bool"},   {"default",true},      {"description","Collapse repeated replacement tokens"}, {"persistent", true}},
  {{"key","max_length"},           {"aliases", {"max"}},                {"type","int"},    {"default",255},       {"description","Maximum filename length in bytes"}, {"persistent", true}},
  {{"key","include_hidden"},       {"aliases", {"hidden","a"}},         {"type","bool"},   {"default",false},     {"description","Also process dot-files and dot-directories (the leading dot is kept)"}, {"persistent", true}},
  {{"key","case_sensitive"},       {"aliases", {"cs"}},                 {"type","bool"},   {"default",false},     {"description","Make extension filtering case-sensitive"}, {"persistent", true}},
  {{"key","threads"},              {"aliases", {"j","workers"}},        {"type","int"},    {"default",0},         {"description","Number of parallel workers (0 = all cores)"}, {"persistent", true}},
  {{"key","backup"},               {"aliases", {"b"}},                  {"type","bool"},   {"default",false},     {"description","Move files through a .scrubname-bak backup name"}, {"persistent", true}},
  {{"key","log_level"},            {"aliases", {"log","l"}},            {"type","string"}, {"default","info"},    {"description","Log level (debug, info, warn, error)"}, {"persistent", true}},
  {{"key","progress"},             {"aliases", {"p"}},                  {"type","bool"},   {"default",true},      {"description","Show a progress meter"}, {"persistent", true}},
  {{"key","progress_meter_size"},  {"aliases", {"meter"}},              {"type","int"},    {"default",40},        {"description","Width of the progress meter in characters"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},            {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  // accept dashed spellings of underscored keys (--dry-run)
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_array()) {
    std::string joined;
    for(const auto& item : value) {
      if(!joined.empty()) joined += ",";
      joined += item.is_string() ? item.get<std::string>() : item.dump();
    }
    return joined;
  }
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "scrubname.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      log_error(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      log_warn(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "list") {
    if(value.is_string()) {
      settings_[spec.key] = split_list(value.get<std::string>());
      return true;
    }
    if(value.is_array() && std::all_of(value.begin(), value.end(),
                                       [](const nlohmann::json& item){ return item.is_string(); })) {
      settings_[spec.key] = value;
      return true;
    }
    error = "expected list of strings";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  if(spec.type == "bool") {
    std::string v = to_lower(trim_copy(value));
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(trim_copy(value), &consumed);
      if(consumed != trim_copy(value).size()) {
        error = "trailing characters in integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    // not trimmed: a replacement token may legitimately be "-" or " "
    return value;
  }
  if(spec.type == "list") {
    return split_list(value);
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
