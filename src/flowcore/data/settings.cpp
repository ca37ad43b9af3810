// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cctype>
#include <flowcore/data/settings.hpp>
#include <flowcore/utils/string_utils.hpp>
#include <sstream>

#include "filename_utils.hpp"
#include "json_serialization.hpp"

namespace flowcore::data {

namespace {

template <typename T>
struct is_vector : std::false_type {};

template <typename T>
struct is_vector<std::vector<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

/// Element type of a vector setting, or the setting type itself
template <typename T>
struct element_type {
  using type = T;
};

template <typename T>
struct element_type<std::vector<T>> {
  using type = T;
};

template <typename T>
std::string format_allowed(const std::vector<T>& allowed) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < allowed.size(); ++i) {
    if (i > 0) oss << ", ";
    if constexpr (std::is_same_v<T, std::string>) {
      oss << "\"" << allowed[i] << "\"";
    } else {
      oss << allowed[i];
    }
  }
  oss << "]";
  return oss.str();
}

/// Check one scalar element against a constraint of a matching element type.
template <typename T>
void check_element(const std::string& key, const T& element,
                   const Constraint& limit) {
  if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
    if (const auto* bound = std::get_if<BoundConstraint<T>>(&limit)) {
      if (element < bound->min || element > bound->max) {
        std::ostringstream range;
        range << "[" << bound->min << ", " << bound->max << "]";
        throw std::invalid_argument("Value for setting '" + key +
                                    "' is out of allowed range. Allowed "
                                    "range: " +
                                    range.str());
      }
    }
  }
  if constexpr (std::is_same_v<T, int64_t> ||
                std::is_same_v<T, std::string>) {
    if (const auto* list = std::get_if<ListConstraint<T>>(&limit)) {
      const auto& allowed = list->allowed_values;
      if (std::find(allowed.begin(), allowed.end(), element) ==
          allowed.end()) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed options. Allowed options: " +
            format_allowed(allowed));
      }
    }
  }
}

bool constraint_fits(const SettingValue& value, const Constraint& limit) {
  return std::visit(
      [&limit](const auto& v) -> bool {
        using ValueType = std::decay_t<decltype(v)>;
        using ElementType = typename element_type<ValueType>::type;
        if constexpr (std::is_same_v<ElementType, int64_t>) {
          return std::holds_alternative<BoundConstraint<int64_t>>(limit) ||
                 std::holds_alternative<ListConstraint<int64_t>>(limit);
        } else if constexpr (std::is_same_v<ElementType, double>) {
          return std::holds_alternative<BoundConstraint<double>>(limit);
        } else if constexpr (std::is_same_v<ElementType, std::string>) {
          return std::holds_alternative<ListConstraint<std::string>>(limit);
        } else {
          return false;
        }
      },
      value);
}

}  // namespace

const SettingValue& Settings::_find(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::_validate(const std::string& key,
                         const SettingValue& value) const {
  const SettingValue& current = _find(key);
  if (value.index() != current.index()) {
    throw SettingTypeMismatch(key, get_type_name(key));
  }

  auto limit_it = limits_.find(key);
  if (limit_it == limits_.end()) {
    return;
  }
  const Constraint& limit = limit_it->second;
  std::visit(
      [&key, &limit](const auto& v) {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (is_vector_v<ValueType>) {
          for (const auto& element : v) {
            check_element(key, element, limit);
          }
        } else if constexpr (!std::is_same_v<ValueType, bool>) {
          check_element(key, v, limit);
        }
      },
      value);
}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  _validate(key, value);
  settings_[key] = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const { return _find(key); }

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(Settings);
}

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";
  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }
  for (const auto& [key, value] : settings_) {
    std::string value_str = _to_string(value);
    if (value_str.length() > 50) {
      value_str = value_str.substr(0, 47) + "...";
    }
    oss << "  " << key << " = " << value_str;
    if (_locked) oss << " (locked)";
    oss << "\n";
  }
  return oss.str();
}

std::string Settings::get_as_string(const std::string& key) const {
  return _to_string(_find(key));
}

std::string Settings::get_type_name(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    return "not_found";
  }
  return std::visit(
      [](const auto& v) -> std::string {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ValueType, bool>) {
          return "bool";
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          return "int64_t";
        } else if constexpr (std::is_same_v<ValueType, double>) {
          return "double";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
          return "vector<int64_t>";
        } else if constexpr (std::is_same_v<ValueType, std::vector<double>>) {
          return "vector<double>";
        } else {
          return "vector<string>";
        }
      },
      it->second);
}

const std::map<std::string, SettingValue>& Settings::get_all_settings() const {
  return settings_;
}

bool Settings::has_description(const std::string& key) const {
  return descriptions_.find(key) != descriptions_.end();
}

std::string Settings::get_description(const std::string& key) const {
  auto it = descriptions_.find(key);
  if (it == descriptions_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.find(key) != limits_.end();
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::validate_required(
    const std::vector<std::string>& required_keys) const {
  for (const auto& key : required_keys) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
  }
}

void Settings::update(const std::map<std::string, SettingValue>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  for (const auto& [key, value] : updates_map) {
    _validate(key, value);
  }
  for (const auto& [key, value] : updates_map) {
    settings_[key] = value;
  }
}

void Settings::update(const std::map<std::string, std::string>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  std::map<std::string, SettingValue> converted;
  for (const auto& [key, str_value] : updates_map) {
    converted[key] = _parse_string(key, str_value);
  }
  update(converted);
}

void Settings::update(const Settings& other_settings) {
  update(other_settings.get_all_settings());
}

void Settings::lock() const { _locked = true; }

bool Settings::is_locked() const { return _locked; }

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit.has_value() && !constraint_fits(value, *limit)) {
    throw std::invalid_argument("Limit type for setting '" + key +
                                "' does not match its value type");
  }
  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = std::move(*description);
  }
  if (limit.has_value()) {
    limits_[key] = std::move(*limit);
  }
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  set_default(key, SettingValue(std::string(value)), std::move(description),
              std::move(limit));
}

std::string Settings::_to_string(const SettingValue& value) const {
  return std::visit(
      [](const auto& v) -> std::string {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ValueType, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<ValueType, double>) {
          std::ostringstream oss;
          oss << std::scientific << v;
          return oss.str();
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          return std::to_string(v);
        } else {
          return format_allowed(v);
        }
      },
      value);
}

nlohmann::json Settings::_value_to_json(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (is_vector_v<ValueType>) {
          if (v.empty()) {
            // Element type of an empty array is not recoverable from JSON
            nlohmann::json typed = nlohmann::json::object();
            typed["__type__"] = "array";
            if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
              typed["__element_type__"] = "int64";
            } else if constexpr (std::is_same_v<ValueType,
                                                std::vector<double>>) {
              typed["__element_type__"] = "double";
            } else {
              typed["__element_type__"] = "string";
            }
            typed["__value__"] = nlohmann::json::array();
            return typed;
          }
        }
        return nlohmann::json(v);
      },
      value);
}

SettingValue Settings::_json_to_value(const nlohmann::json& j) {
  if (j.is_boolean()) {
    return j.get<bool>();
  }
  if (j.is_number_integer()) {
    return j.get<int64_t>();
  }
  if (j.is_number_float()) {
    return j.get<double>();
  }
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (j.is_object() && j.value("__type__", "") == "array") {
    const std::string elem_type = j.value("__element_type__", "");
    if (elem_type == "int64") return std::vector<int64_t>();
    if (elem_type == "double") return std::vector<double>();
    if (elem_type == "string") return std::vector<std::string>();
    throw std::runtime_error("Unsupported typed array element type: " +
                             elem_type);
  }
  if (j.is_array()) {
    if (j.empty() || j[0].is_number_integer()) {
      return j.get<std::vector<int64_t>>();
    }
    if (j[0].is_number_float()) {
      return j.get<std::vector<double>>();
    }
    if (j[0].is_string()) {
      return j.get<std::vector<std::string>>();
    }
    throw std::runtime_error("Unsupported array element type in JSON");
  }
  throw std::runtime_error("Unsupported JSON type");
}

SettingValue Settings::_parse_string(const std::string& key,
                                     const std::string& str_value) const {
  const SettingValue& current = _find(key);
  return std::visit(
      [&](const auto& current_value) -> SettingValue {
        using CurrentType = std::decay_t<decltype(current_value)>;
        if constexpr (std::is_same_v<CurrentType, bool>) {
          std::string lower = str_value;
          std::transform(lower.begin(), lower.end(), lower.begin(),
                         [](unsigned char c) { return std::tolower(c); });
          if (lower == "true" || lower == "1" || lower == "yes" ||
              lower == "on") {
            return true;
          }
          if (lower == "false" || lower == "0" || lower == "no" ||
              lower == "off") {
            return false;
          }
          throw std::runtime_error("Invalid boolean value for setting '" +
                                   key + "': '" + str_value + "'");
        } else if constexpr (std::is_same_v<CurrentType, std::string>) {
          return str_value;
        } else {
          nlohmann::json parsed;
          try {
            parsed = nlohmann::json::parse(str_value);
          } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Invalid value format for setting '" +
                                     key + "': '" + str_value + "' - " +
                                     e.what());
          }
          SettingValue converted = _json_to_value(parsed);
          // Integers are acceptable where a double is expected
          if constexpr (std::is_same_v<CurrentType, double>) {
            if (const auto* as_int = std::get_if<int64_t>(&converted)) {
              return static_cast<double>(*as_int);
            }
          }
          if (!std::holds_alternative<CurrentType>(converted)) {
            throw std::runtime_error("Type mismatch: expected " +
                                     get_type_name(key) + " for setting '" +
                                     key + "'");
          }
          return converted;
        }
      },
      current);
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;

  for (const auto& [key, value] : settings_) {
    json_obj[key] = _value_to_json(value);
  }

  if (!descriptions_.empty()) {
    json_obj["_descriptions"] = descriptions_;
  }
  if (!limits_.empty()) {
    nlohmann::json limits_json = nlohmann::json::object();
    for (const auto& [key, limit] : limits_) {
      std::visit(
          [&limits_json, &key](const auto& l) {
            using LimitType = std::decay_t<decltype(l)>;
            if constexpr (std::is_same_v<LimitType,
                                         BoundConstraint<int64_t>> ||
                          std::is_same_v<LimitType, BoundConstraint<double>>) {
              limits_json[key] = {{"min", l.min}, {"max", l.max}};
            } else {
              limits_json[key] = {{"allowed", l.allowed_values}};
            }
          },
          limit);
    }
    json_obj["_limits"] = limits_json;
  }
  return json_obj;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("Settings JSON must be an object");
  }
  if (json_obj.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj["version"].get<std::string>());
  }

  auto settings = std::make_shared<Settings>();
  for (const auto& [key, value] : json_obj.items()) {
    if (key == "version" || key == "_descriptions" || key == "_limits") {
      continue;
    }
    settings->settings_[key] = _json_to_value(value);
  }

  if (json_obj.contains("_descriptions")) {
    settings->descriptions_ =
        json_obj["_descriptions"].get<std::map<std::string, std::string>>();
  }
  if (json_obj.contains("_limits")) {
    for (const auto& [key, limit_json] : json_obj["_limits"].items()) {
      if (limit_json.contains("min") && limit_json.contains("max")) {
        if (limit_json["min"].is_number_integer()) {
          settings->limits_[key] = BoundConstraint<int64_t>{
              limit_json["min"].get<int64_t>(),
              limit_json["max"].get<int64_t>()};
        } else {
          settings->limits_[key] =
              BoundConstraint<double>{limit_json["min"].get<double>(),
                                      limit_json["max"].get<double>()};
        }
      } else if (limit_json.contains("allowed")) {
        const auto& allowed = limit_json["allowed"];
        if (!allowed.empty() && allowed[0].is_string()) {
          settings->limits_[key] = ListConstraint<std::string>{
              allowed.get<std::vector<std::string>>()};
        } else {
          settings->limits_[key] =
              ListConstraint<int64_t>{allowed.get<std::vector<int64_t>>()};
        }
      } else {
        throw std::runtime_error("Malformed limits for setting '" + key + "'");
      }
    }
  }
  return settings;
}

void Settings::to_json_file(const std::string& filename) const {
  write_json_file(checked_data_filename(filename, "settings"),
                  to_json());
}

std::shared_ptr<Settings> Settings::from_json_file(
    const std::string& filename) {
  return from_json(read_json_file(
      checked_data_filename(filename, "settings"), "Settings"));
}

void Settings::to_file(const std::string& filename,
                       const std::string& type) const {
  if (type != "json") {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json");
  }
  to_json_file(filename);
}

std::shared_ptr<Settings> Settings::from_file(const std::string& filename,
                                              const std::string& type) {
  if (type != "json") {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json");
  }
  return from_json_file(filename);
}

}  // namespace flowcore::data
