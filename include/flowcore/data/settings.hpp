// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstdint>
#include <flowcore/data/data_class.hpp>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace flowcore::data {

/**
 * @brief Type-safe variant for storing different setting value types
 *
 * All integer types are stored internally as int64_t. Other integer types can
 * be requested via get() with a range-checked conversion.
 */
using SettingValue =
    std::variant<bool, int64_t, double, std::string, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>>;

/**
 * @brief Inclusive [min, max] bounds for a numeric setting
 * @tparam T The type of the bounded value (int64_t or double)
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();  ///< Minimum allowed value
  T max = std::numeric_limits<T>::max();     ///< Maximum allowed value
};

/**
 * @brief Explicit list of allowed values for a setting
 * @tparam T The type of the allowed values (int64_t or std::string)
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;  ///< Values the setting may take
};

/**
 * @brief Type for specifying limits on setting values
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

/**
 * @brief Concept for non-bool integral types
 *
 * These are accepted by set()/get() and stored as int64_t.
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

/**
 * @brief Concept to check if a type is a member of a std::variant
 */
template <typename T, typename Variant>
concept VariantMember = is_variant_member_impl<T, Variant>::value;

/**
 * @brief Concept for types supported by the SettingValue variant
 */
template <typename T>
concept SupportedSettingType =
    VariantMember<T, SettingValue> || NonBoolIntegral<T>;

/**
 * @brief Exception thrown when modification of locked settings is requested
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Exception thrown when a setting is not found
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a setting type conversion fails
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Base class for typed, lockable algorithm configuration
 *
 * The set of keys is fixed by derived classes, which declare every key with
 * set_default() in their constructor. After construction only existing keys
 * can be modified, and only with a value of the same type that satisfies the
 * declared constraint. Algorithms lock their settings when they run.
 *
 * Usage:
 * ```cpp
 * class MySettings : public Settings {
 *  public:
 *   MySettings() {
 *     set_default("num_threads", int64_t(0), "Worker threads",
 *                 BoundConstraint<int64_t>{0, 1024});
 *   }
 * };
 * ```
 */
class Settings : public DataClass {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Get a summary string describing the settings
   */
  std::string get_summary() const override;

  std::string get_data_type_name() const override;

  /**
   * @brief Set a setting value
   * @param key The setting key
   * @param value The setting value; must hold the same alternative as the
   * current value
   * @throws SettingsAreLocked if the settings are locked
   * @throws SettingNotFound if the key was never declared
   * @throws SettingTypeMismatch if the type differs from the declared one
   * @throws std::invalid_argument if the value violates the key's constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Set a setting value from a C-style string
   */
  void set(const std::string& key, const char* value);

  /**
   * @brief Set an integral setting value of any width
   * @throws std::out_of_range if the value cannot be represented as int64_t
   */
  template <NonBoolIntegral Integer>
  void set(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (value > static_cast<std::make_unsigned_t<int64_t>>(
                      std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  /**
   * @brief Get a setting value as variant
   * @throws SettingNotFound if key doesn't exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting value with type checking
   * @tparam T A SettingValue alternative, or any non-bool integral type
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if the stored value has a different type or
   * does not fit in T
   */
  template <SupportedSettingType T>
  T get(const std::string& key) const {
    const SettingValue& stored = _find(key);
    if constexpr (VariantMember<T, SettingValue>) {
      if (const T* value = std::get_if<T>(&stored)) {
        return *value;
      }
    } else {
      if (const int64_t* value = std::get_if<int64_t>(&stored)) {
        if (auto converted = _safe_convert<T>(*value)) {
          return *converted;
        }
      }
    }
    throw SettingTypeMismatch(key, typeid(T).name());
  }

  /**
   * @brief Get a setting value, or a default if the key is not declared or
   * holds a different type
   */
  template <SupportedSettingType T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) {
      return default_value;
    }
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  /**
   * @brief Try to get a setting value, returns an empty optional if the key
   * doesn't exist or holds a different type
   */
  template <typename T>
  std::optional<T> try_get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) {
      return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&it->second)) {
      return *value;
    }
    return std::nullopt;
  }

  /**
   * @brief Check if a setting exists and has the expected type
   */
  template <typename T>
  bool has_type(const std::string& key) const {
    auto it = settings_.find(key);
    return it != settings_.end() && std::holds_alternative<T>(it->second);
  }

  bool has(const std::string& key) const;

  std::vector<std::string> keys() const;

  size_t size() const;

  bool empty() const;

  /**
   * @brief Get a setting value as a string representation
   * @throws SettingNotFound if key doesn't exist
   */
  std::string get_as_string(const std::string& key) const;

  /**
   * @brief Get the type name of a setting value, or "not_found"
   */
  std::string get_type_name(const std::string& key) const;

  const std::map<std::string, SettingValue>& get_all_settings() const;

  bool has_description(const std::string& key) const;

  /**
   * @throws SettingNotFound if the key has no description
   */
  std::string get_description(const std::string& key) const;

  bool has_limits(const std::string& key) const;

  /**
   * @throws SettingNotFound if the key has no limits
   */
  Constraint get_limits(const std::string& key) const;

  /**
   * @brief Validate that all required settings are present
   * @throws SettingNotFound for the first missing key
   */
  void validate_required(const std::vector<std::string>& required_keys) const;

  /**
   * @brief Apply multiple settings atomically
   *
   * Every value is validated before any is written; on failure no setting is
   * modified.
   */
  void update(const std::map<std::string, SettingValue>& updates_map);

  /**
   * @brief Apply multiple settings given as strings
   *
   * Each string is parsed according to the current type of its key:
   * "true"/"false"/"1"/"0"/"yes"/"no"/"on"/"off" for booleans, JSON syntax
   * for numbers and vectors, verbatim for strings.
   */
  void update(const std::map<std::string, std::string>& updates_map);

  /**
   * @brief Apply all values of another Settings object
   */
  void update(const Settings& other_settings);

  /**
   * @brief Lock the settings to prevent further modifications
   */
  void lock() const;

  bool is_locked() const;

  nlohmann::json to_json() const override;

  /**
   * @brief Create settings from JSON
   *
   * The base class accepts any key; derived settings should be populated
   * with update() so that declared types and limits are enforced.
   *
   * @throws std::runtime_error if JSON is malformed
   */
  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);

  /**
   * @brief Save settings to a "<name>.settings.json" file
   */
  void to_json_file(const std::string& filename) const override;

  static std::shared_ptr<Settings> from_json_file(const std::string& filename);

  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<Settings> from_file(const std::string& filename,
                                             const std::string& type);

 protected:
  /**
   * @brief Declare a setting and its default value
   *
   * Only meaningful in derived-class constructors; a key that already exists
   * keeps its value.
   *
   * @throws std::invalid_argument if the constraint type does not fit the
   * value type
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  template <NonBoolIntegral Integer>
  void set_default(const std::string& key, Integer value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt) {
    set_default(key, SettingValue(static_cast<int64_t>(value)),
                std::move(description), std::move(limit));
  }

 private:
  /// Serialization version
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  template <typename TargetT>
  static std::optional<TargetT> _safe_convert(int64_t value) {
    if constexpr (std::is_signed_v<TargetT>) {
      if (value >= static_cast<int64_t>(std::numeric_limits<TargetT>::min()) &&
          value <= static_cast<int64_t>(std::numeric_limits<TargetT>::max())) {
        return static_cast<TargetT>(value);
      }
    } else {
      if (value >= 0 && static_cast<uint64_t>(value) <=
                            std::numeric_limits<TargetT>::max()) {
        return static_cast<TargetT>(value);
      }
    }
    return std::nullopt;
  }

  const SettingValue& _find(const std::string& key) const;

  /**
   * @brief Check type and constraint of a candidate value for a key
   */
  void _validate(const std::string& key, const SettingValue& value) const;

  std::string _to_string(const SettingValue& value) const;

  static nlohmann::json _value_to_json(const SettingValue& value);

  static SettingValue _json_to_value(const nlohmann::json& j);

  SettingValue _parse_string(const std::string& key,
                             const std::string& str_value) const;

  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  /// Flag to indicate if settings are locked
  mutable bool _locked = false;
};

static_assert(DataClassCompliant<Settings>,
              "Settings must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace flowcore::data
