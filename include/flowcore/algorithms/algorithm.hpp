// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <flowcore/data/settings.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flowcore::algorithms {

/**
 * @brief Base class for configurable algorithms
 *
 * Provides a run() method that locks the settings and delegates to
 * _run_impl(). Settings can be modified freely until the first run; after
 * that every modification throws data::SettingsAreLocked.
 *
 * @tparam Derived The derived algorithm interface, e.g. ContractionEngine
 * @tparam ReturnType The return type of run() and _run_impl()
 * @tparam Args Input argument types of run()
 *
 * Usage:
 * @code
 * class ContractionEngine
 *     : public Algorithm<ContractionEngine, data::Operand,
 *                        const data::Operand&, const data::Operand&,
 *                        const ContractionOptions&> {
 *  protected:
 *   data::Operand _run_impl(const data::Operand& a, const data::Operand& b,
 *                           const ContractionOptions& options) const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock the settings and run the algorithm
   *
   * @param args Arguments forwarded to _run_impl()
   * @return The result of _run_impl()
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /**
   * @brief Access the algorithm's settings
   */
  data::Settings& settings() { return *_settings; }

  const data::Settings& settings() const { return *_settings; }

  /**
   * @brief Primary registry name of the implementation
   */
  virtual std::string name() const = 0;

  /**
   * @brief All registry names of the implementation, including name()
   */
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /**
   * @brief Name of the algorithm family, shared by all implementations
   */
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  /**
   * @brief Algorithm body, called by run() with the settings locked
   */
  virtual ReturnType _run_impl(Args... args) const = 0;

  /**
   * @brief The algorithm's settings, replaced by derived classes
   */
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of algorithm implementations
 *
 * Each instantiation owns its own static registry, populated on first access
 * by Derived::register_default_instances(). Implementations are registered
 * under their name() and every alias.
 *
 * @tparam BaseAlgorithmType Interface all registered implementations derive
 * from
 * @tparam Derived The concrete factory, which provides the static functions
 * algorithm_type_name(), register_default_instances() and
 * default_algorithm_name()
 *
 * Usage:
 * @code
 * auto engine = ContractionEngineFactory::create("reference");
 * @endcode
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create an algorithm instance
   *
   * @param name Registered name or alias; empty selects
   * Derived::default_algorithm_name()
   * @return A new instance with default settings
   * @throws std::runtime_error if the name is not registered
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;

    const auto& reg = registry();
    auto it = reg.find(key);
    if (it == reg.end()) {
      std::string available_keys;
      for (const auto& k : available()) {
        if (!available_keys.empty()) {
          available_keys += ", ";
        }
        available_keys += k;
      }
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() +
                               ": no algorithm named '" + key +
                               "', available options are: " + available_keys);
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and aliases
   *
   * @param func Creator of the implementation
   * @throws std::runtime_error if the implementation belongs to a different
   * algorithm family or any of its names is already registered
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto probe = func();

    if (probe->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": algorithm '" + probe->name() + "' has type " +
          probe->type_name());
    }

    const auto aliases = probe->aliases();
    for (const auto& alias : aliases) {
      if (reg.find(alias) != reg.end()) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() +
                                 ": name '" + alias +
                                 "' is already registered");
      }
    }
    for (const auto& alias : aliases) {
      reg[alias] = func;
    }
  }

  /**
   * @brief Remove a name from the registry
   * @return true if the name was registered
   */
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  /**
   * @brief All registered names, sorted
   */
  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    const auto& reg = registry();
    keys.reserve(reg.size());
    for (const auto& [key, _] : reg) {
      keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  static bool has(const std::string& key) {
    return registry().find(key) != registry().end();
  }

  /**
   * @brief Remove every registered implementation, defaults included
   */
  static void clear() { registry().clear(); }

 protected:
  static std::unordered_map<std::string, functor_type>& registry() {
    static std::unordered_map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace flowcore::algorithms
