// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/resource_limits.hpp>
#include <mdguard/parsers/minimal_toml.hpp>
#include <mdguard/security/url_validator.hpp>

namespace mdguard
{
namespace core
{

/// \brief Everything one extraction run can be tuned with.
struct ExtractionConfig
{
  ResourceLimits limits;
  DispatchOptions dispatch;
  security::UrlPolicy linkPolicy{{"http", "https", "mailto"}, true};
  bool allowHtml = false;
  bool sanitizeOnFinalize = false;
  std::size_t maxTables = 1000;
  std::size_t maxCodeBlocks = 2000;
  std::size_t maxListItems = 50000;
  Logger::Level logLevel = Logger::Level::Info;
  std::string logFile;
};

/// \brief Loads and parses TOML configuration files for the library.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws ConfigError when the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Builds a loader over an in-memory document.
  static ConfigLoader fromString(const std::string &text)
  {
    ConfigLoader loader;
    try
    {
      loader._table = parsers::toml::parse(text);
    }
    catch (const parsers::toml::parse_error &ex)
    {
      throw ConfigError(ex.what());
    }
    return loader;
  }

  /// \brief Reloads the configuration from disk. The previous table is kept
  /// when loading fails.
  /// \throws ConfigError
  void reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::runtime_error &ex)
    {
      throw ConfigError(std::string(ex.what()) + " (" + _filename + ")");
    }
    MDGUARD_LOG_DEBUG("Loaded configuration from " << _filename);
  }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      if (auto val = node.template as<T>())
      {
        return val;
      }
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws ConfigError if the key is an array but any element is not a
  /// string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw ConfigError("array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

  /// \brief Maps the [limits], [dispatch], [links], [html], [tables],
  /// [codeblocks], [lists] and [log] tables onto an ExtractionConfig. Missing keys keep defaults.
  /// \throws ConfigError on unknown profiles, wrong types and out-of-range
  /// values.
  ExtractionConfig extractionConfig() const
  {
    ExtractionConfig config;

    if (auto profile = getChecked<std::string>("limits.profile"))
    {
      auto preset = ResourceLimits::forProfile(*profile);
      if (!preset)
      {
        throw ConfigError("unknown limits.profile '" + *profile + "'");
      }
      config.limits = *preset;
    }
    if (auto v = getPositive("limits.max_tokens"))
      config.limits.maxTokens = *v;
    if (auto v = getPositive("limits.max_bytes"))
      config.limits.maxBytes = *v;
    if (auto v = getPositive("limits.max_nesting"))
      config.limits.maxNesting = *v;
    if (auto v = getChecked<int64_t>("limits.collector_timeout_ms"))
    {
      if (*v < 0)
      {
        throw ConfigError("limits.collector_timeout_ms must not be negative");
      }
      config.limits.collectorTimeout = std::chrono::milliseconds(*v);
    }

    if (auto v = getChecked<bool>("dispatch.raise_on_collector_error"))
      config.dispatch.raiseOnCollectorError = *v;

    if (auto v = getChecked<bool>("links.allow_relative"))
      config.linkPolicy.allowRelative = *v;
    if (auto schemes = getStringArray("links.allowed_schemes"))
    {
      config.linkPolicy.allowedSchemes.clear();
      for (const auto &scheme : *schemes)
      {
        config.linkPolicy.allowedSchemes.push_back(security::detail::toLowerAscii(scheme));
      }
    }

    if (auto v = getChecked<bool>("html.allow_html"))
      config.allowHtml = *v;
    if (auto v = getChecked<bool>("html.sanitize_on_finalize"))
      config.sanitizeOnFinalize = *v;

    if (auto v = getPositive("tables.max_tables"))
      config.maxTables = *v;
    if (auto v = getPositive("codeblocks.max_blocks"))
      config.maxCodeBlocks = *v;
    if (auto v = getPositive("lists.max_items"))
      config.maxListItems = *v;

    if (auto level = getChecked<std::string>("log.level"))
      config.logLevel = Logger::levelFromString(*level, config.logLevel);
    if (auto file = getChecked<std::string>("log.file"))
      config.logFile = *file;

    return config;
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  parsers::toml::table _table;

  /// Absent keys are fine; present keys of the wrong type are not.
  template <typename T> std::optional<T> getChecked(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    auto value = get<T>(key);
    if (!value)
    {
      throw ConfigError("wrong type for '" + key + "'");
    }
    return value;
  }

  std::optional<std::size_t> getPositive(const std::string &key) const
  {
    auto value = getChecked<int64_t>(key);
    if (!value)
    {
      return std::nullopt;
    }
    if (*value <= 0)
    {
      throw ConfigError(key + " must be positive, got " + std::to_string(*value));
    }
    return static_cast<std::size_t>(*value);
  }
};

} // namespace core
} // namespace mdguard
