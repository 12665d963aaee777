// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <mdguard/core/json.hpp>

namespace mdguard
{
namespace tokens
{

class RawToken;
using RawTokenPtr = std::shared_ptr<const RawToken>;
using RawTokenList = std::vector<RawTokenPtr>;
using AttrList = std::vector<std::pair<std::string, std::string>>;
/// Source lines [start, end) as reported by the producer, unvalidated.
using RawLineMap = std::pair<std::int64_t, std::int64_t>;

/// \brief Token as handed over by a markdown tokenizer.
///
/// Implementations are untrusted: any accessor may throw or return garbage.
/// Only the canonicalizer reads them, and it reads every field in isolation.
class RawToken
{
public:
  virtual ~RawToken() = default;

  virtual std::string type() const = 0;
  virtual std::string tag() const = 0;
  /// 1 opens a container, -1 closes one, 0 is self-contained.
  virtual int nesting() const = 0;
  virtual std::optional<RawLineMap> map() const = 0;
  virtual int level() const = 0;
  virtual std::string content() const = 0;
  virtual std::string markup() const = 0;
  virtual std::string info() const = 0;
  virtual core::Json meta() const = 0;
  virtual bool block() const = 0;
  virtual bool hidden() const = 0;
  virtual RawTokenList children() const = 0;
  virtual AttrList attrs() const = 0;
};

/// \brief RawToken over a markdown-it style JSON token object.
///
/// Missing optional members read as empty; members of the wrong JSON type
/// throw like any other poisoned field.
class JsonRawToken : public RawToken
{
public:
  explicit JsonRawToken(core::Json token) : _token(std::move(token))
  {
    if (!_token.is_object())
    {
      throw std::invalid_argument("JsonRawToken expects a JSON object");
    }
  }

  /// \brief Adapts a JSON array of token objects. Non-object entries are
  /// skipped.
  static RawTokenList fromJsonArray(const core::Json &tokens)
  {
    RawTokenList result;
    if (!tokens.is_array())
    {
      throw std::invalid_argument("token stream must be a JSON array");
    }
    result.reserve(tokens.size());
    for (const auto &token : tokens)
    {
      if (token.is_object())
      {
        result.push_back(std::make_shared<JsonRawToken>(token));
      }
    }
    return result;
  }

  std::string type() const override { return _token.at("type").get<std::string>(); }
  std::string tag() const override { return stringMember("tag"); }
  int nesting() const override { return intMember("nesting"); }
  int level() const override { return intMember("level"); }
  std::string content() const override { return stringMember("content"); }
  std::string markup() const override { return stringMember("markup"); }
  std::string info() const override { return stringMember("info"); }
  bool block() const override { return boolMember("block"); }
  bool hidden() const override { return boolMember("hidden"); }

  std::optional<RawLineMap> map() const override
  {
    auto it = _token.find("map");
    if (it == _token.end() || it->is_null())
    {
      return std::nullopt;
    }
    const auto &m = *it;
    if (!m.is_array() || m.size() != 2)
    {
      throw std::invalid_argument("map must be a two element array");
    }
    return RawLineMap(m.at(0).get<std::int64_t>(), m.at(1).get<std::int64_t>());
  }

  core::Json meta() const override
  {
    auto it = _token.find("meta");
    return it == _token.end() ? core::Json() : *it;
  }

  RawTokenList children() const override
  {
    auto it = _token.find("children");
    if (it == _token.end() || it->is_null())
    {
      return {};
    }
    return fromJsonArray(*it);
  }

  AttrList attrs() const override
  {
    AttrList result;
    auto it = _token.find("attrs");
    if (it == _token.end() || it->is_null())
    {
      return result;
    }
    if (it->is_object())
    {
      for (auto attr = it->begin(); attr != it->end(); ++attr)
      {
        result.emplace_back(attr.key(), attr.value().get<std::string>());
      }
      return result;
    }
    for (const auto &pair : *it)
    {
      result.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
    }
    return result;
  }

private:
  core::Json _token;

  std::string stringMember(const char *key) const
  {
    auto it = _token.find(key);
    return it == _token.end() || it->is_null() ? std::string() : it->get<std::string>();
  }

  int intMember(const char *key) const
  {
    auto it = _token.find(key);
    return it == _token.end() ? 0 : it->get<int>();
  }

  bool boolMember(const char *key) const
  {
    auto it = _token.find(key);
    return it == _token.end() ? false : it->get<bool>();
  }
};

} // namespace tokens
} // namespace mdguard
