// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <mdguard/core/errors.hpp>
#include <mdguard/core/json.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/tokens/raw_token.hpp>

namespace mdguard
{
namespace tokens
{

/// \brief Allowlisted token fields, in read order.
enum class Field : std::uint8_t
{
  Type,
  Tag,
  Nesting,
  Map,
  Level,
  Content,
  Markup,
  Info,
  Meta,
  Block,
  Hidden,
  Children,
  Attrs
};

inline const char *fieldName(Field field)
{
  switch (field)
  {
  case Field::Type:
    return "type";
  case Field::Tag:
    return "tag";
  case Field::Nesting:
    return "nesting";
  case Field::Map:
    return "map";
  case Field::Level:
    return "level";
  case Field::Content:
    return "content";
  case Field::Markup:
    return "markup";
  case Field::Info:
    return "info";
  case Field::Meta:
    return "meta";
  case Field::Block:
    return "block";
  case Field::Hidden:
    return "hidden";
  case Field::Children:
    return "children";
  case Field::Attrs:
    return "attrs";
  }
  return "unknown";
}

/// \brief Normalized source line range: start >= 0 and end >= start.
struct LineRange
{
  std::size_t start = 0;
  std::size_t end = 0;

  bool operator==(const LineRange &other) const
  {
    return start == other.start && end == other.end;
  }
};

/// \brief Passive snapshot of a raw token. Holds plain data only; nothing in
/// it can call back into producer code.
class CanonicalToken
{
public:
  const std::string &type() const { return _type; }
  const std::string &tag() const { return _tag; }
  int nesting() const { return _nesting; }
  const std::optional<LineRange> &map() const { return _map; }
  int level() const { return _level; }
  const std::string &content() const { return _content; }
  const std::string &markup() const { return _markup; }
  const std::string &info() const { return _info; }
  const core::Json &meta() const { return _meta; }
  bool block() const { return _block; }
  bool hidden() const { return _hidden; }
  const std::vector<CanonicalToken> &children() const { return _children; }
  const AttrList &attrs() const { return _attrs; }

  std::optional<std::string> attrGet(const std::string &name) const
  {
    for (const auto &attr : _attrs)
    {
      if (attr.first == name)
        return attr.second;
    }
    return std::nullopt;
  }

  /// \brief False when reading the field from the producer failed.
  bool has(Field field) const { return (_dropMask & bit(field)) == 0; }

  /// \brief Fields whose read failed, in read order.
  std::vector<Field> droppedFields() const
  {
    std::vector<Field> dropped;
    for (auto f = static_cast<std::uint8_t>(Field::Type);
         f <= static_cast<std::uint8_t>(Field::Attrs); ++f)
    {
      if (!has(static_cast<Field>(f)))
        dropped.push_back(static_cast<Field>(f));
    }
    return dropped;
  }

  bool operator==(const CanonicalToken &other) const
  {
    return _type == other._type && _tag == other._tag && _nesting == other._nesting &&
           _map == other._map && _level == other._level && _content == other._content &&
           _markup == other._markup && _info == other._info && _meta == other._meta &&
           _block == other._block && _hidden == other._hidden &&
           _children == other._children && _attrs == other._attrs &&
           _dropMask == other._dropMask;
  }

  bool operator!=(const CanonicalToken &other) const { return !(*this == other); }

private:
  friend class Canonicalizer;

  static std::uint16_t bit(Field field)
  {
    return static_cast<std::uint16_t>(1u << static_cast<unsigned>(field));
  }

  std::string _type;
  std::string _tag;
  int _nesting = 0;
  std::optional<LineRange> _map;
  int _level = 0;
  std::string _content;
  std::string _markup;
  std::string _info;
  core::Json _meta;
  bool _block = false;
  bool _hidden = false;
  std::vector<CanonicalToken> _children;
  AttrList _attrs;
  std::uint16_t _dropMask = 0;
};

/// \brief Turns untrusted RawTokens into CanonicalTokens.
///
/// Every field is read inside its own try block. A read that throws leaves
/// that one field at its default and marks it dropped; the rest of the token
/// is still read. Children are read one level deep only.
class Canonicalizer
{
public:
  static CanonicalToken canonicalize(const RawToken &raw) { return read(raw, true); }

  /// \brief Canonicalizes a whole stream. Null entries are skipped.
  /// \throws core::DocumentTooLarge once top-level plus child tokens exceed
  /// maxTokens.
  static std::vector<CanonicalToken>
  canonicalizeAll(const RawTokenList &raw,
                  std::size_t maxTokens = std::numeric_limits<std::size_t>::max())
  {
    std::vector<CanonicalToken> result;
    result.reserve(raw.size());
    std::size_t total = 0;
    for (const auto &token : raw)
    {
      if (!token)
        continue;
      result.push_back(canonicalize(*token));
      total += 1 + result.back()._children.size();
      if (total > maxTokens)
      {
        MDGUARD_LOG_WARN("Admission rejected during canonicalization: more than "
                         << maxTokens << " tokens including children");
        throw core::DocumentTooLarge(core::DocumentTooLarge::Resource::Tokens, total, maxTokens);
      }
    }
    return result;
  }

  /// \brief Re-canonicalizes snapshots; yields tokens equal to the input.
  static std::vector<CanonicalToken> canonicalizeAll(const std::vector<CanonicalToken> &tokens)
  {
    std::vector<CanonicalToken> result;
    result.reserve(tokens.size());
    for (const auto &token : tokens)
    {
      SnapshotToken view(token);
      result.push_back(canonicalize(view));
    }
    return result;
  }

private:
  /// RawToken face of a snapshot. Dropped fields keep failing so a second
  /// pass drops the same fields.
  class SnapshotToken : public RawToken
  {
  public:
    explicit SnapshotToken(CanonicalToken token) : _token(std::move(token)) {}

    std::string type() const override { return guard(Field::Type, _token.type()); }
    std::string tag() const override { return guard(Field::Tag, _token.tag()); }
    int nesting() const override { return guard(Field::Nesting, _token.nesting()); }
    std::optional<RawLineMap> map() const override
    {
      const auto &m = guard(Field::Map, _token.map());
      if (!m)
        return std::nullopt;
      return RawLineMap(static_cast<std::int64_t>(m->start), static_cast<std::int64_t>(m->end));
    }
    int level() const override { return guard(Field::Level, _token.level()); }
    std::string content() const override { return guard(Field::Content, _token.content()); }
    std::string markup() const override { return guard(Field::Markup, _token.markup()); }
    std::string info() const override { return guard(Field::Info, _token.info()); }
    core::Json meta() const override { return guard(Field::Meta, _token.meta()); }
    bool block() const override { return guard(Field::Block, _token.block()); }
    bool hidden() const override { return guard(Field::Hidden, _token.hidden()); }
    RawTokenList children() const override
    {
      RawTokenList list;
      for (const auto &child : guard(Field::Children, _token.children()))
      {
        list.push_back(std::make_shared<SnapshotToken>(child));
      }
      return list;
    }
    AttrList attrs() const override { return guard(Field::Attrs, _token.attrs()); }

  private:
    CanonicalToken _token;

    template <typename T> const T &guard(Field field, const T &value) const
    {
      if (!_token.has(field))
        throw std::runtime_error(std::string("field was dropped: ") + fieldName(field));
      return value;
    }
  };

  static void readField(CanonicalToken &token, Field field, const std::function<void()> &reader)
  {
    try
    {
      reader();
    }
    catch (const std::exception &ex)
    {
      token._dropMask |= CanonicalToken::bit(field);
      MDGUARD_LOG_DEBUG("Dropped token field '" << fieldName(field) << "': " << ex.what());
    }
    catch (...)
    {
      token._dropMask |= CanonicalToken::bit(field);
      MDGUARD_LOG_DEBUG("Dropped token field '" << fieldName(field)
                                                << "': non-standard exception");
    }
  }

  static CanonicalToken read(const RawToken &raw, bool withChildren)
  {
    CanonicalToken token;
    readField(token, Field::Type, [&] { token._type = raw.type(); });
    readField(token, Field::Tag, [&] { token._tag = raw.tag(); });
    readField(token, Field::Nesting, [&] { token._nesting = raw.nesting(); });
    readField(token, Field::Map, [&] {
      auto m = raw.map();
      if (m)
      {
        std::int64_t start = m->first < 0 ? 0 : m->first;
        std::int64_t end = m->second < start ? start : m->second;
        token._map = LineRange{static_cast<std::size_t>(start), static_cast<std::size_t>(end)};
      }
    });
    readField(token, Field::Level, [&] { token._level = raw.level(); });
    readField(token, Field::Content, [&] { token._content = raw.content(); });
    readField(token, Field::Markup, [&] { token._markup = raw.markup(); });
    readField(token, Field::Info, [&] { token._info = raw.info(); });
    readField(token, Field::Meta, [&] { token._meta = raw.meta(); });
    readField(token, Field::Block, [&] { token._block = raw.block(); });
    readField(token, Field::Hidden, [&] { token._hidden = raw.hidden(); });
    if (withChildren)
    {
      readField(token, Field::Children, [&] {
        RawTokenList children = raw.children();
        std::vector<CanonicalToken> snapshot;
        snapshot.reserve(children.size());
        for (const auto &child : children)
        {
          if (child)
            snapshot.push_back(read(*child, false));
        }
        token._children = std::move(snapshot);
      });
    }
    readField(token, Field::Attrs, [&] { token._attrs = raw.attrs(); });
    return token;
  }
};

} // namespace tokens
} // namespace mdguard
