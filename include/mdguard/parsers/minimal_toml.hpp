// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mdguard
{
namespace parsers
{
namespace toml
{

/// Subset of TOML used by configuration files: [tables], dotted table
/// names, key = value with strings, integers, floats, booleans and
/// single-line or multi-line arrays, and # comments.

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
    : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + what),
      _line(line)
  {
  }

  std::size_t line() const noexcept { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed read. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_value))
        return *d;
      if (auto *i = std::get_if<int64_t>(&_value))
        return static_cast<double>(*i);
    }
    else
    {
      if (auto *v = std::get_if<T>(&_value))
        return *v;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table()
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Returns false when the key already exists.
  bool insert(const std::string &key, node value)
  {
    return _values.emplace(key, std::move(value)).second;
  }

  /// \brief Resolve "a.b.c"; an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? std::string::npos
                                                                           : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      if (dot == std::string::npos)
        return it->second;
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;
    while (true)
    {
      skipBlank();
      if (isEnd())
        break;
      if (peek() == '[')
      {
        current = openTable(root, parseHeader());
      }
      else
      {
        std::string key = parseKey();
        skipInline();
        if (peek() != '=')
          fail("expected '=' after key '" + key + "'");
        advance();
        skipInline();
        node value(parseValue());
        if (!current->insert(key, std::move(value)))
          fail("duplicate key '" + key + "'");
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void skipInline()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
      while (!isEnd() && peek() != '\n')
        advance();
  }

  /// Whitespace, newlines and comments.
  void skipBlank()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  void expectLineEnd()
  {
    skipInline();
    skipComment();
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      fail(std::string("unexpected character '") + peek() + "'");
  }

  std::string parseHeader()
  {
    advance();
    std::string name;
    while (!isEnd() && peek() != ']' && peek() != '\n')
      name += advance();
    if (peek() != ']')
      fail("unterminated table header");
    advance();
    if (name.empty())
      fail("empty table header");
    return name;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd())
    {
      char c = peek();
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')
        key += advance();
      else
        break;
    }
    if (key.empty())
      fail("expected key");
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseString()
  {
    const char quote = advance();
    const bool literal = quote == '\'';
    std::string out;
    while (!isEnd() && peek() != quote)
    {
      if (peek() == '\n')
        fail("newline in string");
      char c = advance();
      if (c != '\\' || literal)
      {
        out += c;
        continue;
      }
      char esc = advance();
      switch (esc)
      {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case '\\':
      case '"':
        out += esc;
        break;
      default:
        fail(std::string("unsupported escape '\\") + esc + "'");
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return out;
  }

  value_type parseArray()
  {
    advance();
    auto arr = std::make_shared<array>();
    skipBlank();
    while (!isEnd() && peek() != ']')
    {
      value_type element = parseValue();
      if (std::holds_alternative<std::shared_ptr<array>>(element))
        fail("nested arrays are not supported");
      arr->push_back(std::move(element));
      skipBlank();
      if (peek() == ',')
      {
        advance();
        skipBlank();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
      fail("unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  value_type parseNumber()
  {
    std::string text;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      text += advance();
    while (!isEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)))
        text += advance();
      else if (c == '_')
        advance();
      else if (c == '.' || c == 'e' || c == 'E' ||
               ((c == '+' || c == '-') && (text.back() == 'e' || text.back() == 'E')))
      {
        isFloat = true;
        text += advance();
      }
      else
        break;
    }
    try
    {
      std::size_t used = 0;
      value_type result;
      if (isFloat)
        result = std::stod(text, &used);
      else
        result = static_cast<int64_t>(std::stoll(text, &used));
      if (used != text.size())
        fail("invalid number '" + text + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + text + "'");
    }
  }

  table *openTable(table &root, const std::string &path)
  {
    table *current = &root;
    std::size_t start = 0;
    while (true)
    {
      std::size_t dot = path.find('.', start);
      std::string part =
        path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
      if (part.empty())
        fail("invalid table name '" + path + "'");
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        fail("'" + part + "' is not a table");
      if (dot == std::string::npos)
        return current;
      start = dot + 1;
    }
  }
};

/// Config files are small; anything larger is rejected before parsing.
constexpr std::size_t MAX_FILE_SIZE = 1024 * 1024;

inline table parse(const std::string &text)
{
  parser p(text);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename, std::ios::binary);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string text = buffer.str();
  if (text.size() > MAX_FILE_SIZE)
    throw std::runtime_error("Configuration file too large: " + filename);
  return parse(text);
}

} // namespace toml
} // namespace parsers
} // namespace mdguard
