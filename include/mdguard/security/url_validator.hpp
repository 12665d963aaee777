// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include <idn2.h>

namespace mdguard
{
namespace security
{

/// \brief What a caller context accepts besides the scheme allow-list.
struct UrlPolicy
{
  std::vector<std::string> allowedSchemes{"http", "https", "mailto"};
  /// Scheme-less references ("/docs", "../a.md", "page.html").
  bool allowRelative = false;
};

/// \brief Outcome of validateUrl(). normalized is only meaningful when valid.
struct UrlValidation
{
  bool valid = false;
  std::string normalized;
  std::string scheme;
  std::vector<std::string> warnings;
  std::string reason;
};

namespace detail
{

inline std::string toLowerAscii(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool isAscii(const std::string &s)
{
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

inline bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

/// \brief Byte length of an invisible or control code point starting at pos,
/// or 0. Covers C0/DEL, C1 controls, zero-width characters, bidi controls,
/// word joiner family and the BOM.
inline std::size_t hiddenCodePointAt(const std::string &s, std::size_t pos)
{
  const auto b0 = static_cast<unsigned char>(s[pos]);
  if (b0 < 0x20 || b0 == 0x7F)
    return 1;
  auto byteAt = [&s](std::size_t i) -> unsigned char
  { return i < s.size() ? static_cast<unsigned char>(s[i]) : 0; };
  const unsigned char b1 = byteAt(pos + 1);
  const unsigned char b2 = byteAt(pos + 2);
  if (b0 == 0xC2 && b1 >= 0x80 && b1 <= 0x9F)
    return 2;
  if (b0 == 0xC2 && b1 == 0xAD)
    return 2;
  if (b0 == 0xE2 && b1 == 0x80 && ((b2 >= 0x8B && b2 <= 0x8F) || (b2 >= 0xAA && b2 <= 0xAE)))
    return 3;
  if (b0 == 0xE2 && b1 == 0x81 && ((b2 >= 0xA0 && b2 <= 0xA4) || (b2 >= 0xA6 && b2 <= 0xA9)))
    return 3;
  if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF)
    return 3;
  return 0;
}

/// \brief RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
inline bool isSchemeSyntax(const std::string &s)
{
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
    return false;
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c)
                     { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; });
}

inline bool isProtocolRelative(const std::string &s)
{
  if (s.size() < 2)
    return false;
  const char a = s[0];
  const char b = s[1];
  return (a == '/' || a == '\\') && (b == '/' || b == '\\');
}

inline bool hasXnLabel(const std::string &host)
{
  std::size_t start = 0;
  while (start <= host.size())
  {
    if (host.compare(start, 4, "xn--") == 0)
      return true;
    std::size_t dot = host.find('.', start);
    if (dot == std::string::npos)
      break;
    start = dot + 1;
  }
  return false;
}

/// \brief IDNA2008 lookup (non-transitional). Empty string on failure with
/// the libidn2 message in error.
inline std::string idnaToAscii(const std::string &host, std::string &error)
{
  uint8_t *out = nullptr;
  int rc = idn2_lookup_u8(reinterpret_cast<const uint8_t *>(host.c_str()), &out,
                          IDN2_NFC_INPUT | IDN2_NONTRANSITIONAL);
  if (rc != IDN2_OK)
  {
    error = idn2_strerror(rc);
    return std::string();
  }
  std::string result(reinterpret_cast<const char *>(out));
  idn2_free(out);
  return result;
}

inline bool isHostnameChar(unsigned char c)
{
  return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

inline bool isIpLiteral(const std::string &host)
{
  if (host.size() < 3 || host.front() != '[' || host.back() != ']')
    return false;
  return std::all_of(host.begin() + 1, host.end() - 1,
                     [](unsigned char c) { return std::isxdigit(c) || c == ':' || c == '.'; });
}

} // namespace detail

/// \brief The single URL validation routine. Checks run in order and stop at
/// the first failure:
///   1. control or invisible characters, then trimming, then empty input
///   2. a bare "#fragment" is accepted as-is
///   3. protocol-relative references are rejected
///   4. the scheme must be on the policy allow-list (or relative allowed)
///   5. hosts are lowercased and IDNA-encoded; failure rejects the URL
///   6. every '%' must start a valid percent escape
inline UrlValidation validateUrl(const std::string &raw, const UrlPolicy &policy = UrlPolicy())
{
  UrlValidation result;

  for (std::size_t i = 0; i < raw.size(); ++i)
  {
    if (detail::hiddenCodePointAt(raw, i) != 0)
    {
      result.reason = "Control or invisible character at byte " + std::to_string(i);
      return result;
    }
  }

  std::size_t first = raw.find_first_not_of(' ');
  if (first == std::string::npos)
  {
    result.reason = "Empty URL";
    return result;
  }
  std::size_t last = raw.find_last_not_of(' ');
  std::string url = raw.substr(first, last - first + 1);
  if (url.size() != raw.size())
  {
    result.warnings.push_back("Surrounding whitespace removed");
  }

  if (url[0] == '#')
  {
    result.valid = true;
    result.normalized = url;
    return result;
  }

  if (detail::isProtocolRelative(url))
  {
    result.reason = "Protocol-relative URL";
    return result;
  }

  std::string rest = url;
  std::size_t colon = url.find(':');
  std::size_t delimiter = url.find_first_of("/?#");
  if (colon != std::string::npos && (delimiter == std::string::npos || colon < delimiter) &&
      detail::isSchemeSyntax(url.substr(0, colon)))
  {
    result.scheme = detail::toLowerAscii(url.substr(0, colon));
    rest = url.substr(colon + 1);
  }

  if (result.scheme.empty())
  {
    if (!policy.allowRelative)
    {
      result.reason = "Relative URL not allowed";
      return result;
    }
  }
  else if (std::find(policy.allowedSchemes.begin(), policy.allowedSchemes.end(),
                     result.scheme) == policy.allowedSchemes.end())
  {
    result.reason = "Disallowed scheme: " + result.scheme;
    return result;
  }

  std::string authority;
  std::string tail = rest;
  const bool hasAuthority = !result.scheme.empty() && rest.compare(0, 2, "//") == 0;
  if (hasAuthority)
  {
    std::size_t end = rest.find_first_of("/?#", 2);
    authority = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
    tail = end == std::string::npos ? std::string() : rest.substr(end);
  }

  std::string normalized = result.scheme.empty() ? std::string() : result.scheme + ":";
  if (hasAuthority)
  {
    if (authority.find('\\') != std::string::npos)
    {
      result.reason = "Backslash in authority";
      return result;
    }

    std::string userinfo;
    std::string hostPort = authority;
    std::size_t at = authority.rfind('@');
    if (at != std::string::npos)
    {
      userinfo = authority.substr(0, at);
      hostPort = authority.substr(at + 1);
      result.warnings.push_back("URL contains userinfo");
    }

    std::string host = hostPort;
    std::string port;
    std::size_t portSep = hostPort.rfind(':');
    if (portSep != std::string::npos && hostPort.find(']', portSep) == std::string::npos)
    {
      host = hostPort.substr(0, portSep);
      port = hostPort.substr(portSep + 1);
    }

    if (!port.empty())
    {
      if (port.size() > 5 ||
          !std::all_of(port.begin(), port.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; }) ||
          std::stoul(port) > 65535)
      {
        result.reason = "Invalid port: " + port;
        return result;
      }
    }

    host = detail::toLowerAscii(host);
    if (!host.empty() && !detail::isIpLiteral(host))
    {
      if (!detail::isAscii(host) || detail::hasXnLabel(host))
      {
        std::string error;
        std::string encoded = detail::idnaToAscii(host, error);
        if (encoded.empty())
        {
          result.reason = "IDNA encoding failed: " + error;
          return result;
        }
        host = encoded;
      }
      else if (!std::all_of(host.begin(), host.end(),
                            [](unsigned char c) { return detail::isHostnameChar(c); }))
      {
        result.reason = "Invalid character in host";
        return result;
      }
    }

    if (host.empty() && (result.scheme == "http" || result.scheme == "https"))
    {
      result.reason = "Missing host";
      return result;
    }

    normalized += "//";
    if (!userinfo.empty())
      normalized += userinfo + "@";
    normalized += host;
    if (!port.empty())
      normalized += ":" + port;
  }
  else if (result.scheme == "http" || result.scheme == "https")
  {
    result.reason = "Missing host";
    return result;
  }
  normalized += tail;

  for (std::size_t i = 0; i < normalized.size(); ++i)
  {
    if (normalized[i] != '%')
      continue;
    if (i + 2 >= normalized.size() || !detail::isHexDigit(normalized[i + 1]) ||
        !detail::isHexDigit(normalized[i + 2]))
    {
      result.reason = "Malformed percent-encoding";
      return result;
    }
  }

  result.valid = true;
  result.normalized = normalized;
  return result;
}

} // namespace security
} // namespace mdguard
