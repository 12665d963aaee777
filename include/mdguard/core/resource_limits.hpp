// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>

namespace mdguard
{
namespace core
{

/// \brief Per-document resource budget. Plain value passed to each warehouse.
struct ResourceLimits
{
  std::size_t maxTokens = 100000;
  std::size_t maxBytes = 10 * 1024 * 1024;
  std::size_t maxNesting = 100;
  /// Budget for one collector callback. Zero runs callbacks inline with no
  /// watchdog.
  std::chrono::milliseconds collectorTimeout{5000};

  /// \brief Preset budgets: "strict", "moderate", "permissive".
  static std::optional<ResourceLimits> forProfile(const std::string &profile)
  {
    ResourceLimits limits;
    if (profile == "strict")
    {
      limits.maxTokens = 50000;
      limits.maxBytes = 100 * 1024;
      limits.maxNesting = 50;
    }
    else if (profile == "moderate")
    {
      limits.maxTokens = 200000;
      limits.maxBytes = 1024 * 1024;
      limits.maxNesting = 100;
    }
    else if (profile == "permissive")
    {
      limits.maxTokens = 1000000;
      limits.maxBytes = 10 * 1024 * 1024;
      limits.maxNesting = 150;
    }
    else
    {
      return std::nullopt;
    }
    return limits;
  }
};

/// \brief Dispatch behaviour switches.
struct DispatchOptions
{
  /// Re-raise collector exceptions out of dispatchAll() as CollectorFailure
  /// after recording them.
  bool raiseOnCollectorError = false;
};

/// \brief Fail-fast admission gate run before any expensive work.
class ResourceAdmission
{
public:
  /// \throws DocumentTooLarge
  static void check(std::size_t tokenCount, std::size_t byteLength, const ResourceLimits &limits)
  {
    if (tokenCount > limits.maxTokens)
    {
      MDGUARD_LOG_WARN("Admission rejected: " << tokenCount << " tokens > " << limits.maxTokens);
      throw DocumentTooLarge(DocumentTooLarge::Resource::Tokens, tokenCount, limits.maxTokens);
    }
    if (byteLength > limits.maxBytes)
    {
      MDGUARD_LOG_WARN("Admission rejected: " << byteLength << " bytes > " << limits.maxBytes);
      throw DocumentTooLarge(DocumentTooLarge::Resource::Bytes, byteLength, limits.maxBytes);
    }
  }

  static bool admits(std::size_t tokenCount, std::size_t byteLength,
                     const ResourceLimits &limits) noexcept
  {
    return tokenCount <= limits.maxTokens && byteLength <= limits.maxBytes;
  }
};

} // namespace core
} // namespace mdguard
