// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mdguard
{
namespace core
{

/// \brief Base class for every fatal condition raised by the library.
class MdGuardError : public std::runtime_error
{
public:
  explicit MdGuardError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Raised before any index exists when a document exceeds its budget.
class DocumentTooLarge : public MdGuardError
{
public:
  enum class Resource
  {
    Tokens,
    Bytes
  };

  DocumentTooLarge(Resource resource, std::size_t actual, std::size_t limit)
    : MdGuardError(std::string("Document too large: ") +
                   (resource == Resource::Tokens ? "token count " : "byte size ") +
                   std::to_string(actual) + " exceeds limit of " + std::to_string(limit)),
      _resource(resource),
      _actual(actual),
      _limit(limit)
  {
  }

  Resource resource() const noexcept { return _resource; }
  std::size_t actual() const noexcept { return _actual; }
  std::size_t limit() const noexcept { return _limit; }

private:
  Resource _resource;
  std::size_t _actual;
  std::size_t _limit;
};

/// \brief Raised by the index builder at the first push beyond max nesting.
class NestingTooDeep : public MdGuardError
{
public:
  NestingTooDeep(std::size_t tokenIndex, std::size_t depth, std::size_t limit,
                 const std::string &tokenType)
    : MdGuardError("Nesting depth " + std::to_string(depth) + " exceeds limit of " +
                   std::to_string(limit) + " at token " + std::to_string(tokenIndex) +
                   " (type=" + tokenType + ")"),
      _tokenIndex(tokenIndex),
      _depth(depth),
      _limit(limit)
  {
  }

  std::size_t tokenIndex() const noexcept { return _tokenIndex; }
  std::size_t depth() const noexcept { return _depth; }
  std::size_t limit() const noexcept { return _limit; }

private:
  std::size_t _tokenIndex;
  std::size_t _depth;
  std::size_t _limit;
};

/// \brief dispatchAll() was entered while a dispatch is already running.
class ReentrantDispatchError : public std::logic_error
{
public:
  ReentrantDispatchError()
    : std::logic_error("dispatchAll() called while a dispatch is already in progress")
  {
  }
};

/// \brief dispatchAll() was called on a warehouse that already dispatched.
class DispatchCompletedError : public std::logic_error
{
public:
  DispatchCompletedError()
    : std::logic_error("dispatchAll() is single-use and this warehouse already dispatched")
  {
  }
};

/// \brief Thrown out of dispatchAll() when strict error propagation is on.
class CollectorFailure : public MdGuardError
{
public:
  CollectorFailure(const std::string &collector, std::int64_t tokenIndex,
                   const std::string &detail)
    : MdGuardError("Collector '" + collector + "' failed at token " +
                   std::to_string(tokenIndex) + ": " + detail),
      _collector(collector),
      _tokenIndex(tokenIndex)
  {
  }

  const std::string &collector() const noexcept { return _collector; }
  std::int64_t tokenIndex() const noexcept { return _tokenIndex; }

private:
  std::string _collector;
  std::int64_t _tokenIndex;
};

/// \brief Invalid or out-of-range configuration value.
class ConfigError : public MdGuardError
{
public:
  explicit ConfigError(const std::string &what) : MdGuardError("Configuration error: " + what) {}
};

/// \brief Non-fatal dispatch outcome recorded by the warehouse.
enum class IssueKind
{
  CollectorError,
  CollectorTimeout
};

inline const char *issueKindName(IssueKind kind)
{
  return kind == IssueKind::CollectorError ? "CollectorError" : "CollectorTimeout";
}

/// \brief One (collector, token, kind) record. tokenIndex is -1 when the
/// failure is not tied to a token (finalize).
struct DispatchIssue
{
  std::string collector;
  std::int64_t tokenIndex;
  IssueKind kind;
  std::string detail;
};

} // namespace core
} // namespace mdguard
