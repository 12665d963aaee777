// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <mdguard/core/json.hpp>
#include <mdguard/index/document_view.hpp>
#include <mdguard/tokens/canonical_token.hpp>

namespace mdguard
{
namespace dispatch
{

/// \brief Which tokens a collector wants to see.
struct Interest
{
  /// Token types to receive. Empty means every type.
  std::set<std::string> types;
  /// Container open types; while one of them is open nothing is delivered.
  std::set<std::string> ignoreInside;

  bool wants(const std::string &type) const { return types.empty() || types.count(type) != 0; }
};

/// \brief Per-invocation dispatch state. Each callback gets its own copy, so
/// a callback still running after its budget never sees later tokens' state.
class DispatchContext
{
public:
  using Stack = std::vector<std::string>;

  DispatchContext() : _stack(std::make_shared<const Stack>()) {}

  DispatchContext(std::shared_ptr<const Stack> stack, std::optional<std::size_t> line,
                  std::shared_ptr<std::atomic<bool>> cancel)
    : _stack(std::move(stack)), _line(line), _cancel(std::move(cancel))
  {
  }

  /// \brief Types of the containers open at this token, outermost first.
  const Stack &stack() const { return *_stack; }

  bool inside(const std::string &containerType) const
  {
    return std::find(_stack->begin(), _stack->end(), containerType) != _stack->end();
  }

  /// \brief Start line of the current token when it has a map.
  std::optional<std::size_t> line() const { return _line; }

  /// \brief Set once this invocation ran out of time. Long-running callbacks
  /// should poll it and return early.
  bool cancelled() const { return _cancel && _cancel->load(std::memory_order_acquire); }

private:
  std::shared_ptr<const Stack> _stack;
  std::optional<std::size_t> _line;
  std::shared_ptr<std::atomic<bool>> _cancel;
};

/// \brief Non-fatal finding a collector reports about the document.
struct CollectorWarning
{
  std::string kind;
  std::string message;
  std::int64_t tokenIndex = -1;
};

/// \brief Pluggable extractor driven by the warehouse.
///
/// Callbacks for one collector are never run concurrently, but they may run
/// on a lane thread rather than the thread that called dispatchAll().
class Collector
{
public:
  Collector(std::string name, Interest interest)
    : _name(std::move(name)), _interest(std::move(interest))
  {
  }

  virtual ~Collector() = default;

  Collector(const Collector &) = delete;
  Collector &operator=(const Collector &) = delete;

  const std::string &name() const { return _name; }
  const Interest &interest() const { return _interest; }

  /// \brief Last filter before onToken(). Runs under the same time budget.
  virtual bool shouldProcess(const tokens::CanonicalToken &, const DispatchContext &,
                             const index::DocumentView &) const
  {
    return true;
  }

  virtual void onToken(std::size_t tokenIndex, const tokens::CanonicalToken &token,
                       const DispatchContext &ctx, const index::DocumentView &view) = 0;

  /// \brief Produces the result list stored under name().
  virtual core::Json finalize(const index::DocumentView &view) = 0;

  std::vector<CollectorWarning> warnings() const
  {
    std::lock_guard<std::mutex> lock(_warningMutex);
    return _warnings;
  }

protected:
  void addWarning(const std::string &kind, const std::string &message,
                  std::int64_t tokenIndex = -1)
  {
    std::lock_guard<std::mutex> lock(_warningMutex);
    _warnings.push_back(CollectorWarning{kind, message, tokenIndex});
  }

private:
  std::string _name;
  Interest _interest;
  mutable std::mutex _warningMutex;
  std::vector<CollectorWarning> _warnings;
};

using CollectorPtr = std::shared_ptr<Collector>;

} // namespace dispatch
} // namespace mdguard
