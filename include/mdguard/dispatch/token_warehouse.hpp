// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <mdguard/core/errors.hpp>
#include <mdguard/core/json.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/resource_limits.hpp>
#include <mdguard/dispatch/collector.hpp>
#include <mdguard/dispatch/collector_lane.hpp>
#include <mdguard/index/document_view.hpp>
#include <mdguard/index/index_builder.hpp>
#include <mdguard/tokens/canonical_token.hpp>
#include <mdguard/tokens/raw_token.hpp>

namespace mdguard
{
namespace dispatch
{

enum class DispatchState
{
  Idle,
  Dispatching,
  Done
};

/// \brief Owns one document's canonical tokens, indices and collectors, and
/// runs the single dispatch pass over them.
///
/// Construction is fail-fast: admission runs on the raw token count and
/// source size before anything is copied, then canonicalization and index
/// building. A constructor that throws leaves nothing behind.
///
/// \code
///   TokenWarehouse warehouse(rawTokens, source.size(), limits);
///   warehouse.registerCollector(std::make_shared<collectors::LinksCollector>());
///   warehouse.dispatchAll();
///   const auto &links = warehouse.results().at("links");
/// \endcode
class TokenWarehouse
{
public:
  /// \throws core::DocumentTooLarge, core::NestingTooDeep
  TokenWarehouse(const tokens::RawTokenList &rawTokens, std::size_t sourceBytes,
                 const core::ResourceLimits &limits = core::ResourceLimits(),
                 const core::DispatchOptions &options = core::DispatchOptions())
    : _limits(limits), _options(options), _state(DispatchState::Idle)
  {
    core::ResourceAdmission::check(rawTokens.size(), sourceBytes, _limits);
    auto canonical = tokens::Canonicalizer::canonicalizeAll(rawTokens, _limits.maxTokens);
    auto documentIndex = index::IndexBuilder::build(canonical, _limits);
    _view = std::make_shared<const index::DocumentView>(std::move(canonical),
                                                        std::move(documentIndex));
  }

  TokenWarehouse(const TokenWarehouse &) = delete;
  TokenWarehouse &operator=(const TokenWarehouse &) = delete;

  /// \throws std::invalid_argument for null or duplicate-name collectors,
  /// std::logic_error once dispatch has started.
  void registerCollector(CollectorPtr collector)
  {
    if (!collector)
    {
      throw std::invalid_argument("registerCollector() requires a collector");
    }
    if (_state.load(std::memory_order_acquire) != DispatchState::Idle)
    {
      throw std::logic_error("collectors must be registered before dispatchAll()");
    }
    for (const auto &existing : _collectors)
    {
      if (existing->name() == collector->name())
      {
        throw std::invalid_argument("duplicate collector name '" + collector->name() + "'");
      }
    }
    _collectors.push_back(std::move(collector));
  }

  /// \brief Visits every token once, in order, delivering it to interested
  /// collectors in registration order, then finalizes each collector.
  ///
  /// Single use. Collector exceptions and overruns become DispatchIssues;
  /// with raiseOnCollectorError the first collector exception is rethrown as
  /// CollectorFailure after it has been recorded.
  /// \throws core::ReentrantDispatchError while a dispatch is running,
  /// core::DispatchCompletedError after one has finished.
  void dispatchAll()
  {
    DispatchState expected = DispatchState::Idle;
    if (!_state.compare_exchange_strong(expected, DispatchState::Dispatching,
                                        std::memory_order_acq_rel))
    {
      if (expected == DispatchState::Dispatching)
      {
        throw core::ReentrantDispatchError();
      }
      throw core::DispatchCompletedError();
    }
    StateGuard guard(_state);

    const auto started = std::chrono::steady_clock::now();
    std::vector<Slot> slots;
    slots.reserve(_collectors.size());
    for (const auto &collector : _collectors)
    {
      Slot slot;
      slot.collector = collector;
      if (_limits.collectorTimeout.count() > 0)
      {
        slot.lane = std::make_unique<CollectorLane>(collector->name());
      }
      slots.push_back(std::move(slot));
    }

    visitTokens(slots);
    drainLanes(slots);
    finalizeAll(slots);

    for (auto &slot : slots)
    {
      if (slot.lane)
      {
        slot.lane->shutdown(std::chrono::milliseconds(100));
      }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
    MDGUARD_LOG_DEBUG("Dispatched " << _view->size() << " tokens to " << slots.size()
                                    << " collectors in " << elapsed.count() << " ms, "
                                    << _issues.size() << " issue(s)");
  }

  DispatchState state() const { return _state.load(std::memory_order_acquire); }

  /// \brief Collector name -> finalize() output. Collectors whose finalize
  /// failed or was skipped have no entry.
  const std::map<std::string, core::Json> &results() const { return _results; }

  const std::vector<core::DispatchIssue> &issues() const { return _issues; }

  const std::vector<CollectorPtr> &collectors() const { return _collectors; }

  const index::DocumentView &view() const { return *_view; }
  index::DocumentViewPtr viewPtr() const { return _view; }

  const core::ResourceLimits &limits() const { return _limits; }
  const core::DispatchOptions &options() const { return _options; }

private:
  struct Pending
  {
    std::int64_t tokenIndex;
    std::future<void> future;
    std::shared_ptr<std::atomic<bool>> cancel;
    bool timedOut;
  };

  struct Slot
  {
    CollectorPtr collector;
    std::unique_ptr<CollectorLane> lane;
    /// Invocations not yet settled, oldest first. Non-empty means lagging.
    std::deque<Pending> pending;
    bool abandoned = false;
  };

  class StateGuard
  {
  public:
    explicit StateGuard(std::atomic<DispatchState> &state) : _state(state) {}
    ~StateGuard() { _state.store(DispatchState::Done, std::memory_order_release); }

    StateGuard(const StateGuard &) = delete;
    StateGuard &operator=(const StateGuard &) = delete;

  private:
    std::atomic<DispatchState> &_state;
  };

  core::ResourceLimits _limits;
  core::DispatchOptions _options;
  std::atomic<DispatchState> _state;
  index::DocumentViewPtr _view;
  std::vector<CollectorPtr> _collectors;
  std::vector<core::DispatchIssue> _issues;
  std::map<std::string, core::Json> _results;

  void visitTokens(std::vector<Slot> &slots)
  {
    const auto &view = *_view;
    auto stack = std::make_shared<const DispatchContext::Stack>();
    std::unordered_map<std::string, std::size_t> openCounts;
    std::unordered_map<std::string, std::vector<std::size_t>> routing;

    for (std::size_t i = 0; i < view.size(); ++i)
    {
      const auto &token = view.token(i);

      if (token.nesting() == 1)
      {
        auto grown = std::make_shared<DispatchContext::Stack>(*stack);
        grown->push_back(token.type());
        stack = std::move(grown);
        ++openCounts[token.type()];
      }
      else if (token.nesting() == -1 && !stack->empty())
      {
        auto shrunk = std::make_shared<DispatchContext::Stack>(*stack);
        --openCounts[shrunk->back()];
        shrunk->pop_back();
        stack = std::move(shrunk);
      }

      auto route = routing.find(token.type());
      if (route == routing.end())
      {
        std::vector<std::size_t> targets;
        for (std::size_t s = 0; s < slots.size(); ++s)
        {
          if (slots[s].collector->interest().wants(token.type()))
            targets.push_back(s);
        }
        route = routing.emplace(token.type(), std::move(targets)).first;
      }

      std::optional<std::size_t> line;
      if (token.map())
        line = token.map()->start;

      for (std::size_t s : route->second)
      {
        Slot &slot = slots[s];
        if (suppressed(slot, openCounts))
          continue;
        invoke(slot, i, stack, line);
      }
    }
  }

  static bool suppressed(const Slot &slot,
                         const std::unordered_map<std::string, std::size_t> &openCounts)
  {
    for (const auto &container : slot.collector->interest().ignoreInside)
    {
      auto it = openCounts.find(container);
      if (it != openCounts.end() && it->second > 0)
        return true;
    }
    return false;
  }

  void invoke(Slot &slot, std::size_t tokenIndex,
              const std::shared_ptr<const DispatchContext::Stack> &stack,
              std::optional<std::size_t> line)
  {
    auto collector = slot.collector;
    auto view = _view;

    if (!slot.lane)
    {
      const DispatchContext ctx(stack, line, nullptr);
      const auto &token = view->token(tokenIndex);
      try
      {
        if (collector->shouldProcess(token, ctx, *view))
          collector->onToken(tokenIndex, token, ctx, *view);
      }
      catch (const core::ReentrantDispatchError &)
      {
        throw;
      }
      catch (const std::exception &ex)
      {
        recordError(slot, static_cast<std::int64_t>(tokenIndex), ex.what());
      }
      catch (...)
      {
        recordError(slot, static_cast<std::int64_t>(tokenIndex), "non-standard exception");
      }
      return;
    }

    harvest(slot);

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    const DispatchContext laneCtx(stack, line, cancel);
    auto future = slot.lane->submit(
      [collector, view, tokenIndex, laneCtx]()
      {
        const auto &token = view->token(tokenIndex);
        if (collector->shouldProcess(token, laneCtx, *view))
          collector->onToken(tokenIndex, token, laneCtx, *view);
      });

    const auto index = static_cast<std::int64_t>(tokenIndex);
    if (!slot.pending.empty())
    {
      // Lagging behind an overrun: queue in order, do not wait.
      slot.pending.push_back(Pending{index, std::move(future), cancel, false});
      return;
    }

    if (future.wait_for(_limits.collectorTimeout) == std::future_status::ready)
    {
      settle(slot, index, future);
      return;
    }
    recordTimeout(slot, index);
    cancel->store(true, std::memory_order_release);
    slot.pending.push_back(Pending{index, std::move(future), cancel, true});
  }

  /// Settles pending invocations that have completed, oldest first.
  void harvest(Slot &slot)
  {
    while (!slot.pending.empty() && slot.pending.front().future.wait_for(std::chrono::seconds(0)) ==
                                      std::future_status::ready)
    {
      settlePending(slot, slot.pending.front());
      slot.pending.pop_front();
    }
  }

  void settlePending(Slot &slot, Pending &pending)
  {
    if (!pending.timedOut)
    {
      settle(slot, pending.tokenIndex, pending.future);
      return;
    }
    try
    {
      pending.future.get();
    }
    catch (const core::ReentrantDispatchError &)
    {
      throw;
    }
    catch (const std::exception &ex)
    {
      MDGUARD_LOG_DEBUG("Collector '" << slot.collector->name() << "' failed after timeout at token "
                                      << pending.tokenIndex << ": " << ex.what());
    }
    catch (...)
    {
      MDGUARD_LOG_DEBUG("Collector '" << slot.collector->name() << "' failed after timeout at token "
                                      << pending.tokenIndex);
    }
  }

  void settle(Slot &slot, std::int64_t tokenIndex, std::future<void> &future)
  {
    try
    {
      future.get();
    }
    catch (const core::ReentrantDispatchError &)
    {
      throw;
    }
    catch (const std::exception &ex)
    {
      recordError(slot, tokenIndex, ex.what());
    }
    catch (...)
    {
      recordError(slot, tokenIndex, "non-standard exception");
    }
  }

  /// Waits for lagging lanes up to one shared deadline. A lane still busy at
  /// the deadline is abandoned and its collector is not finalized.
  void drainLanes(std::vector<Slot> &slots)
  {
    const auto deadline = std::chrono::steady_clock::now() + _limits.collectorTimeout;
    for (auto &slot : slots)
    {
      while (!slot.pending.empty())
      {
        Pending &front = slot.pending.front();
        if (front.future.wait_until(deadline) == std::future_status::ready)
        {
          settlePending(slot, front);
          slot.pending.pop_front();
          continue;
        }
        if (!front.timedOut)
        {
          recordTimeout(slot, front.tokenIndex);
        }
        for (auto &pending : slot.pending)
        {
          pending.cancel->store(true, std::memory_order_release);
        }
        slot.pending.clear();
        slot.lane->abandon();
        slot.abandoned = true;
      }
    }
  }

  void finalizeAll(std::vector<Slot> &slots)
  {
    for (auto &slot : slots)
    {
      const auto &name = slot.collector->name();
      if (slot.abandoned)
      {
        MDGUARD_LOG_ERROR("Skipping finalize for abandoned collector '" << name << "'");
        continue;
      }

      auto collector = slot.collector;
      auto view = _view;
      auto output = std::make_shared<core::Json>();
      if (!slot.lane)
      {
        try
        {
          *output = collector->finalize(*view);
          _results[name] = std::move(*output);
        }
        catch (const std::exception &ex)
        {
          recordError(slot, -1, ex.what());
        }
        catch (...)
        {
          recordError(slot, -1, "non-standard exception");
        }
        continue;
      }

      auto future =
        slot.lane->submit([collector, view, output]() { *output = collector->finalize(*view); });
      if (future.wait_for(_limits.collectorTimeout) != std::future_status::ready)
      {
        recordTimeout(slot, -1);
        slot.lane->abandon();
        slot.abandoned = true;
        continue;
      }
      try
      {
        future.get();
        _results[name] = std::move(*output);
      }
      catch (const std::exception &ex)
      {
        recordError(slot, -1, ex.what());
      }
      catch (...)
      {
        recordError(slot, -1, "non-standard exception");
      }
    }
  }

  /// \throws core::CollectorFailure when raiseOnCollectorError is set.
  void recordError(const Slot &slot, std::int64_t tokenIndex, const std::string &detail)
  {
    const auto &name = slot.collector->name();
    MDGUARD_LOG_WARN("Collector '" << name << "' failed at token " << tokenIndex << ": "
                                   << detail);
    _issues.push_back(core::DispatchIssue{name, tokenIndex, core::IssueKind::CollectorError, detail});
    if (_options.raiseOnCollectorError)
    {
      throw core::CollectorFailure(name, tokenIndex, detail);
    }
  }

  void recordTimeout(const Slot &slot, std::int64_t tokenIndex)
  {
    const auto &name = slot.collector->name();
    MDGUARD_LOG_ERROR("Collector '" << name << "' exceeded " << _limits.collectorTimeout.count()
                                    << " ms at token " << tokenIndex);
    _issues.push_back(core::DispatchIssue{
      name, tokenIndex, core::IssueKind::CollectorTimeout,
      "exceeded " + std::to_string(_limits.collectorTimeout.count()) + " ms"});
  }
};

} // namespace dispatch
} // namespace mdguard
