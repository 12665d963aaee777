// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <mdguard/core/logger.hpp>

namespace mdguard
{
namespace dispatch
{

/// \brief Single worker thread executing one collector's callbacks in FIFO
/// order.
///
/// A running callback cannot be interrupted. When one overruns, the lane can
/// be abandoned: queued work is discarded and the worker thread is detached.
/// The worker only touches the shared lane state and whatever its tasks
/// captured, so it may safely outlive the lane object.
class CollectorLane
{
public:
  explicit CollectorLane(std::string name) : _state(std::make_shared<State>())
  {
    _state->name = std::move(name);
    _worker = std::thread(&CollectorLane::workerLoop, _state);
  }

  ~CollectorLane() { shutdown(std::chrono::milliseconds(100)); }

  CollectorLane(const CollectorLane &) = delete;
  CollectorLane &operator=(const CollectorLane &) = delete;

  const std::string &name() const { return _state->name; }

  /// \brief Queue a callback. The future carries its exception, if any.
  /// \throws std::logic_error when the lane is already closed.
  std::future<void> submit(std::function<void()> work)
  {
    auto task = std::make_shared<std::packaged_task<void()>>(std::move(work));
    auto future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(_state->mutex);
      if (_state->closed)
      {
        throw std::logic_error("CollectorLane '" + _state->name + "' is closed");
      }
      _state->queue.push_back([task]() { (*task)(); });
    }
    _state->condition.notify_one();
    return future;
  }

  /// \brief Drop queued work and let the current callback finish on its own.
  void abandon()
  {
    {
      std::lock_guard<std::mutex> lock(_state->mutex);
      _state->closed = true;
      _state->queue.clear();
    }
    _state->condition.notify_all();
    if (_worker.joinable())
    {
      MDGUARD_LOG_ERROR("Abandoning lane for collector '" << _state->name
                                                          << "', worker thread detached");
      _worker.detach();
    }
  }

  /// \brief Close the lane, discarding queued work, and join the worker if
  /// it exits within grace. Otherwise the worker is detached.
  void shutdown(std::chrono::milliseconds grace)
  {
    if (!_worker.joinable())
    {
      return;
    }
    bool exited = false;
    {
      std::unique_lock<std::mutex> lock(_state->mutex);
      _state->closed = true;
      _state->queue.clear();
      _state->condition.notify_all();
      exited = _state->condition.wait_for(lock, grace, [this]() { return _state->exited; });
    }
    if (exited)
    {
      _worker.join();
    }
    else
    {
      MDGUARD_LOG_DEBUG("Lane for collector '" << _state->name
                                               << "' still busy at shutdown, detaching");
      _worker.detach();
    }
  }

private:
  struct State
  {
    std::string name;
    std::mutex mutex;
    std::condition_variable condition;
    std::deque<std::function<void()>> queue;
    bool closed = false;
    bool exited = false;
  };

  std::shared_ptr<State> _state;
  std::thread _worker;

  static void workerLoop(std::shared_ptr<State> state)
  {
    while (true)
    {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->condition.wait(lock, [&state]() { return state->closed || !state->queue.empty(); });
        if (state->queue.empty())
        {
          break;
        }
        job = std::move(state->queue.front());
        state->queue.pop_front();
      }
      // packaged_task stores any exception in the future.
      job();
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->exited = true;
    state->condition.notify_all();
  }
};

} // namespace dispatch
} // namespace mdguard
