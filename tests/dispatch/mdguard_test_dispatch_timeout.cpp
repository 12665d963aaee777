// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of MdGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace mdguard;
using dispatch::CollectorLane;
using dispatch::TokenWarehouse;
using mdguard::test::CallLog;
using mdguard::test::RecordingCollector;
using mdguard::test::StreamBuilder;

namespace
{
constexpr auto kTimeout = std::chrono::milliseconds(100);

core::ResourceLimits watchdogLimits()
{
  core::ResourceLimits limits;
  limits.collectorTimeout = kTimeout;
  return limits;
}

/// Four paragraphs: tokens 0..11.
tokens::RawTokenList fourParagraphs()
{
  return StreamBuilder()
    .paragraph("a", 0)
    .paragraph("b", 2)
    .paragraph("c", 4)
    .paragraph("d", 6)
    .tokens();
}

std::size_t countIssues(const TokenWarehouse &warehouse, const std::string &collector,
                        core::IssueKind kind)
{
  std::size_t count = 0;
  for (const auto &issue : warehouse.issues())
  {
    if (issue.collector == collector && issue.kind == kind)
      ++count;
  }
  return count;
}

class SlowFinalizeCollector : public dispatch::Collector
{
public:
  explicit SlowFinalizeCollector(std::chrono::milliseconds delay)
    : dispatch::Collector("slow-finalize", dispatch::Interest{{"inline"}, {}}), _delay(delay)
  {
  }

  void onToken(std::size_t, const tokens::CanonicalToken &, const dispatch::DispatchContext &,
               const index::DocumentView &) override
  {
  }

  core::Json finalize(const index::DocumentView &) override
  {
    std::this_thread::sleep_for(_delay);
    return core::Json::array();
  }

private:
  std::chrono::milliseconds _delay;
};
} // namespace

TEST_CASE("CollectorLane runs work in order on one thread", "[dispatch][lane]")
{
  mdguard::test::initializeTestLogging();
  CollectorLane lane("lane");
  REQUIRE(lane.name() == "lane");

  std::vector<int> order;
  std::thread::id first;
  std::thread::id second;
  auto a = lane.submit(
    [&]()
    {
      first = std::this_thread::get_id();
      order.push_back(1);
    });
  auto b = lane.submit(
    [&]()
    {
      second = std::this_thread::get_id();
      order.push_back(2);
    });
  a.get();
  b.get();

  REQUIRE(order == std::vector<int>{1, 2});
  REQUIRE(first == second);
  REQUIRE(first != std::this_thread::get_id());

  SECTION("Exceptions travel through the future")
  {
    auto failing = lane.submit([]() { throw std::runtime_error("lane failure"); });
    REQUIRE_THROWS_WITH(failing.get(), "lane failure");
  }

  SECTION("A closed lane refuses work")
  {
    lane.shutdown(std::chrono::milliseconds(500));
    REQUIRE_THROWS_AS(lane.submit([]() {}), std::logic_error);
  }
}

TEST_CASE("A stalled collector times out without blocking others", "[dispatch][timeout]")
{
  mdguard::test::initializeTestLogging();

  auto log = std::make_shared<CallLog>();
  auto slow = std::make_shared<RecordingCollector>("slow", log);
  slow->stallAt = {1};
  slow->stallFor = std::chrono::milliseconds(3000);
  auto fast = std::make_shared<RecordingCollector>("fast", log);

  TokenWarehouse warehouse(fourParagraphs(), 100, watchdogLimits());
  warehouse.registerCollector(slow);
  warehouse.registerCollector(fast);

  const auto started = std::chrono::steady_clock::now();
  warehouse.dispatchAll();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(elapsed < std::chrono::milliseconds(2000));
  REQUIRE(warehouse.issues().size() == 1);
  const auto &issue = warehouse.issues().front();
  REQUIRE(issue.collector == "slow");
  REQUIRE(issue.kind == core::IssueKind::CollectorTimeout);
  REQUIRE(issue.tokenIndex == 1);
  REQUIRE(issue.detail == "exceeded 100 ms");

  REQUIRE(log->indicesFor("fast").size() == 12);
  REQUIRE(warehouse.results().count("fast") == 1);

  SECTION("The cancellation flag lets the callback return early")
  {
    REQUIRE(slow->cancelledSeen.load() == 1);
    // Later tokens were queued behind the overrun and still delivered.
    REQUIRE(log->indicesFor("slow").size() == 12);
    REQUIRE(warehouse.results().count("slow") == 1);
  }
}

TEST_CASE("An error after a timeout is not reported twice", "[dispatch][timeout]")
{
  mdguard::test::initializeTestLogging();

  auto log = std::make_shared<CallLog>();
  auto slow = std::make_shared<RecordingCollector>("slow", log);
  slow->stallAt = {4};
  slow->throwAt = {4};
  slow->stallFor = std::chrono::milliseconds(3000);

  TokenWarehouse warehouse(fourParagraphs(), 100, watchdogLimits());
  warehouse.registerCollector(slow);
  warehouse.dispatchAll();

  REQUIRE(warehouse.issues().size() == 1);
  REQUIRE(countIssues(warehouse, "slow", core::IssueKind::CollectorTimeout) == 1);
  REQUIRE(countIssues(warehouse, "slow", core::IssueKind::CollectorError) == 0);
  REQUIRE(warehouse.issues().front().tokenIndex == 4);
}

TEST_CASE("A collector that ignores cancellation is abandoned", "[dispatch][timeout]")
{
  mdguard::test::initializeTestLogging();

  auto log = std::make_shared<CallLog>();
  auto stuck = std::make_shared<RecordingCollector>("stuck", log);
  stuck->stallAt = {1};
  stuck->stallFor = std::chrono::milliseconds(800);
  stuck->honourCancel = false;
  auto fast = std::make_shared<RecordingCollector>("fast", log);

  {
    TokenWarehouse warehouse(fourParagraphs(), 100, watchdogLimits());
    warehouse.registerCollector(stuck);
    warehouse.registerCollector(fast);

    const auto started = std::chrono::steady_clock::now();
    warehouse.dispatchAll();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::milliseconds(700));
    REQUIRE(warehouse.issues().size() == 1);
    REQUIRE(countIssues(warehouse, "stuck", core::IssueKind::CollectorTimeout) == 1);
    REQUIRE(warehouse.results().count("stuck") == 0);
    REQUIRE(warehouse.results().count("fast") == 1);
    REQUIRE(log->indicesFor("fast").size() == 12);
  }

  // The detached worker finishes its current callback and exits.
  std::this_thread::sleep_for(std::chrono::milliseconds(1000));
  REQUIRE(log->indicesFor("stuck") == std::vector<std::size_t>{0, 1});
}

TEST_CASE("finalize runs under the same budget", "[dispatch][timeout]")
{
  mdguard::test::initializeTestLogging();

  auto slow = std::make_shared<SlowFinalizeCollector>(std::chrono::milliseconds(600));
  auto log = std::make_shared<CallLog>();

  {
    TokenWarehouse warehouse(fourParagraphs(), 100, watchdogLimits());
    warehouse.registerCollector(slow);
    warehouse.registerCollector(std::make_shared<RecordingCollector>("fast", log));
    warehouse.dispatchAll();

    REQUIRE(warehouse.issues().size() == 1);
    REQUIRE(warehouse.issues()[0].collector == "slow-finalize");
    REQUIRE(warehouse.issues()[0].kind == core::IssueKind::CollectorTimeout);
    REQUIRE(warehouse.issues()[0].tokenIndex == -1);
    REQUIRE(warehouse.results().count("slow-finalize") == 0);
    REQUIRE(warehouse.results().count("fast") == 1);
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(700));
}

TEST_CASE("A zero budget runs callbacks on the dispatching thread", "[dispatch][timeout]")
{
  auto log = std::make_shared<CallLog>();
  auto recorder = std::make_shared<RecordingCollector>("recorder", log);
  std::atomic<bool> sameThread{true};
  const auto caller = std::this_thread::get_id();
  recorder->hook = [&](std::size_t)
  {
    if (std::this_thread::get_id() != caller)
      sameThread = false;
  };

  SECTION("Inline without a watchdog")
  {
    TokenWarehouse warehouse(fourParagraphs(), 100, mdguard::test::inlineLimits());
    warehouse.registerCollector(recorder);
    warehouse.dispatchAll();
    REQUIRE(sameThread.load());
  }

  SECTION("On a lane with a watchdog")
  {
    TokenWarehouse warehouse(fourParagraphs(), 100, watchdogLimits());
    warehouse.registerCollector(recorder);
    warehouse.dispatchAll();
    REQUIRE_FALSE(sameThread.load());
  }
}
