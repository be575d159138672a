#include <catch2/catch_all.hpp>

#include "RunState.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace spim {

namespace {

RunSnapshot
Snapshot(RunState state, unsigned long completed = 0)
{
   RunSnapshot s;
   s.runId = 7;
   s.state = state;
   s.completedEvents = completed;
   return s;
}

} // anonymous namespace

TEST_CASE("terminal run states", "[RunState]")
{
   CHECK_FALSE(IsTerminalRunState(RunStateIdle));
   CHECK_FALSE(IsTerminalRunState(RunStateRunning));
   CHECK_FALSE(IsTerminalRunState(RunStateDraining));
   CHECK(IsTerminalRunState(RunStateCompleted));
   CHECK(IsTerminalRunState(RunStateCancelled));
   CHECK(IsTerminalRunState(RunStateFailed));
   CHECK(std::string(RunStateName(RunStateArmed)) == "Armed");
}

TEST_CASE("snapshot channel delivers every snapshot in order", "[RunState]")
{
   SnapshotChannel ch(Snapshot(RunStateIdle));
   ch.Publish(Snapshot(RunStateProgramming));
   ch.Publish(Snapshot(RunStateRunning, 3));

   RunSnapshot s;
   REQUIRE(ch.TryReceive(s));
   CHECK(s.state == RunStateIdle);
   REQUIRE(ch.Receive(s, 0));
   CHECK(s.state == RunStateProgramming);
   REQUIRE(ch.TryReceive(s));
   CHECK(s.state == RunStateRunning);
   CHECK(s.completedEvents == 3);
   CHECK_FALSE(ch.TryReceive(s));
   CHECK_FALSE(ch.Receive(s, 10));

   CHECK(ch.Latest().state == RunStateRunning);
}

TEST_CASE("wait for terminal snapshot", "[RunState]")
{
   auto ch = std::make_shared<SnapshotChannel>(Snapshot(RunStateIdle));

   RunSnapshot s;
   CHECK_FALSE(ch->WaitForTerminal(s, 10));

   std::thread producer([ch] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      ch->Publish(Snapshot(RunStateDraining, 5));
      ch->Publish(Snapshot(RunStateCompleted, 5));
   });
   REQUIRE(ch->WaitForTerminal(s, 5000));
   CHECK(s.state == RunStateCompleted);
   CHECK(s.completedEvents == 5);
   producer.join();

   CHECK(ch->WaitForTerminal().state == RunStateCompleted);
}

TEST_CASE("cancel token wakes a waiting thread", "[RunState]")
{
   CancelToken token;
   CHECK_FALSE(token.IsCancelled());
   CHECK_FALSE(token.WaitFor(1.0));

   std::thread canceller([&token] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      token.Cancel();
   });
   const auto start = std::chrono::steady_clock::now();
   CHECK(token.WaitFor(60000.0));
   CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(30));
   canceller.join();

   CHECK(token.IsCancelled());
   CHECK(token.WaitFor(60000.0));
}

TEST_CASE("run handle forwards to its channel and token", "[RunState]")
{
   auto ch = std::make_shared<SnapshotChannel>(Snapshot(RunStateIdle));
   auto token = std::make_shared<CancelToken>();
   RunHandle handle(7, ch, token);

   CHECK(handle.GetRunId() == 7);
   handle.Cancel();
   CHECK(token->IsCancelled());

   ch->Publish(Snapshot(RunStateCancelled));
   CHECK(handle.GetLatestSnapshot().state == RunStateCancelled);
   RunSnapshot s;
   REQUIRE(handle.NextSnapshot(s, 0));
   CHECK(s.state == RunStateIdle);
}

} // namespace spim
