///////////////////////////////////////////////////////////////////////////////
// FILE:          RunState.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Run state published by the acquisition worker and the handle used to observe and cancel a run.
//
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "Error.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace spim
{

enum RunState
{
   RunStateIdle,
   RunStateProgramming,
   RunStateArmed,
   RunStateRunning,
   RunStateDraining,
   RunStateCompleted,
   RunStateCancelled,
   RunStateFailed,
};

const char* RunStateName(RunState state);
bool IsTerminalRunState(RunState state);


/**
 * Immutable view of a run at one state transition.
 */
struct RunSnapshot
{
   unsigned long long runId = 0;
   RunState state = RunStateIdle;
   unsigned timePoint = 0;
   unsigned long completedEvents = 0;
   unsigned long expectedEvents = 0;
   std::shared_ptr<const SPIMError> error; // set for RunStateFailed
};


/**
 * One-producer channel carrying snapshots from the worker thread to the
 * control context. Keeps every snapshot until it is received, and always
 * remembers the latest one.
 */
class SnapshotChannel
{
   mutable std::mutex mutex_;
   std::condition_variable cv_;
   std::deque<RunSnapshot> pending_;
   RunSnapshot latest_;

public:
   explicit SnapshotChannel(const RunSnapshot& initial);

   void Publish(const RunSnapshot& snapshot);

   // Returns false on timeout
   bool Receive(RunSnapshot& snapshot, long timeoutMs);
   bool TryReceive(RunSnapshot& snapshot);

   RunSnapshot Latest() const;

   // Returns false on timeout
   bool WaitForTerminal(RunSnapshot& snapshot, long timeoutMs);
   RunSnapshot WaitForTerminal();
};


/**
 * Cooperative cancellation flag with an interruptible wait.
 */
class CancelToken
{
   mutable std::mutex mutex_;
   std::condition_variable cv_;
   bool cancelled_;

public:
   CancelToken() : cancelled_(false) {}

   void Cancel();
   bool IsCancelled() const;

   // Sleep up to timeoutMs; returns true (early) if cancelled
   bool WaitFor(double timeoutMs);
};


/**
 * Control-side handle of one run.
 */
class RunHandle
{
   unsigned long long runId_;
   std::shared_ptr<SnapshotChannel> channel_;
   std::shared_ptr<CancelToken> cancel_;

public:
   RunHandle(unsigned long long runId, std::shared_ptr<SnapshotChannel> channel,
         std::shared_ptr<CancelToken> cancel) :
      runId_(runId), channel_(channel), cancel_(cancel)
   {}

   unsigned long long GetRunId() const { return runId_; }

   // Non-blocking. The run stops at the next cancellation point.
   void Cancel() { cancel_->Cancel(); }

   RunSnapshot GetLatestSnapshot() const { return channel_->Latest(); }
   bool NextSnapshot(RunSnapshot& snapshot, long timeoutMs)
   { return channel_->Receive(snapshot, timeoutMs); }

   RunSnapshot WaitForTerminal() { return channel_->WaitForTerminal(); }
   bool WaitForTerminal(RunSnapshot& snapshot, long timeoutMs)
   { return channel_->WaitForTerminal(snapshot, timeoutMs); }
};

} // namespace spim
