///////////////////////////////////////////////////////////////////////////////
// FILE:          RunState.cpp
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

#include "RunState.h"

#include <chrono>

namespace spim
{

const char*
RunStateName(RunState state)
{
   switch (state)
   {
      case RunStateIdle: return "Idle";
      case RunStateProgramming: return "Programming";
      case RunStateArmed: return "Armed";
      case RunStateRunning: return "Running";
      case RunStateDraining: return "Draining";
      case RunStateCompleted: return "Completed";
      case RunStateCancelled: return "Cancelled";
      case RunStateFailed: return "Failed";
   }
   return "(unknown)";
}


bool
IsTerminalRunState(RunState state)
{
   return state == RunStateCompleted || state == RunStateCancelled ||
      state == RunStateFailed;
}


SnapshotChannel::SnapshotChannel(const RunSnapshot& initial) :
   latest_(initial)
{
   pending_.push_back(initial);
}


void
SnapshotChannel::Publish(const RunSnapshot& snapshot)
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.push_back(snapshot);
      latest_ = snapshot;
   }
   cv_.notify_all();
}


bool
SnapshotChannel::Receive(RunSnapshot& snapshot, long timeoutMs)
{
   std::unique_lock<std::mutex> lock(mutex_);
   if (!cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
            [this] { return !pending_.empty(); }))
      return false;
   snapshot = pending_.front();
   pending_.pop_front();
   return true;
}


bool
SnapshotChannel::TryReceive(RunSnapshot& snapshot)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (pending_.empty())
      return false;
   snapshot = pending_.front();
   pending_.pop_front();
   return true;
}


RunSnapshot
SnapshotChannel::Latest() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return latest_;
}


bool
SnapshotChannel::WaitForTerminal(RunSnapshot& snapshot, long timeoutMs)
{
   std::unique_lock<std::mutex> lock(mutex_);
   if (!cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
            [this] { return IsTerminalRunState(latest_.state); }))
      return false;
   snapshot = latest_;
   return true;
}


RunSnapshot
SnapshotChannel::WaitForTerminal()
{
   std::unique_lock<std::mutex> lock(mutex_);
   cv_.wait(lock, [this] { return IsTerminalRunState(latest_.state); });
   return latest_;
}


void
CancelToken::Cancel()
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
   }
   cv_.notify_all();
}


bool
CancelToken::IsCancelled() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return cancelled_;
}


bool
CancelToken::WaitFor(double timeoutMs)
{
   std::unique_lock<std::mutex> lock(mutex_);
   if (cancelled_ || !(timeoutMs > 0.0))
      return cancelled_;
   auto timeout = std::chrono::duration<double, std::milli>(timeoutMs);
   return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

} // namespace spim
