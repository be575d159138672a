///////////////////////////////////////////////////////////////////////////////
// FILE:          FrameCollectorSink.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Image sink keeping frames in memory.
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

#include "FrameCollectorSink.h"

#include <chrono>

namespace spim
{

FrameCollectorSink::FrameCollectorSink() :
   started_(false),
   ended_(false)
{}


void
FrameCollectorSink::SequenceStarted(const RunMetadata& metadata)
{
   std::lock_guard<std::mutex> lock(mutex_);
   started_ = true;
   ended_ = false;
   runMetadata_ = metadata;
   result_ = RunResult();
   arrivalOrder_.clear();
   index_.clear();
}


void
FrameCollectorSink::FrameReady(const SPIM::ImageFrame& image,
      const AcquisitionEvent& event, const SPIM::FrameMetadata& frameMetadata)
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      StoredFrame stored;
      stored.image = image;
      stored.event = event;
      stored.metadata = frameMetadata;
      index_[Key(event.timePoint, event.sliceIndex, event.cameraLabel)] =
         arrivalOrder_.size();
      arrivalOrder_.push_back(stored);
   }
   cv_.notify_all();
}


void
FrameCollectorSink::SequenceEnded(const RunResult& result)
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      ended_ = true;
      result_ = result;
   }
   cv_.notify_all();
}


bool
FrameCollectorSink::HasStarted() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return started_;
}


bool
FrameCollectorSink::HasEnded() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ended_;
}


RunMetadata
FrameCollectorSink::GetRunMetadata() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return runMetadata_;
}


RunResult
FrameCollectorSink::GetResult() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return result_;
}


std::size_t
FrameCollectorSink::GetFrameCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return arrivalOrder_.size();
}


std::vector<FrameCollectorSink::StoredFrame>
FrameCollectorSink::GetFrames() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return arrivalOrder_;
}


std::vector<FrameCollectorSink::StoredFrame>
FrameCollectorSink::GetFramesForCamera(const std::string& label) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   std::vector<StoredFrame> frames;
   for (const StoredFrame& f : arrivalOrder_)
   {
      if (f.event.cameraLabel == label)
         frames.push_back(f);
   }
   return frames;
}


bool
FrameCollectorSink::GetFrame(unsigned timePoint, unsigned slice,
      const std::string& camera, StoredFrame& frame) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   auto it = index_.find(Key(timePoint, slice, camera));
   if (it == index_.end())
      return false;
   frame = arrivalOrder_[it->second];
   return true;
}


bool
FrameCollectorSink::WaitForFrameCount(std::size_t count, long timeoutMs) const
{
   std::unique_lock<std::mutex> lock(mutex_);
   return cv_.wait_for(lock,
         std::chrono::milliseconds(timeoutMs),
         [this, count] { return arrivalOrder_.size() >= count; });
}

} // namespace spim
