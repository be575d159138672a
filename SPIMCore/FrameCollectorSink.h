///////////////////////////////////////////////////////////////////////////////
// FILE:          FrameCollectorSink.h
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

#pragma once

#include "ImageSink.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace spim
{

/**
 * Keeps every frame in memory, addressable by (time point, slice, camera).
 * Used for redisplay of acquired slices and in tests.
 */
class FrameCollectorSink : public ImageSink
{
public:
   struct StoredFrame
   {
      SPIM::ImageFrame image;
      AcquisitionEvent event;
      SPIM::FrameMetadata metadata;
   };

private:
   typedef std::tuple<unsigned, unsigned, std::string> Key;

   mutable std::mutex mutex_;
   mutable std::condition_variable cv_;
   bool started_;
   bool ended_;
   RunMetadata runMetadata_;
   RunResult result_;
   std::vector<StoredFrame> arrivalOrder_;
   std::map<Key, std::size_t> index_;

public:
   FrameCollectorSink();

   virtual void SequenceStarted(const RunMetadata& metadata);
   virtual void FrameReady(const SPIM::ImageFrame& image,
         const AcquisitionEvent& event,
         const SPIM::FrameMetadata& frameMetadata);
   virtual void SequenceEnded(const RunResult& result);

   bool HasStarted() const;
   bool HasEnded() const;
   RunMetadata GetRunMetadata() const;
   RunResult GetResult() const;

   std::size_t GetFrameCount() const;
   std::vector<StoredFrame> GetFrames() const;
   std::vector<StoredFrame> GetFramesForCamera(const std::string& label) const;

   // Returns false if no such frame was received
   bool GetFrame(unsigned timePoint, unsigned slice, const std::string& camera,
         StoredFrame& frame) const;

   // Returns false on timeout
   bool WaitForFrameCount(std::size_t count, long timeoutMs) const;
};

} // namespace spim
