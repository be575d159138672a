///////////////////////////////////////////////////////////////////////////////
// FILE:          ImageSink.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Destination of the images acquired by a run.
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

#include "AcquisitionPlan.h"
#include "RunState.h"

#include "../SPIMDevice/SPIMDevice.h"

#include <string>
#include <vector>

namespace spim
{

struct RunMetadata
{
   unsigned long long runId = 0;
   AcquisitionPlan plan;
   TimingParameters timing;
   std::vector<std::string> cameraLabels; // physical cameras, in event order
   double estimatedVolumeDurationMs = 0.0;
};

struct RunResult
{
   RunState state = RunStateIdle;
   unsigned long completedEvents = 0;
   unsigned long expectedEvents = 0;
   SPIMError::Code errorCode = SPIMERR_OK;
   std::string errorMessage;
};

/**
 * Receives the images of a run.
 *
 * Calls arrive from the run's worker thread: SequenceStarted() once before
 * the first frame, FrameReady() per frame, SequenceEnded() once after the
 * last. FrameReady() must return promptly; a sink that does slow I/O must
 * queue internally. Throwing SPIMError from FrameReady() fails the run.
 *
 * Frames from several physical cameras are interleaved; the event's (and
 * the metadata's) camera label identifies the source.
 */
class ImageSink
{
public:
   virtual ~ImageSink() {}

   virtual void SequenceStarted(const RunMetadata& metadata) = 0;
   virtual void FrameReady(const SPIM::ImageFrame& image,
         const AcquisitionEvent& event,
         const SPIM::FrameMetadata& frameMetadata) = 0;
   virtual void SequenceEnded(const RunResult& result) = 0;
};

} // namespace spim
