///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionPlan.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Declarative description of a volumetric time-lapse and the values derived from it.
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

#include "AcquisitionPlan.h"

#include "ControllerConfig.h"
#include "CoreUtils.h"
#include "Error.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace spim
{

namespace
{

void
Require(bool condition, const std::string& msg)
{
   if (!condition)
      throw SPIMError("Invalid acquisition plan: " + msg, SPIMERR_INVALID_PLAN);
}

bool
IsFinite(double v)
{
   return std::isfinite(v);
}

} // anonymous namespace


void
ValidatePlan(const AcquisitionPlan& plan, unsigned numCameras)
{
   Require(numCameras >= 1, "no camera available");
   Require(plan.numTimePoints >= 1, "at least one time point is required");
   Require(plan.numSlices >= 1, "at least one slice per volume is required");
   Require(plan.numSlices <= MaxSlicesPerVolume,
         "at most " + ToString(MaxSlicesPerVolume) + " slices per volume");
   Require(IsFinite(plan.sliceStepUm), "slice step must be finite");
   Require(std::fabs(plan.sliceStepUm) <= MaxSliceStepUm,
         "slice step must not exceed " + ToString(MaxSliceStepUm) + " um");
   Require(IsFinite(plan.exposureMs) && plan.exposureMs > 0.0,
         "exposure must be positive");
   Require(plan.exposureMs <= MaxExposureMs,
         "exposure must not exceed " + ToString(MaxExposureMs) + " ms");
   Require(IsFinite(plan.laserPulseMs) && plan.laserPulseMs >= 0.0,
         "laser pulse duration must not be negative");
   Require(plan.laserPulseMs <= MaxExposureMs,
         "laser pulse must not exceed " + ToString(MaxExposureMs) + " ms");
   if (plan.hasInterval)
   {
      Require(IsFinite(plan.intervalMs),
            "interval must be finite");
      Require(plan.intervalMs >= 0.0,
            "interval must not be negative");
      Require(plan.intervalMs <= MaxIntervalMs,
            "interval must not exceed " + ToString(MaxIntervalMs) + " ms");
   }

   std::set<std::string> names;
   for (const Channel& ch : plan.channels)
   {
      Require(!ch.name.empty(), "channel name must not be empty");
      Require(names.insert(ch.name).second,
            "duplicate channel " + ToQuotedString(ch.name));
      Require(ch.cameraIndex < numCameras,
            "channel " + ToQuotedString(ch.name) + " uses camera " +
            ToString(ch.cameraIndex) + " but only " + ToString(numCameras) +
            " camera(s) are available");
   }
}


TimingParameters
ComputeTimingParameters(const AcquisitionPlan& plan,
      double cameraMinExposureMs, const ControllerConfig& config)
{
   TimingParameters timing;
   timing.slicesPerVolume = plan.numSlices;
   timing.scanDurationMs = (std::max)(plan.exposureMs, cameraMinExposureMs) +
      config.timing.cameraReadoutMs;
   timing.numRepeats = 1;
   timing.delayBeforeRepeatMs = config.timing.delayBeforeRepeatMs;
   timing.delayBeforeSideMs = config.timing.delayBeforeSideMs;
   if (plan.numSlices > 1)
   {
      const double zRangeUm = (plan.numSlices - 1) * std::fabs(plan.sliceStepUm);
      timing.galvoAmplitudeDeg = zRangeUm /
         config.scanner.sliceCalibrationUmPerDeg;
   }
   return timing;
}


double
EstimateVolumeDurationMs(const TimingParameters& timing)
{
   const double oneVolume = timing.numSides * (timing.delayBeforeSideMs +
      timing.slicesPerVolume * timing.scanDurationMs);
   if (timing.numRepeats == 0)
      return 0.0;
   return timing.numRepeats * oneVolume +
      (timing.numRepeats - 1) * timing.delayBeforeRepeatMs;
}


std::vector<AcquisitionEvent>
GenerateVolumeEvents(const AcquisitionPlan& plan, unsigned timePoint,
      const std::vector<std::string>& cameraLabels)
{
   std::vector<std::string> channelForCamera(cameraLabels.size(),
         DefaultChannelName);
   for (std::size_t cam = 0; cam < cameraLabels.size(); ++cam)
   {
      auto it = std::find_if(plan.channels.begin(), plan.channels.end(),
            [cam](const Channel& ch) { return ch.cameraIndex == cam; });
      if (it != plan.channels.end())
         channelForCamera[cam] = it->name;
   }

   std::vector<AcquisitionEvent> events;
   events.reserve(plan.numSlices * cameraLabels.size());
   for (unsigned slice = 0; slice < plan.numSlices; ++slice)
   {
      for (std::size_t cam = 0; cam < cameraLabels.size(); ++cam)
      {
         AcquisitionEvent e;
         e.timePoint = timePoint;
         e.sliceIndex = slice;
         e.channel = channelForCamera[cam];
         e.cameraLabel = cameraLabels[cam];
         e.zOffsetUm = slice * plan.sliceStepUm;
         events.push_back(e);
      }
   }
   return events;
}

} // namespace spim
