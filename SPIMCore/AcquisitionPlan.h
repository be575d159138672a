///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionPlan.h
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

#pragma once

#include "LogicProgram.h"

#include <string>
#include <vector>

namespace spim
{

struct ControllerConfig;

const char* const DefaultChannelName = "Default";

// Largest values a plan may request
const unsigned MaxSlicesPerVolume = 65535;
const double MaxSliceStepUm = 10000.0;
const double MaxExposureMs = 60000.0;
const double MaxIntervalMs = 24.0 * 60.0 * 60.0 * 1000.0;

struct Channel
{
   std::string name;
   int laserLine;
   unsigned cameraIndex;

   Channel() : laserLine(0), cameraIndex(0) {}
   Channel(const std::string& channelName, int laser, unsigned camera) :
      name(channelName), laserLine(laser), cameraIndex(camera)
   {}
};

/**
 * What to acquire in one run.
 *
 * The engine takes a copy when a run starts; the copy is never modified.
 */
struct AcquisitionPlan
{
   unsigned numTimePoints = 1;
   unsigned numSlices = 1;
   double sliceStepUm = 1.0;
   double exposureMs = 10.0;
   double laserPulseMs = 0.0; // 0: same as exposure
   std::vector<Channel> channels;
   TriggerTopology topology = TriggerTopologySimple;

   // Without an interval, volumes follow each other as fast as possible
   bool hasInterval = false;
   double intervalMs = 0.0;

   void SetInterval(double ms) { hasInterval = true; intervalMs = ms; }
   void ClearInterval() { hasInterval = false; intervalMs = 0.0; }
};

/**
 * Check the plan against the cameras that will acquire it. Throws
 * SPIMError(SPIMERR_INVALID_PLAN) describing the first problem found.
 */
void ValidatePlan(const AcquisitionPlan& plan, unsigned numCameras);


/**
 * Card-facing timing values, recomputed for every run.
 */
struct TimingParameters
{
   unsigned slicesPerVolume = 1;
   unsigned numSides = 1; // events are generated for single-sided scans
   double scanDurationMs = 0.0;
   unsigned numRepeats = 1;
   double delayBeforeRepeatMs = 0.0;
   double delayBeforeSideMs = 0.0;
   double galvoAmplitudeDeg = 0.0;
};

// Time points are started individually, so each programmed volume runs
// exactly once. The scan of a slice lasts as long as the longer of the
// requested and the camera's minimum exposure, plus the readout overhead.
// The galvo sweeps the Z range of the volume, converted to degrees with the
// slice calibration; a single slice does not sweep.
TimingParameters ComputeTimingParameters(const AcquisitionPlan& plan,
      double cameraMinExposureMs, const ControllerConfig& config);

double EstimateVolumeDurationMs(const TimingParameters& timing);


struct AcquisitionEvent
{
   unsigned timePoint;
   unsigned sliceIndex;
   std::string channel;
   std::string cameraLabel;
   double zOffsetUm;

   AcquisitionEvent() : timePoint(0), sliceIndex(0), zOffsetUm(0.0) {}
};

/**
 * Events of one volume, in the order the hardware produces images: for each
 * slice, one event per physical camera.
 *
 * Each camera is assigned the first channel naming it; a camera that no
 * channel names gets DefaultChannelName.
 */
std::vector<AcquisitionEvent> GenerateVolumeEvents(const AcquisitionPlan& plan,
      unsigned timePoint, const std::vector<std::string>& cameraLabels);

} // namespace spim
