///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionEngine.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Runs hardware-timed volumetric acquisitions on a background thread.
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
#include "ControllerConfig.h"
#include "ImageSink.h"
#include "LogManager.h"
#include "RunState.h"
#include "SequenceProgrammer.h"

#include "../SPIMDevice/SPIMDevice.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace spim
{

class DeviceSession;

/**
 * The acquisition worker.
 *
 * Start() validates the plan and returns at once; the run itself executes
 * on a dedicated thread, which is the only user of the device session while
 * the run is active. For each time point the worker programs the cards,
 * starts the scan and drains the camera buffer, matching every image to the
 * next outstanding event of the camera that produced it.
 *
 * At most one run is active at a time.
 */
class AcquisitionEngine
{
   struct RunContext;

   std::shared_ptr<DeviceSession> session_;
   ControllerConfig config_;
   logging::Logger logger_;
   SequenceProgrammer programmer_;

   std::mutex mutex_; // guards camera_, worker_ and run bookkeeping
   std::shared_ptr<SPIM::Camera> camera_;
   std::thread worker_;
   std::shared_ptr<CancelToken> currentCancel_;
   unsigned long long nextRunId_;
   std::atomic<bool> runActive_;

public:
   AcquisitionEngine(std::shared_ptr<DeviceSession> session,
         std::shared_ptr<SPIM::Camera> camera, const ControllerConfig& config,
         LogManager& logManager);

   // Cancels an active run and waits for it to end
   ~AcquisitionEngine();

   AcquisitionEngine(const AcquisitionEngine&) = delete;
   AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;

   /**
    * Start a run.
    *
    * Throws (before any command is sent) SPIMError with
    * SPIMERR_RUN_ALREADY_ACTIVE if a run has not reached a terminal state,
    * SPIMERR_INVALID_PLAN if the plan cannot be executed with the current
    * cameras, or SPIMERR_CAMERA if the camera cannot be queried.
    */
   RunHandle Start(const AcquisitionPlan& plan, std::shared_ptr<ImageSink> sink);

   bool IsRunActive() const { return runActive_.load(); }

   // Throws SPIMERR_RUN_ALREADY_ACTIVE while a run is active
   void SetCamera(std::shared_ptr<SPIM::Camera> camera);

   // Outside of runs only; throw SPIMERR_RUN_ALREADY_ACTIVE during a run and
   // pass on session errors
   void SetGlobalShutter(bool open);
   void SetLiveLaser(bool enable);

   /**
    * Labels of the physical cameras behind a camera device: the sub-camera
    * labels of a composite device, otherwise the device's own label.
    */
   static std::vector<std::string> ResolveCameraLabels(SPIM::Camera& camera);

private:
   void RunAcquisition(std::shared_ptr<RunContext> ctx);

   void Publish(RunContext& ctx, RunState state);
   void StartCameras(RunContext& ctx);
   void StopCameras(RunContext& ctx);
   void StartScan(RunContext& ctx);
   void BeginVolume(RunContext& ctx, unsigned timePoint);
   bool DrainVolume(RunContext& ctx);
   std::size_t DrainAvailable(RunContext& ctx, bool finalPass);
   void RouteFrame(RunContext& ctx, const SPIM::ImageFrame& frame,
         bool finalPass);
};

} // namespace spim
