///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionEngine.cpp
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

#include "AcquisitionEngine.h"

#include "CommandCodec.h"
#include "CoreUtils.h"
#include "DeviceSession.h"
#include "Error.h"

#include <chrono>
#include <deque>
#include <map>
#include <utility>

namespace spim
{

struct AcquisitionEngine::RunContext
{
   unsigned long long runId;
   AcquisitionPlan plan;
   TimingParameters timing;
   LogicProgram program;
   std::vector<std::string> cameraLabels;
   std::shared_ptr<SPIM::Camera> camera;
   std::shared_ptr<ImageSink> sink;
   std::shared_ptr<SnapshotChannel> channel;
   std::shared_ptr<CancelToken> cancel;

   unsigned timePoint = 0;
   unsigned long completedEvents = 0;
   unsigned long expectedEvents = 0;
   std::shared_ptr<const SPIMError> error;

   // Events of the current volume not yet matched to an image, per camera
   std::map<std::string, std::deque<AcquisitionEvent>> pending;
   std::size_t outstanding = 0;

   bool triggerModeChanged = false;
   bool sequenceStarted = false;
};


AcquisitionEngine::AcquisitionEngine(std::shared_ptr<DeviceSession> session,
      std::shared_ptr<SPIM::Camera> camera, const ControllerConfig& config,
      LogManager& logManager) :
   session_(session),
   config_(config),
   logger_(logManager.NewLogger("Engine")),
   programmer_(*session, config, logManager.NewLogger("Programmer")),
   camera_(camera),
   nextRunId_(1),
   runActive_(false)
{
   config_.Validate();
}


AcquisitionEngine::~AcquisitionEngine()
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (runActive_ && currentCancel_)
   {
      LOG_WARNING(logger_) << "Engine destroyed during a run; cancelling";
      currentCancel_->Cancel();
   }
   if (worker_.joinable())
      worker_.join();
}


void
AcquisitionEngine::SetGlobalShutter(bool open)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (runActive_)
   {
      throw SPIMError("Cannot operate the global shutter while a run is active",
            SPIMERR_RUN_ALREADY_ACTIVE);
   }
   programmer_.SetGlobalShutter(open);
}


void
AcquisitionEngine::SetLiveLaser(bool enable)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (runActive_)
   {
      throw SPIMError("Cannot change the live laser while a run is active",
            SPIMERR_RUN_ALREADY_ACTIVE);
   }
   programmer_.SetLiveLaser(enable);
}


void
AcquisitionEngine::SetCamera(std::shared_ptr<SPIM::Camera> camera)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (runActive_)
   {
      throw SPIMError("Cannot change the camera while a run is active",
            SPIMERR_RUN_ALREADY_ACTIVE);
   }
   camera_ = camera;
}


std::vector<std::string>
AcquisitionEngine::ResolveCameraLabels(SPIM::Camera& camera)
{
   std::vector<std::string> labels;
   if (!camera.IsComposite())
   {
      labels.push_back(camera.GetLabel());
      return labels;
   }

   const unsigned n = camera.GetNumberOfPhysicalCameras();
   if (n == 0)
   {
      throw SPIMError("Composite camera " + ToQuotedString(camera.GetLabel()) +
            " has no physical cameras", SPIMERR_CAMERA);
   }
   for (unsigned i = 0; i < n; ++i)
   {
      std::string label;
      int ret = camera.GetPhysicalCameraLabel(i, label);
      if (ret != DEVICE_OK || label.empty())
      {
         throw SPIMError("Cannot get label of physical camera " + ToString(i) +
               " of " + ToQuotedString(camera.GetLabel()), SPIMERR_CAMERA);
      }
      labels.push_back(label);
   }
   return labels;
}


RunHandle
AcquisitionEngine::Start(const AcquisitionPlan& plan,
      std::shared_ptr<ImageSink> sink)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (runActive_)
   {
      throw SPIMError("An acquisition run is already active",
            SPIMERR_RUN_ALREADY_ACTIVE);
   }
   if (worker_.joinable())
      worker_.join();

   if (!camera_)
      throw SPIMError("No camera device set", SPIMERR_CAMERA);
   if (!sink)
      throw SPIMError("No image sink given");

   auto ctx = std::make_shared<RunContext>();
   ctx->cameraLabels = ResolveCameraLabels(*camera_);
   ValidatePlan(plan, static_cast<unsigned>(ctx->cameraLabels.size()));
   ctx->program = BuildLogicProgram(plan.topology, plan.exposureMs,
         plan.laserPulseMs, config_);
   config_.GetPresets(plan.topology);

   if (!session_->IsConnected())
   {
      throw SPIMError("Controller session is not connected",
            SPIMERR_SESSION_NOT_CONNECTED);
   }

   ctx->runId = nextRunId_++;
   ctx->plan = plan;
   ctx->timing = ComputeTimingParameters(plan,
         camera_->GetMinimumExposureMs(), config_);
   ctx->camera = camera_;
   ctx->sink = sink;
   ctx->cancel = std::make_shared<CancelToken>();
   ctx->expectedEvents = static_cast<unsigned long>(plan.numTimePoints) *
      plan.numSlices * ctx->cameraLabels.size();

   const double volumeMs = EstimateVolumeDurationMs(ctx->timing);
   if (plan.hasInterval && plan.intervalMs < volumeMs)
   {
      LOG_WARNING(logger_) << "Requested interval of " << plan.intervalMs <<
         " ms is shorter than the estimated volume duration of " <<
         volumeMs << " ms; volumes will follow each other without delay";
   }

   RunSnapshot initial;
   initial.runId = ctx->runId;
   initial.state = RunStateIdle;
   initial.expectedEvents = ctx->expectedEvents;
   ctx->channel = std::make_shared<SnapshotChannel>(initial);

   LOG_INFO(logger_) << "Starting run " << ctx->runId << ": " <<
      plan.numTimePoints << " time point(s) x " << plan.numSlices <<
      " slice(s) x " << ctx->cameraLabels.size() << " camera(s)";

   currentCancel_ = ctx->cancel;
   runActive_ = true;
   worker_ = std::thread(&AcquisitionEngine::RunAcquisition, this, ctx);

   return RunHandle(ctx->runId, ctx->channel, ctx->cancel);
}


void
AcquisitionEngine::Publish(RunContext& ctx, RunState state)
{
   RunSnapshot snapshot;
   snapshot.runId = ctx.runId;
   snapshot.state = state;
   snapshot.timePoint = ctx.timePoint;
   snapshot.completedEvents = ctx.completedEvents;
   snapshot.expectedEvents = ctx.expectedEvents;
   snapshot.error = ctx.error;

   LOG_DEBUG(logger_) << "Run " << ctx.runId << " -> " << RunStateName(state) <<
      " (time point " << ctx.timePoint << ", " << ctx.completedEvents << "/" <<
      ctx.expectedEvents << " images)";

   ctx.channel->Publish(snapshot);
}


void
AcquisitionEngine::RunAcquisition(std::shared_ptr<RunContext> ctx)
{
   RunState finalState = RunStateCompleted;
   bool sinkStarted = false;

   try
   {
      StartCameras(*ctx);

      RunMetadata metadata;
      metadata.runId = ctx->runId;
      metadata.plan = ctx->plan;
      metadata.timing = ctx->timing;
      metadata.cameraLabels = ctx->cameraLabels;
      metadata.estimatedVolumeDurationMs = EstimateVolumeDurationMs(ctx->timing);
      ctx->sink->SequenceStarted(metadata);
      sinkStarted = true;

      bool cancelled = false;
      for (unsigned t = 0; t < ctx->plan.numTimePoints && !cancelled; ++t)
      {
         if (ctx->cancel->IsCancelled())
         {
            cancelled = true;
            break;
         }

         const auto volumeStart = std::chrono::steady_clock::now();
         ctx->timePoint = t;

         Publish(*ctx, RunStateProgramming);
         programmer_.ProgramVolume(ctx->timing, ctx->program);
         Publish(*ctx, RunStateArmed);

         BeginVolume(*ctx, t);
         StartScan(*ctx);
         Publish(*ctx, RunStateRunning);

         if (!DrainVolume(*ctx))
         {
            cancelled = true;
            break;
         }

         if (t + 1 < ctx->plan.numTimePoints && ctx->plan.hasInterval)
         {
            const double elapsedMs = std::chrono::duration<double, std::milli>(
                  std::chrono::steady_clock::now() - volumeStart).count();
            const double waitMs = ctx->plan.intervalMs - elapsedMs;
            if (waitMs > 0.0 && ctx->cancel->WaitFor(waitMs))
               cancelled = true;
         }
      }

      Publish(*ctx, RunStateDraining);
      if (cancelled)
      {
         LOG_INFO(logger_) << "Run " << ctx->runId << " cancelled";
         DrainAvailable(*ctx, true);
         programmer_.HaltAndReset();
         finalState = RunStateCancelled;
      }
      else
      {
         // Anything still in the buffer is an image nobody asked for
         DrainAvailable(*ctx, false);
      }
   }
   catch (const SPIMError& e)
   {
      LOG_ERROR(logger_) << "Run " << ctx->runId << " failed: " <<
         e.getFullMsg();
      ctx->error = std::make_shared<SPIMError>(e);
      finalState = RunStateFailed;
      programmer_.HaltAndReset();
   }
   catch (const std::exception& e)
   {
      LOG_ERROR(logger_) << "Run " << ctx->runId << " failed: " << e.what();
      ctx->error = std::make_shared<SPIMError>(
            std::string("Unexpected error: ") + e.what());
      finalState = RunStateFailed;
      programmer_.HaltAndReset();
   }

   StopCameras(*ctx);

   if (sinkStarted)
   {
      RunResult result;
      result.state = finalState;
      result.completedEvents = ctx->completedEvents;
      result.expectedEvents = ctx->expectedEvents;
      if (ctx->error)
      {
         result.errorCode = ctx->error->getSpecificCode();
         result.errorMessage = ctx->error->getFullMsg();
      }
      try
      {
         ctx->sink->SequenceEnded(result);
      }
      catch (const SPIMError& e)
      {
         LOG_ERROR(logger_) << "Image sink failed to finish run " <<
            ctx->runId << ": " << e.getFullMsg();
         if (finalState != RunStateFailed)
         {
            ctx->error = std::make_shared<SPIMError>(
                  "Image sink failed to finish the run", SPIMERR_SINK, e);
            finalState = RunStateFailed;
         }
      }
      catch (const std::exception& e)
      {
         LOG_ERROR(logger_) << "Image sink failed to finish run " <<
            ctx->runId << ": " << e.what();
         if (finalState != RunStateFailed)
         {
            ctx->error = std::make_shared<SPIMError>(
                  std::string("Image sink failed to finish the run: ") +
                  e.what(), SPIMERR_SINK);
            finalState = RunStateFailed;
         }
      }
   }

   LOG_INFO(logger_) << "Run " << ctx->runId << " ended: " <<
      RunStateName(finalState) << ", " << ctx->completedEvents << " of " <<
      ctx->expectedEvents << " images";

   // Allow the next Start() before the terminal snapshot becomes visible
   runActive_ = false;
   Publish(*ctx, finalState);
}


void
AcquisitionEngine::StartCameras(RunContext& ctx)
{
   SPIM::Camera& camera = *ctx.camera;

   int ret = camera.SetTriggerMode(SPIM::ExternalEdgeTrigger);
   if (ret != DEVICE_OK)
   {
      throw SPIMError("Cannot put camera " + ToQuotedString(camera.GetLabel()) +
            " into external trigger mode (error " + ToString(ret) + ")",
            SPIMERR_CAMERA);
   }
   ctx.triggerModeChanged = true;

   const long numImages = static_cast<long>(ctx.plan.numTimePoints) *
      ctx.plan.numSlices + config_.engine.cameraSequenceMargin;
   ret = camera.StartSequenceAcquisition(numImages);
   if (ret != DEVICE_OK)
   {
      throw SPIMError("Cannot start sequence acquisition on camera " +
            ToQuotedString(camera.GetLabel()) + " (error " + ToString(ret) +
            ")", SPIMERR_CAMERA);
   }
   ctx.sequenceStarted = true;
}


void
AcquisitionEngine::StopCameras(RunContext& ctx)
{
   SPIM::Camera& camera = *ctx.camera;

   if (ctx.sequenceStarted)
   {
      int ret = camera.StopSequenceAcquisition();
      if (ret != DEVICE_OK)
      {
         LOG_WARNING(logger_) << "Stopping sequence acquisition on " <<
            camera.GetLabel() << " failed (error " << ret << ")";
      }
      ctx.sequenceStarted = false;
   }
   if (ctx.triggerModeChanged)
   {
      int ret = camera.SetTriggerMode(SPIM::InternalTrigger);
      if (ret != DEVICE_OK)
      {
         LOG_WARNING(logger_) << "Restoring internal trigger on " <<
            camera.GetLabel() << " failed (error " << ret << ")";
      }
      ctx.triggerModeChanged = false;
   }
}


void
AcquisitionEngine::StartScan(RunContext& ctx)
{
   if (config_.scanner.enableBeamForScan)
      session_->Send(programmer_.BeamOnCommand());

   try
   {
      session_->Send(programmer_.StartScanCommand());
      return;
   }
   catch (const SPIMError& e)
   {
      if (e.getCode() != SPIMERR_SESSION_TIMEOUT)
         throw;

      // The command may have been executed even though the reply was lost
      LOG_WARNING(logger_) << "Start scan of time point " << ctx.timePoint <<
         " not acknowledged; querying scan state";

      std::string state;
      try
      {
         Ack reply = session_->Send(programmer_.ScanStateQueryCommand());
         state = reply.GetValue("X");
      }
      catch (const SPIMError& queryError)
      {
         throw SPIMError("Start scan not acknowledged and scan state unknown",
               SPIMERR_START_SCAN_NOT_CONFIRMED, queryError);
      }

      if (state == g_ScanState::Running)
      {
         LOG_WARNING(logger_) << "Scanner reports running; continuing";
         return;
      }
      throw SPIMError("Start scan not acknowledged and scanner is not running "
            "(state " + ToQuotedString(state) + ")",
            SPIMERR_START_SCAN_NOT_CONFIRMED, e);
   }
}


void
AcquisitionEngine::BeginVolume(RunContext& ctx, unsigned timePoint)
{
   ctx.pending.clear();
   for (const std::string& label : ctx.cameraLabels)
      ctx.pending[label];

   const std::vector<AcquisitionEvent> events =
      GenerateVolumeEvents(ctx.plan, timePoint, ctx.cameraLabels);
   for (const AcquisitionEvent& e : events)
      ctx.pending[e.cameraLabel].push_back(e);
   ctx.outstanding = events.size();
}


bool
AcquisitionEngine::DrainVolume(RunContext& ctx)
{
   SPIM::Camera& camera = *ctx.camera;
   const auto frameTimeout = std::chrono::milliseconds(config_.engine.frameTimeoutMs);
   const auto pollInterval = std::chrono::milliseconds(config_.engine.pollIntervalMs);
   auto lastProgress = std::chrono::steady_clock::now();

   while (ctx.outstanding > 0)
   {
      if (ctx.cancel->IsCancelled())
         return false;

      if (camera.IsBufferOverflowed())
      {
         throw SPIMError("Camera buffer overflowed; images were lost",
               SPIMERR_CAMERA_BUFFER_OVERFLOW);
      }

      if (DrainAvailable(ctx, false) > 0)
      {
         lastProgress = std::chrono::steady_clock::now();
         continue;
      }

      if (!camera.IsCapturing())
      {
         throw SPIMError("Camera stopped capturing with " +
               ToString(ctx.outstanding) + " image(s) outstanding",
               SPIMERR_CAMERA);
      }
      if (std::chrono::steady_clock::now() - lastProgress > frameTimeout)
      {
         throw SPIMError("No image received for " +
               ToString(config_.engine.frameTimeoutMs) + " ms with " +
               ToString(ctx.outstanding) + " image(s) outstanding",
               SPIMERR_FRAME_TIMEOUT);
      }

      if (pollInterval.count() > 0)
         std::this_thread::sleep_for(pollInterval);
      else
         std::this_thread::yield();
   }
   return true;
}


std::size_t
AcquisitionEngine::DrainAvailable(RunContext& ctx, bool finalPass)
{
   SPIM::Camera& camera = *ctx.camera;
   std::size_t count = 0;
   while (camera.GetRemainingImageCount() > 0)
   {
      SPIM::ImageFrame frame;
      int ret = camera.PopNextImage(frame);
      if (ret == DEVICE_BUFFER_EMPTY)
         break;
      if (ret != DEVICE_OK)
      {
         throw SPIMError("Cannot retrieve image from camera (error " +
               ToString(ret) + ")", SPIMERR_CAMERA);
      }
      RouteFrame(ctx, frame, finalPass);
      ++count;
   }
   return count;
}


void
AcquisitionEngine::RouteFrame(RunContext& ctx, const SPIM::ImageFrame& frame,
      bool finalPass)
{
   std::string label = frame.metadata.GetCameraLabel();
   if (label.empty() && ctx.cameraLabels.size() == 1)
      label = ctx.cameraLabels[0];

   auto it = ctx.pending.find(label);
   if (it == ctx.pending.end() || it->second.empty())
   {
      const std::string what = (it == ctx.pending.end()) ?
         "Image from unknown camera " + ToQuotedString(label) :
         "More images than expected from camera " + ToQuotedString(label);
      if (finalPass)
      {
         LOG_WARNING(logger_) << what << " discarded";
         return;
      }
      throw SPIMError(what, SPIMERR_UNEXPECTED_FRAME);
   }

   const AcquisitionEvent event = it->second.front();
   it->second.pop_front();
   --ctx.outstanding;

   try
   {
      ctx.sink->FrameReady(frame, event, frame.metadata);
   }
   catch (const SPIMError& e)
   {
      throw SPIMError("Image sink rejected image (time point " +
            ToString(event.timePoint) + ", slice " +
            ToString(event.sliceIndex) + ", camera " +
            ToQuotedString(event.cameraLabel) + ")", SPIMERR_SINK, e);
   }
   ++ctx.completedEvents;
}

} // namespace spim
